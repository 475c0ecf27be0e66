#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "../dnn/face_detector.hpp"
#include "../emotion/emotion.hpp"
#include "../utils/time_format.hpp"

extern const char* const kUnknownLabel;

enum class EventOutcome {
    Verified,  // confirmed identity, verified report written
    Unknown,   // below the unknown threshold, incident archived
    Observed,  // history only
};

const char* eventOutcomeToString(EventOutcome outcome);

struct DetectionEvent {
    std::string identity_label = kUnknownLabel;
    float similarity = 0.0f;
    Emotion emotion = Emotion::Neutral;
    double instantaneous_motion = 0.0;
    double cumulative_motion = 0.0;
    bool is_known = false;
    EventOutcome outcome = EventOutcome::Observed;
    BoundingBox location;
    TimePoint timestamp;

    nlohmann::json toJSON() const;
};
