#pragma once

#include <array>
#include <mutex>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

#include "motion_tracker.hpp"
#include "../emotion/emotion.hpp"
#include "../utils/time_format.hpp"

enum class PresencePhase {
    Idle,
    Pending,
    Confirmed,
};

const char* presencePhaseToString(PresencePhase phase);

enum class PresenceTransition {
    None,
    Started,    // Idle -> Pending
    Confirmed,  // Pending -> Confirmed
    Cleared,    // Pending -> Idle
};

struct PresenceSnapshot {
    PresencePhase phase = PresencePhase::Idle;
    std::optional<TimePoint> since;
    double cumulative_motion = 0.0;
    std::optional<cv::Point2f> last_center;
    EmotionCounts emotion_counts{};
};

struct SightingResult {
    PresenceTransition transition = PresenceTransition::None;
    bool confirmed = false;
    // Displacement from the previous sighting, 0 on the first one.
    double instantaneous_motion = 0.0;
    double cumulative_motion = 0.0;
    // Seconds since the Confirmed transition, 0 while not confirmed.
    double presence_seconds = 0.0;
    Emotion dominant_emotion = Emotion::Neutral;
};

// Presence state machine for one identity. The activation window is polled
// against the timestamp of each sighting; nothing fires between frames.
class PresenceSession {
    private:
        mutable std::mutex mutex_;
        std::string name_;
        double activation_window_;

        PresencePhase phase_ = PresencePhase::Idle;
        TimePoint since_;
        double cumulative_motion_ = 0.0;
        std::optional<cv::Point2f> last_center_;
        EmotionCounts emotion_counts_{};

        Emotion dominantEmotion(Emotion fallback) const;

    public:
        PresenceSession(const std::string& name, double activation_window_seconds);

        // A face resolved to this identity with a known-grade similarity.
        // Motion is measured against the last center under the session lock.
        SightingResult observeKnown(TimePoint now, Emotion emotion, const cv::Point2f& center);
        // A face resolved to this identity below the known threshold. Only a
        // pending timer is cleared; a confirmed session is left as is.
        PresenceTransition observeMiss();

        PresenceSnapshot snapshot() const;
};
