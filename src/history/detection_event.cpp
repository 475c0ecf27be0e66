#include "detection_event.hpp"

#include <cmath>

const char* const kUnknownLabel = "unknown";

namespace {

double roundOneDecimal(double value) {
    return std::round(value * 10.0) / 10.0;
}

} // namespace

const char* eventOutcomeToString(EventOutcome outcome) {
    switch (outcome) {
    case EventOutcome::Verified:
        return "verified";
    case EventOutcome::Unknown:
        return "unknown";
    case EventOutcome::Observed:
    default:
        return "observed";
    }
}

nlohmann::json DetectionEvent::toJSON() const {
    return {
        {"location", {
            {"top", location.top},
            {"right", location.right},
            {"bottom", location.bottom},
            {"left", location.left},
        }},
        {"user", identity_label},
        {"similarity", roundOneDecimal(similarity)},
        {"emotion", emotionToLabel(emotion)},
        {"motion", roundOneDecimal(instantaneous_motion)},
        {"total_motion", roundOneDecimal(cumulative_motion)},
        {"is_known", is_known},
        {"outcome", eventOutcomeToString(outcome)},
        {"timestamp", toIsoString(timestamp)},
    };
}
