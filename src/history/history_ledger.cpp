#include "history_ledger.hpp"

#include <chrono>
#include <cmath>

nlohmann::json HistoryPage::toJSON() const {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& event : events) {
        history.push_back(event.toJSON());
    }
    return {
        {"history", history},
        {"total", total},
    };
}

nlohmann::json HistoryStats::toJSON() const {
    nlohmann::json emotions = nlohmann::json::object();
    for (Emotion emotion : allEmotions()) {
        emotions[emotionToLabel(emotion)] = emotion_counts[static_cast<size_t>(emotion)];
    }
    return {
        {"total_detections", total_detections},
        {"known_detections", known_detections},
        {"unknown_detections", unknown_detections},
        {"recent_detections", recent_detections},
        {"average_motion", std::round(average_motion * 10.0) / 10.0},
        {"emotion_counts", emotions},
    };
}

HistoryLedger::HistoryLedger(size_t capacity) : events_(capacity == 0 ? kDefaultCapacity : capacity) {
}

void HistoryLedger::append(const DetectionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

HistoryPage HistoryLedger::query(size_t limit, const std::string& identity_filter, size_t offset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    HistoryPage page;

    size_t skipped = 0;
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (!identity_filter.empty() && it->identity_label != identity_filter) {
            continue;
        }
        ++page.total;
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        if (page.events.size() < limit) {
            page.events.push_back(*it);
        }
    }

    return page;
}

HistoryStats HistoryLedger::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    HistoryStats stats;
    const TimePoint recent_since = now - std::chrono::hours(24);

    double total_motion = 0.0;
    for (const auto& event : events_) {
        ++stats.total_detections;
        if (event.is_known) {
            ++stats.known_detections;
        } else {
            ++stats.unknown_detections;
        }
        stats.emotion_counts[static_cast<size_t>(event.emotion)] += 1;
        total_motion += event.instantaneous_motion;
        if (event.timestamp > recent_since) {
            ++stats.recent_detections;
        }
    }

    if (stats.total_detections > 0) {
        stats.average_motion = total_motion / static_cast<double>(stats.total_detections);
    }
    return stats;
}

size_t HistoryLedger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t HistoryLedger::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.capacity();
}
