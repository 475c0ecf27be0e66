#pragma once

#include <mutex>
#include <string>
#include <vector>

#include <boost/circular_buffer.hpp>
#include <nlohmann/json.hpp>

#include "detection_event.hpp"

struct HistoryPage {
    std::vector<DetectionEvent> events;  // most recent first
    size_t total = 0;                    // matching events before paging

    nlohmann::json toJSON() const;
};

struct HistoryStats {
    size_t total_detections = 0;
    size_t known_detections = 0;
    size_t unknown_detections = 0;
    size_t recent_detections = 0;
    double average_motion = 0.0;
    EmotionCounts emotion_counts{};

    nlohmann::json toJSON() const;
};

// Bounded, chronological event log. Appending past capacity evicts the
// oldest entry in the same critical section.
class HistoryLedger {
    private:
        mutable std::mutex mutex_;
        boost::circular_buffer<DetectionEvent> events_;

    public:
        static constexpr size_t kDefaultCapacity = 1000;

        explicit HistoryLedger(size_t capacity = kDefaultCapacity);

        void append(const DetectionEvent& event);
        HistoryPage query(size_t limit, const std::string& identity_filter = "", size_t offset = 0) const;
        HistoryStats stats(TimePoint now = Clock::now()) const;

        size_t size() const;
        size_t capacity() const;
};
