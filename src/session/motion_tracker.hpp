#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include <opencv2/core.hpp>

// Euclidean distance between two face centers.
double centerDistance(const cv::Point2f& from, const cv::Point2f& to);

// Per-key face center history. The empty key tracks faces with no identity.
class MotionTracker {
    private:
        struct Track {
            cv::Point2f last_center;
            double total = 0.0;
        };

        mutable std::mutex mutex_;
        std::unordered_map<std::string, Track> tracks_;

    public:
        static const std::string kUnknownKey;

        // Distance from the previous center for this key, 0 on first sight.
        double update(const std::string& key, const cv::Point2f& center);
        // Sum of every displacement reported for this key.
        double cumulative(const std::string& key) const;
};
