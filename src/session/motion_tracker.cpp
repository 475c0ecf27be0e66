#include "motion_tracker.hpp"

#include <cmath>

const std::string MotionTracker::kUnknownKey = "";

double centerDistance(const cv::Point2f& from, const cv::Point2f& to) {
    const double dx = static_cast<double>(to.x) - from.x;
    const double dy = static_cast<double>(to.y) - from.y;
    return std::sqrt(dx * dx + dy * dy);
}

double MotionTracker::update(const std::string& key, const cv::Point2f& center) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracks_.find(key);
    if (it == tracks_.end()) {
        tracks_.emplace(key, Track{center, 0.0});
        return 0.0;
    }

    const double motion = centerDistance(it->second.last_center, center);
    it->second.last_center = center;
    it->second.total += motion;
    return motion;
}

double MotionTracker::cumulative(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracks_.find(key);
    return it == tracks_.end() ? 0.0 : it->second.total;
}
