#include <gtest/gtest.h>

#include "../session/motion_tracker.hpp"

TEST(MotionTrackerTest, CenterDistanceIsEuclidean) {
    EXPECT_DOUBLE_EQ(centerDistance(cv::Point2f(0.0f, 0.0f), cv::Point2f(3.0f, 4.0f)), 5.0);
    EXPECT_DOUBLE_EQ(centerDistance(cv::Point2f(7.0f, 7.0f), cv::Point2f(7.0f, 7.0f)), 0.0);
}

TEST(MotionTrackerTest, FirstSightingHasNoMotion) {
    MotionTracker tracker;
    EXPECT_DOUBLE_EQ(tracker.cumulative("alice"), 0.0);
    EXPECT_DOUBLE_EQ(tracker.update("alice", cv::Point2f(10.0f, 10.0f)), 0.0);
    EXPECT_DOUBLE_EQ(tracker.cumulative("alice"), 0.0);
}

TEST(MotionTrackerTest, ReturnsEuclideanDistanceAndAccumulates) {
    MotionTracker tracker;
    tracker.update("alice", cv::Point2f(0.0f, 0.0f));
    EXPECT_DOUBLE_EQ(tracker.update("alice", cv::Point2f(3.0f, 4.0f)), 5.0);
    EXPECT_DOUBLE_EQ(tracker.update("alice", cv::Point2f(3.0f, 4.0f)), 0.0);
    EXPECT_DOUBLE_EQ(tracker.update("alice", cv::Point2f(3.0f, 6.0f)), 2.0);
    EXPECT_DOUBLE_EQ(tracker.cumulative("alice"), 7.0);
}

TEST(MotionTrackerTest, KeysAreIndependent) {
    MotionTracker tracker;
    tracker.update("alice", cv::Point2f(0.0f, 0.0f));
    EXPECT_DOUBLE_EQ(tracker.update(MotionTracker::kUnknownKey, cv::Point2f(100.0f, 100.0f)), 0.0);
    EXPECT_DOUBLE_EQ(tracker.update("alice", cv::Point2f(0.0f, 1.0f)), 1.0);
    EXPECT_DOUBLE_EQ(tracker.cumulative(MotionTracker::kUnknownKey), 0.0);
}
