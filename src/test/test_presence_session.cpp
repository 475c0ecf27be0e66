#include <chrono>

#include <gtest/gtest.h>

#include "../session/presence_session.hpp"

namespace {

TimePoint at(double seconds) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(1700000000.0 + seconds)));
}

} // namespace

TEST(PresenceSessionTest, ConfirmsAfterActivationWindow) {
    PresenceSession session("alice", 3.0);

    SightingResult first = session.observeKnown(at(0), Emotion::Happy, cv::Point2f(10, 10));
    EXPECT_EQ(first.transition, PresenceTransition::Started);
    EXPECT_FALSE(first.confirmed);

    SightingResult second = session.observeKnown(at(1), Emotion::Happy, cv::Point2f(13, 14));
    EXPECT_FALSE(second.confirmed);
    EXPECT_DOUBLE_EQ(second.instantaneous_motion, 5.0);
    EXPECT_DOUBLE_EQ(second.cumulative_motion, 5.0);

    SightingResult third = session.observeKnown(at(2), Emotion::Happy, cv::Point2f(16, 14));
    EXPECT_FALSE(third.confirmed);
    EXPECT_DOUBLE_EQ(third.cumulative_motion, 8.0);

    SightingResult fourth = session.observeKnown(at(3), Emotion::Happy, cv::Point2f(16, 16));
    EXPECT_EQ(fourth.transition, PresenceTransition::Confirmed);
    EXPECT_TRUE(fourth.confirmed);
    EXPECT_DOUBLE_EQ(fourth.instantaneous_motion, 2.0);
    EXPECT_DOUBLE_EQ(fourth.cumulative_motion, 0.0);
    EXPECT_DOUBLE_EQ(fourth.presence_seconds, 0.0);
    EXPECT_EQ(fourth.dominant_emotion, Emotion::Happy);

    EXPECT_EQ(session.snapshot().phase, PresencePhase::Confirmed);
    EXPECT_STREQ(presencePhaseToString(session.snapshot().phase), "confirmed");
}

TEST(PresenceSessionTest, FirstSightingHasNoMotion) {
    PresenceSession session("alice", 3.0);
    EXPECT_FALSE(session.snapshot().last_center.has_value());
    EXPECT_STREQ(presencePhaseToString(session.snapshot().phase), "idle");

    SightingResult first = session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(50, 50));
    EXPECT_DOUBLE_EQ(first.instantaneous_motion, 0.0);
    EXPECT_DOUBLE_EQ(first.cumulative_motion, 0.0);
    ASSERT_TRUE(session.snapshot().last_center.has_value());
    EXPECT_EQ(*session.snapshot().last_center, cv::Point2f(50, 50));
    EXPECT_STREQ(presencePhaseToString(session.snapshot().phase), "pending");
}

TEST(PresenceSessionTest, MissClearsPendingTimer) {
    PresenceSession session("alice", 3.0);
    session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(0, 0));
    ASSERT_EQ(session.snapshot().phase, PresencePhase::Pending);

    EXPECT_EQ(session.observeMiss(), PresenceTransition::Cleared);
    EXPECT_EQ(session.snapshot().phase, PresencePhase::Idle);
    EXPECT_FALSE(session.snapshot().since.has_value());

    // The window restarts from the next known sighting.
    SightingResult restart = session.observeKnown(at(4), Emotion::Neutral, cv::Point2f(0, 0));
    EXPECT_EQ(restart.transition, PresenceTransition::Started);
    EXPECT_FALSE(restart.confirmed);
}

TEST(PresenceSessionTest, ConfirmedSessionSurvivesMisses) {
    PresenceSession session("alice", 1.0);
    session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(0, 0));
    session.observeKnown(at(1), Emotion::Neutral, cv::Point2f(0, 0));
    ASSERT_EQ(session.snapshot().phase, PresencePhase::Confirmed);

    EXPECT_EQ(session.observeMiss(), PresenceTransition::None);
    EXPECT_EQ(session.snapshot().phase, PresencePhase::Confirmed);

    SightingResult later = session.observeKnown(at(6), Emotion::Sad, cv::Point2f(0, 4));
    EXPECT_TRUE(later.confirmed);
    EXPECT_EQ(later.transition, PresenceTransition::None);
    EXPECT_DOUBLE_EQ(later.presence_seconds, 5.0);
    EXPECT_DOUBLE_EQ(later.cumulative_motion, 4.0);
}

TEST(PresenceSessionTest, ZeroWindowConfirmsOnSecondSighting) {
    PresenceSession session("alice", 0.0);
    EXPECT_FALSE(session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(0, 0)).confirmed);
    EXPECT_TRUE(session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(0, 0)).confirmed);
}

TEST(PresenceSessionTest, DominantEmotionCountsConfirmedSightings) {
    PresenceSession session("alice", 0.0);
    session.observeKnown(at(0), Emotion::Angry, cv::Point2f(0, 0));
    session.observeKnown(at(1), Emotion::Sad, cv::Point2f(0, 0));
    session.observeKnown(at(2), Emotion::Happy, cv::Point2f(0, 0));
    SightingResult result = session.observeKnown(at(3), Emotion::Happy, cv::Point2f(0, 0));

    EXPECT_EQ(result.dominant_emotion, Emotion::Happy);
    PresenceSnapshot snapshot = session.snapshot();
    EXPECT_EQ(snapshot.emotion_counts[static_cast<size_t>(Emotion::Happy)], 2);
    EXPECT_EQ(snapshot.emotion_counts[static_cast<size_t>(Emotion::Sad)], 1);
    // The pending-phase sighting is not counted.
    EXPECT_EQ(snapshot.emotion_counts[static_cast<size_t>(Emotion::Angry)], 0);
}

TEST(PresenceSessionTest, CumulativeMotionNeverDecreasesWhileConfirmed) {
    PresenceSession session("alice", 0.0);
    session.observeKnown(at(0), Emotion::Neutral, cv::Point2f(0, 0));
    session.observeKnown(at(1), Emotion::Neutral, cv::Point2f(0, 0));

    double previous = 0.0;
    for (int i = 2; i < 10; ++i) {
        SightingResult result = session.observeKnown(at(i), Emotion::Neutral, cv::Point2f(0, 1.5f * (i - 1)));
        EXPECT_DOUBLE_EQ(result.instantaneous_motion, 1.5);
        EXPECT_GE(result.cumulative_motion, previous);
        previous = result.cumulative_motion;
    }
    EXPECT_DOUBLE_EQ(previous, 12.0);
}
