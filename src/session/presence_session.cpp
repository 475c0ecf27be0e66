#include "presence_session.hpp"

#include <iostream>

const char* presencePhaseToString(PresencePhase phase) {
    switch (phase) {
    case PresencePhase::Pending:
        return "pending";
    case PresencePhase::Confirmed:
        return "confirmed";
    case PresencePhase::Idle:
    default:
        return "idle";
    }
}

PresenceSession::PresenceSession(const std::string& name, double activation_window_seconds)
    : name_(name), activation_window_(activation_window_seconds) {
}

Emotion PresenceSession::dominantEmotion(Emotion fallback) const {
    int best_count = 0;
    Emotion best = fallback;
    for (Emotion emotion : allEmotions()) {
        int count = emotion_counts_[static_cast<size_t>(emotion)];
        if (count > best_count) {
            best_count = count;
            best = emotion;
        }
    }
    return best;
}

SightingResult PresenceSession::observeKnown(TimePoint now, Emotion emotion, const cv::Point2f& center) {
    std::lock_guard<std::mutex> lock(mutex_);
    SightingResult result;

    if (last_center_) {
        result.instantaneous_motion = centerDistance(*last_center_, center);
        cumulative_motion_ += result.instantaneous_motion;
    }
    last_center_ = center;

    switch (phase_) {
    case PresencePhase::Idle:
        phase_ = PresencePhase::Pending;
        since_ = now;
        result.transition = PresenceTransition::Started;
        std::cout << "User " << name_ << " detection started..." << std::endl;
        break;
    case PresencePhase::Pending:
        if (secondsBetween(since_, now) >= activation_window_) {
            phase_ = PresencePhase::Confirmed;
            since_ = now;
            cumulative_motion_ = 0.0;
            emotion_counts_.fill(0);
            result.transition = PresenceTransition::Confirmed;
            std::cout << "User " << name_ << " confirmed and system activated." << std::endl;
        }
        break;
    case PresencePhase::Confirmed:
        break;
    }

    if (phase_ == PresencePhase::Confirmed) {
        emotion_counts_[static_cast<size_t>(emotion)] += 1;
        result.confirmed = true;
        result.presence_seconds = secondsBetween(since_, now);
    }
    result.cumulative_motion = cumulative_motion_;
    result.dominant_emotion = dominantEmotion(emotion);
    return result;
}

PresenceTransition PresenceSession::observeMiss() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != PresencePhase::Pending) {
        return PresenceTransition::None;
    }
    phase_ = PresencePhase::Idle;
    std::cout << "User " << name_ << " detection reset" << std::endl;
    return PresenceTransition::Cleared;
}

PresenceSnapshot PresenceSession::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PresenceSnapshot snapshot;
    snapshot.phase = phase_;
    if (phase_ != PresencePhase::Idle) {
        snapshot.since = since_;
    }
    snapshot.cumulative_motion = cumulative_motion_;
    snapshot.last_center = last_center_;
    snapshot.emotion_counts = emotion_counts_;
    return snapshot;
}
