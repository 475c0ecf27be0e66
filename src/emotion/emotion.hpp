#pragma once

#include <array>
#include <cstddef>
#include <string>

// Order matches the emotion model's output layout.
enum class Emotion {
    Angry = 0,
    Disgust = 1,
    Sad = 2,
    Fear = 3,
    Happy = 4,
    Surprise = 5,
    Neutral = 6,
};

constexpr std::size_t kEmotionCount = 7;

using EmotionCounts = std::array<int, kEmotionCount>;

const std::array<Emotion, kEmotionCount>& allEmotions();
Emotion emotionFromIndex(std::size_t index);
const char* emotionToLabel(Emotion emotion);
// Returns false and leaves `out` untouched for an unrecognised label.
bool emotionFromLabel(const std::string& label, Emotion& out);
