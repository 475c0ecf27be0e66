#include "emotion.hpp"

const std::array<Emotion, kEmotionCount>& allEmotions() {
    static const std::array<Emotion, kEmotionCount> emotions = {
        Emotion::Angry,
        Emotion::Disgust,
        Emotion::Sad,
        Emotion::Fear,
        Emotion::Happy,
        Emotion::Surprise,
        Emotion::Neutral,
    };
    return emotions;
}

Emotion emotionFromIndex(std::size_t index) {
    switch (index) {
    case 0:
        return Emotion::Angry;
    case 1:
        return Emotion::Disgust;
    case 2:
        return Emotion::Sad;
    case 3:
        return Emotion::Fear;
    case 4:
        return Emotion::Happy;
    case 5:
        return Emotion::Surprise;
    default:
        return Emotion::Neutral;
    }
}

const char* emotionToLabel(Emotion emotion) {
    switch (emotion) {
    case Emotion::Angry:
        return "angry";
    case Emotion::Disgust:
        return "disgust";
    case Emotion::Sad:
        return "sad";
    case Emotion::Fear:
        return "fear";
    case Emotion::Happy:
        return "happy";
    case Emotion::Surprise:
        return "surprise";
    case Emotion::Neutral:
    default:
        return "neutral";
    }
}

bool emotionFromLabel(const std::string& label, Emotion& out) {
    for (Emotion emotion : allEmotions()) {
        if (label == emotionToLabel(emotion)) {
            out = emotion;
            return true;
        }
    }
    return false;
}
