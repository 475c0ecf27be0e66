#pragma once

#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "emotion.hpp"

class Config;

class EmotionClassifier {
    public:
        virtual ~EmotionClassifier() = default;
        virtual Emotion classify(const cv::Mat& face_bgr) = 0;
};

// Runs an ONNX emotion model through cv::dnn on a 64x64 grayscale crop.
class DnnEmotionClassifier : public EmotionClassifier {
    private:
        cv::dnn::Net net_;
        std::mutex net_mutex_;

    public:
        explicit DnnEmotionClassifier(const std::string& model_path);
        Emotion classify(const cv::Mat& face_bgr) override;
};

// Uniform random label, used when no emotion model is available.
class RandomEmotionClassifier : public EmotionClassifier {
    private:
        std::mt19937 rng_;
        std::mutex rng_mutex_;

    public:
        RandomEmotionClassifier();
        explicit RandomEmotionClassifier(unsigned int seed);
        Emotion classify(const cv::Mat& face_bgr) override;
};

// Always returns the same label.
class FixedEmotionClassifier : public EmotionClassifier {
    private:
        Emotion emotion_;

    public:
        explicit FixedEmotionClassifier(Emotion emotion) : emotion_(emotion) {}
        Emotion classify(const cv::Mat&) override { return emotion_; }
};

std::unique_ptr<EmotionClassifier> makeEmotionClassifier(const Config& config);
