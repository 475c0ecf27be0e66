#include "emotion_classifier.hpp"
#include "../utils/config.hpp"

#include <iostream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

namespace {

constexpr int kEmotionInputSize = 64;

} // namespace

DnnEmotionClassifier::DnnEmotionClassifier(const std::string& model_path) {
    net_ = cv::dnn::readNetFromONNX(model_path);
    if (net_.empty()) {
        throw std::runtime_error("Emotion model initialization failed: " + model_path);
    }
}

Emotion DnnEmotionClassifier::classify(const cv::Mat& face_bgr) {
    if (face_bgr.empty()) {
        return Emotion::Neutral;
    }

    try {
        cv::Mat gray;
        if (face_bgr.channels() == 3) {
            cv::cvtColor(face_bgr, gray, cv::COLOR_BGR2GRAY);
        } else if (face_bgr.channels() == 4) {
            cv::cvtColor(face_bgr, gray, cv::COLOR_BGRA2GRAY);
        } else {
            gray = face_bgr;
        }
        cv::resize(gray, gray, cv::Size(kEmotionInputSize, kEmotionInputSize), 0.0, 0.0, cv::INTER_LINEAR);

        // Scale to [0,1] as the model was trained on normalised pixels
        const cv::Mat blob = cv::dnn::blobFromImage(
            gray,
            1.0 / 255.0,
            cv::Size(kEmotionInputSize, kEmotionInputSize),
            cv::Scalar(),
            false,
            false,
            CV_32F);

        cv::Mat output;
        {
            std::lock_guard<std::mutex> lock(net_mutex_);
            net_.setInput(blob);
            output = net_.forward();
        }
        if (output.empty()) {
            return Emotion::Neutral;
        }

        const cv::Mat flattened = output.reshape(1, 1);
        cv::Point max_loc;
        cv::minMaxLoc(flattened, nullptr, nullptr, nullptr, &max_loc);
        return emotionFromIndex(static_cast<std::size_t>(max_loc.x));
    } catch (const cv::Exception& e) {
        std::cerr << "Error detecting emotion: " << e.what() << std::endl;
        return Emotion::Neutral;
    }
}

RandomEmotionClassifier::RandomEmotionClassifier() : rng_(std::random_device{}()) {}

RandomEmotionClassifier::RandomEmotionClassifier(unsigned int seed) : rng_(seed) {}

Emotion RandomEmotionClassifier::classify(const cv::Mat&) {
    std::uniform_int_distribution<std::size_t> dist(0, kEmotionCount - 1);
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return emotionFromIndex(dist(rng_));
}

std::unique_ptr<EmotionClassifier> makeEmotionClassifier(const Config& config) {
    if (config.emotion_model_path.empty()) {
        std::cout << "Emotion model not configured. Emotion detection will be simulated." << std::endl;
        return std::make_unique<RandomEmotionClassifier>();
    }
    try {
        auto classifier = std::make_unique<DnnEmotionClassifier>(config.emotion_model_path);
        std::cout << "Emotion model loaded successfully" << std::endl;
        return classifier;
    } catch (const std::exception& e) {
        std::cerr << "Error loading emotion model: " << e.what() << std::endl;
        std::cerr << "Emotion detection will be simulated." << std::endl;
        return std::make_unique<RandomEmotionClassifier>();
    }
}
