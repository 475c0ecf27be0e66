#include "yunet_face_encoder.hpp"
#include "../utils/config.hpp"

#include <cmath>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

YuNetFaceEncoder::YuNetFaceEncoder(const Config& config)
    : env_(ORT_LOGGING_LEVEL_ERROR, "face_embedding"),
      min_face_size_(config.min_face_size) {
    detector_ = cv::FaceDetectorYN::create(
        config.face_detector_model, "", cv::Size(320, 320), config.detector_score_threshold, 0.3f, 5000);
    if (detector_.empty()) {
        throw std::runtime_error("Face detector initialization failed: " + config.face_detector_model);
    }
    embedding_net_ = std::make_unique<OnnxNet>(env_, config.embedding_model_path);
    std::cout << "Face encoder initialized successfully" << std::endl;
}

std::vector<float> YuNetFaceEncoder::embed(const cv::Mat& face_bgr) {
    cv::Mat rgb;
    cv::cvtColor(face_bgr, rgb, cv::COLOR_BGR2RGB);
    cv::resize(rgb, rgb, cv::Size(kEmbeddingInputSize, kEmbeddingInputSize), 0, 0, cv::INTER_LINEAR);

    // fixed_image_standardization: (pixel - 127.5) / 128.0
    cv::Mat standardized;
    rgb.convertTo(standardized, CV_32FC3, 1.0 / 128.0, -127.5 / 128.0);

    // HWC -> CHW
    std::vector<cv::Mat> channels(3);
    cv::split(standardized, channels);
    std::vector<float> tensor;
    tensor.reserve(3 * kEmbeddingInputSize * kEmbeddingInputSize);
    for (const auto& channel : channels) {
        const float* data = channel.ptr<float>(0);
        tensor.insert(tensor.end(), data, data + kEmbeddingInputSize * kEmbeddingInputSize);
    }

    std::vector<float> embedding = embedding_net_->forward(
        tensor, {1, 3, kEmbeddingInputSize, kEmbeddingInputSize});

    double norm = 0.0;
    for (float value : embedding) {
        norm += static_cast<double>(value) * value;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (float& value : embedding) {
            value = static_cast<float>(value / norm);
        }
    }
    return embedding;
}

std::vector<ObservedFace> YuNetFaceEncoder::detect(const cv::Mat& frame) {
    std::vector<ObservedFace> faces;
    if (frame.empty()) {
        std::cerr << "Empty frame received" << std::endl;
        return faces;
    }

    cv::Mat bgr = frame;
    if (frame.channels() == 4) {
        cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    } else if (frame.channels() == 1) {
        cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    }

    cv::Mat face_matrix;
    {
        std::lock_guard<std::mutex> lock(detector_mutex_);
        detector_->setInputSize(bgr.size());
        detector_->detect(bgr, face_matrix);
    }

    const cv::Rect frame_rect(0, 0, bgr.cols, bgr.rows);
    for (int row = 0; row < face_matrix.rows; ++row) {
        cv::Rect rect(
            static_cast<int>(std::round(face_matrix.at<float>(row, 0))),
            static_cast<int>(std::round(face_matrix.at<float>(row, 1))),
            static_cast<int>(std::round(face_matrix.at<float>(row, 2))),
            static_cast<int>(std::round(face_matrix.at<float>(row, 3)))
        );
        rect &= frame_rect;
        if (rect.width < min_face_size_ || rect.height < min_face_size_) {
            continue;
        }

        ObservedFace face;
        face.box = BoundingBox::fromRect(rect);
        if (!face.box.valid()) {
            continue;
        }
        face.crop = bgr(rect).clone();
        face.embedding = embed(face.crop);
        faces.push_back(std::move(face));
    }

    return faces;
}
