#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <opencv2/objdetect.hpp>

#include "face_detector.hpp"
#include "onnx_module.h"

class Config;

// Localises faces with OpenCV's YuNet detector and extracts a feature
// vector per face with an ONNX embedding network (160x160 RGB input).
class YuNetFaceEncoder : public FaceDetector {
    private:
        cv::Ptr<cv::FaceDetectorYN> detector_;
        std::mutex detector_mutex_;
        Ort::Env env_;
        std::unique_ptr<OnnxNet> embedding_net_;
        float min_face_size_;

        std::vector<float> embed(const cv::Mat& face_bgr);

    public:
        static constexpr int kEmbeddingInputSize = 160;

        explicit YuNetFaceEncoder(const Config& config);
        std::vector<ObservedFace> detect(const cv::Mat& frame) override;
};
