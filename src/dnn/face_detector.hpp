#pragma once

#include <vector>
#include <opencv2/core.hpp>

// Pixel box in (top, right, bottom, left) order.
struct BoundingBox {
    int top = 0;
    int right = 0;
    int bottom = 0;
    int left = 0;

    BoundingBox() = default;
    BoundingBox(int top, int right, int bottom, int left)
        : top(top), right(right), bottom(bottom), left(left) {}

    static BoundingBox fromRect(const cv::Rect& rect) {
        return BoundingBox(rect.y, rect.x + rect.width, rect.y + rect.height, rect.x);
    }

    cv::Rect toRect() const { return cv::Rect(left, top, right - left, bottom - top); }

    // Integer center, matching the pixel grid of the box.
    cv::Point2f center() const {
        return cv::Point2f(static_cast<float>((left + right) / 2),
                           static_cast<float>((top + bottom) / 2));
    }

    bool valid() const { return bottom > top && right > left; }
};

struct ObservedFace {
    BoundingBox box;
    std::vector<float> embedding;
    cv::Mat crop;
};

class FaceDetector {
    public:
        virtual ~FaceDetector() = default;
        // Returns every face found in the frame; empty when there are none.
        virtual std::vector<ObservedFace> detect(const cv::Mat& frame) = 0;
};
