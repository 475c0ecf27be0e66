#pragma once

#include <opencv2/imgproc.hpp>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "../history/detection_event.hpp"

static cv::Scalar outcomeColor(EventOutcome outcome) {
  switch (outcome) {
  case EventOutcome::Verified:
    return cv::Scalar(0, 200, 0);
  case EventOutcome::Unknown:
    return cv::Scalar(0, 0, 255);
  case EventOutcome::Observed:
  default:
    return cv::Scalar(0, 255, 255);
  }
}

static cv::Mat drawDetections(const cv::Mat &img,
                              const std::vector<DetectionEvent> &events,
                              const double fps = 0.0) {
  cv::Mat outImg;
  img.convertTo(outImg, CV_8UC3);

  for (const auto &event : events) {
    cv::Rect rect = event.location.toRect();
    cv::Scalar color = outcomeColor(event.outcome);

    std::ostringstream text;
    text << std::fixed << std::setprecision(0) << event.identity_label << " ("
         << event.similarity << "%) " << emotionToLabel(event.emotion);

    cv::rectangle(outImg, rect, color, 2);
    cv::Point textPos = cv::Point(rect.tl().x, rect.br().y + 20); // 20px below the box
    cv::putText(outImg, text.str(), textPos, cv::FONT_HERSHEY_SIMPLEX, 0.5, color, 2);
  }

  if (fps > 0.0) {
    cv::putText(outImg, "FPS: " + std::to_string(fps).substr(0, 4), cv::Point(10, 20),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 255), 2);
  }
  return outImg;
}
