#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "../emotion/emotion.hpp"
#include "../history/detection_event.hpp"
#include "../utils/time_format.hpp"

// Append-only text reports. Write failures are logged and reported through
// the return value; they never throw.
class ReportSink {
    private:
        std::filesystem::path users_path_;
        std::filesystem::path unknown_archive_path_;
        std::mutex write_mutex_;
        uint64_t unknown_sequence_ = 0;

        void loadVerifiedReport(const std::string& name, const std::filesystem::path& report_path,
                                std::vector<DetectionEvent>& events) const;
        void loadUnknownReport(const std::filesystem::path& report_path,
                               std::vector<DetectionEvent>& events) const;

    public:
        static constexpr const char* kVerifiedReportFile = "verified_user_report.txt";
        static constexpr const char* kUnknownReportFile = "unknown_report.txt";

        ReportSink(const std::string& users_path, const std::string& unknown_archive_path);

        // Appends one block to users/<name>/verified_user_report.txt. Skipped
        // when the identity's folder does not exist.
        bool writeVerified(const std::string& name, float similarity, Emotion emotion,
                           double cumulative_motion, double presence_seconds = 0.0,
                           TimePoint timestamp = Clock::now());

        // Archives the face crop and appends one incident line.
        bool writeUnknown(float similarity, Emotion emotion, const cv::Mat& face_image,
                          double cumulative_motion, TimePoint timestamp = Clock::now());

        // Parses every report back into events, oldest first. Reports carry a
        // single motion value; it fills both motion fields of the event.
        std::vector<DetectionEvent> loadHistory() const;

        std::filesystem::path verifiedReportPath(const std::string& name) const;
        std::filesystem::path unknownReportPath() const;
        const std::filesystem::path& unknownArchivePath() const { return unknown_archive_path_; }
};
