#include "report_sink.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <opencv2/imgcodecs.hpp>

namespace fs = std::filesystem;

namespace {

constexpr const char* kVerifiedTimeFormat = "%Y-%m-%d_%H:%M:%S";
constexpr const char* kUnknownTimeFormat = "%Y%m%d_%H%M%S";

std::string valueAfter(const std::string& line, const std::string& key) {
    size_t pos = line.find(key);
    if (pos == std::string::npos) {
        return "";
    }
    return line.substr(pos + key.size());
}

bool parseNumber(std::string text, float& out) {
    text.erase(std::remove(text.begin(), text.end(), '%'), text.end());
    try {
        out = std::stof(text);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

ReportSink::ReportSink(const std::string& users_path, const std::string& unknown_archive_path)
    : users_path_(users_path), unknown_archive_path_(unknown_archive_path) {
}

fs::path ReportSink::verifiedReportPath(const std::string& name) const {
    return users_path_ / name / kVerifiedReportFile;
}

fs::path ReportSink::unknownReportPath() const {
    return unknown_archive_path_ / kUnknownReportFile;
}

bool ReportSink::writeVerified(const std::string& name, float similarity, Emotion emotion,
                               double cumulative_motion, double presence_seconds, TimePoint timestamp) {
    std::ostringstream block;
    block << std::fixed << std::setprecision(1);
    block << name << " at " << formatTime(timestamp, kVerifiedTimeFormat) << "\n"
          << "presence: " << presence_seconds << " s\n"
          << "dominant emotion: " << emotionToLabel(emotion) << "\n"
          << "motion: " << cumulative_motion << "\n"
          << "similarity: " << similarity << "%\n\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    try {
        fs::path user_folder = users_path_ / name;
        if (!fs::is_directory(user_folder)) {
            std::cerr << "Verified report skipped, no storage for " << name << std::endl;
            return false;
        }

        std::ofstream report(verifiedReportPath(name), std::ios::app);
        if (!report.is_open()) {
            std::cerr << "Error saving verified user report: cannot open "
                      << verifiedReportPath(name) << std::endl;
            return false;
        }
        report << block.str();
        report.flush();
        if (!report) {
            std::cerr << "Error saving verified user report for " << name << std::endl;
            return false;
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error saving verified user report: " << e.what() << std::endl;
        return false;
    }

    std::ostringstream log;
    log << std::fixed << std::setprecision(1)
        << "Verified user report saved for " << name << " with motion " << cumulative_motion;
    std::cout << log.str() << std::endl;
    return true;
}

bool ReportSink::writeUnknown(float similarity, Emotion emotion, const cv::Mat& face_image,
                              double cumulative_motion, TimePoint timestamp) {
    const std::string stamp = formatTime(timestamp, kUnknownTimeFormat);

    std::ostringstream line;
    line << std::fixed << std::setprecision(1);
    line << kUnknownLabel << " " << stamp
         << " similarity:" << similarity << "%"
         << " emotion:" << emotionToLabel(emotion)
         << " motion:" << cumulative_motion << "\n";

    std::lock_guard<std::mutex> lock(write_mutex_);
    try {
        fs::create_directories(unknown_archive_path_);

        if (!face_image.empty()) {
            fs::path face_path = unknown_archive_path_ /
                ("unknown_" + stamp + "_" + std::to_string(unknown_sequence_++) + ".jpg");
            try {
                if (!cv::imwrite(face_path.string(), face_image)) {
                    std::cerr << "Error saving unknown face image " << face_path << std::endl;
                }
            } catch (const cv::Exception& e) {
                std::cerr << "Error saving unknown face image: " << e.what() << std::endl;
            }
        }

        std::ofstream report(unknownReportPath(), std::ios::app);
        if (!report.is_open()) {
            std::cerr << "Error saving unknown face report: cannot open " << unknownReportPath() << std::endl;
            return false;
        }
        report << line.str();
        report.flush();
        if (!report) {
            std::cerr << "Error saving unknown face report" << std::endl;
            return false;
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error saving unknown face report: " << e.what() << std::endl;
        return false;
    }

    std::ostringstream log;
    log << std::fixed << std::setprecision(1)
        << "Unknown face report saved with similarity " << similarity << "% and motion " << cumulative_motion;
    std::cout << log.str() << std::endl;
    return true;
}

void ReportSink::loadVerifiedReport(const std::string& name, const fs::path& report_path,
                                    std::vector<DetectionEvent>& events) const {
    std::ifstream report(report_path);
    if (!report.is_open()) {
        std::cerr << "Error reading verified report for " << name << std::endl;
        return;
    }

    std::vector<std::string> block;
    std::string line;
    auto flush_block = [&]() {
        if (block.size() >= 5) {
            DetectionEvent event;
            event.identity_label = name;
            event.is_known = true;
            event.outcome = EventOutcome::Verified;

            size_t at = block[0].rfind(" at ");
            bool timed = at != std::string::npos &&
                parseTime(block[0].substr(at + 4), kVerifiedTimeFormat, event.timestamp);

            Emotion emotion;
            if (emotionFromLabel(valueAfter(block[2], "dominant emotion: "), emotion)) {
                event.emotion = emotion;
            }

            float motion = 0.0f;
            float similarity = 0.0f;
            if (timed && parseNumber(valueAfter(block[3], "motion: "), motion) &&
                parseNumber(valueAfter(block[4], "similarity: "), similarity)) {
                event.instantaneous_motion = motion;
                event.cumulative_motion = motion;
                event.similarity = similarity;
                events.push_back(event);
            }
        }
        block.clear();
    };

    while (std::getline(report, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush_block();
        } else {
            block.push_back(line);
        }
    }
    flush_block();
}

void ReportSink::loadUnknownReport(const fs::path& report_path, std::vector<DetectionEvent>& events) const {
    std::ifstream report(report_path);
    if (!report.is_open()) {
        std::cerr << "Error reading unknown report " << report_path << std::endl;
        return;
    }

    std::string line;
    while (std::getline(report, line)) {
        std::istringstream tokens(line);
        std::string label;
        std::string stamp;
        if (!(tokens >> label >> stamp) || label != kUnknownLabel) {
            continue;
        }

        DetectionEvent event;
        event.is_known = false;
        event.outcome = EventOutcome::Unknown;
        if (!parseTime(stamp, kUnknownTimeFormat, event.timestamp)) {
            continue;
        }

        std::string token;
        while (tokens >> token) {
            size_t colon = token.find(':');
            if (colon == std::string::npos) {
                continue;
            }
            std::string key = token.substr(0, colon);
            std::string value = token.substr(colon + 1);
            float number = 0.0f;
            if (key == "similarity" && parseNumber(value, number)) {
                event.similarity = number;
            } else if (key == "motion" && parseNumber(value, number)) {
                event.instantaneous_motion = number;
                event.cumulative_motion = number;
            } else if (key == "emotion") {
                Emotion emotion;
                if (emotionFromLabel(value, emotion)) {
                    event.emotion = emotion;
                }
            }
        }
        events.push_back(event);
    }
}

std::vector<DetectionEvent> ReportSink::loadHistory() const {
    std::vector<DetectionEvent> events;

    try {
        if (fs::is_directory(users_path_)) {
            for (const auto& entry : fs::directory_iterator(users_path_)) {
                if (!entry.is_directory()) {
                    continue;
                }
                fs::path report_path = entry.path() / kVerifiedReportFile;
                if (fs::exists(report_path)) {
                    loadVerifiedReport(entry.path().filename().string(), report_path, events);
                }
            }
        }
        if (fs::exists(unknownReportPath())) {
            loadUnknownReport(unknownReportPath(), events);
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Error loading detection history: " << e.what() << std::endl;
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const DetectionEvent& lhs, const DetectionEvent& rhs) {
                         return lhs.timestamp < rhs.timestamp;
                     });

    std::cout << "Loaded " << events.size() << " detection records from files" << std::endl;
    return events;
}
