#include <filesystem>

#include <gtest/gtest.h>

#include "test_utils.hpp"
#include "../report/report_sink.hpp"

namespace fs = std::filesystem;

class ReportSinkTest : public ::testing::Test {
    protected:
        TempDir dir;
        ReportSink sink{dir.str("users"), dir.str("unknown")};
        TimePoint stamp;

        void SetUp() override {
            ASSERT_TRUE(parseTime("2024-03-05_14:30:15", "%Y-%m-%d_%H:%M:%S", stamp));
        }
};

TEST_F(ReportSinkTest, VerifiedReportSkippedWithoutUserFolder) {
    EXPECT_FALSE(sink.writeVerified("ghost", 88.0f, Emotion::Happy, 1.0, 0.0, stamp));
    EXPECT_FALSE(fs::exists(dir.path() / "users" / "ghost"));
}

TEST_F(ReportSinkTest, VerifiedReportAppendsBlock) {
    fs::create_directories(dir.path() / "users" / "alice");

    ASSERT_TRUE(sink.writeVerified("alice", 87.25f, Emotion::Happy, 12.34, 4.0, stamp));
    ASSERT_TRUE(sink.writeVerified("alice", 90.0f, Emotion::Sad, 0.0, 5.0, stamp));

    std::string report = readFile(sink.verifiedReportPath("alice"));
    EXPECT_EQ(countOccurrences(report, "alice at 2024-03-05_14:30:15\n"), 2u);
    EXPECT_NE(report.find("presence: 4.0 s\n"), std::string::npos);
    EXPECT_NE(report.find("dominant emotion: happy\n"), std::string::npos);
    EXPECT_NE(report.find("motion: 12.3\n"), std::string::npos);
    EXPECT_NE(report.find("similarity: 87.2%\n\n"), std::string::npos);
}

TEST_F(ReportSinkTest, UnknownReportWritesLineAndImage) {
    cv::Mat face(32, 32, CV_8UC3, cv::Scalar(40, 80, 120));
    ASSERT_TRUE(sink.writeUnknown(45.0f, Emotion::Fear, face, 3.5, stamp));

    std::string report = readFile(sink.unknownReportPath());
    EXPECT_EQ(report, "unknown 20240305_143015 similarity:45.0% emotion:fear motion:3.5\n");

    size_t images = 0;
    for (const auto& entry : fs::directory_iterator(sink.unknownArchivePath())) {
        if (entry.path().extension() == ".jpg") {
            ++images;
        }
    }
    EXPECT_EQ(images, 1u);
}

TEST_F(ReportSinkTest, UnknownReportWithoutImage) {
    ASSERT_TRUE(sink.writeUnknown(10.0f, Emotion::Neutral, cv::Mat(), 0.0, stamp));
    EXPECT_EQ(countOccurrences(readFile(sink.unknownReportPath()), "\n"), 1u);
}

TEST_F(ReportSinkTest, LoadHistoryParsesBothReports) {
    fs::create_directories(dir.path() / "users" / "alice");
    sink.writeVerified("alice", 82.0f, Emotion::Surprise, 6.0, 1.0, stamp);
    sink.writeUnknown(30.0f, Emotion::Angry, cv::Mat(), 2.0, stamp - std::chrono::seconds(60));

    // Malformed lines are skipped.
    {
        std::ofstream extra(sink.unknownReportPath(), std::ios::app);
        extra << "garbage line\n";
    }

    std::vector<DetectionEvent> events = sink.loadHistory();
    ASSERT_EQ(events.size(), 2u);

    EXPECT_EQ(events[0].identity_label, kUnknownLabel);
    EXPECT_FALSE(events[0].is_known);
    EXPECT_EQ(events[0].outcome, EventOutcome::Unknown);
    EXPECT_EQ(events[0].emotion, Emotion::Angry);
    EXPECT_FLOAT_EQ(events[0].similarity, 30.0f);

    EXPECT_EQ(events[1].identity_label, "alice");
    EXPECT_TRUE(events[1].is_known);
    EXPECT_EQ(events[1].outcome, EventOutcome::Verified);
    EXPECT_EQ(events[1].emotion, Emotion::Surprise);
    EXPECT_DOUBLE_EQ(events[1].cumulative_motion, 6.0);
    EXPECT_DOUBLE_EQ(events[1].instantaneous_motion, 6.0);
    EXPECT_DOUBLE_EQ(events[0].instantaneous_motion, 2.0);
    EXPECT_EQ(events[1].timestamp, stamp);
}

TEST_F(ReportSinkTest, LoadHistoryWithNoReports) {
    EXPECT_TRUE(sink.loadHistory().empty());
}
