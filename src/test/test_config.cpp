#include <fstream>

#include <gtest/gtest.h>

#include "test_utils.hpp"
#include "../utils/config.hpp"

namespace {

std::string writeConfig(const TempDir& dir, const std::string& body) {
    std::string path = dir.str("config.ini");
    std::ofstream file(path);
    file << body;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsWhenFileMissing) {
    TempDir dir;
    Config config;
    EXPECT_FALSE(config.load(dir.str("missing.ini")));

    EXPECT_EQ(config.users_path, "users");
    EXPECT_FLOAT_EQ(config.activation_window, 3.0f);
    EXPECT_FLOAT_EQ(config.known_threshold, 70.0f);
    EXPECT_FLOAT_EQ(config.unknown_threshold, 60.0f);
    EXPECT_EQ(config.history_capacity, 1000);
    EXPECT_EQ(config.persistence, "folder");
}

TEST(ConfigTest, ReadsValuesAndIgnoresComments) {
    TempDir dir;
    std::string path = writeConfig(dir,
        "# presence\n"
        "activation_window = 5\n"
        "; thresholds\n"
        "known_threshold=80\n"
        "unknown_threshold = 50\n"
        "similarity_metric = euclidean\n"
        "history_capacity = 200\n"
        "load_history_on_start = off\n"
        "users_path = /data/users\n"
        "persistence = postgres\n"
        "db_port = 5432\n");

    Config config;
    ASSERT_TRUE(config.load(path));
    EXPECT_FLOAT_EQ(config.activation_window, 5.0f);
    EXPECT_FLOAT_EQ(config.known_threshold, 80.0f);
    EXPECT_FLOAT_EQ(config.unknown_threshold, 50.0f);
    EXPECT_EQ(config.similarity_metric, "euclidean");
    EXPECT_EQ(config.history_capacity, 200);
    EXPECT_FALSE(config.load_history_on_start);
    EXPECT_EQ(config.users_path, "/data/users");
    EXPECT_EQ(config.persistence, "postgres");
    EXPECT_EQ(config.db_port, 5432);
}

TEST(ConfigTest, InvalidValuesFallBackToDefaults) {
    TempDir dir;
    std::string path = writeConfig(dir,
        "activation_window = -2\n"
        "known_threshold = 50\n"
        "unknown_threshold = 65\n"
        "history_capacity = lots\n"
        "similarity_metric = manhattan\n"
        "persistence = cloud\n"
        "visualize = maybe\n");

    Config config;
    ASSERT_TRUE(config.load(path));
    EXPECT_FLOAT_EQ(config.activation_window, 3.0f);
    EXPECT_FLOAT_EQ(config.known_threshold, 70.0f);
    EXPECT_FLOAT_EQ(config.unknown_threshold, 60.0f);
    EXPECT_EQ(config.history_capacity, 1000);
    EXPECT_EQ(config.similarity_metric, "cosine");
    EXPECT_EQ(config.persistence, "folder");
    EXPECT_FALSE(config.visualize);
}

TEST(ConfigTest, NonFiniteValuesFallBackToDefaults) {
    TempDir dir;
    std::string path = writeConfig(dir,
        "activation_window = nan\n"
        "known_threshold = inf\n"
        "unknown_threshold = 50\n"
        "min_face_size = nan\n"
        "detector_score_threshold = 2.5\n");

    Config config;
    ASSERT_TRUE(config.load(path));
    EXPECT_FLOAT_EQ(config.activation_window, 3.0f);
    EXPECT_GE(1e9f, config.activation_window);
    EXPECT_FLOAT_EQ(config.known_threshold, 70.0f);
    EXPECT_FLOAT_EQ(config.unknown_threshold, 60.0f);
    EXPECT_FLOAT_EQ(config.min_face_size, 40.0f);
    EXPECT_FLOAT_EQ(config.detector_score_threshold, 0.7f);
}
