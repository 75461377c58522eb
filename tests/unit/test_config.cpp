/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace task_planner;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "tp_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.schema.tag_alias, "Task");
    EXPECT_EQ(config.schema.locale, "en");
    EXPECT_FALSE(config.schema.status_labels.has_value());
    EXPECT_DOUBLE_EQ(config.engine.waiting_multiplier, 0.6);
    EXPECT_TRUE(config.engine.cache_enabled);
    EXPECT_EQ(config.views.due_soon_days, 7u);
    EXPECT_FALSE(config.views.due_soon_include_overdue);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(config.logging.log_dir.empty());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [schema]
        tag_alias = "  #Todo "
        locale = "zh-CN"
        status_labels = ["Open", "Active", "Blocked", "Closed"]
        canceled_labels = ["Dropped"]

        [engine]
        waiting_multiplier = 0.5
        cache_enabled = false

        [views]
        due_soon_days = 14
        due_soon_include_overdue = true

        [logging]
        level = "debug"
        log_dir = "/tmp/tp_logs"
        max_file_size_mb = 10
        rotate_count = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& c = *result;

    EXPECT_EQ(c.schema.tag_alias, "Todo");
    EXPECT_EQ(c.schema.locale, "zh-CN");
    ASSERT_TRUE(c.schema.status_labels.has_value());
    EXPECT_EQ((*c.schema.status_labels)[3], "Closed");
    ASSERT_EQ(c.schema.canceled_labels.size(), 1u);
    EXPECT_EQ(c.schema.canceled_labels[0], "Dropped");

    EXPECT_DOUBLE_EQ(c.engine.waiting_multiplier, 0.5);
    EXPECT_FALSE(c.engine.cache_enabled);
    EXPECT_EQ(c.views.due_soon_days, 14u);
    EXPECT_TRUE(c.views.due_soon_include_overdue);

    EXPECT_EQ(c.logging.level, "debug");
    EXPECT_EQ(c.logging.log_dir, "/tmp/tp_logs");
    EXPECT_EQ(c.logging.max_file_size_mb, 10u);
    EXPECT_EQ(c.logging.rotate_count, 3u);
}

TEST_F(ConfigTest, PartialConfigUsesDefaults) {
    auto path = write_toml(R"(
        [views]
        due_soon_days = 3
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->views.due_soon_days, 3u);
    EXPECT_EQ(result->schema.tag_alias, "Task");
    EXPECT_DOUBLE_EQ(result->engine.waiting_multiplier, 0.6);
}

TEST_F(ConfigTest, MissingFileReturnsIoError) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Io);
}

TEST_F(ConfigTest, InvalidTomlReturnsParseError) {
    auto path = write_toml("this is not valid toml [[[");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, WrongStatusLabelCountIsRejected) {
    auto result = parse_config(R"(
        [schema]
        status_labels = ["A", "B", "C"]
    )");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}

TEST_F(ConfigTest, WaitingMultiplierOutOfRangeIsRejected) {
    auto result = parse_config(R"(
        [engine]
        waiting_multiplier = 1.5
    )");
    EXPECT_FALSE(result.has_value());
}

TEST_F(ConfigTest, DueSoonDaysIsClamped) {
    auto low = parse_config("[views]\ndue_soon_days = 0\n");
    auto high = parse_config("[views]\ndue_soon_days = 99999\n");
    ASSERT_TRUE(low.has_value());
    ASSERT_TRUE(high.has_value());
    EXPECT_EQ(low->views.due_soon_days, 1u);
    EXPECT_EQ(high->views.due_soon_days, 3650u);
}

TEST(TagAliasTest, Normalization) {
    EXPECT_EQ(normalize_tag_alias("Task"), "Task");
    EXPECT_EQ(normalize_tag_alias("  #Project "), "Project");
    EXPECT_EQ(normalize_tag_alias("##"), "Task");
    EXPECT_EQ(normalize_tag_alias(""), "Task");
}
