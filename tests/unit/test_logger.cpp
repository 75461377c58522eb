/**
 * @file test_logger.cpp
 * @brief Unit tests for the logger, log sinks and metrics events.
 */

#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace task_planner;

namespace {

struct CapturedLogger {
    MemorySink* sink;
    Logger logger;

    explicit CapturedLogger(LogLevel level)
        : CapturedLogger(std::make_unique<MemorySink>(), level) {}

private:
    CapturedLogger(std::unique_ptr<MemorySink> owned, LogLevel level)
        : sink(owned.get()), logger(std::move(owned), level, "test") {}
};

}  // namespace

TEST(LoggerTest, FiltersBelowMinimumLevel) {
    CapturedLogger log(LogLevel::Warn);
    log.logger.debug("hidden");
    log.logger.info("hidden");
    log.logger.warn("shown");
    log.logger.error("shown too");

    auto lines = log.sink->lines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("level":"error")"), std::string::npos);
}

TEST(LoggerTest, RecordCarriesComponentAndMessage) {
    CapturedLogger log(LogLevel::Debug);
    log.logger.info("hello");
    log.logger.log(LogLevel::Info, "loader", "loaded 3 tasks");

    EXPECT_TRUE(log.sink->contains(R"("component":"test","msg":"hello")"));
    EXPECT_TRUE(log.sink->contains(R"("component":"loader","msg":"loaded 3 tasks")"));
}

TEST(LoggerTest, SetLevelAtRuntime) {
    CapturedLogger log(LogLevel::Error);
    log.logger.info("dropped");
    log.logger.set_level(LogLevel::Info);
    log.logger.info("kept");

    EXPECT_EQ(log.logger.level(), LogLevel::Info);
    EXPECT_EQ(log.sink->lines().size(), 1u);
    EXPECT_TRUE(log.logger.enabled(LogLevel::Warn));
    EXPECT_FALSE(log.logger.enabled(LogLevel::Debug));
}

TEST(LoggerTest, MessagesAreEscaped) {
    CapturedLogger log(LogLevel::Info);
    log.logger.info("say \"hi\"\nnext");
    EXPECT_TRUE(log.sink->contains(R"(say \"hi\"\nnext)"));
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\\b"), "a\\\\b");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("WARN").has_value());
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(JsonFileSinkTest, RotatesWhenFull) {
    auto dir = std::filesystem::temp_directory_path() / "tp_test_logs";
    std::filesystem::remove_all(dir);
    {
        // 1 MB limit: write a little over 1 MB to force one rotation.
        JsonFileSink sink(dir, "planner", 1, 2);
        std::string line(1024, 'x');
        for (int i = 0; i < 1100; ++i) sink.write(line);
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir / "planner.ndjson");
    }
    EXPECT_TRUE(std::filesystem::exists(dir / "planner.ndjson"));
    EXPECT_TRUE(std::filesystem::exists(dir / "planner.1.ndjson"));
    EXPECT_FALSE(std::filesystem::exists(dir / "planner.2.ndjson"));
    std::filesystem::remove_all(dir);
}

class MetricsCollectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        metrics_ = std::make_unique<MetricsCollector>(std::move(sink));
    }

    MemorySink* sink_ = nullptr;
    std::unique_ptr<MetricsCollector> metrics_;
};

TEST_F(MetricsCollectorTest, EvaluationPassEvent) {
    EvaluationPassStats stats;
    stats.generation = 3;
    stats.tasks = 12;
    stats.next_actions = 4;
    stats.dangling_dependencies = 1;
    stats.duration = Duration{250};
    metrics_->record_evaluation_pass(stats);

    ASSERT_EQ(sink_->lines().size(), 1u);
    EXPECT_EQ(sink_->lines()[0],
              R"({"event":"evaluation_pass","generation":3,"tasks":12,"next_actions":4,)"
              R"("dangling_edges":1,"dependency_cycle":false,"duration_us":250})");
}

TEST_F(MetricsCollectorTest, CacheAndMutationEvents) {
    metrics_->record_cache_hit(2);
    metrics_->record_cache_invalidated(3, "set_status");
    metrics_->record_task_mutation("set_star", 42, false);
    metrics_->record_custom("demo", R"({"n":1})");

    auto lines = sink_->lines();
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], R"({"event":"cache_hit","generation":2})");
    EXPECT_EQ(lines[1], R"({"event":"cache_invalidated","generation":3,"reason":"set_status"})");
    EXPECT_EQ(lines[2], R"({"event":"task_mutation","command":"set_star","task":42,"ok":false})");
    EXPECT_EQ(lines[3], R"({"event":"demo","data":{"n":1}})");
}
