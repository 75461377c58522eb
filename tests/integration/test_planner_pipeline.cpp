/**
 * @file test_planner_pipeline.cpp
 * @brief Integration tests running a snapshot outline through the full
 *        read pipeline: config → snapshot → engine → views.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "engine/next_action_engine.hpp"
#include "engine/task_views.hpp"
#include "host/in_memory_store.hpp"
#include "host/snapshot_loader.hpp"
#include "schema/task_schema.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

using namespace task_planner;

namespace {

constexpr const char* kConfig = R"(
[schema]
tag_alias = "#Task"
locale = "en"

[engine]
waiting_multiplier = 0.6

[views]
due_soon_days = 3

[logging]
level = "debug"
)";

// Launch project: design is done, build waits a day after it, test waits on
// build and has its own subtask. A mirror of "Order cake" sits elsewhere.
constexpr const char* kOutline = R"(
[[block]]
id = 1
text = "Launch"

[[block]]
id = 2
text = "Design #Task"
parent = 1
modified_at = 2024-04-30T12:00:00Z
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  Status = "Done"

[[block]]
id = 3
text = "Build #Task"
parent = 1
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  "Depends on" = [2]
  "Dependency delay" = 24

[[block]]
id = 4
text = "Test #Task"
parent = 1
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  "Depends on" = [3]

[[block]]
id = 5
text = "Write test plan #Task"
parent = 4
  [[block.tag]]
  alias = "Task"

[[block]]
id = 6
text = "Order cake #Task"
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  Star = true
  Importance = 70
  "End time" = 2024-05-03

[[block]]
id = 7
text = "Await vendor quote #Task"
modified_at = 2024-04-26T00:00:00Z
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  Status = "Waiting"

[[block]]
id = 8
text = "Old idea #Task"
  [[block.tag]]
  alias = "Task"
  [block.tag.properties]
  Status = "Canceled"

[[block]]
id = 9
text = "Order cake #Task"
mirror_of = 6
  [[block.tag]]
  alias = "Task"
)";

Timestamp at(int day, int hour) {
    using namespace std::chrono;
    return sys_days{year{2024} / May / day} + hours{hour};
}

}  // namespace

class PlannerPipeline : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = parse_config(kConfig);
        ASSERT_TRUE(config.has_value()) << config.error().message;
        config_ = *config;

        auto loaded = parse_snapshot(kOutline, store_);
        ASSERT_TRUE(loaded.has_value()) << loaded.error().message;

        auto sink = std::make_unique<MemorySink>();
        log_sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
        metrics_ = std::make_unique<MetricsCollector>(std::make_unique<NullSink>());

        NextActionEngineOptions options;
        options.waiting_multiplier = config_.engine.waiting_multiplier;
        options.cache_enabled = config_.engine.cache_enabled;
        options.clock = [this] { return now_; };
        engine_ = std::make_unique<NextActionEngine>(
            store_, TaskSchema::from_config(config_.schema), *logger_, options, metrics_.get());
    }

    const NextActionEvaluation& eval(const EvaluationSet& set, TaskId id) {
        const auto* found = set.find(id);
        EXPECT_NE(found, nullptr) << "task " << id;
        return *found;
    }

    std::vector<TaskId> next_ids() {
        auto actions = engine_->collect_next_actions();
        EXPECT_TRUE(actions.has_value());
        std::vector<TaskId> ids;
        for (const auto& item : *actions) ids.push_back(item.task.id);
        return ids;
    }

    Timestamp now_ = at(1, 0);
    Config config_;
    InMemoryBlockStore store_{[this] { return now_; }};
    MemorySink* log_sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<MetricsCollector> metrics_;
    std::unique_ptr<NextActionEngine> engine_;
};

TEST_F(PlannerPipeline, EvaluatesOutline) {
    auto result = engine_->collect_next_action_evaluations();
    ASSERT_TRUE(result.has_value());
    const auto& set = **result;

    // The mirror collapses onto its source.
    EXPECT_EQ(set.evaluations.size(), 7u);
    EXPECT_EQ(set.load_stats.merged_duplicates, 1u);
    EXPECT_FALSE(set.dependency_cycle);

    EXPECT_EQ(eval(set, 2).reasons, (BlockedReasonSet{BlockedReason::Completed}));
    EXPECT_EQ(eval(set, 3).reasons, (BlockedReasonSet{BlockedReason::DependencyDelayed}));
    EXPECT_EQ(eval(set, 4).reasons, (BlockedReasonSet{BlockedReason::DependencyUnmet,
                                                      BlockedReason::HasOpenChildren}));
    EXPECT_EQ(eval(set, 5).reasons, (BlockedReasonSet{BlockedReason::AncestorDependencyUnmet}));
    EXPECT_EQ(eval(set, 8).reasons, (BlockedReasonSet{BlockedReason::Canceled}));
    EXPECT_TRUE(eval(set, 7).reasons.empty());
    EXPECT_FALSE(eval(set, 7).is_next_action);

    EXPECT_EQ(next_ids(), (std::vector<TaskId>{6}));
}

TEST_F(PlannerPipeline, ViewsOverOnePass) {
    auto result = engine_->collect_next_action_evaluations();
    ASSERT_TRUE(result.has_value());
    const auto& set = **result;

    auto due = due_soon(set, set.evaluated_at, static_cast<int>(config_.views.due_soon_days),
                        config_.views.due_soon_include_overdue);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].task_id, 6);

    auto starred = starred_tasks(set);
    ASSERT_EQ(starred.size(), 1u);
    EXPECT_EQ(starred[0].task_id, 6);

    auto waiting = waiting_tasks(set);
    ASSERT_EQ(waiting.size(), 1u);
    EXPECT_EQ(waiting[0].task_id, 7);
    EXPECT_GT(waiting[0].score, 0.0);

    auto delayed = blocked_by(set, BlockedReason::DependencyDelayed);
    ASSERT_EQ(delayed.size(), 1u);
    EXPECT_EQ(delayed[0].task_id, 3);
}

TEST_F(PlannerPipeline, DelayElapsesThenWorkFlowsDown) {
    EXPECT_EQ(next_ids(), (std::vector<TaskId>{6}));

    // Reads are cached: moving the clock alone changes nothing.
    now_ = at(1, 13);
    EXPECT_EQ(next_ids(), (std::vector<TaskId>{6}));

    engine_->invalidate_next_action_evaluation_cache("clock advanced");
    auto ready = next_ids();
    EXPECT_NE(std::find(ready.begin(), ready.end(), 3), ready.end());

    ASSERT_TRUE(engine_->set_status(3, TaskStatus::Done).has_value());

    auto result = engine_->collect_next_action_evaluations();
    ASSERT_TRUE(result.has_value());
    const auto& set = **result;
    EXPECT_EQ(eval(set, 3).reasons, (BlockedReasonSet{BlockedReason::Completed}));
    EXPECT_EQ(eval(set, 4).reasons, (BlockedReasonSet{BlockedReason::HasOpenChildren}));
    EXPECT_TRUE(eval(set, 5).is_next_action);

    ASSERT_TRUE(engine_->set_status(5, TaskStatus::Done).has_value());
    ready = next_ids();
    EXPECT_NE(std::find(ready.begin(), ready.end(), 4), ready.end());
}

TEST_F(PlannerPipeline, CommandThroughMirrorReachesSource) {
    ASSERT_TRUE(engine_->set_star(9, false).has_value());

    auto result = engine_->collect_next_action_evaluations();
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(starred_tasks(**result).empty());
    EXPECT_TRUE(log_sink_->contains("evaluation pass: 7 tasks"));
}
