/**
 * @file next_action_engine.hpp
 * @brief Planner facade: cached evaluation reads and task mutation commands.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "engine/evaluation_cache.hpp"
#include "engine/score.hpp"
#include "host/block_source.hpp"
#include "schema/task_properties.hpp"
#include "schema/task_schema.hpp"
#include "telemetry/metrics_collector.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace task_planner {

/**
 * @brief An actionable task with its score, as returned by collect_next_actions.
 */
struct NextActionItem {
    Task task;
    double score = 0.0;
};

struct NextActionEngineOptions {
    double waiting_multiplier = kWaitingMultiplier;
    bool cache_enabled = true;
    std::function<Timestamp()> clock;   ///< Defaults to system_clock::now
};

/**
 * @brief Owns the evaluation cache over one host store.
 *
 * Reads return the cached pass until something invalidates it. Every
 * command goes through a single write path that resolves the task, writes
 * to the store and invalidates the cache before returning, so a reader
 * never observes a pass older than the last successful command.
 */
class NextActionEngine {
public:
    NextActionEngine(IBlockStore& store,
                     TaskSchema schema,
                     Logger& logger,
                     NextActionEngineOptions options = {},
                     MetricsCollector* metrics = nullptr);

    // ── Reads ─────────────────────────────────
    /// Every task with readiness and score. Fails only when the fetch fails.
    [[nodiscard]] Result<EvaluationSetPtr> collect_next_action_evaluations();

    /// Actionable tasks, score descending then id ascending.
    [[nodiscard]] Result<std::vector<NextActionItem>> collect_next_actions();

    /// Every task in containment order (parents first).
    [[nodiscard]] Result<std::vector<Task>> collect_all_tasks();

    void invalidate_next_action_evaluation_cache(std::string_view reason = "manual");

    // ── Commands ──────────────────────────────
    Result<void> set_status(BlockId id, TaskStatus status);
    /// Advances todo → doing → done → todo. Returns the new status.
    Result<TaskStatus> cycle_status(BlockId id);
    Result<void> set_star(BlockId id, bool star);
    Result<void> set_dependencies(BlockId id,
                                  const std::vector<BlockId>& depends_on,
                                  DependencyMode mode,
                                  std::optional<double> delay_hours);
    Result<void> set_schedule(BlockId id,
                              std::optional<Timestamp> start_time,
                              std::optional<Timestamp> end_time);
    Result<void> set_priority(BlockId id,
                              std::optional<double> importance,
                              std::optional<double> urgency,
                              std::optional<double> effort);
    /// New tagged child block under a task. Returns the new id.
    Result<BlockId> add_subtask(BlockId parent_id, std::string text);
    Result<void> remove_task_tag(BlockId id);
    Result<void> move_task(BlockId id, std::optional<BlockId> new_parent);

    // ── Accessors ─────────────────────────────
    [[nodiscard]] const TaskSchema& schema() const noexcept { return schema_; }
    [[nodiscard]] Timestamp now() const;
    [[nodiscard]] uint64_t cache_generation() const noexcept { return cache_.generation(); }

private:
    using Mutation = std::function<Result<void>(TaskId id, TaskPropertyValues& values)>;

    [[nodiscard]] Result<EvaluationSetPtr> run_pass();

    /// Canonical id of a live, tagged task block, or NotFound.
    [[nodiscard]] Result<TaskId> resolve_task(BlockId id) const;
    [[nodiscard]] TaskPropertyValues read_values(TaskId id) const;

    /// The single write path: resolve, mutate, write back, invalidate.
    Result<void> update_task(std::string_view command, BlockId id, const Mutation& mutate);
    /// Same choke point for commands that change structure, not properties.
    Result<void> apply_command(std::string_view command,
                               BlockId id,
                               const std::function<Result<void>(TaskId)>& action);

    IBlockStore& store_;
    TaskSchema schema_;
    Logger& logger_;
    NextActionEngineOptions options_;
    MetricsCollector* metrics_;
    EvaluationCache cache_;
};

}  // namespace task_planner
