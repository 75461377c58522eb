/**
 * @file readiness.hpp
 * @brief Readiness evaluation: which tasks are next actions, and why not.
 */

#pragma once

#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace task_planner {

/**
 * @brief Per-task outcome of one evaluation pass.
 */
struct NextActionEvaluation {
    TaskId task_id = 0;
    std::string text;
    TaskStatus status = TaskStatus::Todo;
    std::optional<Timestamp> end_time;
    bool is_next_action = false;
    BlockedReasonSet reasons;
    double score = 0.0;

    [[nodiscard]] std::optional<BlockedReason> primary_reason() const {
        if (reasons.empty()) return std::nullopt;
        return reasons.primary();
    }
};

/// When a done task was completed; nullopt when unknown.
using CompletionLookup = std::function<std::optional<Timestamp>(const Task&)>;

/**
 * @brief Computes blocked reasons for every task in `graph`.
 *
 * Neighbor state is read from task status only, never from neighbor
 * readiness, so dependency cycles cannot recurse. Ancestor propagation walks
 * containment parents before children. Scores are left at zero.
 *
 * @param completion  Completion instant of a done prerequisite, used by the
 *                    dependency delay. Defaults to the task's completed_at,
 *                    then its modified_at.
 */
[[nodiscard]] std::unordered_map<TaskId, NextActionEvaluation>
evaluate_readiness(const TaskGraph& graph,
                   Timestamp now,
                   const CompletionLookup& completion = {});

/// Reasons derived from the task itself, its prerequisites and its
/// containment descendants (steps 1-4).
[[nodiscard]] BlockedReasonSet local_reasons(const TaskGraph& graph,
                                             const Task& task,
                                             Timestamp now,
                                             const CompletionLookup& completion);

}  // namespace task_planner
