/**
 * @file score_context.hpp
 * @brief Graph-derived score inputs computed once per pass.
 */

#pragma once

#include "engine/score.hpp"
#include "graph/task_graph.hpp"

#include <unordered_map>

namespace task_planner {

/**
 * @brief Builds a ScoreContext for every task in `graph`.
 *
 * Descendants are the open tasks that transitively depend on a task; demand
 * counts direct open dependents. Both are divided by the pass maximum.
 * Waiting tasks get `waiting_days` from waiting_since, else modified_at.
 */
[[nodiscard]] std::unordered_map<TaskId, ScoreContext>
build_score_contexts(const TaskGraph& graph, Timestamp now);

/// Open tasks reachable through reverse dependency edges. Cycle-safe.
/// One DFS per call; use dependency_descendant_counts for a whole pass.
[[nodiscard]] size_t count_dependency_descendants(const TaskGraph& graph, TaskId id);

/**
 * @brief count_dependency_descendants for every task at once.
 *
 * Collapses dependency cycles into strongly connected components (Tarjan),
 * then unions reachable open-task bitsets once per component in reverse
 * topological order: O((n + e) * n / 64) instead of a DFS per task.
 */
[[nodiscard]] std::unordered_map<TaskId, size_t>
dependency_descendant_counts(const TaskGraph& graph);

}  // namespace task_planner
