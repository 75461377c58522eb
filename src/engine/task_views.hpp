/**
 * @file task_views.hpp
 * @brief Filtered views over one evaluation set.
 */

#pragma once

#include "engine/evaluation_cache.hpp"

#include <vector>

namespace task_planner {

/// Open starred tasks, score descending.
[[nodiscard]] std::vector<NextActionEvaluation> starred_tasks(const EvaluationSet& set);

/**
 * @brief Open tasks whose end time falls in [now, now + days].
 *
 * Overdue tasks (end time before now) are included only when
 * `include_overdue` is set. Sorted by end time, then id.
 */
[[nodiscard]] std::vector<NextActionEvaluation> due_soon(const EvaluationSet& set,
                                                         Timestamp now,
                                                         int days,
                                                         bool include_overdue);

/// Tasks in waiting status, score descending.
[[nodiscard]] std::vector<NextActionEvaluation> waiting_tasks(const EvaluationSet& set);

/// Tasks carrying `reason`, id ascending.
[[nodiscard]] std::vector<NextActionEvaluation> blocked_by(const EvaluationSet& set,
                                                           BlockedReason reason);

}  // namespace task_planner
