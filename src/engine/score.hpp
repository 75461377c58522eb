/**
 * @file score.hpp
 * @brief Deterministic 0-100 priority score.
 */

#pragma once

#include "core/types.hpp"
#include "graph/task_graph.hpp"

#include <optional>

namespace task_planner {

/**
 * @brief Graph-derived inputs. The caller normalizes descendants and demand
 *        to [0, 1].
 */
struct ScoreContext {
    std::optional<double> dependency_descendants;
    std::optional<double> dependency_demand;
    std::optional<double> waiting_days;
};

/**
 * @brief Sub-factors of one score, exposed for inspection and tests.
 */
struct ScoreBreakdown {
    double importance = 50.0;
    double urgency = 50.0;
    double effort_normalized = 0.5;
    double due_factor = 45.0;
    double start_factor = 100.0;
    double context_factor = 50.0;
    double criticality = 0.0;
    double overdue_normalized = 0.0;
    double start_by_pressure = 0.0;
    double aging_normalized = 0.0;
    double base = 0.0;
    double multiplier = 1.0;
    double score = 0.0;
};

inline constexpr double kImportanceCurve = 1.25;
inline constexpr double kUrgencyCurve = 1.15;
inline constexpr double kWaitingMultiplier = 0.6;

/// `50 + sign(v-50) * (|v-50|/50)^p * 50`. Missing values read as 50.
[[nodiscard]] double curve_score(std::optional<double> value, double exponent);

[[nodiscard]] double due_factor(const std::optional<Timestamp>& end_time, Timestamp now);
[[nodiscard]] double start_factor(const std::optional<Timestamp>& start_time, Timestamp now);

/// Full factor breakdown for `task` at `now`.
[[nodiscard]] ScoreBreakdown score_breakdown(const Task& task,
                                             Timestamp now,
                                             const ScoreContext& context = {},
                                             double status_multiplier = 1.0);

/**
 * @brief Score in [0, 100] rounded to 3 decimals.
 *
 * @param status_multiplier  Applied after the combination and before the
 *                           clamp; 0.6 ranks waiting tasks below ready ones.
 */
[[nodiscard]] double score_task(const Task& task,
                                Timestamp now,
                                const ScoreContext& context = {},
                                double status_multiplier = 1.0);

}  // namespace task_planner
