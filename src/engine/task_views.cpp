/**
 * @file task_views.cpp
 * @brief Task view filters.
 */

#include "engine/task_views.hpp"

#include <algorithm>
#include <chrono>

namespace task_planner {

namespace {

void sort_by_score(std::vector<NextActionEvaluation>& items) {
    std::sort(items.begin(), items.end(),
              [](const NextActionEvaluation& a, const NextActionEvaluation& b) {
                  if (a.score != b.score) return a.score > b.score;
                  return a.task_id < b.task_id;
              });
}

}  // namespace

std::vector<NextActionEvaluation> starred_tasks(const EvaluationSet& set) {
    std::vector<NextActionEvaluation> out;
    for (const auto& eval : set.evaluations) {
        const auto* task = set.graph.find(eval.task_id);
        if (task != nullptr && task->star && !is_closed(eval.status)) {
            out.push_back(eval);
        }
    }
    sort_by_score(out);
    return out;
}

std::vector<NextActionEvaluation> due_soon(const EvaluationSet& set,
                                           Timestamp now,
                                           int days,
                                           bool include_overdue) {
    auto horizon = now + std::chrono::hours(24) * std::max(days, 0);

    std::vector<NextActionEvaluation> out;
    for (const auto& eval : set.evaluations) {
        if (!eval.end_time || is_closed(eval.status)) continue;
        bool overdue = *eval.end_time < now;
        if (overdue ? include_overdue : *eval.end_time <= horizon) {
            out.push_back(eval);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const NextActionEvaluation& a, const NextActionEvaluation& b) {
                  if (*a.end_time != *b.end_time) return *a.end_time < *b.end_time;
                  return a.task_id < b.task_id;
              });
    return out;
}

std::vector<NextActionEvaluation> waiting_tasks(const EvaluationSet& set) {
    std::vector<NextActionEvaluation> out;
    for (const auto& eval : set.evaluations) {
        if (eval.status == TaskStatus::Waiting) {
            out.push_back(eval);
        }
    }
    sort_by_score(out);
    return out;
}

std::vector<NextActionEvaluation> blocked_by(const EvaluationSet& set, BlockedReason reason) {
    std::vector<NextActionEvaluation> out;
    for (const auto& eval : set.evaluations) {
        if (eval.reasons.contains(reason)) {
            out.push_back(eval);
        }
    }
    return out;
}

}  // namespace task_planner
