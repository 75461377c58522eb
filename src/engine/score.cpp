/**
 * @file score.cpp
 * @brief Priority scorer implementation.
 */

#include "engine/score.hpp"

#include <algorithm>
#include <cmath>

namespace task_planner {

namespace {

constexpr double kNeutral = 50.0;

constexpr double kDueNoDate = 45.0;
constexpr double kDueFloor = 35.0;
constexpr double kDueSpan = 65.0;
constexpr double kDueDecayDays = 4.0;

constexpr double kStartFloor = 10.0;
constexpr double kStartHorizonDays = 14.0;

constexpr double kContextStarred = 80.0;

constexpr double kFocusHoursPerDay = 3.0;
constexpr double kOverdueWindowDays = 7.0;
constexpr double kSlackWindowDays = 7.0;
constexpr double kAgingWindowDays = 14.0;

// Weights of the base combination and the boost factors.
constexpr double kWeightImportance = 0.40;
constexpr double kWeightUrgency = 0.22;
constexpr double kWeightDue = 0.20;
constexpr double kWeightStart = 0.10;
constexpr double kWeightContext = 0.08;

constexpr double kTimePenalty = 0.90;
constexpr double kCriticalBoost = 0.30;
constexpr double kDeadlineBoost = 0.25;
constexpr double kStartByBoost = 0.22;
constexpr double kAgingBoost = 0.12;

double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

double neutral(std::optional<double> v) {
    if (!v || !std::isfinite(*v)) return kNeutral;
    return std::clamp(*v, 0.0, 100.0);
}

double round3(double v) {
    return std::round(v * 1000.0) / 1000.0;
}

}  // namespace

double curve_score(std::optional<double> value, double exponent) {
    double centered = neutral(value) - kNeutral;
    if (centered == 0.0) return kNeutral;
    double magnitude = std::pow(std::abs(centered) / kNeutral, exponent) * kNeutral;
    return kNeutral + (centered > 0.0 ? magnitude : -magnitude);
}

double due_factor(const std::optional<Timestamp>& end_time, Timestamp now) {
    if (!end_time) return kDueNoDate;
    if (*end_time <= now) return 100.0;
    double days_until_due = days_between(now, *end_time);
    return kDueFloor + kDueSpan * std::exp(-days_until_due / kDueDecayDays);
}

double start_factor(const std::optional<Timestamp>& start_time, Timestamp now) {
    if (!start_time || *start_time <= now) return 100.0;
    double days_until_start = days_between(now, *start_time);
    if (days_until_start >= kStartHorizonDays) return kStartFloor;
    double t = 1.0 - days_until_start / kStartHorizonDays;
    return kStartFloor + (100.0 - kStartFloor) * t * t;
}

ScoreBreakdown score_breakdown(const Task& task,
                               Timestamp now,
                               const ScoreContext& context,
                               double status_multiplier) {
    ScoreBreakdown b;
    b.importance = curve_score(task.importance, kImportanceCurve);
    b.urgency = curve_score(task.urgency, kUrgencyCurve);
    b.effort_normalized = neutral(task.effort) / 100.0;
    b.due_factor = due_factor(task.end_time, now);
    b.start_factor = start_factor(task.start_time, now);
    b.context_factor = task.star ? kContextStarred : kNeutral;

    b.criticality = clamp01(0.6 * clamp01(context.dependency_descendants.value_or(0.0))
                          + 0.4 * clamp01(context.dependency_demand.value_or(0.0)));

    if (task.end_time) {
        double days_until_due = days_between(now, *task.end_time);
        if (days_until_due < 0.0) {
            b.overdue_normalized = clamp01(-days_until_due / kOverdueWindowDays);
        }
        // Effort maps to 0..24 hours of work done at kFocusHoursPerDay.
        double required_days = (b.effort_normalized * 24.0) / kFocusHoursPerDay;
        double slack = days_until_due - required_days - 1.0;
        b.start_by_pressure = clamp01(1.0 - slack / kSlackWindowDays);
    }

    if (context.waiting_days) {
        b.aging_normalized = clamp01(*context.waiting_days / kAgingWindowDays);
    }

    b.base = kWeightImportance * b.importance
           + kWeightUrgency * b.urgency
           + kWeightDue * b.due_factor
           + kWeightStart * b.start_factor
           + kWeightContext * b.context_factor;

    double boosted = b.base
        * (1.0 + kCriticalBoost * b.criticality)
        * (1.0 + kDeadlineBoost * b.overdue_normalized)
        * (1.0 + kStartByBoost * b.start_by_pressure)
        * (1.0 + kAgingBoost * b.aging_normalized);
    double raw = boosted / (1.0 + kTimePenalty * b.effort_normalized);

    b.multiplier = std::isfinite(status_multiplier) ? std::max(status_multiplier, 0.0) : 1.0;
    raw *= b.multiplier;
    if (!std::isfinite(raw)) raw = 0.0;
    b.score = round3(std::clamp(raw, 0.0, 100.0));
    return b;
}

double score_task(const Task& task,
                  Timestamp now,
                  const ScoreContext& context,
                  double status_multiplier) {
    return score_breakdown(task, now, context, status_multiplier).score;
}

}  // namespace task_planner
