/**
 * @file readiness.cpp
 * @brief Readiness evaluator implementation.
 */

#include "engine/readiness.hpp"

#include <algorithm>
#include <chrono>
#include <unordered_set>

namespace task_planner {

namespace {

/// The stamped completion instant; records written without one fall back to
/// the block's last modification.
std::optional<Timestamp> default_completion(const Task& task) {
    return task.completed_at ? task.completed_at : task.modified_at;
}

Timestamp add_hours(Timestamp t, double hours) {
    auto delta = std::chrono::duration_cast<Timestamp::duration>(
        std::chrono::duration<double, std::ratio<3600>>(hours));
    return t + delta;
}

/// Returns Unmet, Delayed or nothing for the task's dependency set.
std::optional<BlockedReason> dependency_reason(const TaskGraph& graph,
                                               const Task& task,
                                               Timestamp now,
                                               const CompletionLookup& completion) {
    const auto& prerequisites = graph.dependencies(task.id);
    if (prerequisites.empty()) {
        return std::nullopt;
    }

    std::vector<const Task*> done;
    size_t resolved = 0;
    for (auto id : prerequisites) {
        const auto* target = graph.find(id);
        if (target == nullptr) continue;
        ++resolved;
        if (target->status == TaskStatus::Done) {
            done.push_back(target);
        }
    }
    if (resolved == 0) {
        return std::nullopt;
    }

    bool satisfied = task.depends_mode == DependencyMode::All
        ? done.size() == resolved
        : !done.empty();
    if (!satisfied) {
        return BlockedReason::DependencyUnmet;
    }

    double delay = task.dependency_delay_hours.value_or(0.0);
    if (delay <= 0.0) {
        return std::nullopt;
    }

    // ALL waits on the latest completion, ANY on the earliest.
    std::optional<Timestamp> gate;
    for (const auto* target : done) {
        auto completed_at = completion ? completion(*target) : default_completion(*target);
        if (!completed_at) continue;
        if (!gate) {
            gate = completed_at;
        } else if (task.depends_mode == DependencyMode::All) {
            gate = std::max(*gate, *completed_at);
        } else {
            gate = std::min(*gate, *completed_at);
        }
    }
    if (gate && now < add_hours(*gate, delay)) {
        return BlockedReason::DependencyDelayed;
    }
    return std::nullopt;
}

/// Breadth-first over containment descendants; any open one blocks.
bool has_open_descendant(const TaskGraph& graph, const Task& task) {
    std::vector<TaskId> queue(task.children.begin(), task.children.end());
    std::unordered_set<TaskId> visited{task.id};

    for (size_t head = 0; head < queue.size(); ++head) {
        TaskId id = queue[head];
        if (!visited.insert(id).second) continue;

        const auto* child = graph.find(id);
        if (child == nullptr) continue;
        if (!is_closed(child->status)) return true;
        for (auto grandchild : child->children) {
            if (!visited.contains(grandchild)) queue.push_back(grandchild);
        }
    }
    return false;
}

}  // namespace

BlockedReasonSet local_reasons(const TaskGraph& graph,
                               const Task& task,
                               Timestamp now,
                               const CompletionLookup& completion) {
    // Terminal statuses are exclusive.
    if (task.status == TaskStatus::Done) {
        return BlockedReasonSet{BlockedReason::Completed};
    }
    if (task.status == TaskStatus::Canceled) {
        return BlockedReasonSet{BlockedReason::Canceled};
    }

    BlockedReasonSet reasons;
    if (task.start_time && *task.start_time > now) {
        reasons.insert(BlockedReason::NotStarted);
    }

    if (has_open_descendant(graph, task)) {
        reasons.insert(BlockedReason::HasOpenChildren);
    }

    if (auto reason = dependency_reason(graph, task, now, completion)) {
        reasons.insert(*reason);
    }
    return reasons;
}

std::unordered_map<TaskId, NextActionEvaluation>
evaluate_readiness(const TaskGraph& graph,
                   Timestamp now,
                   const CompletionLookup& completion) {
    std::unordered_map<TaskId, NextActionEvaluation> out;
    out.reserve(graph.task_count());

    // Per task: does it or any ancestor have unmet or delayed dependencies.
    // Kept apart from the reason sets so terminal ancestors still pass it on.
    std::unordered_map<TaskId, bool> chain_blocked;
    chain_blocked.reserve(graph.task_count());

    for (auto id : graph.containment_order()) {
        const auto* task = graph.find(id);
        if (task == nullptr) continue;

        NextActionEvaluation eval;
        eval.task_id = task->id;
        eval.text = task->text;
        eval.status = task->status;
        eval.end_time = task->end_time;
        eval.reasons = local_reasons(graph, *task, now, completion);

        bool terminal = eval.reasons.contains(BlockedReason::Completed)
                     || eval.reasons.contains(BlockedReason::Canceled);
        bool own_blocked = terminal
            ? dependency_reason(graph, *task, now, completion).has_value()
            : eval.reasons.contains(BlockedReason::DependencyUnmet)
              || eval.reasons.contains(BlockedReason::DependencyDelayed);

        // Parents come first in containment order; a parent left for the
        // tail of a malformed loop counts as unblocked.
        bool ancestor_blocked = false;
        if (task->parent) {
            auto parent = chain_blocked.find(*task->parent);
            ancestor_blocked = parent != chain_blocked.end() && parent->second;
        }
        if (!terminal && ancestor_blocked) {
            eval.reasons.insert(BlockedReason::AncestorDependencyUnmet);
        }
        chain_blocked[id] = own_blocked || ancestor_blocked;

        eval.is_next_action = eval.reasons.empty() && task->status != TaskStatus::Waiting;
        out.emplace(id, std::move(eval));
    }
    return out;
}

}  // namespace task_planner
