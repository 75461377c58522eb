/**
 * @file task_graph.hpp
 * @brief Arena of Task records with containment and dependency adjacency.
 *
 * Rebuilt from scratch on every loader pass and never mutated afterwards.
 * Two independent relations are kept side by side, both keyed by canonical
 * task id: containment (parent/children, acyclic in well-formed outlines)
 * and dependency (dependsOn, may contain cycles).
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace task_planner {

/**
 * @brief One logical task as seen by a single evaluation pass.
 */
struct Task {
    TaskId id = 0;
    BlockId source_block_id = 0;        ///< Physical record the values came from
    std::string text;
    std::string status_label;
    TaskStatus status = TaskStatus::Todo;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    std::optional<double> importance;
    std::optional<double> urgency;
    std::optional<double> effort;
    bool star = false;
    std::vector<std::string> labels;
    std::string remark;
    std::vector<TaskId> depends_on;     ///< Canonical targets, de-duplicated, may dangle
    DependencyMode depends_mode = DependencyMode::All;
    std::optional<double> dependency_delay_hours;
    std::optional<TaskId> parent;
    std::vector<TaskId> children;
    std::optional<Timestamp> modified_at;
    std::optional<Timestamp> completed_at;
    std::optional<Timestamp> waiting_since;
};

class TaskGraph {
public:
    TaskGraph() = default;

    // ── Construction ──────────────────────────
    /// Adds a task; a second task with the same id replaces the first.
    TaskId add_task(Task task);
    /// `dependent` waits on `prerequisite`. Duplicate edges are ignored.
    void add_dependency(TaskId dependent, TaskId prerequisite);
    /// Records containment; both ends must already be tasks.
    void set_parent(TaskId child, TaskId parent);

    // ── Queries ───────────────────────────────
    [[nodiscard]] const Task* find(TaskId id) const;
    [[nodiscard]] bool contains(TaskId id) const { return index_.contains(id); }
    [[nodiscard]] const std::vector<Task>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }
    [[nodiscard]] size_t dependency_edge_count() const noexcept { return edge_count_; }

    /// Resolved prerequisites of `id`, in dependsOn order.
    [[nodiscard]] const std::vector<TaskId>& dependencies(TaskId id) const;
    /// Tasks that list `id` as a prerequisite.
    [[nodiscard]] const std::vector<TaskId>& dependents(TaskId id) const;

    /// Every task, each parent before its children. Tasks caught in a
    /// malformed containment loop are appended at the end.
    [[nodiscard]] std::vector<TaskId> containment_order() const;

    /// DFS cycle check over dependency edges.
    [[nodiscard]] bool has_dependency_cycle() const;

private:
    std::vector<Task> tasks_;
    std::unordered_map<TaskId, size_t> index_;
    std::unordered_map<TaskId, std::vector<TaskId>> prerequisites_;   // dependent → prerequisites
    std::unordered_map<TaskId, std::vector<TaskId>> dependents_;      // prerequisite → dependents
    size_t edge_count_{0};
};

}  // namespace task_planner
