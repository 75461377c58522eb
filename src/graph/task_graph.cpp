/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation.
 *
 * Kahn's algorithm over containment for parent-first ordering and an
 * iterative three-colour DFS for dependency cycle detection. Both are
 * O(V+E) over the internal adjacency maps.
 */

#include "graph/task_graph.hpp"

#include <algorithm>
#include <queue>
#include <stack>

namespace task_planner {

namespace {

const std::vector<TaskId>& empty_ids() {
    static const std::vector<TaskId> kEmpty;
    return kEmpty;
}

}  // namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TaskId TaskGraph::add_task(Task task) {
    TaskId id = task.id;
    if (auto it = index_.find(id); it != index_.end()) {
        tasks_[it->second] = std::move(task);
        return id;
    }
    index_.emplace(id, tasks_.size());
    tasks_.push_back(std::move(task));
    return id;
}

void TaskGraph::add_dependency(TaskId dependent, TaskId prerequisite) {
    auto& prereqs = prerequisites_[dependent];
    if (std::find(prereqs.begin(), prereqs.end(), prerequisite) != prereqs.end()) {
        return;
    }
    prereqs.push_back(prerequisite);
    dependents_[prerequisite].push_back(dependent);
    ++edge_count_;
}

void TaskGraph::set_parent(TaskId child, TaskId parent) {
    auto child_it = index_.find(child);
    auto parent_it = index_.find(parent);
    if (child_it == index_.end() || parent_it == index_.end() || child == parent) return;

    auto& child_task = tasks_[child_it->second];
    if (child_task.parent && *child_task.parent != parent) {
        if (auto old = index_.find(*child_task.parent); old != index_.end()) {
            std::erase(tasks_[old->second].children, child);
        }
    }
    child_task.parent = parent;

    auto& siblings = tasks_[parent_it->second].children;
    if (std::find(siblings.begin(), siblings.end(), child) == siblings.end()) {
        siblings.push_back(child);
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

const Task* TaskGraph::find(TaskId id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &tasks_[it->second];
}

const std::vector<TaskId>& TaskGraph::dependencies(TaskId id) const {
    auto it = prerequisites_.find(id);
    return it == prerequisites_.end() ? empty_ids() : it->second;
}

const std::vector<TaskId>& TaskGraph::dependents(TaskId id) const {
    auto it = dependents_.find(id);
    return it == dependents_.end() ? empty_ids() : it->second;
}

std::vector<TaskId> TaskGraph::containment_order() const {
    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    std::queue<TaskId> ready;
    for (const auto& task : tasks_) {
        if (!task.parent || !contains(*task.parent)) {
            ready.push(task.id);
        }
    }

    std::unordered_map<TaskId, bool> emitted;
    while (!ready.empty()) {
        auto current = ready.front();
        ready.pop();
        if (emitted[current]) continue;
        emitted[current] = true;
        order.push_back(current);

        if (const auto* task = find(current)) {
            for (auto child : task->children) {
                const auto* child_task = find(child);
                if (child_task && child_task->parent == current) {
                    ready.push(child);
                }
            }
        }
    }

    // Anything left sits on a containment loop; keep it evaluable.
    if (order.size() != tasks_.size()) {
        for (const auto& task : tasks_) {
            if (!emitted[task.id]) order.push_back(task.id);
        }
    }
    return order;
}

bool TaskGraph::has_dependency_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::unordered_map<TaskId, Color> color;
    for (const auto& task : tasks_) {
        color[task.id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& start : tasks_) {
        if (color[start.id] != Color::White) continue;

        std::stack<Frame> dfs_stack;
        dfs_stack.push({start.id, 0});
        color[start.id] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& [node, idx] = dfs_stack.top();
            const auto& next = dependencies(node);

            if (idx >= next.size()) {
                color[node] = Color::Black;
                dfs_stack.pop();
                continue;
            }

            auto neighbor = next[idx];
            ++idx;

            if (color[neighbor] == Color::Gray) {
                return true;
            }
            if (color[neighbor] == Color::White) {
                color[neighbor] = Color::Gray;
                dfs_stack.push({neighbor, 0});
            }
        }
    }
    return false;
}

}  // namespace task_planner
