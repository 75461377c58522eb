/**
 * @file score_context.cpp
 * @brief Score context builder.
 */

#include "engine/score_context.hpp"

#include <algorithm>
#include <bit>
#include <cstdint>
#include <unordered_set>

namespace task_planner {

namespace {

bool is_open(const TaskGraph& graph, TaskId id) {
    const auto* task = graph.find(id);
    return task != nullptr && !is_closed(task->status);
}

}  // namespace

size_t count_dependency_descendants(const TaskGraph& graph, TaskId id) {
    std::unordered_set<TaskId> visited{id};
    std::vector<TaskId> stack{id};
    size_t count = 0;

    while (!stack.empty()) {
        TaskId current = stack.back();
        stack.pop_back();
        for (auto dependent : graph.dependents(current)) {
            if (!visited.insert(dependent).second) continue;
            if (is_open(graph, dependent)) ++count;
            stack.push_back(dependent);
        }
    }
    return count;
}

std::unordered_map<TaskId, size_t> dependency_descendant_counts(const TaskGraph& graph) {
    const auto& tasks = graph.tasks();
    const size_t n = tasks.size();
    constexpr size_t kUnvisited = static_cast<size_t>(-1);

    std::unordered_map<TaskId, size_t> index;
    index.reserve(n);
    for (size_t i = 0; i < n; ++i) index.emplace(tasks[i].id, i);

    // ── Tarjan SCC over task -> dependent edges (iterative) ──
    // Components come out in reverse topological order: every component
    // reachable from C is numbered before C.
    std::vector<size_t> order(n, kUnvisited);
    std::vector<size_t> low(n, 0);
    std::vector<size_t> comp(n, kUnvisited);
    std::vector<bool> on_stack(n, false);
    std::vector<size_t> stack;
    size_t counter = 0;
    size_t comp_count = 0;

    struct Frame {
        size_t node;
        size_t edge;
    };

    for (size_t root = 0; root < n; ++root) {
        if (order[root] != kUnvisited) continue;

        std::vector<Frame> frames{{root, 0}};
        order[root] = low[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!frames.empty()) {
            auto& frame = frames.back();
            const auto& out = graph.dependents(tasks[frame.node].id);
            if (frame.edge < out.size()) {
                auto it = index.find(out[frame.edge++]);
                if (it == index.end()) continue;
                size_t next = it->second;
                if (order[next] == kUnvisited) {
                    order[next] = low[next] = counter++;
                    stack.push_back(next);
                    on_stack[next] = true;
                    frames.push_back({next, 0});
                } else if (on_stack[next]) {
                    low[frame.node] = std::min(low[frame.node], order[next]);
                }
                continue;
            }

            size_t node = frame.node;
            frames.pop_back();
            if (!frames.empty()) {
                auto& parent = frames.back().node;
                low[parent] = std::min(low[parent], low[node]);
            }
            if (low[node] == order[node]) {
                size_t member = kUnvisited;
                do {
                    member = stack.back();
                    stack.pop_back();
                    on_stack[member] = false;
                    comp[member] = comp_count;
                } while (member != node);
                ++comp_count;
            }
        }
    }

    // ── Reachable open tasks per component ──
    const size_t words = (n + 63) / 64;
    std::vector<std::vector<size_t>> members(comp_count);
    std::vector<std::vector<uint64_t>> own(comp_count, std::vector<uint64_t>(words, 0));
    std::vector<size_t> open_in(comp_count, 0);
    for (size_t i = 0; i < n; ++i) {
        members[comp[i]].push_back(i);
        if (!is_closed(tasks[i].status)) {
            own[comp[i]][i / 64] |= uint64_t{1} << (i % 64);
            ++open_in[comp[i]];
        }
    }

    std::vector<std::vector<uint64_t>> reach(comp_count, std::vector<uint64_t>(words, 0));
    for (size_t c = 0; c < comp_count; ++c) {
        for (auto m : members[c]) {
            for (auto dependent : graph.dependents(tasks[m].id)) {
                auto it = index.find(dependent);
                if (it == index.end()) continue;
                size_t d = comp[it->second];
                if (d == c) continue;
                for (size_t w = 0; w < words; ++w) {
                    reach[c][w] |= reach[d][w] | own[d][w];
                }
            }
        }
    }

    std::unordered_map<TaskId, size_t> counts;
    counts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t c = comp[i];
        size_t reachable = 0;
        for (auto word : reach[c]) reachable += static_cast<size_t>(std::popcount(word));
        // Other open members of a cycle reach this task and each other.
        size_t same_component = open_in[c] - (is_closed(tasks[i].status) ? 0 : 1);
        counts.emplace(tasks[i].id, reachable + same_component);
    }
    return counts;
}

std::unordered_map<TaskId, ScoreContext>
build_score_contexts(const TaskGraph& graph, Timestamp now) {
    auto descendants = dependency_descendant_counts(graph);
    std::unordered_map<TaskId, size_t> demand;
    size_t max_descendants = 0;
    size_t max_demand = 0;

    for (const auto& task : graph.tasks()) {
        size_t d = descendants[task.id];
        const auto& direct = graph.dependents(task.id);
        size_t m = static_cast<size_t>(std::count_if(direct.begin(), direct.end(),
            [&](TaskId dep) { return is_open(graph, dep); }));
        demand[task.id] = m;
        max_descendants = std::max(max_descendants, d);
        max_demand = std::max(max_demand, m);
    }

    std::unordered_map<TaskId, ScoreContext> out;
    out.reserve(graph.task_count());
    for (const auto& task : graph.tasks()) {
        ScoreContext ctx;
        if (max_descendants > 0) {
            ctx.dependency_descendants =
                static_cast<double>(descendants[task.id]) / static_cast<double>(max_descendants);
        }
        if (max_demand > 0) {
            ctx.dependency_demand =
                static_cast<double>(demand[task.id]) / static_cast<double>(max_demand);
        }
        auto since = task.waiting_since ? task.waiting_since : task.modified_at;
        if (task.status == TaskStatus::Waiting && since) {
            ctx.waiting_days = std::max(0.0, days_between(*since, now));
        }
        out.emplace(task.id, ctx);
    }
    return out;
}

}  // namespace task_planner
