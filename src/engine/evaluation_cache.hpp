/**
 * @file evaluation_cache.hpp
 * @brief One generation of evaluation results, held until invalidated.
 */

#pragma once

#include "engine/readiness.hpp"
#include "graph/task_graph.hpp"
#include "graph/task_loader.hpp"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

namespace task_planner {

/**
 * @brief Immutable result of one full pass (load, readiness, score).
 */
struct EvaluationSet {
    uint64_t generation = 0;
    Timestamp evaluated_at{};
    std::vector<NextActionEvaluation> evaluations;   ///< Task id ascending
    TaskGraph graph;
    LoadStats load_stats;
    bool dependency_cycle = false;

    [[nodiscard]] const NextActionEvaluation* find(TaskId id) const;
    [[nodiscard]] size_t next_action_count() const;

    /// Rebuilds the id → position index after `evaluations` is filled.
    void build_index();

private:
    std::unordered_map<TaskId, size_t> index_;
};

using EvaluationSetPtr = std::shared_ptr<const EvaluationSet>;

/**
 * @brief Holds the latest EvaluationSet.
 *
 * Every invalidation bumps the generation. A set computed under an older
 * generation is refused by `store`, so a stale pass can never be served.
 * Sequential use only.
 */
class EvaluationCache {
public:
    /// The cached set, or null when nothing valid is held.
    [[nodiscard]] EvaluationSetPtr get() const noexcept { return current_; }
    [[nodiscard]] bool valid() const noexcept { return current_ != nullptr; }

    /// Stores `set` if it was computed under the current generation.
    bool store(EvaluationSetPtr set);

    void invalidate() noexcept;

    [[nodiscard]] uint64_t generation() const noexcept { return generation_; }

private:
    EvaluationSetPtr current_;
    uint64_t generation_{0};
};

}  // namespace task_planner
