/**
 * @file evaluation_cache.cpp
 * @brief EvaluationSet and EvaluationCache implementation.
 */

#include "engine/evaluation_cache.hpp"

#include <algorithm>

namespace task_planner {

const NextActionEvaluation* EvaluationSet::find(TaskId id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &evaluations[it->second];
}

size_t EvaluationSet::next_action_count() const {
    return static_cast<size_t>(std::count_if(evaluations.begin(), evaluations.end(),
        [](const NextActionEvaluation& e) { return e.is_next_action; }));
}

void EvaluationSet::build_index() {
    index_.clear();
    index_.reserve(evaluations.size());
    for (size_t i = 0; i < evaluations.size(); ++i) {
        index_[evaluations[i].task_id] = i;
    }
}

bool EvaluationCache::store(EvaluationSetPtr set) {
    if (!set || set->generation != generation_) {
        return false;
    }
    current_ = std::move(set);
    return true;
}

void EvaluationCache::invalidate() noexcept {
    current_.reset();
    ++generation_;
}

}  // namespace task_planner
