/**
 * @file test_evaluation_cache.cpp
 * @brief Unit tests for EvaluationCache generations.
 */

#include "engine/evaluation_cache.hpp"

#include <gtest/gtest.h>

using namespace task_planner;

namespace {

std::shared_ptr<EvaluationSet> make_set(uint64_t generation) {
    auto set = std::make_shared<EvaluationSet>();
    set->generation = generation;
    NextActionEvaluation a;
    a.task_id = 7;
    a.is_next_action = true;
    NextActionEvaluation b;
    b.task_id = 9;
    b.reasons.insert(BlockedReason::NotStarted);
    set->evaluations = {a, b};
    set->build_index();
    return set;
}

}  // namespace

TEST(EvaluationCacheTest, EmptyUntilStored) {
    EvaluationCache cache;
    EXPECT_FALSE(cache.valid());
    EXPECT_EQ(cache.get(), nullptr);
    EXPECT_EQ(cache.generation(), 0u);
}

TEST(EvaluationCacheTest, StoreThenGetReturnsSameObject) {
    EvaluationCache cache;
    EvaluationSetPtr set = make_set(0);
    ASSERT_TRUE(cache.store(set));
    EXPECT_EQ(cache.get().get(), set.get());
    EXPECT_EQ(cache.get().get(), cache.get().get());
}

TEST(EvaluationCacheTest, InvalidateDropsAndBumpsGeneration) {
    EvaluationCache cache;
    ASSERT_TRUE(cache.store(make_set(0)));
    cache.invalidate();
    EXPECT_FALSE(cache.valid());
    EXPECT_EQ(cache.generation(), 1u);
}

TEST(EvaluationCacheTest, StaleGenerationIsRefused) {
    EvaluationCache cache;
    cache.invalidate();
    EXPECT_FALSE(cache.store(make_set(0)));
    EXPECT_FALSE(cache.valid());
    EXPECT_TRUE(cache.store(make_set(1)));
}

TEST(EvaluationCacheTest, NullSetIsRefused) {
    EvaluationCache cache;
    EXPECT_FALSE(cache.store(nullptr));
}

TEST(EvaluationSetTest, FindAndCount) {
    auto set = make_set(0);
    ASSERT_NE(set->find(9), nullptr);
    EXPECT_TRUE(set->find(9)->reasons.contains(BlockedReason::NotStarted));
    EXPECT_EQ(set->find(8), nullptr);
    EXPECT_EQ(set->next_action_count(), 1u);
}
