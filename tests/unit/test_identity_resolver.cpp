/**
 * @file test_identity_resolver.cpp
 * @brief Unit tests for canonical identity across mirrored blocks.
 */

#include "graph/identity_resolver.hpp"

#include "../test_support.hpp"

#include <gtest/gtest.h>

using namespace task_planner;
using namespace task_planner::test;

class IdentityResolverTest : public ::testing::Test {
protected:
    InMemoryBlockStore store_;
    TaskSchema schema_ = TaskSchema::for_locale("en");

    void SetUp() override {
        store_.add_block(task_block(schema_, 1, "source", default_task_values(schema_)));
        auto mirror = task_block(schema_, 2, "mirror", default_task_values(schema_));
        mirror.mirror_of = 1;
        store_.add_block(mirror);
    }
};

TEST_F(IdentityResolverTest, MirrorAndSourceShareCanonicalId) {
    std::vector<Block> working_set;
    IdentityResolver resolver(store_, working_set);
    EXPECT_EQ(resolver.canonical_id(1), 1);
    EXPECT_EQ(resolver.canonical_id(2), 1);
}

TEST_F(IdentityResolverTest, UnknownIdIsItsOwnCanonicalId) {
    std::vector<Block> working_set;
    IdentityResolver resolver(store_, working_set);
    EXPECT_EQ(resolver.canonical_id(404), 404);
}

TEST_F(IdentityResolverTest, WorkingSetResolvesBlocksMissingFromLiveState) {
    Block stale_mirror = plain_block(50, "stale");
    stale_mirror.mirror_of = 1;
    std::vector<Block> working_set{stale_mirror};

    IdentityResolver resolver(store_, working_set);
    EXPECT_EQ(resolver.canonical_id(50), 1);
}

TEST_F(IdentityResolverTest, PreferredBlockIsLiveState) {
    Block stale = plain_block(1, "stale copy");
    std::vector<Block> working_set{stale};
    IdentityResolver resolver(store_, working_set);

    auto preferred = resolver.preferred_block(1);
    ASSERT_TRUE(preferred.has_value());
    EXPECT_EQ(preferred->text, "source #Task");
}

TEST_F(IdentityResolverTest, PreferredBlockFallsBackToWorkingSet) {
    Block fetched = plain_block(70, "only fetched");
    std::vector<Block> working_set{fetched};
    IdentityResolver resolver(store_, working_set);

    auto preferred = resolver.preferred_block(70);
    ASSERT_TRUE(preferred.has_value());
    EXPECT_EQ(preferred->text, "only fetched");
    EXPECT_FALSE(resolver.preferred_block(71).has_value());
}
