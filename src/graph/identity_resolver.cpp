/**
 * @file identity_resolver.cpp
 * @brief IdentityResolver implementation.
 */

#include "graph/identity_resolver.hpp"

namespace task_planner {

IdentityResolver::IdentityResolver(const IBlockSource& source,
                                   const std::vector<Block>& working_set)
    : source_(source) {
    working_set_.reserve(working_set.size());
    for (const auto& block : working_set) {
        working_set_.emplace(block.id, &block);
        if (block.mirror_of) {
            mirror_by_canonical_.emplace(*block.mirror_of, &block);
        }
    }
}

std::optional<BlockId> IdentityResolver::mirror_target(BlockId raw_id) const {
    if (auto live = source_.live_block(raw_id)) {
        return live->mirror_of;
    }
    if (auto it = working_set_.find(raw_id); it != working_set_.end()) {
        return it->second->mirror_of;
    }
    return std::nullopt;
}

TaskId IdentityResolver::canonical_id(BlockId raw_id) const {
    // Mirrors point at their source; a mirror of a mirror is not produced by
    // hosts, so a single hop is the full resolution.
    return mirror_target(raw_id).value_or(raw_id);
}

std::optional<Block> IdentityResolver::preferred_block(TaskId canonical) const {
    if (auto live = source_.live_block(canonical)) {
        return live;
    }
    if (auto it = working_set_.find(canonical); it != working_set_.end()) {
        return *it->second;
    }
    if (auto it = mirror_by_canonical_.find(canonical); it != mirror_by_canonical_.end()) {
        return *it->second;
    }
    return std::nullopt;
}

}  // namespace task_planner
