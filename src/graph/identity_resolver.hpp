/**
 * @file identity_resolver.hpp
 * @brief Canonical task identity across mirrored block records.
 */

#pragma once

#include "host/block_source.hpp"

#include <unordered_map>
#include <vector>

namespace task_planner {

/**
 * @brief Maps any physical block id to its logical task id.
 *
 * A mirror block resolves to the block it mirrors. Lookups consult the
 * host's live state first and fall back to the fetched working set.
 * Unknown ids are their own canonical id. Pure lookup, never fails.
 */
class IdentityResolver {
public:
    IdentityResolver(const IBlockSource& source, const std::vector<Block>& working_set);

    [[nodiscard]] TaskId canonical_id(BlockId raw_id) const;

    /// The block that should be read for a canonical id: live first, then
    /// the working-set record with that id, then any mirror of it.
    [[nodiscard]] std::optional<Block> preferred_block(TaskId canonical) const;

private:
    [[nodiscard]] std::optional<BlockId> mirror_target(BlockId raw_id) const;

    const IBlockSource& source_;
    std::unordered_map<BlockId, const Block*> working_set_;
    std::unordered_map<TaskId, const Block*> mirror_by_canonical_;
};

}  // namespace task_planner
