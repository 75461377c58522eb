/**
 * @file block_source.hpp
 * @brief Host collaborator interfaces consumed by the planner.
 */

#pragma once

#include "core/result.hpp"
#include "host/block.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace task_planner {

/**
 * @brief Read side of the host store.
 *
 * `fetch_tagged_blocks` is the single backend call of a loader pass and may
 * return stale or duplicated (mirrored) records. `live_block` reads the
 * host's live in-memory state and is what identity resolution trusts.
 */
class IBlockSource {
public:
    virtual ~IBlockSource() = default;

    virtual Result<std::vector<Block>> fetch_tagged_blocks(std::string_view tag_alias) = 0;
    [[nodiscard]] virtual std::optional<Block> live_block(BlockId id) const = 0;
};

/**
 * @brief Write side of the host store, used by planner commands.
 */
class IBlockStore : public IBlockSource {
public:
    /// Replace the named properties of the block's tag ref (others kept).
    virtual Result<void> set_ref_data(BlockId block_id,
                                      std::string_view tag_alias,
                                      const std::vector<BlockProperty>& properties) = 0;

    /// Attach a tag ref to a block (no-op when already tagged) and set data.
    virtual Result<void> insert_tag(BlockId block_id,
                                    std::string_view tag_alias,
                                    const std::vector<BlockProperty>& properties) = 0;

    virtual Result<void> remove_tag(BlockId block_id, std::string_view tag_alias) = 0;

    /// Append a new block as the last child of `parent_id`.
    virtual Result<BlockId> insert_child_block(BlockId parent_id, std::string text) = 0;

    /// Reparent a block; `new_parent` nullopt detaches it to the root.
    virtual Result<void> move_block(BlockId block_id, std::optional<BlockId> new_parent) = 0;
};

}  // namespace task_planner
