/**
 * @file in_memory_store.hpp
 * @brief Map-backed IBlockStore used as the reference host.
 */

#pragma once

#include "host/block_source.hpp"

#include <functional>
#include <map>
#include <string>

namespace task_planner {

/**
 * @brief Outline store held entirely in memory.
 *
 * Mirror blocks (`mirror_of` set) are returned by `fetch_tagged_blocks`
 * alongside their sources when they carry the tag, reproducing the
 * duplicate-record behaviour of a real host. Writes addressed to a mirror
 * land on its source block.
 */
class InMemoryBlockStore : public IBlockStore {
public:
    using Clock = std::function<Timestamp()>;

    InMemoryBlockStore();
    explicit InMemoryBlockStore(Clock clock);

    // ── Snapshot construction ────────────────
    /// Insert or replace a block. A set parent gains the id as its last child.
    void add_block(Block block);
    [[nodiscard]] size_t block_count() const noexcept { return blocks_.size(); }

    /// Make subsequent fetches fail with a Backend error.
    void set_fetch_failure(std::optional<std::string> message);
    [[nodiscard]] size_t fetch_count() const noexcept { return fetch_count_; }

    // ── IBlockSource ─────────────────────────
    Result<std::vector<Block>> fetch_tagged_blocks(std::string_view tag_alias) override;
    [[nodiscard]] std::optional<Block> live_block(BlockId id) const override;

    // ── IBlockStore ──────────────────────────
    Result<void> set_ref_data(BlockId block_id,
                              std::string_view tag_alias,
                              const std::vector<BlockProperty>& properties) override;
    Result<void> insert_tag(BlockId block_id,
                            std::string_view tag_alias,
                            const std::vector<BlockProperty>& properties) override;
    Result<void> remove_tag(BlockId block_id, std::string_view tag_alias) override;
    Result<BlockId> insert_child_block(BlockId parent_id, std::string text) override;
    Result<void> move_block(BlockId block_id, std::optional<BlockId> new_parent) override;

private:
    Block* writable(BlockId id);
    void touch(Block& block);
    static void merge_properties(std::vector<BlockProperty>& target,
                                 const std::vector<BlockProperty>& updates);

    Clock clock_;
    std::map<BlockId, Block> blocks_;
    std::optional<std::string> fetch_failure_;
    size_t fetch_count_{0};
    int64_t next_ref_id_{1'000'000};
};

}  // namespace task_planner
