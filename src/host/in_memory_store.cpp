/**
 * @file in_memory_store.cpp
 * @brief InMemoryBlockStore implementation.
 */

#include "host/in_memory_store.hpp"

#include <algorithm>

namespace task_planner {

InMemoryBlockStore::InMemoryBlockStore()
    : InMemoryBlockStore([] { return std::chrono::system_clock::now(); }) {}

InMemoryBlockStore::InMemoryBlockStore(Clock clock) : clock_(std::move(clock)) {}

// ─────────────────────────────────────────────
// Snapshot construction
// ─────────────────────────────────────────────

void InMemoryBlockStore::add_block(Block block) {
    for (const auto& ref : block.refs) {
        next_ref_id_ = std::max(next_ref_id_, ref.id + 1);
    }

    if (block.parent) {
        if (auto it = blocks_.find(*block.parent); it != blocks_.end()) {
            auto& siblings = it->second.children;
            if (std::find(siblings.begin(), siblings.end(), block.id) == siblings.end()) {
                siblings.push_back(block.id);
            }
        }
    }

    auto id = block.id;
    blocks_.insert_or_assign(id, std::move(block));
}

void InMemoryBlockStore::set_fetch_failure(std::optional<std::string> message) {
    fetch_failure_ = std::move(message);
}

// ─────────────────────────────────────────────
// IBlockSource
// ─────────────────────────────────────────────

Result<std::vector<Block>> InMemoryBlockStore::fetch_tagged_blocks(std::string_view tag_alias) {
    ++fetch_count_;
    if (fetch_failure_) {
        return Error{ErrorCode::Backend, *fetch_failure_};
    }

    std::vector<Block> out;
    for (const auto& [id, block] : blocks_) {
        if (find_tag_ref(block, tag_alias) != nullptr) {
            out.push_back(block);
        }
    }
    return out;
}

std::optional<Block> InMemoryBlockStore::live_block(BlockId id) const {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// IBlockStore
// ─────────────────────────────────────────────

Result<void> InMemoryBlockStore::set_ref_data(BlockId block_id,
                                              std::string_view tag_alias,
                                              const std::vector<BlockProperty>& properties) {
    auto* block = writable(block_id);
    if (block == nullptr) {
        return Error{ErrorCode::NotFound, "block not found: " + std::to_string(block_id)};
    }

    for (auto& ref : block->refs) {
        if (ref.type == RefType::Tag && ref.alias == tag_alias) {
            merge_properties(ref.data, properties);
            touch(*block);
            return {};
        }
    }
    return Error{ErrorCode::NotFound,
                 "block " + std::to_string(block->id) + " has no tag " + std::string{tag_alias}};
}

Result<void> InMemoryBlockStore::insert_tag(BlockId block_id,
                                            std::string_view tag_alias,
                                            const std::vector<BlockProperty>& properties) {
    auto* block = writable(block_id);
    if (block == nullptr) {
        return Error{ErrorCode::NotFound, "block not found: " + std::to_string(block_id)};
    }

    if (find_tag_ref(*block, tag_alias) == nullptr) {
        BlockRef ref;
        ref.id = next_ref_id_++;
        ref.to = 0;
        ref.type = RefType::Tag;
        ref.alias = std::string{tag_alias};
        block->refs.push_back(std::move(ref));
    }
    return set_ref_data(block->id, tag_alias, properties);
}

Result<void> InMemoryBlockStore::remove_tag(BlockId block_id, std::string_view tag_alias) {
    auto* block = writable(block_id);
    if (block == nullptr) {
        return Error{ErrorCode::NotFound, "block not found: " + std::to_string(block_id)};
    }

    auto before = block->refs.size();
    std::erase_if(block->refs, [&](const BlockRef& ref) {
        return ref.type == RefType::Tag && ref.alias == tag_alias;
    });
    if (block->refs.size() == before) {
        return Error{ErrorCode::NotFound,
                     "block " + std::to_string(block->id) + " has no tag " + std::string{tag_alias}};
    }
    touch(*block);
    return {};
}

Result<BlockId> InMemoryBlockStore::insert_child_block(BlockId parent_id, std::string text) {
    auto* parent = writable(parent_id);
    if (parent == nullptr) {
        return Error{ErrorCode::NotFound, "block not found: " + std::to_string(parent_id)};
    }

    BlockId id = blocks_.empty() ? 1 : blocks_.rbegin()->first + 1;
    parent->children.push_back(id);

    Block child;
    child.id = id;
    child.text = std::move(text);
    child.parent = parent->id;
    child.modified_at = clock_();
    blocks_.emplace(id, std::move(child));
    return id;
}

Result<void> InMemoryBlockStore::move_block(BlockId block_id, std::optional<BlockId> new_parent) {
    auto* block = writable(block_id);
    if (block == nullptr) {
        return Error{ErrorCode::NotFound, "block not found: " + std::to_string(block_id)};
    }
    const BlockId id = block->id;

    if (new_parent) {
        // Refuse to move a block beneath itself.
        std::optional<BlockId> cursor = *new_parent;
        while (cursor) {
            if (*cursor == id) {
                return Error{ErrorCode::InvalidArgument,
                             "cannot move block " + std::to_string(id) + " under its own subtree"};
            }
            auto it = blocks_.find(*cursor);
            if (it == blocks_.end()) break;
            cursor = it->second.parent;
        }
        if (blocks_.find(*new_parent) == blocks_.end()) {
            return Error{ErrorCode::NotFound, "block not found: " + std::to_string(*new_parent)};
        }
    }

    if (block->parent) {
        if (auto it = blocks_.find(*block->parent); it != blocks_.end()) {
            std::erase(it->second.children, id);
        }
    }

    block->parent = new_parent;
    if (new_parent) {
        blocks_.at(*new_parent).children.push_back(id);
    }
    touch(*block);
    return {};
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

Block* InMemoryBlockStore::writable(BlockId id) {
    auto it = blocks_.find(id);
    if (it == blocks_.end()) return nullptr;
    if (it->second.mirror_of) {
        auto source = blocks_.find(*it->second.mirror_of);
        if (source != blocks_.end()) return &source->second;
    }
    return &it->second;
}

void InMemoryBlockStore::touch(Block& block) {
    block.modified_at = clock_();
}

void InMemoryBlockStore::merge_properties(std::vector<BlockProperty>& target,
                                          const std::vector<BlockProperty>& updates) {
    for (const auto& update : updates) {
        auto it = std::find_if(target.begin(), target.end(), [&](const BlockProperty& p) {
            return p.name == update.name;
        });
        if (it != target.end()) {
            *it = update;
        } else {
            target.push_back(update);
        }
    }
}

}  // namespace task_planner
