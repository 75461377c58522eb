/**
 * @file block.hpp
 * @brief Host outline model: blocks, typed properties and references.
 *
 * A read-only projection of what the host document store exposes. The
 * planner never mutates these in place; commands go through IBlockStore.
 */

#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace task_planner {

enum class PropertyType : uint8_t {
    Text,
    BlockRefs,
    Number,
    Boolean,
    DateTime,
    TextChoices
};

/// Typed property payload. monostate = explicitly empty.
using PropertyValue = std::variant<std::monostate,
                                   bool,
                                   double,
                                   std::string,
                                   std::vector<std::string>,
                                   std::vector<BlockId>,
                                   Timestamp>;

struct BlockProperty {
    std::string name;
    PropertyType type = PropertyType::Text;
    PropertyValue value;
};

enum class RefType : uint8_t {
    Link,       ///< Inline reference to another block
    Tag         ///< Tag reference; carries the tag's property payload
};

struct BlockRef {
    int64_t id = 0;                     ///< Ref id, distinct from block ids
    BlockId to = 0;                     ///< Referenced block
    RefType type = RefType::Link;
    std::string alias;                  ///< Tag alias for tag refs
    std::vector<BlockProperty> data;    ///< Tag property payload
};

struct Block {
    BlockId id = 0;
    std::string text;
    std::optional<BlockId> parent;
    std::vector<BlockId> children;
    std::vector<BlockRef> refs;
    std::optional<BlockId> mirror_of;       ///< Set when this block mirrors another
    std::optional<Timestamp> modified_at;
};

/// Find the tag ref for `alias` on a block, or nullptr.
[[nodiscard]] inline const BlockRef* find_tag_ref(const Block& block, std::string_view alias) {
    for (const auto& ref : block.refs) {
        if (ref.type == RefType::Tag && ref.alias == alias) return &ref;
    }
    return nullptr;
}

[[nodiscard]] inline const BlockProperty* find_property(const std::vector<BlockProperty>& data,
                                                        std::string_view name) {
    for (const auto& prop : data) {
        if (prop.name == name) return &prop;
    }
    return nullptr;
}

}  // namespace task_planner
