/**
 * @file snapshot_loader.hpp
 * @brief Reads an outline snapshot from TOML into an InMemoryBlockStore.
 *
 * Format:
 * @code
 *   [[block]]
 *   id = 1
 *   text = "Ship release #Task"
 *   parent = 10                          # optional
 *   mirror_of = 5                        # optional
 *   modified_at = 2024-05-01T09:00:00Z   # optional
 *
 *     [[block.tag]]
 *     alias = "Task"
 *     id = 100                           # optional ref id
 *     [block.tag.properties]
 *     Status = "Doing"
 *     "Depends on" = [500]
 *
 *     [[block.link]]
 *     id = 500
 *     to = 3
 * @endcode
 * Strings, numbers, booleans, dates and arrays of ids or strings map onto
 * the matching PropertyValue alternatives. Dates without a time are
 * midnight UTC; local date-times are read as UTC.
 */

#pragma once

#include "core/result.hpp"
#include "host/in_memory_store.hpp"

#include <filesystem>
#include <string_view>

namespace task_planner {

/// Adds every block in the file to `store`. Returns the number of blocks.
[[nodiscard]] Result<size_t> load_snapshot(const std::filesystem::path& path,
                                           InMemoryBlockStore& store);

/// Same as load_snapshot, from a TOML string.
[[nodiscard]] Result<size_t> parse_snapshot(std::string_view toml_text,
                                            InMemoryBlockStore& store);

/// Parses an ISO 8601 instant (`2024-05-01T09:00:00Z`, offsets allowed, or a
/// bare date) through the TOML date-time grammar.
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view text);

}  // namespace task_planner
