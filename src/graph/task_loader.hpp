/**
 * @file task_loader.hpp
 * @brief Builds a TaskGraph from the host's tagged blocks.
 */

#pragma once

#include "core/result.hpp"
#include "graph/task_graph.hpp"
#include "host/block_source.hpp"
#include "schema/task_schema.hpp"

namespace task_planner {

/**
 * @brief Counters describing one loader pass.
 */
struct LoadStats {
    size_t fetched_blocks = 0;
    size_t tasks = 0;
    size_t merged_duplicates = 0;       ///< Records collapsed onto an existing canonical id
    size_t dangling_dependencies = 0;   ///< dependsOn targets that are not tasks
    size_t self_dependencies = 0;       ///< dependsOn entries naming the task itself
};

/**
 * @brief Fetch every block carrying the task tag (one backend call) and
 *        decode it into a TaskGraph keyed by canonical id.
 *
 * Only a failing fetch is an error; individual malformed tasks decode to
 * defaults and dangling references are dropped from the edge set.
 */
[[nodiscard]] Result<TaskGraph> load_all_tasks(IBlockSource& source,
                                               const TaskSchema& schema,
                                               LoadStats* stats = nullptr);

/// Display text: the block text with tag tokens removed.
[[nodiscard]] std::string resolve_task_text(const Block& block, std::string_view tag_alias);

}  // namespace task_planner
