/**
 * @file task_properties.hpp
 * @brief Schema-aware decode/encode of a task tag's property payload.
 */

#pragma once

#include "host/block.hpp"
#include "schema/task_schema.hpp"

#include <optional>
#include <string>
#include <vector>

namespace task_planner {

/**
 * @brief Decoded planning fields of one task.
 */
struct TaskPropertyValues {
    std::string status_label;
    TaskStatus status = TaskStatus::Todo;
    std::optional<Timestamp> start_time;
    std::optional<Timestamp> end_time;
    std::optional<double> importance;               ///< [0, 100]
    std::optional<double> urgency;                  ///< [0, 100]
    std::optional<double> effort;                   ///< [0, 100]
    bool star = false;
    std::vector<std::string> labels;
    std::string remark;
    std::vector<BlockId> depends_on;                ///< Ref ids or block ids, de-duplicated
    DependencyMode depends_mode = DependencyMode::All;
    std::optional<double> dependency_delay_hours;   ///< >= 0
    std::optional<Timestamp> completed_at;          ///< Stamped on entering done
    std::optional<Timestamp> waiting_since;         ///< Stamped on entering waiting
};

/**
 * @brief Decode a tag payload. Never fails: missing or wrong-typed values
 *        fall back to schema defaults. `ref_data` may be null (untagged).
 */
[[nodiscard]] TaskPropertyValues decode_task_properties(const std::vector<BlockProperty>* ref_data,
                                                        const TaskSchema& schema);

/**
 * @brief Encode values into the payload written back through IBlockStore.
 */
[[nodiscard]] std::vector<BlockProperty> encode_task_properties(const TaskPropertyValues& values,
                                                                const TaskSchema& schema);

/// Default values for a freshly tagged task.
[[nodiscard]] TaskPropertyValues default_task_values(const TaskSchema& schema);

/// Split a free-form label string (`,` `，` `;` `；` newline, or `["a","b"]`).
[[nodiscard]] std::vector<std::string> parse_task_labels(std::string_view raw);

/// Collapse whitespace, drop empties, de-duplicate case-insensitively.
[[nodiscard]] std::vector<std::string> normalize_task_labels(const std::vector<std::string>& labels);

}  // namespace task_planner
