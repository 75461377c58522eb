/**
 * @file task_schema.hpp
 * @brief Task tag schema: property names, status labels, status semantics.
 *
 * Status labels are host-configurable; their meaning is not. The schema is
 * the only place that maps a label string to a TaskStatus.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace task_planner {

struct TaskPropertyNames {
    std::string status;
    std::string start_time;
    std::string end_time;
    std::string depends_on;
    std::string depends_mode;
    std::string dependency_delay;
    std::string star;
    std::string labels;
    std::string remark;
    std::string importance;
    std::string urgency;
    std::string effort;
    std::string completed_at;
    std::string waiting_since;
};

struct TaskSchema {
    std::string locale = "en";
    std::string tag_alias = kDefaultTaskTagAlias;
    TaskPropertyNames names;
    std::array<std::string, 4> status_labels;     ///< todo, doing, waiting, done
    std::vector<std::string> canceled_labels;
    std::array<std::string, 2> dependency_mode_labels = {"ALL", "ANY"};

    /// Built-in schema for "en" or "zh-CN"; any other locale falls back to "en".
    static TaskSchema for_locale(std::string_view locale,
                                 std::string_view tag_alias = kDefaultTaskTagAlias);

    /// Locale schema with the overrides from a [schema] config section applied.
    static TaskSchema from_config(const SchemaConfig& config);

    /// Label → status. Unknown labels read as Todo.
    [[nodiscard]] TaskStatus status_from_label(std::string_view label) const;

    /// Status → label written back to the host.
    [[nodiscard]] std::string label_for(TaskStatus status) const;

    /// Trimmed, ASCII case-insensitive match against the canceled family.
    [[nodiscard]] bool is_canceled_label(std::string_view label) const;

    [[nodiscard]] const std::string& default_status_label() const noexcept {
        return status_labels[0];
    }

    [[nodiscard]] DependencyMode mode_from_label(std::string_view label) const noexcept;
};

/**
 * @brief Main status cycle: todo → doing → done → todo.
 *        Waiting and canceled restart at todo.
 */
[[nodiscard]] constexpr TaskStatus next_status_in_main_cycle(TaskStatus current) noexcept {
    switch (current) {
        case TaskStatus::Todo:  return TaskStatus::Doing;
        case TaskStatus::Doing: return TaskStatus::Done;
        case TaskStatus::Done:  return TaskStatus::Todo;
        default:                return TaskStatus::Todo;
    }
}

}  // namespace task_planner
