/**
 * @file task_schema.cpp
 * @brief Built-in locale schemas and status label mapping.
 */

#include "schema/task_schema.hpp"

#include <algorithm>
#include <cctype>

namespace task_planner {

namespace {

TaskPropertyNames english_names() {
    return TaskPropertyNames{
        .status = "Status",
        .start_time = "Start time",
        .end_time = "End time",
        .depends_on = "Depends on",
        .depends_mode = "Depends mode",
        .dependency_delay = "Dependency delay",
        .star = "Star",
        .labels = "Labels",
        .remark = "Remark",
        .importance = "Importance",
        .urgency = "Urgency",
        .effort = "Effort",
        .completed_at = "Completed at",
        .waiting_since = "Waiting since",
    };
}

TaskPropertyNames chinese_names() {
    return TaskPropertyNames{
        .status = "状态",
        .start_time = "开始时间",
        .end_time = "结束时间",
        .depends_on = "依赖任务",
        .depends_mode = "依赖模式",
        .dependency_delay = "依赖延迟",
        .star = "收藏",
        .labels = "标签",
        .remark = "备注",
        .importance = "重要性",
        .urgency = "紧急度",
        .effort = "工作量",
        .completed_at = "完成时间",
        .waiting_since = "等待开始时间",
    };
}

std::string_view trim(std::string_view text) {
    const auto* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size()
        && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x))
                   == std::tolower(static_cast<unsigned char>(y));
           });
}

}  // namespace

TaskSchema TaskSchema::for_locale(std::string_view locale, std::string_view tag_alias) {
    TaskSchema schema;
    schema.tag_alias = normalize_tag_alias(tag_alias);
    schema.canceled_labels = SchemaConfig{}.canceled_labels;

    if (locale == "zh-CN") {
        schema.locale = "zh-CN";
        schema.names = chinese_names();
        schema.status_labels = {"待开始", "进行中", "等待中", "已完成"};
    } else {
        schema.locale = "en";
        schema.names = english_names();
        schema.status_labels = {"TODO", "Doing", "Waiting", "Done"};
    }
    return schema;
}

TaskSchema TaskSchema::from_config(const SchemaConfig& config) {
    auto schema = for_locale(config.locale, config.tag_alias);
    if (config.status_labels) {
        schema.status_labels = *config.status_labels;
    }
    if (!config.canceled_labels.empty()) {
        schema.canceled_labels = config.canceled_labels;
    }
    return schema;
}

TaskStatus TaskSchema::status_from_label(std::string_view label) const {
    if (label == status_labels[0]) return TaskStatus::Todo;
    if (label == status_labels[1]) return TaskStatus::Doing;
    if (label == status_labels[2]) return TaskStatus::Waiting;
    if (label == status_labels[3]) return TaskStatus::Done;
    if (is_canceled_label(label))  return TaskStatus::Canceled;
    return TaskStatus::Todo;
}

std::string TaskSchema::label_for(TaskStatus status) const {
    switch (status) {
        case TaskStatus::Todo:    return status_labels[0];
        case TaskStatus::Doing:   return status_labels[1];
        case TaskStatus::Waiting: return status_labels[2];
        case TaskStatus::Done:    return status_labels[3];
        case TaskStatus::Canceled:
            return canceled_labels.empty() ? std::string{"Canceled"} : canceled_labels.front();
    }
    return status_labels[0];
}

bool TaskSchema::is_canceled_label(std::string_view label) const {
    auto normalized = trim(label);
    return std::any_of(canceled_labels.begin(), canceled_labels.end(),
                       [&](const std::string& candidate) {
                           return iequals(normalized, trim(candidate));
                       });
}

DependencyMode TaskSchema::mode_from_label(std::string_view label) const noexcept {
    return label == dependency_mode_labels[1] ? DependencyMode::Any : DependencyMode::All;
}

}  // namespace task_planner
