/**
 * @file task_properties.cpp
 * @brief Tolerant decoding of task properties.
 *
 * A single malformed task must not break a whole evaluation pass, so every
 * accessor here returns "absent" instead of failing.
 */

#include "schema/task_properties.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <unordered_set>

namespace task_planner {

namespace {

const PropertyValue* lookup(const std::vector<BlockProperty>* data, const std::string& name) {
    if (data == nullptr) return nullptr;
    const auto* prop = find_property(*data, name);
    return prop ? &prop->value : nullptr;
}

std::optional<std::string> get_string(const std::vector<BlockProperty>* data,
                                      const std::string& name) {
    const auto* value = lookup(data, name);
    if (value == nullptr) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(value)) return *s;
    // Single-choice properties may arrive as a one-element choice list.
    if (const auto* list = std::get_if<std::vector<std::string>>(value); list && !list->empty()) {
        return list->front();
    }
    return std::nullopt;
}

std::optional<double> get_number(const std::vector<BlockProperty>* data, const std::string& name) {
    const auto* value = lookup(data, name);
    if (value == nullptr) return std::nullopt;
    if (const auto* d = std::get_if<double>(value); d && std::isfinite(*d)) return *d;
    return std::nullopt;
}

std::optional<double> get_score(const std::vector<BlockProperty>* data, const std::string& name) {
    auto value = get_number(data, name);
    if (!value) return std::nullopt;
    return std::clamp(*value, 0.0, 100.0);
}

std::optional<Timestamp> get_time(const std::vector<BlockProperty>* data, const std::string& name) {
    const auto* value = lookup(data, name);
    if (value == nullptr) return std::nullopt;
    if (const auto* ts = std::get_if<Timestamp>(value)) return *ts;
    // Epoch milliseconds are accepted as well.
    if (const auto* ms = std::get_if<double>(value); ms && std::isfinite(*ms)) {
        return Timestamp{std::chrono::duration_cast<Timestamp::duration>(
            std::chrono::duration<double, std::milli>(*ms))};
    }
    return std::nullopt;
}

bool get_bool(const std::vector<BlockProperty>* data, const std::string& name) {
    const auto* value = lookup(data, name);
    if (value == nullptr) return false;
    const auto* b = std::get_if<bool>(value);
    return b != nullptr && *b;
}

std::optional<BlockId> parse_id(std::string_view text) {
    BlockId id = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return id;
}

std::vector<BlockId> get_ids(const std::vector<BlockProperty>* data, const std::string& name) {
    const auto* value = lookup(data, name);
    std::vector<BlockId> raw;
    if (value != nullptr) {
        if (const auto* ids = std::get_if<std::vector<BlockId>>(value)) {
            raw = *ids;
        } else if (const auto* strings = std::get_if<std::vector<std::string>>(value)) {
            for (const auto& s : *strings) {
                if (auto id = parse_id(s)) raw.push_back(*id);
            }
        }
    }

    std::vector<BlockId> out;
    std::unordered_set<BlockId> seen;
    for (auto id : raw) {
        if (seen.insert(id).second) out.push_back(id);
    }
    return out;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::string ascii_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace

std::vector<std::string> normalize_task_labels(const std::vector<std::string>& labels) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& raw : labels) {
        auto label = collapse_whitespace(raw);
        if (label.empty()) continue;
        if (seen.insert(ascii_lower(label)).second) out.push_back(std::move(label));
    }
    return out;
}

std::vector<std::string> parse_task_labels(std::string_view raw) {
    auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    auto last = raw.find_last_not_of(" \t\r\n");
    auto text = raw.substr(first, last - first + 1);

    std::vector<std::string> parts;

    // `["a","b"]` form: take the quoted strings.
    if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
        auto body = text.substr(1, text.size() - 2);
        size_t pos = 0;
        bool well_formed = true;
        while (pos < body.size()) {
            auto open = body.find('"', pos);
            if (open == std::string_view::npos) break;
            auto close = body.find('"', open + 1);
            if (close == std::string_view::npos) {
                well_formed = false;
                break;
            }
            parts.emplace_back(body.substr(open + 1, close - open - 1));
            pos = close + 1;
        }
        if (well_formed && !parts.empty()) return normalize_task_labels(parts);
        parts.clear();
    }

    static constexpr std::string_view kSeparators[] = {",", "\n", ";", "，", "；"};
    std::string current;
    size_t i = 0;
    while (i < text.size()) {
        bool split = false;
        for (auto sep : kSeparators) {
            if (text.substr(i, sep.size()) == sep) {
                parts.push_back(std::move(current));
                current.clear();
                i += sep.size();
                split = true;
                break;
            }
        }
        if (!split) current += text[i++];
    }
    parts.push_back(std::move(current));
    return normalize_task_labels(parts);
}

TaskPropertyValues decode_task_properties(const std::vector<BlockProperty>* ref_data,
                                          const TaskSchema& schema) {
    const auto& names = schema.names;
    TaskPropertyValues values;

    values.status_label = get_string(ref_data, names.status).value_or(schema.default_status_label());
    values.status = schema.status_from_label(values.status_label);
    values.start_time = get_time(ref_data, names.start_time);
    values.end_time = get_time(ref_data, names.end_time);
    values.importance = get_score(ref_data, names.importance);
    values.urgency = get_score(ref_data, names.urgency);
    values.effort = get_score(ref_data, names.effort);
    values.star = get_bool(ref_data, names.star);

    if (const auto* labels = lookup(ref_data, names.labels)) {
        if (const auto* list = std::get_if<std::vector<std::string>>(labels)) {
            values.labels = normalize_task_labels(*list);
        } else if (const auto* text = std::get_if<std::string>(labels)) {
            values.labels = parse_task_labels(*text);
        }
    }

    values.remark = get_string(ref_data, names.remark).value_or(std::string{});
    values.depends_on = get_ids(ref_data, names.depends_on);
    values.depends_mode = schema.mode_from_label(
        get_string(ref_data, names.depends_mode).value_or(schema.dependency_mode_labels[0]));

    if (auto delay = get_number(ref_data, names.dependency_delay); delay && *delay >= 0.0) {
        values.dependency_delay_hours = *delay;
    }
    values.completed_at = get_time(ref_data, names.completed_at);
    values.waiting_since = get_time(ref_data, names.waiting_since);

    return values;
}

TaskPropertyValues default_task_values(const TaskSchema& schema) {
    TaskPropertyValues values;
    values.status_label = schema.default_status_label();
    values.status = TaskStatus::Todo;
    return values;
}

std::vector<BlockProperty> encode_task_properties(const TaskPropertyValues& values,
                                                  const TaskSchema& schema) {
    const auto& names = schema.names;
    auto optional_time = [](const std::optional<Timestamp>& t) -> PropertyValue {
        if (t) return *t;
        return std::monostate{};
    };
    auto optional_number = [](const std::optional<double>& n) -> PropertyValue {
        if (n) return *n;
        return std::monostate{};
    };

    std::vector<BlockProperty> out;
    out.push_back({names.status, PropertyType::TextChoices, schema.label_for(values.status)});
    out.push_back({names.start_time, PropertyType::DateTime, optional_time(values.start_time)});
    out.push_back({names.end_time, PropertyType::DateTime, optional_time(values.end_time)});
    out.push_back({names.importance, PropertyType::Number, optional_number(values.importance)});
    out.push_back({names.urgency, PropertyType::Number, optional_number(values.urgency)});
    out.push_back({names.effort, PropertyType::Number, optional_number(values.effort)});
    out.push_back({names.star, PropertyType::Boolean, values.star});
    out.push_back({names.labels, PropertyType::TextChoices, normalize_task_labels(values.labels)});
    out.push_back({names.remark, PropertyType::Text,
                   values.remark.empty() ? PropertyValue{std::monostate{}} : PropertyValue{values.remark}});
    out.push_back({names.depends_on, PropertyType::BlockRefs, values.depends_on});
    out.push_back({names.depends_mode, PropertyType::TextChoices,
                   std::string{to_string(values.depends_mode)}});
    out.push_back({names.dependency_delay, PropertyType::Number,
                   optional_number(values.dependency_delay_hours)});
    out.push_back({names.completed_at, PropertyType::DateTime, optional_time(values.completed_at)});
    out.push_back({names.waiting_since, PropertyType::DateTime, optional_time(values.waiting_since)});
    return out;
}

}  // namespace task_planner
