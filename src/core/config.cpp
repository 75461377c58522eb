/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <algorithm>

#include <toml++/toml.hpp>

namespace task_planner {

namespace {

std::string_view trim(std::string_view text) {
    const auto* ws = " \t\r\n";
    auto first = text.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> string_array(const toml::array& arr) {
    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (auto s = item.value<std::string>()) {
            out.push_back(*s);
        }
    }
    return out;
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [schema]
    if (auto schema = tbl["schema"]; schema.is_table()) {
        config.schema.tag_alias = normalize_tag_alias(
            schema["tag_alias"].value_or(std::string{kDefaultTaskTagAlias}));
        config.schema.locale = schema["locale"].value_or(std::string{"en"});

        if (auto* labels = schema["status_labels"].as_array()) {
            auto values = string_array(*labels);
            if (values.size() != 4) {
                return Error{ErrorCode::Parse,
                             "schema.status_labels must list exactly 4 labels "
                             "(todo, doing, waiting, done)"};
            }
            config.schema.status_labels =
                std::array<std::string, 4>{values[0], values[1], values[2], values[3]};
        }
        if (auto* canceled = schema["canceled_labels"].as_array()) {
            config.schema.canceled_labels = string_array(*canceled);
        }
    }

    // [engine]
    if (auto engine = tbl["engine"]; engine.is_table()) {
        config.engine.waiting_multiplier = engine["waiting_multiplier"].value_or(0.6);
        config.engine.cache_enabled = engine["cache_enabled"].value_or(true);
        if (config.engine.waiting_multiplier < 0.0 || config.engine.waiting_multiplier > 1.0) {
            return Error{ErrorCode::Parse, "engine.waiting_multiplier must be within [0, 1]"};
        }
    }

    // [views]
    if (auto views = tbl["views"]; views.is_table()) {
        config.views.due_soon_days = normalize_due_soon_days(
            views["due_soon_days"].value_or(int64_t{7}));
        config.views.due_soon_include_overdue =
            views["due_soon_include_overdue"].value_or(false);
    }

    // [logging]
    if (auto logging = tbl["logging"]; logging.is_table()) {
        config.logging.level = logging["level"].value_or(std::string{"info"});
        config.logging.log_dir = logging["log_dir"].value_or(std::string{});
        config.logging.max_file_size_mb = static_cast<uint32_t>(
            logging["max_file_size_mb"].value_or(int64_t{50}));
        config.logging.rotate_count = static_cast<uint32_t>(
            logging["rotate_count"].value_or(int64_t{5}));
    }

    return config;
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Io, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

std::string normalize_tag_alias(std::string_view raw) {
    auto text = trim(raw);
    while (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    text = trim(text);
    return text.empty() ? std::string{kDefaultTaskTagAlias} : std::string{text};
}

uint32_t normalize_due_soon_days(int64_t raw) noexcept {
    return static_cast<uint32_t>(std::clamp<int64_t>(raw, 1, 3650));
}

}  // namespace task_planner
