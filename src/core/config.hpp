/**
 * @file config.hpp
 * @brief Planner configuration with TOML deserialization.
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace task_planner {

inline constexpr const char* kDefaultTaskTagAlias = "Task";

struct SchemaConfig {
    std::string tag_alias = kDefaultTaskTagAlias;
    std::string locale = "en";                                    ///< "en" or "zh-CN"
    std::optional<std::array<std::string, 4>> status_labels;      ///< todo, doing, waiting, done
    std::vector<std::string> canceled_labels = {
        "Canceled", "Cancelled", "已取消", "取消"};
};

struct EngineConfig {
    double waiting_multiplier = 0.6;
    bool cache_enabled = true;
};

struct ViewsConfig {
    uint32_t due_soon_days = 7;               ///< Clamped to [1, 3650]
    bool due_soon_include_overdue = false;
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path log_dir;            ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
};

/**
 * @brief Top-level planner configuration.
 */
struct Config {
    SchemaConfig schema;
    EngineConfig engine;
    ViewsConfig views;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file. Absent keys keep defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/// Trim whitespace and leading '#'; empty input yields the default alias.
[[nodiscard]] std::string normalize_tag_alias(std::string_view raw);

/// Round and clamp a due-soon window to [1, 3650] days.
[[nodiscard]] uint32_t normalize_due_soon_days(int64_t raw) noexcept;

}  // namespace task_planner
