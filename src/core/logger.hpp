/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * Provides ILogSink (runtime-configurable log destination) and a Logger
 * front-end that renders one NDJSON record per call. Records carry the
 * emitting component so engine, loader and CLI output can be told apart.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace task_planner {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/// Parse "debug" / "info" / "warn" / "error" (case-sensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/**
 * @brief Logger front-end. Each record is
 *        {"level","ts","component","msg"} on a single line.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info,
                    std::string component = "planner");

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void log(LogLevel level, std::string_view component, std::string_view message);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= min_level_; }

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::string component_;
    mutable std::mutex mutex_;
};

}  // namespace task_planner
