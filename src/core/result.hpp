/**
 * @file result.hpp
 * @brief Value-based error handling for the task planner.
 *
 * Provides Result<T, E> as the error channel between modules. Engine code
 * never throws across a module boundary; third-party exceptions (toml++)
 * are caught at the edge and converted into an Error.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace task_planner {

/**
 * @brief Coarse error classification.
 */
enum class ErrorCode : uint8_t {
    NotFound,           ///< A task or block id resolved to nothing
    InvalidArgument,    ///< Caller passed a value the operation rejects
    Backend,            ///< The host block store failed
    Parse,              ///< TOML or snapshot content was malformed
    Io                  ///< File could not be read
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NotFound:        return "not_found";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Backend:         return "backend";
        case ErrorCode::Parse:           return "parse";
        case ErrorCode::Io:              return "io";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>: either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations that can fail but return nothing.
 */
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
};

/// Shorthand for a NotFound error naming the block id that failed to resolve.
[[nodiscard]] inline Error task_not_found(int64_t block_id) {
    return Error{ErrorCode::NotFound, "task not found: " + std::to_string(block_id)};
}

}  // namespace task_planner
