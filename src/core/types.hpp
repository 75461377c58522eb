/**
 * @file types.hpp
 * @brief Fundamental types used throughout the task planner.
 *
 * Defines BlockId/TaskId, TaskStatus, DependencyMode and the closed
 * BlockedReason tag set. All types are designed for value semantics.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string_view>
#include <vector>

namespace task_planner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using BlockId = int64_t;
using TaskId = BlockId;          ///< Always a canonical id (see IdentityResolver)
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;

constexpr double kSecondsPerDay = 24.0 * 60.0 * 60.0;

/// Signed distance `to - from` expressed in fractional days.
[[nodiscard]] inline double days_between(Timestamp from, Timestamp to) noexcept {
    return std::chrono::duration<double>(to - from).count() / kSecondsPerDay;
}

// ─────────────────────────────────────────────
// Task Status
// ─────────────────────────────────────────────

/**
 * @brief Semantic task status. Host labels map onto these through the schema.
 */
enum class TaskStatus : uint8_t {
    Todo,
    Doing,
    Waiting,
    Done,
    Canceled
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Todo:     return "todo";
        case TaskStatus::Doing:    return "doing";
        case TaskStatus::Waiting:  return "waiting";
        case TaskStatus::Done:     return "done";
        case TaskStatus::Canceled: return "canceled";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_closed(TaskStatus status) noexcept {
    return status == TaskStatus::Done || status == TaskStatus::Canceled;
}

// ─────────────────────────────────────────────
// Dependency Mode
// ─────────────────────────────────────────────

enum class DependencyMode : uint8_t {
    All,    ///< Every dependency must be done
    Any     ///< At least one dependency must be done
};

[[nodiscard]] constexpr std::string_view to_string(DependencyMode mode) noexcept {
    switch (mode) {
        case DependencyMode::All: return "ALL";
        case DependencyMode::Any: return "ANY";
    }
    return "ALL";
}

// ─────────────────────────────────────────────
// Blocked Reasons
// ─────────────────────────────────────────────

/**
 * @brief Why a task is not a next action.
 *
 * Declaration order is the display priority: the first reason present in a
 * set is its primary reason.
 */
enum class BlockedReason : uint8_t {
    Completed,
    Canceled,
    NotStarted,
    DependencyUnmet,
    DependencyDelayed,
    AncestorDependencyUnmet,
    HasOpenChildren
};

inline constexpr std::array<BlockedReason, 7> kAllBlockedReasons = {
    BlockedReason::Completed,
    BlockedReason::Canceled,
    BlockedReason::NotStarted,
    BlockedReason::DependencyUnmet,
    BlockedReason::DependencyDelayed,
    BlockedReason::AncestorDependencyUnmet,
    BlockedReason::HasOpenChildren,
};

[[nodiscard]] constexpr std::string_view to_string(BlockedReason reason) noexcept {
    switch (reason) {
        case BlockedReason::Completed:               return "completed";
        case BlockedReason::Canceled:                return "canceled";
        case BlockedReason::NotStarted:              return "not-started";
        case BlockedReason::DependencyUnmet:         return "dependency-unmet";
        case BlockedReason::DependencyDelayed:       return "dependency-delayed";
        case BlockedReason::AncestorDependencyUnmet: return "ancestor-dependency-unmet";
        case BlockedReason::HasOpenChildren:         return "has-open-children";
    }
    return "unknown";
}

/**
 * @brief Small flag set over BlockedReason.
 */
class BlockedReasonSet {
public:
    constexpr BlockedReasonSet() noexcept = default;
    constexpr BlockedReasonSet(std::initializer_list<BlockedReason> reasons) noexcept {
        for (auto reason : reasons) insert(reason);
    }

    constexpr void insert(BlockedReason reason) noexcept { bits_ |= bit(reason); }
    constexpr void erase(BlockedReason reason) noexcept {
        bits_ = static_cast<uint8_t>(bits_ & ~bit(reason));
    }

    [[nodiscard]] constexpr bool contains(BlockedReason reason) const noexcept {
        return (bits_ & bit(reason)) != 0;
    }
    [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
    [[nodiscard]] constexpr size_t size() const noexcept {
        size_t n = 0;
        for (auto reason : kAllBlockedReasons) {
            if (contains(reason)) ++n;
        }
        return n;
    }

    /// True when the set holds any dependency-family reason.
    [[nodiscard]] constexpr bool blocked_by_dependency() const noexcept {
        return contains(BlockedReason::DependencyUnmet)
            || contains(BlockedReason::DependencyDelayed)
            || contains(BlockedReason::AncestorDependencyUnmet);
    }

    /// First reason in display order. Precondition: !empty().
    [[nodiscard]] constexpr BlockedReason primary() const noexcept {
        for (auto reason : kAllBlockedReasons) {
            if (contains(reason)) return reason;
        }
        return BlockedReason::Completed;
    }

    [[nodiscard]] std::vector<BlockedReason> to_vector() const {
        std::vector<BlockedReason> out;
        for (auto reason : kAllBlockedReasons) {
            if (contains(reason)) out.push_back(reason);
        }
        return out;
    }

    [[nodiscard]] constexpr uint8_t bits() const noexcept { return bits_; }

    constexpr bool operator==(const BlockedReasonSet&) const = default;

private:
    static constexpr uint8_t bit(BlockedReason reason) noexcept {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(reason));
    }

    uint8_t bits_{0};
};

}  // namespace task_planner
