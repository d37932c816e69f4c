/**
 * @file types.hpp
 * @brief Fundamental vocabulary types used throughout the MiC scheduler.
 * @author Dimitris Kafetzis
 *
 * Defines task/cluster identities, the simulated time base, the fixed
 * resource-type and building-system enumerations, and small value types
 * (coordinates, RPN triples, objective vectors). All types have value
 * semantics.
 */

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace mic_scheduler {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using TaskId = std::string;
using ClusterId = uint32_t;

/// Sentinel for tasks that are not part of any cluster (frozen work, lookahead tail).
inline constexpr ClusterId kNoCluster = std::numeric_limits<ClusterId>::max();

/// Simulated time: whole hours since the project epoch (start date, 00:00).
using SimTime = std::chrono::hours;
using Hours = std::chrono::hours;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Resource Types
// ─────────────────────────────────────────────

inline constexpr size_t kResourceTypeCount = 6;

enum class ResourceType : uint8_t {
    Skilled,
    SemiSkilled,
    Unskilled,
    Crane,
    Testing,
    Specialized
};

inline constexpr std::array<ResourceType, kResourceTypeCount> kAllResourceTypes = {
    ResourceType::Skilled, ResourceType::SemiSkilled, ResourceType::Unskilled,
    ResourceType::Crane, ResourceType::Testing, ResourceType::Specialized
};

[[nodiscard]] constexpr std::string_view to_string(ResourceType type) noexcept {
    switch (type) {
        case ResourceType::Skilled:     return "skilled";
        case ResourceType::SemiSkilled: return "semi_skilled";
        case ResourceType::Unskilled:   return "unskilled";
        case ResourceType::Crane:       return "crane";
        case ResourceType::Testing:     return "testing";
        case ResourceType::Specialized: return "specialized";
    }
    return "unknown";
}

/// Units required (or available) per resource type, indexed by ResourceType.
using ResourceVector = std::array<int32_t, kResourceTypeCount>;

[[nodiscard]] constexpr size_t index_of(ResourceType type) noexcept {
    return static_cast<size_t>(type);
}

/// True when every component of @p demand fits inside @p capacity.
[[nodiscard]] constexpr bool fits_within(const ResourceVector& demand,
                                         const ResourceVector& capacity) noexcept {
    for (size_t r = 0; r < kResourceTypeCount; ++r) {
        if (demand[r] > capacity[r]) return false;
    }
    return true;
}

[[nodiscard]] constexpr ResourceVector operator+(const ResourceVector& a,
                                                 const ResourceVector& b) noexcept {
    ResourceVector out{};
    for (size_t r = 0; r < kResourceTypeCount; ++r) out[r] = a[r] + b[r];
    return out;
}

// ─────────────────────────────────────────────
// Building Systems
// ─────────────────────────────────────────────

inline constexpr size_t kSystemTypeCount = 5;

enum class SystemType : uint8_t {
    Structural,
    Electrical,
    Plumbing,
    HVAC,
    Facade
};

[[nodiscard]] constexpr std::string_view to_string(SystemType system) noexcept {
    switch (system) {
        case SystemType::Structural: return "Struct";
        case SystemType::Electrical: return "Elec";
        case SystemType::Plumbing:   return "Plumb";
        case SystemType::HVAC:       return "HVAC";
        case SystemType::Facade:     return "Facade";
    }
    return "unknown";
}

/// Accepts both the short template names ("Struct") and full names ("Structural").
[[nodiscard]] std::optional<SystemType> parse_system_type(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Task Lifecycle
// ─────────────────────────────────────────────

enum class TaskStatus : uint8_t {
    Pending,          ///< Awaiting a committed slot
    Scheduled,        ///< Inside the commit window, frozen
    InProgress,       ///< Started, frozen
    Preempted,        ///< Interrupted by an emergency (transient)
    Completed,        ///< Finished (fully or as the elapsed part of a split)
    SplitRemainder    ///< Remaining work of a preempted task, schedulable like Pending
};

[[nodiscard]] constexpr std::string_view to_string(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending:        return "pending";
        case TaskStatus::Scheduled:      return "scheduled";
        case TaskStatus::InProgress:     return "in_progress";
        case TaskStatus::Preempted:      return "preempted";
        case TaskStatus::Completed:      return "completed";
        case TaskStatus::SplitRemainder: return "split_remainder";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_schedulable(TaskStatus status) noexcept {
    return status == TaskStatus::Pending || status == TaskStatus::SplitRemainder;
}

[[nodiscard]] constexpr bool is_frozen(TaskStatus status) noexcept {
    return status == TaskStatus::Scheduled || status == TaskStatus::InProgress;
}

// ─────────────────────────────────────────────
// Geometry & Risk Inputs
// ─────────────────────────────────────────────

struct Point3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    bool operator==(const Point3&) const = default;
};

/**
 * @brief Declared project envelope; task coordinates must fall inside it.
 */
struct ProjectBounds {
    Point3 min{-1.0e6, -1.0e6, -1.0e6};
    Point3 max{1.0e6, 1.0e6, 1.0e6};

    [[nodiscard]] constexpr bool contains(const Point3& p) const noexcept {
        return p.x >= min.x && p.x <= max.x
            && p.y >= min.y && p.y <= max.y
            && p.z >= min.z && p.z <= max.z;
    }
};

/**
 * @brief Severity/occurrence/detection triple from a failure-mode assessment.
 */
struct RpnScore {
    int severity{1};
    int occurrence{1};
    int detection{1};

    [[nodiscard]] constexpr int value() const noexcept {
        return severity * occurrence * detection;
    }

    bool operator==(const RpnScore&) const = default;
};

/// Criticality derived from an RPN: floor(S*O*D / 100), clamped to [1, 10].
[[nodiscard]] constexpr int criticality_from_rpn(const RpnScore& rpn) noexcept {
    return std::clamp(rpn.value() / 100, 1, 10);
}

// ─────────────────────────────────────────────
// Objective Vector
// ─────────────────────────────────────────────

inline constexpr size_t kObjectiveCount = 3;

/**
 * @brief The three minimised schedule objectives.
 */
struct Objectives {
    double cost{0.0};
    double risk{0.0};
    double delay{0.0};

    [[nodiscard]] constexpr double operator[](size_t index) const noexcept {
        switch (index) {
            case 0: return cost;
            case 1: return risk;
            default: return delay;
        }
    }

    bool operator==(const Objectives&) const = default;
    auto operator<=>(const Objectives&) const = default;
};

}  // namespace mic_scheduler
