/**
 * @file events.hpp
 * @brief Inputs of the rolling-horizon state machine.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "project/model.hpp"

#include <string_view>
#include <variant>

namespace mic_scheduler {

/// Simulated or wall-clock time moved to @c now.
struct TickEvent {
    SimTime now{0};
};

/// An urgent task arrived at @c now.
struct EmergencyEvent {
    Task task;
    SimTime now{0};
};

/// Resource availability changed; applies from the current origin.
struct CapacityEvent {
    ResourceCapacities capacities;
};

/// Caller-initiated preemption, typically after a capacity mismatch.
struct PreemptEvent {
    TaskId id;
    SimTime now{0};
};

using ControllerEvent = std::variant<TickEvent, EmergencyEvent, CapacityEvent, PreemptEvent>;

[[nodiscard]] inline std::string_view event_name(const ControllerEvent& event) {
    struct Visitor {
        std::string_view operator()(const TickEvent&) const noexcept { return "tick"; }
        std::string_view operator()(const EmergencyEvent&) const noexcept { return "emergency"; }
        std::string_view operator()(const CapacityEvent&) const noexcept { return "capacity"; }
        std::string_view operator()(const PreemptEvent&) const noexcept { return "preempt"; }
    };
    return std::visit(Visitor{}, event);
}

}  // namespace mic_scheduler
