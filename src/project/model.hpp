/**
 * @file model.hpp
 * @brief Task records and resource capacities exchanged at the engine boundary.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace mic_scheduler {

/**
 * @brief A single inspection, maintenance or construction task.
 *
 * Created by the import collaborator or by the controller (split remainders,
 * emergencies). Only the controller and the decoder's output change the
 * lifecycle fields.
 */
struct Task {
    TaskId id;
    std::string name;
    SystemType system = SystemType::Structural;
    Point3 location;
    ResourceVector demand{};
    Hours duration{0};                      ///< Working hours of effort
    std::vector<TaskId> predecessors;
    int criticality = 0;                    ///< 1..10, 0 = derive from rpn or project mean
    std::optional<RpnScore> rpn;

    TaskStatus status = TaskStatus::Pending;
    std::optional<SimTime> planned_start;
    std::optional<SimTime> planned_end;
    std::optional<SimTime> actual_start;
    std::optional<SimTime> actual_end;

    bool urgent = false;
    std::optional<SimTime> deadline;        ///< Required finish for emergencies
    std::optional<TaskId> split_from;       ///< Set on split remainders

    bool operator==(const Task&) const = default;
};

/**
 * @brief Capacity change taking effect at @p from and lasting until the next one.
 */
struct CapacityChange {
    SimTime from{0};
    ResourceVector units{};

    bool operator==(const CapacityChange&) const = default;
};

/**
 * @brief Available units per resource type, possibly varying over time.
 */
struct ResourceCapacities {
    ResourceVector base{};
    std::vector<CapacityChange> changes;    ///< Sorted by @c from

    [[nodiscard]] ResourceVector at(SimTime t) const {
        ResourceVector current = base;
        for (const auto& change : changes) {
            if (change.from > t) break;
            current = change.units;
        }
        return current;
    }

    /// Component-wise maximum over the whole timeline: the theoretical capacity.
    [[nodiscard]] ResourceVector peak() const {
        ResourceVector out = base;
        for (const auto& change : changes) {
            for (size_t r = 0; r < kResourceTypeCount; ++r) {
                out[r] = std::max(out[r], change.units[r]);
            }
        }
        return out;
    }

    void add_change(SimTime from, ResourceVector units) {
        auto pos = std::upper_bound(changes.begin(), changes.end(), from,
                                    [](SimTime t, const CapacityChange& c) { return t < c.from; });
        changes.insert(pos, CapacityChange{from, units});
    }

    bool operator==(const ResourceCapacities&) const = default;
};

}  // namespace mic_scheduler
