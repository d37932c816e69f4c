/**
 * @file problem.hpp
 * @brief Immutable input snapshot shared by the decoder and the optimizer.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "clustering/cluster_engine.hpp"
#include "project/calendar.hpp"
#include "project/model.hpp"

#include <map>
#include <span>
#include <vector>

namespace mic_scheduler {

/**
 * @brief Everything a decode depends on besides the chromosome.
 *
 * @c tasks are the schedulable tasks (window and tail). @c frozen tasks carry
 * their committed planned_start/planned_end and are never moved. @c finished
 * maps completed task ids to the time their predecessors' constraint is met.
 */
struct SchedulingProblem {
    std::vector<Task> tasks;
    std::vector<std::vector<TaskId>> cluster_members;   ///< Indexed by ClusterId
    std::vector<TaskId> tail;                           ///< Lookahead tail, after every cluster
    std::vector<Task> frozen;
    std::map<TaskId, SimTime> finished;
    ResourceCapacities capacities;
    SimTime origin{0};
    SimTime horizon_end{8760};
    bool allow_overflow = false;

    [[nodiscard]] size_t cluster_count() const noexcept { return cluster_members.size(); }
};

/**
 * @brief Fill cluster_members and tail from a clustering of (a subset of) tasks.
 *
 * Tasks without a cluster go to the tail in id order.
 */
void attach_clusters(SchedulingProblem& problem, const ClusteringResult& clustering);

struct TimeBounds {
    SimTime start{0};
    SimTime finish{0};
};

/**
 * @brief Precedence-only earliest start/finish, ignoring capacity.
 *
 * @p external maps tasks outside @p tasks (completed or frozen) to the time
 * they release their dependents. Predecessors found nowhere are ignored;
 * tasks on a cycle get no entry.
 */
[[nodiscard]] std::map<TaskId, TimeBounds> precedence_bounds(
    std::span<const Task> tasks,
    const std::map<TaskId, SimTime>& external,
    SimTime origin,
    const WorkingCalendar& calendar);

/// Completion map of @p problem: finished tasks plus frozen planned ends.
[[nodiscard]] std::map<TaskId, SimTime> release_times(const SchedulingProblem& problem);

}  // namespace mic_scheduler
