/**
 * @file problem.cpp
 * @brief SchedulingProblem helpers.
 * @author Dimitris Kafetzis
 */

#include "scheduler/problem.hpp"

#include "project/task_graph.hpp"

#include <algorithm>
#include <set>

namespace mic_scheduler {

void attach_clusters(SchedulingProblem& problem, const ClusteringResult& clustering) {
    problem.cluster_members.clear();
    problem.tail.clear();

    std::set<TaskId> present;
    for (const auto& task : problem.tasks) present.insert(task.id);

    for (const auto& cluster : clustering.clusters) {
        std::vector<TaskId> members;
        for (const auto& id : cluster.members) {
            if (present.contains(id)) members.push_back(id);
        }
        problem.cluster_members.push_back(std::move(members));
    }

    for (const auto& task : problem.tasks) {
        if (!clustering.assignment.contains(task.id)) problem.tail.push_back(task.id);
    }
    std::sort(problem.tail.begin(), problem.tail.end());
}

std::map<TaskId, TimeBounds> precedence_bounds(std::span<const Task> tasks,
                                               const std::map<TaskId, SimTime>& external,
                                               SimTime origin,
                                               const WorkingCalendar& calendar) {
    auto graph = TaskGraph::from_tasks(tasks);
    std::map<TaskId, TimeBounds> bounds;

    for (const auto& id : graph.topological_order()) {
        auto task = graph.get_task(id);
        if (!task) continue;

        SimTime ready = origin;
        for (const auto& pred : task->predecessors) {
            if (auto it = bounds.find(pred); it != bounds.end()) {
                ready = std::max(ready, it->second.finish);
            } else if (auto ext = external.find(pred); ext != external.end()) {
                ready = std::max(ready, ext->second);
            }
        }
        auto start = calendar.next_working_hour(ready);
        bounds[id] = TimeBounds{start, calendar.add_work_hours(start, task->duration)};
    }
    return bounds;
}

std::map<TaskId, SimTime> release_times(const SchedulingProblem& problem) {
    auto out = problem.finished;
    for (const auto& task : problem.frozen) {
        if (task.planned_end) out[task.id] = *task.planned_end;
    }
    return out;
}

}  // namespace mic_scheduler
