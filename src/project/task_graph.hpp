/**
 * @file task_graph.hpp
 * @brief Precedence graph over project tasks.
 * @author Dimitris Kafetzis
 *
 * Models precedence constraints as a DAG where nodes are tasks and edges run
 * from predecessor to successor. Provides deterministic topological ordering,
 * cycle detection that reports the cycle members, and critical-path length.
 */

#pragma once

#include "project/model.hpp"

#include <map>
#include <optional>
#include <span>
#include <vector>

namespace mic_scheduler {

class TaskGraph {
public:
    TaskGraph() = default;

    /// Build from task records; predecessor lists become edges.
    static TaskGraph from_tasks(std::span<const Task> tasks);

    // ── Construction ──────────────────────────
    TaskId add_task(Task task);
    void add_dependency(const TaskId& from, const TaskId& to);

    // ── Queries ───────────────────────────────
    /// Kahn's algorithm; ties broken by ascending id. Shorter than task_count() on a cycle.
    [[nodiscard]] std::vector<TaskId> topological_order() const;
    [[nodiscard]] std::vector<TaskId> dependents(const TaskId& id) const;
    [[nodiscard]] std::vector<TaskId> dependencies(const TaskId& id) const;
    [[nodiscard]] bool has_cycle() const;
    /// Members of one cycle in edge order, empty if the graph is acyclic.
    [[nodiscard]] std::vector<TaskId> find_cycle() const;
    [[nodiscard]] size_t task_count() const noexcept;
    [[nodiscard]] bool contains(const TaskId& id) const;
    [[nodiscard]] std::optional<Task> get_task(const TaskId& id) const;

    // ── Metrics ───────────────────────────────
    /// Longest duration-weighted path, ignoring resources and calendar.
    [[nodiscard]] Hours critical_path_length() const;
    [[nodiscard]] Hours total_duration() const;

private:
    std::map<TaskId, Task> tasks_;
    std::map<TaskId, std::vector<TaskId>> adj_list_;
    std::map<TaskId, std::vector<TaskId>> reverse_adj_;
};

}  // namespace mic_scheduler
