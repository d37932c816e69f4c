/**
 * @file task_graph.cpp
 * @brief TaskGraph implementation: precedence graph algorithms.
 * @author Dimitris Kafetzis
 *
 * Implements Kahn's algorithm with an ordered ready set (so equal inputs give
 * equal orders), iterative DFS cycle extraction, and longest-path critical
 * path computation. Edges that mention unknown tasks are kept for validation
 * but ignored by the graph algorithms.
 */

#include "project/task_graph.hpp"

#include <algorithm>
#include <set>

namespace mic_scheduler {

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

TaskGraph TaskGraph::from_tasks(std::span<const Task> tasks) {
    TaskGraph graph;
    for (const auto& task : tasks) {
        graph.add_task(task);
    }
    for (const auto& task : tasks) {
        for (const auto& pred : task.predecessors) {
            graph.add_dependency(pred, task.id);
        }
    }
    return graph;
}

TaskId TaskGraph::add_task(Task task) {
    TaskId id = task.id;
    adj_list_[id];
    reverse_adj_[id];
    tasks_.insert_or_assign(id, std::move(task));
    return id;
}

void TaskGraph::add_dependency(const TaskId& from, const TaskId& to) {
    auto& out = adj_list_[from];
    if (std::find(out.begin(), out.end(), to) != out.end()) return;
    out.push_back(to);
    reverse_adj_[to].push_back(from);

    if (auto it = tasks_.find(to); it != tasks_.end()) {
        auto& preds = it->second.predecessors;
        if (std::find(preds.begin(), preds.end(), from) == preds.end()) {
            preds.push_back(from);
        }
    }
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::topological_order() const {
    std::map<TaskId, size_t> in_degree;
    for (const auto& [id, _] : tasks_) {
        in_degree[id] = 0;
    }
    for (const auto& [from, neighbors] : adj_list_) {
        if (!tasks_.contains(from)) continue;
        for (const auto& to : neighbors) {
            if (auto it = in_degree.find(to); it != in_degree.end()) {
                ++it->second;
            }
        }
    }

    std::set<TaskId> ready;
    for (const auto& [id, deg] : in_degree) {
        if (deg == 0) ready.insert(id);
    }

    std::vector<TaskId> order;
    order.reserve(tasks_.size());

    while (!ready.empty()) {
        auto current = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(current);

        if (auto it = adj_list_.find(current); it != adj_list_.end()) {
            for (const auto& neighbor : it->second) {
                auto deg_it = in_degree.find(neighbor);
                if (deg_it != in_degree.end() && --deg_it->second == 0) {
                    ready.insert(neighbor);
                }
            }
        }
    }

    return order;
}

// ─────────────────────────────────────────────
// Query Methods
// ─────────────────────────────────────────────

std::vector<TaskId> TaskGraph::dependents(const TaskId& id) const {
    auto it = adj_list_.find(id);
    if (it == adj_list_.end()) return {};
    return it->second;
}

std::vector<TaskId> TaskGraph::dependencies(const TaskId& id) const {
    auto it = reverse_adj_.find(id);
    if (it == reverse_adj_.end()) return {};
    return it->second;
}

bool TaskGraph::has_cycle() const {
    return !find_cycle().empty();
}

std::vector<TaskId> TaskGraph::find_cycle() const {
    enum class Color : uint8_t { White, Gray, Black };
    std::map<TaskId, Color> color;
    for (const auto& [id, _] : tasks_) {
        color[id] = Color::White;
    }

    struct Frame {
        TaskId node;
        size_t neighbor_idx;
    };

    for (const auto& [start_id, _] : tasks_) {
        if (color[start_id] != Color::White) continue;

        std::vector<Frame> path;
        path.push_back({start_id, 0});
        color[start_id] = Color::Gray;

        while (!path.empty()) {
            auto& [node, idx] = path.back();

            auto adj_it = adj_list_.find(node);
            if (adj_it == adj_list_.end() || idx >= adj_it->second.size()) {
                color[node] = Color::Black;
                path.pop_back();
                continue;
            }

            TaskId neighbor = adj_it->second[idx];
            ++idx;

            auto color_it = color.find(neighbor);
            if (color_it == color.end()) continue;   // unknown task

            if (color_it->second == Color::Gray) {
                // Back edge: the cycle is the path suffix starting at neighbor.
                std::vector<TaskId> cycle;
                bool inside = false;
                for (const auto& frame : path) {
                    if (frame.node == neighbor) inside = true;
                    if (inside) cycle.push_back(frame.node);
                }
                return cycle;
            }
            if (color_it->second == Color::White) {
                color_it->second = Color::Gray;
                path.push_back({neighbor, 0});
            }
        }
    }

    return {};
}

size_t TaskGraph::task_count() const noexcept {
    return tasks_.size();
}

bool TaskGraph::contains(const TaskId& id) const {
    return tasks_.contains(id);
}

std::optional<Task> TaskGraph::get_task(const TaskId& id) const {
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// Metrics
// ─────────────────────────────────────────────

Hours TaskGraph::critical_path_length() const {
    auto topo = topological_order();
    if (topo.size() != tasks_.size()) return Hours{0};

    // finish[v] = longest path ending at v, inclusive of v's duration
    std::map<TaskId, Hours> finish;
    Hours longest{0};
    for (const auto& id : topo) {
        Hours start{0};
        for (const auto& pred : dependencies(id)) {
            if (auto it = finish.find(pred); it != finish.end()) {
                start = std::max(start, it->second);
            }
        }
        finish[id] = start + tasks_.at(id).duration;
        longest = std::max(longest, finish[id]);
    }
    return longest;
}

Hours TaskGraph::total_duration() const {
    Hours total{0};
    for (const auto& [id, task] : tasks_) {
        total += task.duration;
    }
    return total;
}

}  // namespace mic_scheduler
