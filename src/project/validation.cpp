/**
 * @file validation.cpp
 * @brief Task-set validation and criticality resolution.
 * @author Dimitris Kafetzis
 */

#include "project/validation.hpp"

#include "project/task_graph.hpp"

#include <cmath>
#include <format>
#include <set>

namespace mic_scheduler {

namespace {

bool in_level_range(int value) {
    return value >= 1 && value <= 10;
}

std::string join_ids(const std::vector<TaskId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id.empty() ? std::string{"<empty>"} : id;
    }
    return out;
}

Error validation_error(std::string_view what, std::vector<TaskId> ids) {
    auto message = std::format("{}: {}", what, join_ids(ids));
    return Error{ErrorCode::DataValidation, std::move(message), std::move(ids)};
}

}  // anonymous namespace

Result<void> validate_tasks(std::span<const Task> tasks,
                            const ProjectBounds& bounds,
                            std::span<const TaskId> known_ids) {
    std::vector<TaskId> bad_fields;
    std::set<TaskId> seen;
    std::vector<TaskId> duplicates;

    for (const auto& task : tasks) {
        if (task.id.empty()) {
            bad_fields.push_back(task.id);
            continue;
        }
        if (!seen.insert(task.id).second) {
            duplicates.push_back(task.id);
        }

        bool ok = task.duration > Hours{0} && bounds.contains(task.location);
        for (auto units : task.demand) {
            if (units < 0) ok = false;
        }
        if (task.criticality != 0 && !in_level_range(task.criticality)) ok = false;
        if (task.rpn && !(in_level_range(task.rpn->severity) &&
                          in_level_range(task.rpn->occurrence) &&
                          in_level_range(task.rpn->detection))) {
            ok = false;
        }
        if (!ok) bad_fields.push_back(task.id);
    }

    if (!duplicates.empty()) {
        return validation_error("duplicate task ids", std::move(duplicates));
    }
    if (!bad_fields.empty()) {
        return validation_error("tasks with missing or out-of-range fields", std::move(bad_fields));
    }

    std::set<TaskId> known(known_ids.begin(), known_ids.end());
    std::vector<TaskId> dangling;
    for (const auto& task : tasks) {
        for (const auto& pred : task.predecessors) {
            if (!seen.contains(pred) && !known.contains(pred)) {
                dangling.push_back(task.id);
                break;
            }
        }
    }
    if (!dangling.empty()) {
        return validation_error("tasks with unknown predecessors", std::move(dangling));
    }

    auto cycle = TaskGraph::from_tasks(tasks).find_cycle();
    if (!cycle.empty()) {
        return validation_error("predecessor cycle", std::move(cycle));
    }

    return Result<void>{};
}

void resolve_criticality(std::vector<Task>& tasks) {
    int known_sum = 0;
    int known_count = 0;

    for (auto& task : tasks) {
        if (task.criticality == 0 && task.rpn) {
            task.criticality = criticality_from_rpn(*task.rpn);
        }
        if (task.criticality != 0) {
            known_sum += task.criticality;
            ++known_count;
        }
    }

    int fallback = 5;
    if (known_count > 0) {
        fallback = static_cast<int>(std::lround(
            static_cast<double>(known_sum) / static_cast<double>(known_count)));
        fallback = std::clamp(fallback, 1, 10);
    }

    for (auto& task : tasks) {
        if (task.criticality == 0) {
            task.criticality = fallback;
        }
    }
}

}  // namespace mic_scheduler
