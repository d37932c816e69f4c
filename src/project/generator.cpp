/**
 * @file generator.cpp
 * @brief Synthetic project generator implementations.
 * @author Dimitris Kafetzis
 */

#include "project/generator.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace mic_scheduler {

namespace {

ResourceVector units(int skilled, int semi, int unskilled, int crane, int testing, int specialized) {
    return ResourceVector{skilled, semi, unskilled, crane, testing, specialized};
}

/// Typical crew per building system.
ResourceVector system_demand(SystemType system) {
    switch (system) {
        case SystemType::Structural: return units(2, 0, 2, 1, 0, 0);
        case SystemType::Electrical: return units(1, 1, 0, 0, 1, 0);
        case SystemType::Plumbing:   return units(0, 2, 1, 0, 0, 0);
        case SystemType::HVAC:       return units(1, 1, 0, 0, 0, 1);
        case SystemType::Facade:     return units(0, 1, 2, 1, 0, 0);
    }
    return ResourceVector{};
}

Task make_task(TaskId id, SystemType system, Point3 location, ResourceVector demand,
               Hours duration, int criticality, std::vector<TaskId> predecessors = {}) {
    Task task;
    task.name = id;
    task.id = std::move(id);
    task.system = system;
    task.location = location;
    task.demand = demand;
    task.duration = duration;
    task.criticality = criticality;
    task.predecessors = std::move(predecessors);
    return task;
}

}  // anonymous namespace

ResourceCapacities ProjectGenerator::default_capacities() {
    return ResourceCapacities{.base = units(10, 15, 30, 2, 5, 5), .changes = {}};
}

// ─────────────────────────────────────────────
// MiC project:
//
//   F1-M0-Struct -> F1-M0-{Elec,Plumb,HVAC,Facade}
//        ^
//   F0-M0-Struct -> F0-M0-{Elec,Plumb,HVAC,Facade}
//
// One column per module, stacked floor by floor.
// ─────────────────────────────────────────────

ProjectData ProjectGenerator::mic_project(const GeneratorOptions& options, std::mt19937_64& rng) {
    ProjectData project;
    project.capacities = default_capacities();

    std::uniform_int_distribution<int64_t> duration_dist(options.min_duration.count(),
                                                         options.max_duration.count());
    std::uniform_int_distribution<int> score_dist(1, 10);
    std::uniform_real_distribution<double> jitter(-0.5, 0.5);

    constexpr std::array<SystemType, 4> kFitOut = {
        SystemType::Electrical, SystemType::Plumbing, SystemType::HVAC, SystemType::Facade
    };

    for (size_t f = 0; f < options.floors; ++f) {
        for (size_t m = 0; m < options.modules_per_floor; ++m) {
            Point3 centre{static_cast<double>(m) * options.module_spacing,
                          0.0,
                          static_cast<double>(f) * options.floor_height};

            auto draw = [&](SystemType system, TaskId id, std::vector<TaskId> preds) {
                Point3 at{centre.x + jitter(rng), centre.y + jitter(rng), centre.z};
                Task task = make_task(std::move(id), system, at, system_demand(system),
                                      Hours{duration_dist(rng)}, 0, std::move(preds));
                if (options.use_rpn) {
                    task.rpn = RpnScore{score_dist(rng), score_dist(rng), score_dist(rng)};
                } else {
                    task.criticality = score_dist(rng);
                }
                project.tasks.push_back(std::move(task));
            };

            auto structure = std::format("F{}-M{}-{}", f, m, to_string(SystemType::Structural));
            std::vector<TaskId> below;
            if (f > 0) {
                below.push_back(std::format("F{}-M{}-{}", f - 1, m, to_string(SystemType::Structural)));
            }
            draw(SystemType::Structural, structure, std::move(below));

            for (auto system : kFitOut) {
                draw(system, std::format("F{}-M{}-{}", f, m, to_string(system)), {structure});
            }
        }
    }
    return project;
}

// ─────────────────────────────────────────────
// Random tasks:
// Only adds edges from lower-indexed to higher-indexed tasks to
// guarantee acyclicity.
// ─────────────────────────────────────────────

std::vector<Task> ProjectGenerator::random_tasks(size_t num_tasks,
                                                 double edge_probability,
                                                 std::mt19937_64& rng) {
    std::uniform_int_distribution<int> system_dist(0, static_cast<int>(kSystemTypeCount) - 1);
    std::uniform_int_distribution<int64_t> duration_dist(2, 12);
    std::uniform_int_distribution<int> crew_dist(0, 2);
    std::uniform_int_distribution<int> score_dist(1, 10);
    std::uniform_real_distribution<double> position(0.0, 50.0);
    std::uniform_real_distribution<double> edge_dist(0.0, 1.0);

    std::vector<Task> tasks;
    tasks.reserve(num_tasks);
    for (size_t i = 0; i < num_tasks; ++i) {
        auto system = static_cast<SystemType>(system_dist(rng));
        auto demand = system_demand(system);
        demand[index_of(ResourceType::Skilled)] = std::max(1, crew_dist(rng));
        demand[index_of(ResourceType::Unskilled)] += crew_dist(rng);

        Point3 at{position(rng), position(rng), std::floor(position(rng) / 10.0) * 3.2};
        tasks.push_back(make_task(std::format("T{:02}", i), system, at, demand,
                                  Hours{duration_dist(rng)}, score_dist(rng)));
    }
    for (size_t j = 1; j < num_tasks; ++j) {
        for (size_t i = 0; i < j; ++i) {
            if (edge_dist(rng) < edge_probability) {
                tasks[j].predecessors.push_back(tasks[i].id);
            }
        }
    }
    return tasks;
}

std::vector<Task> ProjectGenerator::linear_chain(size_t num_tasks,
                                                 ResourceVector demand,
                                                 Hours duration) {
    std::vector<Task> tasks;
    tasks.reserve(num_tasks);
    for (size_t i = 0; i < num_tasks; ++i) {
        std::vector<TaskId> preds;
        if (i > 0) preds.push_back(tasks.back().id);
        tasks.push_back(make_task(std::format("chain_{}", i), SystemType::Structural,
                                  Point3{static_cast<double>(i), 0.0, 0.0}, demand, duration,
                                  5, std::move(preds)));
    }
    return tasks;
}

ProjectData ProjectGenerator::skilled_contention() {
    ProjectData project;
    project.capacities.base = units(2, 0, 0, 0, 0, 0);

    const auto skilled = [](int n) { return units(n, 0, 0, 0, 0, 0); };
    project.tasks = {
        make_task("A", SystemType::Structural, {0.0, 0.0, 0.0}, skilled(2), Hours{4}, 9),
        make_task("B", SystemType::Structural, {1.0, 0.0, 0.0}, skilled(1), Hours{3}, 3),
        make_task("C", SystemType::Electrical, {20.0, 5.0, 3.2}, skilled(1), Hours{2}, 5),
        make_task("D", SystemType::Electrical, {21.0, 5.0, 3.2}, skilled(1), Hours{5}, 7),
        make_task("E", SystemType::Electrical, {22.0, 6.0, 3.2}, skilled(2), Hours{2}, 4),
    };
    return project;
}

ProjectData ProjectGenerator::single_crane_site() {
    ProjectData project;
    project.capacities.base = units(6, 6, 10, 1, 2, 2);

    project.tasks = {
        make_task("LIFT-01", SystemType::Facade, {0.0, 0.0, 6.4}, units(1, 1, 2, 1, 0, 0), Hours{16}, 2),
        make_task("ELEC-01", SystemType::Electrical, {10.0, 0.0, 3.2}, units(1, 1, 0, 0, 1, 0), Hours{6}, 5),
        make_task("PLUMB-01", SystemType::Plumbing, {12.0, 0.0, 3.2}, units(0, 2, 1, 0, 0, 0), Hours{5}, 4),
        make_task("HVAC-01", SystemType::HVAC, {14.0, 2.0, 3.2}, units(1, 1, 0, 0, 0, 1), Hours{8}, 6,
                  {"ELEC-01"}),
    };
    return project;
}

Task ProjectGenerator::crane_emergency(TaskId id) {
    Task task = make_task(std::move(id), SystemType::Structural, {0.0, 0.0, 3.2},
                          units(2, 0, 1, 1, 0, 0), Hours{4}, 10);
    task.name = "Beam crack repair";
    task.urgent = true;
    return task;
}

}  // namespace mic_scheduler
