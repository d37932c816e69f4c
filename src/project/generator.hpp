/**
 * @file generator.hpp
 * @brief Synthetic MiC projects for testing, benchmarking and the demo CLI.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "project/model.hpp"
#include "project/project_file.hpp"

#include <random>

namespace mic_scheduler {

struct GeneratorOptions {
    size_t floors = 4;
    size_t modules_per_floor = 3;
    double module_spacing = 6.0;        ///< Metres between module centres
    double floor_height = 3.2;
    Hours min_duration{4};
    Hours max_duration{16};
    bool use_rpn = true;                ///< Draw RPN triples instead of direct criticality
};

/**
 * @brief Factory for synthetic projects with various shapes.
 */
class ProjectGenerator {
public:
    /// Default site capacities: 10 skilled, 15 semi-skilled, 30 unskilled, 2 cranes, 5 testing, 5 specialized.
    static ResourceCapacities default_capacities();

    /**
     * @brief Floors of modules, each with a structural task and four fit-out systems.
     *
     * A module's structure follows the structure of the module below it;
     * its fit-out tasks follow its own structure.
     */
    static ProjectData mic_project(const GeneratorOptions& options, std::mt19937_64& rng);

    /// @p num_tasks tasks with random systems, positions and demands; edges only from lower to higher index.
    static std::vector<Task> random_tasks(size_t num_tasks,
                                          double edge_probability,
                                          std::mt19937_64& rng);

    /// chain_0 -> chain_1 -> ... with identical demand and duration
    static std::vector<Task> linear_chain(size_t num_tasks,
                                          ResourceVector demand,
                                          Hours duration);

    /**
     * @brief Five skilled-labour tasks sharing two skilled workers.
     *
     * "A" needs both workers for 4 h at criticality 9, "B" one worker for
     * 3 h at criticality 3.
     */
    static ProjectData skilled_contention();

    /**
     * @brief A site with a single crane held by the low-criticality "LIFT-01".
     *
     * Pair with crane_emergency().
     */
    static ProjectData single_crane_site();

    /// Criticality-10 structural repair needing the crane for 4 h.
    static Task crane_emergency(TaskId id = "EMG-01");
};

}  // namespace mic_scheduler
