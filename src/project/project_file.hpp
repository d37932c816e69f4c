/**
 * @file project_file.hpp
 * @brief TOML project description: tasks and resource capacities.
 * @author Dimitris Kafetzis
 *
 * @code
 * [resources]
 * skilled = 10
 * crane = 2
 *
 * [[resources.change]]
 * from_hour = 200
 * crane = 1
 *
 * [[task]]
 * id = "L3-STR-01"
 * system = "Struct"
 * location = [12.0, 4.5, 9.0]
 * demand = { skilled = 2, crane = 1 }
 * duration = 6
 * predecessors = ["L2-STR-01"]
 * criticality = 8            # or rpn = [7, 5, 4]
 * @endcode
 *
 * Lifecycle keys (status, planned_start, actual_start, ...) are optional and
 * let a saved rolling-horizon state be resumed.
 */

#pragma once

#include "core/result.hpp"
#include "project/model.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace mic_scheduler {

struct ProjectData {
    std::vector<Task> tasks;
    ResourceCapacities capacities;
    SimTime origin{0};                  ///< Rolling-window origin; [window] origin in the file
};

/**
 * @brief Parse a project file.
 *
 * @p default_capacity applies to resource types the file does not list.
 * Missing file: IoError. TOML syntax: ConfigError. Missing or malformed task
 * fields: DataValidation naming every offending task.
 */
Result<ProjectData> load_project(const std::filesystem::path& path,
                                 const ResourceVector& default_capacity);

/// Same as load_project() on in-memory TOML text.
Result<ProjectData> parse_project(std::string_view text, const ResourceVector& default_capacity);

/// Write @p project, lifecycle fields included, in the format load_project() reads.
Result<void> save_project(const std::filesystem::path& path, const ProjectData& project);

[[nodiscard]] std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept;

}  // namespace mic_scheduler
