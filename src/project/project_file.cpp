/**
 * @file project_file.cpp
 * @brief Project file reading and writing using toml++.
 * @author Dimitris Kafetzis
 */

#include "project/project_file.hpp"

#include <toml++/toml.hpp>

#include <format>
#include <fstream>
#include <sstream>

namespace mic_scheduler {

namespace {

std::optional<ResourceType> parse_resource_type(std::string_view name) noexcept {
    for (auto type : kAllResourceTypes) {
        if (to_string(type) == name) return type;
    }
    return std::nullopt;
}

/// Overlay the listed resource keys on @p units; false on an unknown key or non-integer value.
bool read_units(const toml::table& table, ResourceVector& units) {
    for (const auto& [key, node] : table) {
        auto type = parse_resource_type(key.str());
        auto value = node.value<int64_t>();
        if (!type || !value) return false;
        units[index_of(*type)] = static_cast<int32_t>(*value);
    }
    return true;
}

std::optional<Point3> read_point(const toml::node_view<const toml::node>& node) {
    const auto* arr = node.as_array();
    if (arr == nullptr || arr->size() != 3) return std::nullopt;
    auto x = arr->at(0).value<double>();
    auto y = arr->at(1).value<double>();
    auto z = arr->at(2).value<double>();
    if (!x || !y || !z) return std::nullopt;
    return Point3{*x, *y, *z};
}

std::optional<SimTime> read_hour(const toml::node_view<const toml::node>& node) {
    if (auto v = node.value<int64_t>()) return SimTime{*v};
    return std::nullopt;
}

/// Parse one [[task]] table; false when a required field is missing or malformed.
bool read_task(const toml::table& table, Task& task) {
    bool ok = true;

    task.id = table["id"].value_or(std::string{});
    task.name = table["name"].value_or(std::string{task.id});
    if (task.id.empty()) ok = false;

    auto system = parse_system_type(table["system"].value_or(std::string_view{}));
    if (system) {
        task.system = *system;
    } else {
        ok = false;
    }

    if (auto location = read_point(table["location"])) {
        task.location = *location;
    } else {
        ok = false;
    }

    if (auto duration = table["duration"].value<int64_t>()) {
        task.duration = Hours{*duration};
    } else {
        ok = false;
    }

    if (const auto* demand = table["demand"].as_table()) {
        if (!read_units(*demand, task.demand)) ok = false;
    }

    if (const auto* preds = table["predecessors"].as_array()) {
        for (const auto& pred : *preds) {
            auto id = pred.value<std::string>();
            if (!id) {
                ok = false;
                continue;
            }
            task.predecessors.push_back(*id);
        }
    }

    task.criticality = static_cast<int>(table["criticality"].value_or(int64_t{0}));
    if (const auto* rpn = table["rpn"].as_array()) {
        if (rpn->size() != 3) {
            ok = false;
        } else {
            task.rpn = RpnScore{
                static_cast<int>(rpn->at(0).value_or(int64_t{0})),
                static_cast<int>(rpn->at(1).value_or(int64_t{0})),
                static_cast<int>(rpn->at(2).value_or(int64_t{0})),
            };
        }
    }

    task.urgent = table["urgent"].value_or(false);
    task.deadline = read_hour(table["deadline"]);

    if (auto status = table["status"].value<std::string>()) {
        auto parsed = parse_task_status(*status);
        if (parsed) {
            task.status = *parsed;
        } else {
            ok = false;
        }
    }
    task.planned_start = read_hour(table["planned_start"]);
    task.planned_end = read_hour(table["planned_end"]);
    task.actual_start = read_hour(table["actual_start"]);
    task.actual_end = read_hour(table["actual_end"]);
    if (auto split_from = table["split_from"].value<std::string>()) task.split_from = *split_from;

    return ok;
}

Result<ProjectData> from_table(const toml::table& root, const ResourceVector& default_capacity) {
    ProjectData project;
    project.capacities.base = default_capacity;

    if (const auto* resources = root["resources"].as_table()) {
        for (const auto& [key, node] : *resources) {
            if (key.str() == "change") continue;
            auto type = parse_resource_type(key.str());
            auto value = node.value<int64_t>();
            if (!type || !value) {
                return Error{ErrorCode::ConfigError,
                             std::format("unknown resource entry '{}'", key.str())};
            }
            project.capacities.base[index_of(*type)] = static_cast<int32_t>(*value);
        }

        if (const auto* changes = (*resources)["change"].as_array()) {
            for (const auto& node : *changes) {
                const auto* change = node.as_table();
                auto from = change ? (*change)["from_hour"].value<int64_t>() : std::nullopt;
                if (!from) {
                    return Error{ErrorCode::ConfigError,
                                 "resources.change entries need an integer from_hour"};
                }
                auto units = project.capacities.base;
                toml::table listed = *change;
                listed.erase("from_hour");
                if (!read_units(listed, units)) {
                    return Error{ErrorCode::ConfigError, "unknown resource in resources.change"};
                }
                project.capacities.add_change(SimTime{*from}, units);
            }
        }
    }

    if (const auto* window = root["window"].as_table()) {
        auto origin = (*window)["origin"].value<int64_t>();
        if (!origin || *origin < 0) {
            return Error{ErrorCode::ConfigError, "window.origin must be a non-negative hour"};
        }
        project.origin = SimTime{*origin};
    }

    std::vector<std::string> bad;
    if (const auto* tasks = root["task"].as_array()) {
        size_t index = 0;
        for (const auto& node : *tasks) {
            Task task;
            const auto* table = node.as_table();
            if (table == nullptr || !read_task(*table, task)) {
                bad.push_back(task.id.empty() ? std::format("#{}", index) : task.id);
            } else {
                project.tasks.push_back(std::move(task));
            }
            ++index;
        }
    }
    if (!bad.empty()) {
        std::string joined;
        for (const auto& id : bad) {
            if (!joined.empty()) joined += ", ";
            joined += id;
        }
        return Error{ErrorCode::DataValidation,
                     std::format("tasks with missing or malformed fields: {}", joined),
                     std::move(bad)};
    }
    return project;
}

toml::table units_table(const ResourceVector& units, bool skip_zero) {
    toml::table out;
    for (auto type : kAllResourceTypes) {
        auto value = units[index_of(type)];
        if (skip_zero && value == 0) continue;
        out.insert_or_assign(to_string(type), int64_t{value});
    }
    return out;
}

}  // anonymous namespace

std::optional<TaskStatus> parse_task_status(std::string_view text) noexcept {
    for (auto status : {TaskStatus::Pending, TaskStatus::Scheduled, TaskStatus::InProgress,
                        TaskStatus::Preempted, TaskStatus::Completed, TaskStatus::SplitRemainder}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

Result<ProjectData> load_project(const std::filesystem::path& path,
                                 const ResourceVector& default_capacity) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::IoError, "Project file not found: " + path.string()};
    }
    try {
        return from_table(toml::parse_file(path.string()), default_capacity);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::format("TOML parse error in {}: {}", path.string(), err.description())};
    }
}

Result<ProjectData> parse_project(std::string_view text, const ResourceVector& default_capacity) {
    try {
        return from_table(toml::parse(text), default_capacity);
    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::format("TOML parse error: {}", err.description())};
    }
}

Result<void> save_project(const std::filesystem::path& path, const ProjectData& project) {
    toml::table root;

    auto resources = units_table(project.capacities.base, false);
    if (!project.capacities.changes.empty()) {
        toml::array changes;
        for (const auto& change : project.capacities.changes) {
            auto entry = units_table(change.units, false);
            entry.insert_or_assign("from_hour", int64_t{change.from.count()});
            changes.push_back(std::move(entry));
        }
        resources.insert_or_assign("change", std::move(changes));
    }
    root.insert_or_assign("resources", std::move(resources));
    root.insert_or_assign("window", toml::table{{"origin", int64_t{project.origin.count()}}});

    toml::array tasks;
    for (const auto& task : project.tasks) {
        toml::table entry;
        entry.insert_or_assign("id", task.id);
        entry.insert_or_assign("name", task.name);
        entry.insert_or_assign("system", std::string{to_string(task.system)});
        entry.insert_or_assign("location",
                               toml::array{task.location.x, task.location.y, task.location.z});
        entry.insert_or_assign("demand", units_table(task.demand, true));
        entry.insert_or_assign("duration", int64_t{task.duration.count()});

        toml::array preds;
        for (const auto& pred : task.predecessors) preds.push_back(pred);
        entry.insert_or_assign("predecessors", std::move(preds));

        if (task.criticality != 0) entry.insert_or_assign("criticality", int64_t{task.criticality});
        if (task.rpn) {
            entry.insert_or_assign("rpn", toml::array{int64_t{task.rpn->severity},
                                                      int64_t{task.rpn->occurrence},
                                                      int64_t{task.rpn->detection}});
        }
        if (task.urgent) entry.insert_or_assign("urgent", true);
        entry.insert_or_assign("status", std::string{to_string(task.status)});

        auto put_hour = [&entry](std::string_view key, const std::optional<SimTime>& t) {
            if (t) entry.insert_or_assign(key, int64_t{t->count()});
        };
        put_hour("deadline", task.deadline);
        put_hour("planned_start", task.planned_start);
        put_hour("planned_end", task.planned_end);
        put_hour("actual_start", task.actual_start);
        put_hour("actual_end", task.actual_end);
        if (task.split_from) entry.insert_or_assign("split_from", *task.split_from);

        tasks.push_back(std::move(entry));
    }
    root.insert_or_assign("task", std::move(tasks));

    std::ofstream out(path);
    if (!out) {
        return Error{ErrorCode::IoError, "cannot write project file: " + path.string()};
    }
    out << root << '\n';
    if (!out) {
        return Error{ErrorCode::IoError, "short write to project file: " + path.string()};
    }
    return Result<void>{};
}

}  // namespace mic_scheduler
