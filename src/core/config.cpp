/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <format>

namespace mic_scheduler {

namespace {

template <size_t N>
void read_double_array(toml::node_view<toml::node> node, std::array<double, N>& out) {
    auto* arr = node.as_array();
    if (arr == nullptr) return;
    for (size_t i = 0; i < N && i < arr->size(); ++i) {
        out[i] = arr->at(i).value_or(out[i]);
    }
}

void read_resource_vector(toml::node_view<toml::node> table, ResourceVector& out) {
    if (!table.is_table()) return;
    for (auto type : kAllResourceTypes) {
        auto idx = index_of(type);
        out[idx] = static_cast<int32_t>(
            table[to_string(type)].value_or(int64_t{out[idx]}));
    }
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::IoError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.seed = static_cast<uint64_t>(
                engine["seed"].value_or(int64_t{42}));
        }

        // [project]
        if (auto project = tbl["project"]; project.is_table()) {
            config.project.name = project["name"].value_or(std::string{config.project.name});
            config.project.start_date = project["start_date"].value_or(std::string{config.project.start_date});
            config.project.horizon_hours = static_cast<uint32_t>(
                project["horizon_hours"].value_or(int64_t{config.project.horizon_hours}));

            // [project.bounds]
            if (auto bounds = project["bounds"]; bounds.is_table()) {
                auto& b = config.project.bounds;
                b.min.x = bounds["min_x"].value_or(b.min.x);
                b.min.y = bounds["min_y"].value_or(b.min.y);
                b.min.z = bounds["min_z"].value_or(b.min.z);
                b.max.x = bounds["max_x"].value_or(b.max.x);
                b.max.y = bounds["max_y"].value_or(b.max.y);
                b.max.z = bounds["max_z"].value_or(b.max.z);
            }
        }

        // [calendar]
        if (auto calendar = tbl["calendar"]; calendar.is_table()) {
            if (auto* windows = calendar["work_windows"].as_array()) {
                config.calendar.work_windows.clear();
                for (auto& window : *windows) {
                    auto* pair = window.as_array();
                    if (pair == nullptr || pair->size() != 2) {
                        return Error{ErrorCode::ConfigError,
                                     "calendar.work_windows entries must be [begin, end] pairs"};
                    }
                    config.calendar.work_windows.emplace_back(
                        static_cast<int>(pair->at(0).value_or(int64_t{0})),
                        static_cast<int>(pair->at(1).value_or(int64_t{0})));
                }
            }
            if (auto* rest = calendar["rest_days"].as_array()) {
                config.calendar.rest_days.clear();
                for (auto& day : *rest) {
                    config.calendar.rest_days.push_back(day.value_or(std::string{}));
                }
            }
        }

        // [resources]
        read_resource_vector(tbl["resources"], config.resources.capacity);

        // [costs]
        if (auto costs = tbl["costs"]; costs.is_table()) {
            for (auto type : kAllResourceTypes) {
                auto idx = index_of(type);
                config.costs.day_rate[idx] =
                    costs[to_string(type)].value_or(config.costs.day_rate[idx]);
            }
            config.costs.penalty = costs["penalty"].value_or(config.costs.penalty);
            config.costs.downtime = costs["downtime"].value_or(config.costs.downtime);
            config.costs.cluster_setup = costs["cluster_setup"].value_or(config.costs.cluster_setup);
            config.costs.emergency_multiplier =
                costs["emergency_multiplier"].value_or(config.costs.emergency_multiplier);
        }

        // [clustering]
        if (auto clustering = tbl["clustering"]; clustering.is_table()) {
            auto& c = config.clustering;
            c.k_min = static_cast<uint32_t>(clustering["k_min"].value_or(int64_t{c.k_min}));
            c.k_max = static_cast<uint32_t>(clustering["k_max"].value_or(int64_t{c.k_max}));
            c.forced_k = static_cast<uint32_t>(clustering["forced_k"].value_or(int64_t{c.forced_k}));
            c.silhouette_threshold =
                clustering["silhouette_threshold"].value_or(c.silhouette_threshold);
            c.max_retries = static_cast<uint32_t>(
                clustering["max_retries"].value_or(int64_t{c.max_retries}));
            c.max_iterations = static_cast<uint32_t>(
                clustering["max_iterations"].value_or(int64_t{c.max_iterations}));
            c.restarts = static_cast<uint32_t>(clustering["restarts"].value_or(int64_t{c.restarts}));

            // [clustering.weights]
            if (auto weights = clustering["weights"]; weights.is_table()) {
                c.weights.spatial = weights["spatial"].value_or(c.weights.spatial);
                c.weights.system = weights["system"].value_or(c.weights.system);
                c.weights.resource = weights["resource"].value_or(c.weights.resource);
                c.weights.criticality = weights["criticality"].value_or(c.weights.criticality);
            }
        }

        // [optimizer]
        if (auto optimizer = tbl["optimizer"]; optimizer.is_table()) {
            auto& o = config.optimizer;
            o.population_size = static_cast<uint32_t>(
                optimizer["population_size"].value_or(int64_t{o.population_size}));
            o.generations = static_cast<uint32_t>(
                optimizer["generations"].value_or(int64_t{o.generations}));
            o.crossover_probability =
                optimizer["crossover_probability"].value_or(o.crossover_probability);
            o.mutation_probability =
                optimizer["mutation_probability"].value_or(o.mutation_probability);
            o.stall_generations = static_cast<uint32_t>(
                optimizer["stall_generations"].value_or(int64_t{o.stall_generations}));
            o.threads = static_cast<uint32_t>(optimizer["threads"].value_or(int64_t{o.threads}));
            o.allow_overflow = optimizer["allow_overflow"].value_or(o.allow_overflow);

            // [optimizer.recommendation]
            if (auto rec = optimizer["recommendation"]; rec.is_table()) {
                o.recommendation.cost = rec["cost"].value_or(o.recommendation.cost);
                o.recommendation.risk = rec["risk"].value_or(o.recommendation.risk);
                o.recommendation.delay = rec["delay"].value_or(o.recommendation.delay);
            }
        }

        // [horizon]
        if (auto horizon = tbl["horizon"]; horizon.is_table()) {
            auto& h = config.horizon;
            h.commit_window_hours = static_cast<uint32_t>(
                horizon["commit_window_hours"].value_or(int64_t{h.commit_window_hours}));
            h.lookahead_hours = static_cast<uint32_t>(
                horizon["lookahead_hours"].value_or(int64_t{h.lookahead_hours}));
            h.budget_ms = static_cast<uint32_t>(horizon["budget_ms"].value_or(int64_t{h.budget_ms}));
            h.preemption_margin = static_cast<int32_t>(
                horizon["preemption_margin"].value_or(int64_t{h.preemption_margin}));
        }

        // [risk]
        if (auto risk = tbl["risk"]; risk.is_table()) {
            read_double_array(risk["monthly_probability"], config.risk.monthly_probability);
            if (auto exposure = risk["exposure"]; exposure.is_table()) {
                for (size_t s = 0; s < kSystemTypeCount; ++s) {
                    auto name = to_string(static_cast<SystemType>(s));
                    config.risk.exposure[s] = exposure[name].value_or(config.risk.exposure[s]);
                }
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.report_file =
                telemetry["report_file"].value_or(std::string{"schedule_report.ndjson"});
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    const auto& c = config.clustering;
    if (c.k_min < 1 || c.k_max < c.k_min) {
        return Error{ErrorCode::ConfigError,
                     std::format("clustering k range [{}, {}] is empty", c.k_min, c.k_max)};
    }
    if (c.silhouette_threshold < -1.0 || c.silhouette_threshold > 1.0) {
        return Error{ErrorCode::ConfigError, "clustering.silhouette_threshold must lie in [-1, 1]"};
    }

    const auto& o = config.optimizer;
    if (o.population_size < 2) {
        return Error{ErrorCode::ConfigError, "optimizer.population_size must be at least 2"};
    }
    if (o.crossover_probability < 0.0 || o.crossover_probability > 1.0 ||
        o.mutation_probability < 0.0 || o.mutation_probability > 1.0) {
        return Error{ErrorCode::ConfigError, "optimizer probabilities must lie in [0, 1]"};
    }

    for (const auto& [begin, end] : config.calendar.work_windows) {
        if (begin < 0 || end > 24 || begin >= end) {
            return Error{ErrorCode::ConfigError,
                         std::format("invalid work window [{}, {})", begin, end)};
        }
    }
    for (auto units : config.resources.capacity) {
        if (units < 0) {
            return Error{ErrorCode::ConfigError, "resource capacities must be non-negative"};
        }
    }
    if (config.project.horizon_hours == 0) {
        return Error{ErrorCode::ConfigError, "project.horizon_hours must be positive"};
    }
    return Result<void>{};
}

}  // namespace mic_scheduler
