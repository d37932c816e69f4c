/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * Every field carries the default the engine runs with when the key is
 * absent from the TOML file.
 */

#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/result.hpp"
#include "core/types.hpp"

namespace mic_scheduler {

struct EngineConfig {
    uint64_t seed = 42;                 ///< Fixes every random decision
};

struct ProjectConfig {
    std::string name = "mic-project";
    std::string start_date = "2024-06-03";
    uint32_t horizon_hours = 8760;      ///< Latest hour any task may finish
    ProjectBounds bounds;
};

struct CalendarConfig {
    std::vector<std::pair<int, int>> work_windows{{8, 12}, {13, 17}};
    std::vector<std::string> rest_days{"Sun"};
};

struct ResourceConfig {
    ResourceVector capacity{10, 15, 30, 2, 5, 5};
};

struct CostConfig {
    std::array<double, kResourceTypeCount> day_rate{1200.0, 800.0, 500.0,
                                                    3000.0, 1500.0, 1000.0};
    double penalty = 2000.0;            ///< Per resource-wait hour
    double downtime = 5000.0;           ///< Per overflow unit-hour
    double cluster_setup = 500.0;       ///< Per cluster mobilisation
    double emergency_multiplier = 1.2;
};

struct SimilarityWeights {
    double spatial = 0.35;
    double system = 0.25;
    double resource = 0.15;
    double criticality = 0.25;
};

struct ClusteringConfig {
    uint32_t k_min = 2;
    uint32_t k_max = 10;
    uint32_t forced_k = 0;              ///< 0 = elbow selection
    double silhouette_threshold = 0.5;
    uint32_t max_retries = 4;
    uint32_t max_iterations = 100;
    uint32_t restarts = 4;
    SimilarityWeights weights;
};

struct RecommendationWeights {
    double cost = 0.35;
    double risk = 0.45;
    double delay = 0.20;
};

struct OptimizerConfig {
    uint32_t population_size = 50;
    uint32_t generations = 100;
    double crossover_probability = 0.9;
    double mutation_probability = 0.0;  ///< 0 = 1/n per gene
    uint32_t stall_generations = 25;    ///< 0 disables early stop
    uint32_t threads = 1;               ///< Fitness evaluation workers, 0 = hardware
    bool allow_overflow = false;
    RecommendationWeights recommendation;
};

struct HorizonConfig {
    uint32_t commit_window_hours = 8;
    uint32_t lookahead_hours = 336;
    uint32_t budget_ms = 10000;
    int32_t preemption_margin = 3;      ///< Minimum criticality gap to preempt
};

struct RiskConfig {
    /// Typhoon/rainstorm probability by month (January first).
    std::array<double, 12> monthly_probability{0.01, 0.01, 0.02, 0.05, 0.15, 0.30,
                                               0.50, 0.60, 0.40, 0.20, 0.05, 0.01};
    /// Weather exposure by SystemType.
    std::array<double, kSystemTypeCount> exposure{1.0, 0.4, 0.3, 0.5, 1.0};
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path report_file = "schedule_report.ndjson";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    ProjectConfig project;
    CalendarConfig calendar;
    ResourceConfig resources;
    CostConfig costs;
    ClusteringConfig clustering;
    OptimizerConfig optimizer;
    HorizonConfig horizon;
    RiskConfig risk;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Range and consistency checks that TOML typing cannot express.
 */
Result<void> validate_config(const Config& config);

}  // namespace mic_scheduler
