/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace mic_scheduler;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "mic_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.engine.seed, 42u);
    EXPECT_EQ(config.resources.capacity, (ResourceVector{10, 15, 30, 2, 5, 5}));
    EXPECT_DOUBLE_EQ(config.costs.day_rate[index_of(ResourceType::Crane)], 3000.0);
    EXPECT_DOUBLE_EQ(config.clustering.weights.spatial, 0.35);
    EXPECT_DOUBLE_EQ(config.clustering.silhouette_threshold, 0.5);
    EXPECT_EQ(config.clustering.k_min, 2u);
    EXPECT_EQ(config.clustering.k_max, 10u);
    EXPECT_EQ(config.optimizer.population_size, 50u);
    EXPECT_EQ(config.horizon.commit_window_hours, 8u);
    EXPECT_TRUE(validate_config(config).has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [engine]
        seed = 7

        [project]
        name = "tower-b"
        start_date = "2025-01-06"
        horizon_hours = 2000

        [calendar]
        work_windows = [[7, 12], [13, 19]]
        rest_days = ["Sat", "Sun"]

        [resources]
        skilled = 4
        crane = 1

        [costs]
        crane = 3500.0
        penalty = 2500.0

        [clustering]
        k_min = 3
        k_max = 6
        forced_k = 4
        silhouette_threshold = 0.4

        [clustering.weights]
        spatial = 0.5
        system = 0.2
        resource = 0.1
        criticality = 0.2

        [optimizer]
        population_size = 30
        generations = 40
        threads = 2
        allow_overflow = true

        [optimizer.recommendation]
        cost = 0.5
        risk = 0.3
        delay = 0.2

        [horizon]
        commit_window_hours = 16
        lookahead_hours = 100
        budget_ms = 500
        preemption_margin = 2

        [risk]
        monthly_probability = [0.0, 0.0, 0.0, 0.0, 0.0, 0.9, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0]

        [risk.exposure]
        Elec = 0.1

        [telemetry]
        log_dir = "/tmp/mic_logs"
        log_level = "debug"
        report_file = "out.ndjson"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    auto& config = *result;
    EXPECT_EQ(config.engine.seed, 7u);
    EXPECT_EQ(config.project.name, "tower-b");
    EXPECT_EQ(config.project.start_date, "2025-01-06");
    EXPECT_EQ(config.project.horizon_hours, 2000u);
    ASSERT_EQ(config.calendar.work_windows.size(), 2u);
    EXPECT_EQ(config.calendar.work_windows[1], (std::pair<int, int>{13, 19}));
    EXPECT_EQ(config.calendar.rest_days.size(), 2u);
    EXPECT_EQ(config.resources.capacity[index_of(ResourceType::Skilled)], 4);
    EXPECT_EQ(config.resources.capacity[index_of(ResourceType::Crane)], 1);
    EXPECT_EQ(config.resources.capacity[index_of(ResourceType::Unskilled)], 30);
    EXPECT_DOUBLE_EQ(config.costs.day_rate[index_of(ResourceType::Crane)], 3500.0);
    EXPECT_DOUBLE_EQ(config.costs.penalty, 2500.0);
    EXPECT_EQ(config.clustering.k_min, 3u);
    EXPECT_EQ(config.clustering.forced_k, 4u);
    EXPECT_DOUBLE_EQ(config.clustering.weights.spatial, 0.5);
    EXPECT_EQ(config.optimizer.population_size, 30u);
    EXPECT_EQ(config.optimizer.threads, 2u);
    EXPECT_TRUE(config.optimizer.allow_overflow);
    EXPECT_DOUBLE_EQ(config.optimizer.recommendation.cost, 0.5);
    EXPECT_EQ(config.horizon.commit_window_hours, 16u);
    EXPECT_EQ(config.horizon.preemption_margin, 2);
    EXPECT_DOUBLE_EQ(config.risk.monthly_probability[5], 0.9);
    EXPECT_DOUBLE_EQ(config.risk.exposure[static_cast<size_t>(SystemType::Electrical)], 0.1);
    EXPECT_DOUBLE_EQ(config.risk.exposure[static_cast<size_t>(SystemType::Structural)], 1.0);
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_EQ(config.telemetry.report_file, "out.ndjson");
}

TEST_F(ConfigTest, PartialConfig) {
    auto path = write_toml(R"(
        [optimizer]
        generations = 12
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());

    // Overridden field
    EXPECT_EQ(result->optimizer.generations, 12u);
    // Defaults for everything else
    EXPECT_EQ(result->optimizer.population_size, 50u);
    EXPECT_EQ(result->project.start_date, "2024-06-03");
}

TEST_F(ConfigTest, NonexistentFile) {
    auto result = load_config("/nonexistent/path/config.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

TEST_F(ConfigTest, MalformedToml) {
    auto path = write_toml("this is [[ not valid toml }}}}");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, RejectsEmptyKRange) {
    auto path = write_toml(R"(
        [clustering]
        k_min = 5
        k_max = 3
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST_F(ConfigTest, RejectsBadWorkWindow) {
    auto path = write_toml(R"(
        [calendar]
        work_windows = [[12, 8]]
    )");
    EXPECT_FALSE(load_config(path).has_value());
}

TEST_F(ConfigTest, ValidateRejectsTinyPopulation) {
    auto config = default_config();
    config.optimizer.population_size = 1;
    auto valid = validate_config(config);
    ASSERT_FALSE(valid);
    EXPECT_EQ(valid.error().code, ErrorCode::ConfigError);
}
