/**
 * @file test_project_file.cpp
 * @brief Unit tests for project file parsing and saving.
 */

#include "project/generator.hpp"
#include "project/project_file.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace mic_scheduler;

namespace {

const ResourceVector kDefaults{10, 15, 30, 2, 5, 5};

constexpr const char* kProject = R"(
[resources]
skilled = 4
crane = 1

[[resources.change]]
from_hour = 100
crane = 2

[[task]]
id = "F1-STR"
system = "Struct"
location = [0.0, 0.0, 3.2]
demand = { skilled = 2, crane = 1 }
duration = 6
criticality = 8

[[task]]
id = "F1-ELEC"
name = "First floor wiring"
system = "Elec"
location = [1.0, 2.0, 3.2]
demand = { skilled = 1, testing = 1 }
duration = 4
predecessors = ["F1-STR"]
rpn = [7, 5, 4]
)";

}  // namespace

class ProjectFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "mic_test_project";
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write_file(const std::string& name, std::string_view content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ProjectFileTest, ParsesTasksAndResources) {
    auto project = parse_project(kProject, kDefaults);
    ASSERT_TRUE(project.has_value()) << project.error().message;

    const auto& caps = project->capacities;
    EXPECT_EQ(caps.base, (ResourceVector{4, 15, 30, 1, 5, 5}));
    ASSERT_EQ(caps.changes.size(), 1u);
    EXPECT_EQ(caps.changes[0].from, SimTime{100});
    EXPECT_EQ(caps.at(SimTime{150})[index_of(ResourceType::Crane)], 2);
    EXPECT_EQ(caps.at(SimTime{150})[index_of(ResourceType::Skilled)], 4);

    ASSERT_EQ(project->tasks.size(), 2u);
    const auto& str = project->tasks[0];
    EXPECT_EQ(str.id, "F1-STR");
    EXPECT_EQ(str.name, "F1-STR");
    EXPECT_EQ(str.system, SystemType::Structural);
    EXPECT_EQ(str.demand, (ResourceVector{2, 0, 0, 1, 0, 0}));
    EXPECT_EQ(str.duration, Hours{6});
    EXPECT_EQ(str.criticality, 8);
    EXPECT_EQ(str.status, TaskStatus::Pending);

    const auto& elec = project->tasks[1];
    EXPECT_EQ(elec.name, "First floor wiring");
    EXPECT_EQ(elec.location, (Point3{1.0, 2.0, 3.2}));
    EXPECT_EQ(elec.predecessors, (std::vector<TaskId>{"F1-STR"}));
    ASSERT_TRUE(elec.rpn.has_value());
    EXPECT_EQ(elec.rpn->value(), 140);
    EXPECT_EQ(elec.criticality, 0);
}

TEST_F(ProjectFileTest, MissingFieldsNameEveryBadTask) {
    auto project = parse_project(R"(
[[task]]
id = "NO-DURATION"
system = "Struct"
location = [0.0, 0.0, 0.0]

[[task]]
system = "Elec"
location = [0.0, 0.0, 0.0]
duration = 2

[[task]]
id = "BAD-SYSTEM"
system = "Roofing"
location = [0.0, 0.0, 0.0]
duration = 2
)", kDefaults);
    ASSERT_FALSE(project.has_value());
    EXPECT_EQ(project.error().code, ErrorCode::DataValidation);
    EXPECT_EQ(project.error().subject_ids,
              (std::vector<TaskId>{"NO-DURATION", "#1", "BAD-SYSTEM"}));
}

TEST_F(ProjectFileTest, UnknownResourceIsConfigError) {
    auto project = parse_project("[resources]\nforklift = 2\n", kDefaults);
    ASSERT_FALSE(project.has_value());
    EXPECT_EQ(project.error().code, ErrorCode::ConfigError);

    auto bad_demand = parse_project(R"(
[[task]]
id = "T"
system = "Struct"
location = [0.0, 0.0, 0.0]
duration = 2
demand = { forklift = 1 }
)", kDefaults);
    ASSERT_FALSE(bad_demand.has_value());
    EXPECT_EQ(bad_demand.error().code, ErrorCode::DataValidation);
}

TEST_F(ProjectFileTest, SyntaxErrorIsConfigError) {
    auto project = parse_project("[[task]\nid = ", kDefaults);
    ASSERT_FALSE(project.has_value());
    EXPECT_EQ(project.error().code, ErrorCode::ConfigError);
}

TEST_F(ProjectFileTest, MissingFileIsIoError) {
    auto project = load_project(dir_ / "absent.toml", kDefaults);
    ASSERT_FALSE(project.has_value());
    EXPECT_EQ(project.error().code, ErrorCode::IoError);
}

TEST_F(ProjectFileTest, LoadsFromDisk) {
    auto path = write_file("site.toml", kProject);
    auto project = load_project(path, kDefaults);
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project->tasks.size(), 2u);
}

TEST_F(ProjectFileTest, SavedStateResumes) {
    auto site = ProjectGenerator::single_crane_site();
    site.capacities.add_change(SimTime{48}, ResourceVector{6, 6, 10, 2, 2, 2});

    auto& lift = site.tasks[0];
    lift.status = TaskStatus::Completed;
    lift.planned_start = SimTime{8};
    lift.planned_end = SimTime{12};
    lift.actual_start = SimTime{8};
    lift.actual_end = SimTime{12};

    Task remainder = lift;
    remainder.id = "LIFT-01/r1";
    remainder.status = TaskStatus::SplitRemainder;
    remainder.split_from = "LIFT-01";
    remainder.planned_start.reset();
    remainder.planned_end.reset();
    remainder.actual_start.reset();
    remainder.actual_end.reset();
    site.tasks.push_back(remainder);

    auto emergency = ProjectGenerator::crane_emergency();
    emergency.deadline = SimTime{41};
    emergency.rpn = RpnScore{10, 9, 8};
    site.tasks.push_back(emergency);

    auto path = dir_ / "state.toml";
    ASSERT_TRUE(save_project(path, ProjectData{site.tasks, site.capacities, SimTime{12}}));

    auto loaded = load_project(path, ResourceVector{});
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded->capacities, site.capacities);
    EXPECT_EQ(loaded->tasks, site.tasks);
    EXPECT_EQ(loaded->origin, SimTime{12});
}

TEST_F(ProjectFileTest, WindowOriginDefaultsToZero) {
    auto fresh = parse_project(R"(
[[task]]
id = "T"
system = "Structural"
location = [0.0, 0.0, 0.0]
demand = { skilled = 1 }
duration = 2
)", ProjectGenerator::default_capacities().base);
    ASSERT_TRUE(fresh.has_value()) << fresh.error().message;
    EXPECT_EQ(fresh->origin, SimTime{0});

    auto resumed = parse_project("[window]\norigin = 36\n", ResourceVector{});
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(resumed->origin, SimTime{36});

    auto negative = parse_project("[window]\norigin = -4\n", ResourceVector{});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code, ErrorCode::ConfigError);
}

TEST_F(ProjectFileTest, SaveToMissingDirectoryFails) {
    auto result = save_project(dir_ / "no" / "such" / "dir.toml", ProjectData{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

TEST(TaskStatusTest, ParsesEveryStatus) {
    for (auto status : {TaskStatus::Pending, TaskStatus::Scheduled, TaskStatus::InProgress,
                        TaskStatus::Preempted, TaskStatus::Completed, TaskStatus::SplitRemainder}) {
        EXPECT_EQ(parse_task_status(to_string(status)), status);
    }
    EXPECT_FALSE(parse_task_status("paused").has_value());
}
