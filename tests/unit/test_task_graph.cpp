/**
 * @file test_task_graph.cpp
 * @brief Unit tests for TaskGraph.
 * @author Dimitris Kafetzis
 */

#include "project/task_graph.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace mic_scheduler;

// ─── Helper ──────────────────────────────────

static Task make_task(const std::string& id, int64_t hours = 4,
                      std::vector<TaskId> preds = {}) {
    Task task;
    task.id = id;
    task.name = "Task " + id;
    task.duration = Hours{hours};
    task.predecessors = std::move(preds);
    return task;
}

static size_t position(const std::vector<TaskId>& order, const TaskId& id) {
    return static_cast<size_t>(std::find(order.begin(), order.end(), id) - order.begin());
}

// ─── Construction ────────────────────────────

TEST(TaskGraphTest, AddTasksAndEdges) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_dependency("a", "b");

    EXPECT_EQ(graph.task_count(), 2u);
    EXPECT_TRUE(graph.contains("a"));
    EXPECT_EQ(graph.dependents("a"), (std::vector<TaskId>{"b"}));
    EXPECT_EQ(graph.dependencies("b"), (std::vector<TaskId>{"a"}));
    EXPECT_EQ(graph.get_task("b")->predecessors, (std::vector<TaskId>{"a"}));
}

TEST(TaskGraphTest, DuplicateEdgeIgnored) {
    TaskGraph graph;
    graph.add_task(make_task("a"));
    graph.add_task(make_task("b"));
    graph.add_dependency("a", "b");
    graph.add_dependency("a", "b");
    EXPECT_EQ(graph.dependents("a").size(), 1u);
}

TEST(TaskGraphTest, FromTasksUsesPredecessorLists) {
    std::vector<Task> tasks{make_task("s"), make_task("e1", 2, {"s"}), make_task("e2", 3, {"s"})};
    auto graph = TaskGraph::from_tasks(tasks);
    EXPECT_EQ(graph.dependents("s").size(), 2u);
    EXPECT_FALSE(graph.get_task("missing").has_value());
}

// ─── Ordering ────────────────────────────────

TEST(TaskGraphTest, TopologicalOrderRespectsEdges) {
    std::vector<Task> tasks{
        make_task("d", 1, {"b", "c"}), make_task("c", 1, {"a"}),
        make_task("b", 1, {"a"}), make_task("a", 1),
    };
    auto order = TaskGraph::from_tasks(tasks).topological_order();
    ASSERT_EQ(order.size(), 4u);
    EXPECT_LT(position(order, "a"), position(order, "b"));
    EXPECT_LT(position(order, "a"), position(order, "c"));
    EXPECT_LT(position(order, "b"), position(order, "d"));
    EXPECT_LT(position(order, "c"), position(order, "d"));
}

TEST(TaskGraphTest, TopologicalTiesBrokenById) {
    std::vector<Task> tasks{make_task("z"), make_task("m"), make_task("a")};
    auto order = TaskGraph::from_tasks(tasks).topological_order();
    EXPECT_EQ(order, (std::vector<TaskId>{"a", "m", "z"}));
}

TEST(TaskGraphTest, DetectsCycle) {
    std::vector<Task> tasks{
        make_task("a", 1, {"c"}), make_task("b", 1, {"a"}), make_task("c", 1, {"b"}),
        make_task("free"),
    };
    auto graph = TaskGraph::from_tasks(tasks);
    EXPECT_TRUE(graph.has_cycle());

    auto cycle = graph.find_cycle();
    std::sort(cycle.begin(), cycle.end());
    EXPECT_EQ(cycle, (std::vector<TaskId>{"a", "b", "c"}));
    EXPECT_LT(graph.topological_order().size(), graph.task_count());
}

TEST(TaskGraphTest, UnknownPredecessorIgnoredByAlgorithms) {
    std::vector<Task> tasks{make_task("a", 1, {"ghost"})};
    auto graph = TaskGraph::from_tasks(tasks);
    EXPECT_FALSE(graph.has_cycle());
    EXPECT_EQ(graph.topological_order().size(), 1u);
}

// ─── Metrics ─────────────────────────────────

TEST(TaskGraphTest, CriticalPathLength) {
    std::vector<Task> tasks{
        make_task("a", 2), make_task("b", 5, {"a"}), make_task("c", 1, {"a"}),
        make_task("d", 3, {"b", "c"}),
    };
    auto graph = TaskGraph::from_tasks(tasks);
    EXPECT_EQ(graph.critical_path_length(), Hours{10});
    EXPECT_EQ(graph.total_duration(), Hours{11});
}
