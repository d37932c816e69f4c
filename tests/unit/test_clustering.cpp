/**
 * @file test_clustering.cpp
 * @brief Unit tests for similarity, k-means and the cluster engine.
 * @author Dimitris Kafetzis
 */

#include "clustering/cluster_engine.hpp"
#include "clustering/kmeans.hpp"
#include "clustering/similarity.hpp"
#include "project/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <format>
#include <random>
#include <set>

using namespace mic_scheduler;

// ─── Helpers ─────────────────────────────────

static Task make_task(const std::string& id, SystemType system, Point3 at,
                      ResourceVector demand, int criticality) {
    Task task;
    task.id = id;
    task.system = system;
    task.location = at;
    task.demand = demand;
    task.duration = Hours{4};
    task.criticality = criticality;
    return task;
}

/// Two well separated groups: structural work near the origin, electrical work far away.
static std::vector<Task> two_groups(size_t per_group = 6) {
    std::vector<Task> tasks;
    for (size_t i = 0; i < per_group; ++i) {
        auto offset = static_cast<double>(i) * 0.3;
        tasks.push_back(make_task(std::format("A{}", i), SystemType::Structural,
                                  {offset, 0.0, 0.0}, {2, 0, 1, 1, 0, 0}, 9));
        tasks.push_back(make_task(std::format("B{}", i), SystemType::Electrical,
                                  {60.0 + offset, 40.0, 12.0}, {0, 1, 0, 0, 1, 0}, 2));
    }
    return tasks;
}

static bool is_pure(const Cluster& cluster) {
    std::set<char> groups;
    for (const auto& id : cluster.members) groups.insert(id.front());
    return groups.size() == 1;
}

// ─── Similarity ──────────────────────────────

TEST(SimilarityTest, RangeAndSymmetry) {
    auto tasks = two_groups(3);
    auto model = SimilarityModel::fit(tasks, SimilarityWeights{});
    for (size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_DOUBLE_EQ(model.similarity(i, i), 1.0);
        for (size_t j = 0; j < tasks.size(); ++j) {
            auto s = model.similarity(i, j);
            EXPECT_GE(s, 0.0);
            EXPECT_LE(s, 1.0);
            EXPECT_DOUBLE_EQ(s, model.similarity(j, i));
        }
    }
}

TEST(SimilarityTest, SameGroupCloserThanOtherGroup) {
    auto tasks = two_groups(2);   // A0, B0, A1, B1
    auto model = SimilarityModel::fit(tasks, SimilarityWeights{});
    EXPECT_GT(model.similarity(0, 2), model.similarity(0, 1));
    EXPECT_LT(model.distance(0, 2), model.distance(0, 3));
}

TEST(SimilarityTest, ComponentWeights) {
    // Identical except system: only the system term differs.
    std::vector<Task> tasks{
        make_task("x", SystemType::HVAC, {0, 0, 0}, {1, 0, 0, 0, 0, 0}, 5),
        make_task("y", SystemType::Plumbing, {0, 0, 0}, {1, 0, 0, 0, 0, 0}, 5),
    };
    auto model = SimilarityModel::fit(tasks, SimilarityWeights{});
    EXPECT_NEAR(model.similarity(0, 1), 0.75, 1e-12);
}

TEST(SimilarityTest, EmbeddingSeparatesGroups) {
    auto tasks = two_groups(2);
    auto points = SimilarityModel::fit(tasks, SimilarityWeights{}).embed();
    ASSERT_EQ(points.size(), tasks.size());
    EXPECT_LT(squared_distance(points[0], points[2]), squared_distance(points[0], points[1]));
}

// ─── K-Means ─────────────────────────────────

TEST(KMeansTest, EveryLabelUsed) {
    std::vector<FeatureVector> points{{0.0}, {0.1}, {0.2}, {5.0}, {5.1}, {9.0}};
    std::mt19937_64 rng(3);
    auto result = kmeans(points, 3, rng, 50);
    ASSERT_EQ(result.labels.size(), points.size());
    std::set<uint32_t> used(result.labels.begin(), result.labels.end());
    EXPECT_EQ(used.size(), 3u);
    EXPECT_EQ(result.centroids.size(), 3u);
}

TEST(KMeansTest, DuplicatePointsStillFillEveryCluster) {
    std::vector<FeatureVector> points(5, FeatureVector{1.0, 1.0});
    std::mt19937_64 rng(1);
    auto result = kmeans(points, 3, rng, 20);
    std::set<uint32_t> used(result.labels.begin(), result.labels.end());
    EXPECT_EQ(used.size(), 3u);
    EXPECT_DOUBLE_EQ(result.sse, 0.0);
}

TEST(KMeansTest, BestOfIsDeterministic) {
    std::vector<FeatureVector> points{{0.0, 0.0}, {0.2, 0.1}, {4.0, 4.0}, {4.1, 3.9}, {8.0, 0.0}};
    auto a = kmeans_best_of(points, 2, 99, 4, 50);
    auto b = kmeans_best_of(points, 2, 99, 4, 50);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_DOUBLE_EQ(a.sse, b.sse);
}

// ─── Quality Measures ────────────────────────

TEST(ElbowTest, LargestSecondDifference) {
    std::vector<std::pair<uint32_t, double>> sse{{2, 100.0}, {3, 40.0}, {4, 35.0}, {5, 33.0}};
    EXPECT_EQ(elbow_k(sse), 3u);
}

TEST(ElbowTest, ShortCurvePicksSmallestK) {
    EXPECT_EQ(elbow_k({{4, 10.0}, {5, 2.0}}), 4u);
    EXPECT_EQ(elbow_k({}), 0u);
}

TEST(SilhouetteTest, GoodAndBadPartitions) {
    auto tasks = two_groups(3);   // A0 B0 A1 B1 A2 B2
    auto model = SimilarityModel::fit(tasks, SimilarityWeights{});
    std::vector<uint32_t> good{0, 1, 0, 1, 0, 1};
    std::vector<uint32_t> bad{0, 0, 1, 1, 0, 1};
    std::vector<double> per_cluster;
    auto s_good = silhouette_score(model, good, 2, &per_cluster);
    EXPECT_GT(s_good, 0.8);
    EXPECT_LT(silhouette_score(model, bad, 2), s_good);
    ASSERT_EQ(per_cluster.size(), 2u);
    EXPECT_GT(per_cluster[0], 0.8);
}

// ─── ClusterEngine ───────────────────────────

TEST(ClusterEngineTest, SeparatesObviousGroups) {
    ClusteringConfig config;
    config.k_max = 3;
    ClusterEngine engine(config);
    auto result = engine.cluster(two_groups(), 42);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->chosen_k, 2u);
    EXPECT_TRUE(result->quality_ok);
    EXPECT_GE(result->silhouette, 0.5);
    EXPECT_TRUE(result->diagnostics.empty());
    for (const auto& cluster : result->clusters) {
        EXPECT_TRUE(is_pure(cluster));
    }
}

TEST(ClusterEngineTest, NeverMixesSeparatedGroups) {
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(two_groups(), 42);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sse_by_k.size(), 9u);   // K = 2..10
    for (const auto& cluster : result->clusters) {
        EXPECT_TRUE(is_pure(cluster));
    }
}

TEST(ClusterEngineTest, PartitionCoversEveryTaskOnce) {
    std::mt19937_64 rng(5);
    auto tasks = ProjectGenerator::random_tasks(25, 0.0, rng);
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(tasks, 7);
    ASSERT_TRUE(result.has_value());

    size_t total = 0;
    for (size_t c = 0; c < result->clusters.size(); ++c) {
        EXPECT_EQ(result->clusters[c].id, c);
        EXPECT_FALSE(result->clusters[c].members.empty());
        total += result->clusters[c].members.size();
        for (const auto& id : result->clusters[c].members) {
            EXPECT_EQ(result->cluster_of(id), c);
        }
    }
    EXPECT_EQ(total, tasks.size());
    EXPECT_EQ(result->assignment.size(), tasks.size());
    EXPECT_EQ(result->clusters.size(), result->chosen_k);
}

TEST(ClusterEngineTest, DeterministicAndOrderIndependent) {
    std::mt19937_64 rng(11);
    auto tasks = ProjectGenerator::random_tasks(20, 0.0, rng);
    ClusterEngine engine(ClusteringConfig{});

    auto first = engine.cluster(tasks, 42);
    auto again = engine.cluster(tasks, 42);
    std::reverse(tasks.begin(), tasks.end());
    auto reversed = engine.cluster(tasks, 42);

    ASSERT_TRUE(first && again && reversed);
    EXPECT_EQ(first->assignment, again->assignment);
    EXPECT_EQ(first->assignment, reversed->assignment);
    EXPECT_EQ(first->chosen_k, reversed->chosen_k);
}

TEST(ClusterEngineTest, MembersOrderedByCriticality) {
    auto tasks = two_groups(4);
    tasks[0].criticality = 10;   // A0
    tasks[2].criticality = 1;    // A1
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(tasks, KRange{2, 2}, 1);
    ASSERT_TRUE(result.has_value());

    for (const auto& cluster : result->clusters) {
        for (size_t i = 1; i < cluster.members.size(); ++i) {
            auto prev = std::find_if(tasks.begin(), tasks.end(),
                                     [&](const Task& t) { return t.id == cluster.members[i - 1]; });
            auto cur = std::find_if(tasks.begin(), tasks.end(),
                                    [&](const Task& t) { return t.id == cluster.members[i]; });
            EXPECT_LE(prev->criticality, cur->criticality);
        }
    }
    auto a_cluster = result->cluster_of("A1");
    ASSERT_TRUE(a_cluster.has_value());
    EXPECT_EQ(result->clusters[*a_cluster].members.front(), "A1");
    EXPECT_EQ(result->clusters[*a_cluster].members.back(), "A0");
}

TEST(ClusterEngineTest, ClusterSummaries) {
    auto tasks = two_groups(3);
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(tasks, KRange{2, 4}, 3, 2);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->clusters.size(), 2u);

    // Canonical ids: the cluster holding the smallest id ("A0") is 0.
    const auto& a = result->clusters[0];
    EXPECT_EQ(a.dominant_system, SystemType::Structural);
    EXPECT_DOUBLE_EQ(a.mean_criticality, 9.0);
    EXPECT_DOUBLE_EQ(a.mean_demand[index_of(ResourceType::Crane)], 1.0);
    EXPECT_NEAR(a.centroid.x, 0.3, 1e-9);
    EXPECT_EQ(result->clusters[1].dominant_system, SystemType::Electrical);
}

TEST(ClusterEngineTest, ForcedKSkipsSelection) {
    auto tasks = two_groups();
    ClusteringConfig config;
    config.forced_k = 4;
    ClusterEngine engine(config);
    auto result = engine.cluster(tasks, 42);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->chosen_k, 4u);
    EXPECT_EQ(result->clusters.size(), 4u);
    EXPECT_EQ(result->attempts, 1u);
}

TEST(ClusterEngineTest, LowQualityFallsBackWithWarning) {
    std::mt19937_64 rng(17);
    auto tasks = ProjectGenerator::random_tasks(30, 0.0, rng);
    ClusteringConfig config;
    config.silhouette_threshold = 0.99;
    config.max_retries = 3;
    ClusterEngine engine(config);

    auto result = engine.cluster(tasks, 42);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->quality_ok);
    EXPECT_LE(result->attempts, config.max_retries + 1);
    EXPECT_TRUE(has_diagnostic(result->diagnostics, ErrorCode::ClusteringQuality));
    EXPECT_FALSE(result->clusters.empty());
}

TEST(ClusterEngineTest, TinyInputsGetOneClusterEach) {
    auto tasks = two_groups(1);
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(tasks, 42);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->chosen_k, 2u);
    EXPECT_EQ(result->clusters.size(), 2u);

    auto empty = engine.cluster(std::vector<Task>{}, 42);
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->clusters.empty());
}

TEST(ClusterEngineTest, InvalidRangeIsConfigError) {
    ClusterEngine engine(ClusteringConfig{});
    auto result = engine.cluster(two_groups(), KRange{6, 3}, 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigError);
}

TEST(ClusterEngineTest, InputIsNotModified) {
    auto tasks = two_groups(3);
    tasks[0].criticality = 0;
    auto copy = tasks;
    ClusterEngine engine(ClusteringConfig{});
    ASSERT_TRUE(engine.cluster(tasks, 1).has_value());
    EXPECT_EQ(tasks, copy);
}
