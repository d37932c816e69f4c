/**
 * @file cluster_engine.hpp
 * @brief Similarity-based task clustering with automatic K selection.
 * @author Dimitris Kafetzis
 *
 * Groups tasks into execution batches: k-means++ over the similarity
 * embedding for every K in range, elbow selection on the SSE curve, then a
 * silhouette check on the composite distance with bounded K retries.
 */

#pragma once

#include "core/config.hpp"
#include "core/diagnostic.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "clustering/similarity.hpp"
#include "project/model.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace mic_scheduler {

struct KRange {
    uint32_t min = 2;
    uint32_t max = 10;
};

/**
 * @brief One execution batch. Snapshots are immutable; a new run supersedes them.
 */
struct Cluster {
    ClusterId id{0};
    std::vector<TaskId> members;            ///< Ascending criticality, then id
    Point3 centroid;                        ///< Spatial mean
    SystemType dominant_system = SystemType::Structural;
    std::array<double, kResourceTypeCount> mean_demand{};
    double mean_criticality{0.0};
    double silhouette{0.0};
};

struct ClusteringResult {
    std::vector<Cluster> clusters;          ///< Indexed by ClusterId
    std::map<TaskId, ClusterId> assignment;
    std::vector<std::pair<uint32_t, double>> sse_by_k;
    uint32_t chosen_k{0};
    double silhouette{0.0};
    bool quality_ok{true};
    uint32_t attempts{0};                   ///< K values checked against the threshold
    std::vector<Diagnostic> diagnostics;

    [[nodiscard]] std::optional<ClusterId> cluster_of(const TaskId& id) const;
};

class ClusterEngine {
public:
    explicit ClusterEngine(ClusteringConfig config, Logger* logger = nullptr);

    /// Cluster with the configured range and forced K.
    [[nodiscard]] Result<ClusteringResult> cluster(std::span<const Task> tasks,
                                                   uint64_t seed) const;

    /**
     * @brief Cluster @p tasks; @p forced_k > 0 bypasses elbow selection and retries.
     *
     * Unresolved criticality is resolved on a private copy; @p tasks is never
     * modified. Fewer than three tasks yield one cluster per task.
     */
    [[nodiscard]] Result<ClusteringResult> cluster(std::span<const Task> tasks,
                                                   KRange range,
                                                   uint64_t seed,
                                                   uint32_t forced_k = 0) const;

    [[nodiscard]] const ClusteringConfig& config() const noexcept { return config_; }

private:
    ClusteringConfig config_;
    Logger* logger_;
};

/**
 * @brief K with the largest SSE second difference.
 *
 * Needs three consecutive K values; with fewer the smallest K is returned.
 */
[[nodiscard]] uint32_t elbow_k(const std::vector<std::pair<uint32_t, double>>& sse_by_k);

/**
 * @brief Mean silhouette coefficient on the composite distance 1 - S.
 *
 * Singleton clusters contribute 0. @p per_cluster, when given, receives the
 * mean coefficient of each label.
 */
[[nodiscard]] double silhouette_score(const SimilarityModel& model,
                                      const std::vector<uint32_t>& labels,
                                      uint32_t k,
                                      std::vector<double>* per_cluster = nullptr);

}  // namespace mic_scheduler
