/**
 * @file kmeans.hpp
 * @brief Seeded k-means++ initialisation and Lloyd iteration.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "clustering/similarity.hpp"

#include <cstdint>
#include <random>
#include <vector>

namespace mic_scheduler {

struct KMeansResult {
    std::vector<uint32_t> labels;           ///< Cluster index per point, all in [0, k)
    std::vector<FeatureVector> centroids;
    double sse{0.0};
    uint32_t iterations{0};
};

/**
 * @brief One k-means run.
 *
 * Requires 1 <= k <= points.size(). Ties in the assignment step go to the
 * lowest centroid index; a centroid left empty is re-seeded on the point
 * farthest from its own centroid, so every label in [0, k) is used.
 */
KMeansResult kmeans(const std::vector<FeatureVector>& points,
                    uint32_t k,
                    std::mt19937_64& rng,
                    uint32_t max_iterations);

/**
 * @brief Lowest-SSE result over @p restarts runs, all drawn from one
 *        generator seeded with @p seed.
 */
KMeansResult kmeans_best_of(const std::vector<FeatureVector>& points,
                            uint32_t k,
                            uint64_t seed,
                            uint32_t restarts,
                            uint32_t max_iterations);

[[nodiscard]] double squared_distance(const FeatureVector& a, const FeatureVector& b) noexcept;

}  // namespace mic_scheduler
