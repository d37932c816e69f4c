/**
 * @file similarity.hpp
 * @brief Composite task similarity and its k-means embedding.
 * @author Dimitris Kafetzis
 *
 * S(i, j) = w_s * spatial + w_y * same_system + w_r * resource + w_c * criticality
 *
 * Spatial and resource terms are Euclidean distances min-max normalised over
 * the task set and inverted; same_system is 0/1; criticality closeness is
 * 1 - |Ci - Cj| / 10. Distance is 1 - S.
 */

#pragma once

#include "core/config.hpp"
#include "project/model.hpp"

#include <span>
#include <vector>

namespace mic_scheduler {

using FeatureVector = std::vector<double>;

class SimilarityModel {
public:
    /// Precompute normalisation ranges over @p tasks (criticality must be resolved).
    static SimilarityModel fit(std::span<const Task> tasks, const SimilarityWeights& weights);

    [[nodiscard]] double similarity(size_t i, size_t j) const noexcept;
    [[nodiscard]] double distance(size_t i, size_t j) const noexcept { return 1.0 - similarity(i, j); }

    /**
     * @brief Feature vectors for k-means.
     *
     * Squared Euclidean distance between two embedded tasks equals the
     * weighted sum of the squared component dissimilarities, with spatial and
     * resource distances scaled by their largest pairwise value.
     */
    [[nodiscard]] std::vector<FeatureVector> embed() const;

    [[nodiscard]] size_t size() const noexcept { return locations_.size(); }

private:
    SimilarityModel() = default;

    SimilarityWeights weights_;
    std::vector<Point3> locations_;
    std::vector<SystemType> systems_;
    std::vector<ResourceVector> demands_;
    std::vector<int> criticality_;

    double spatial_min_{0.0};
    double spatial_max_{0.0};
    double resource_min_{0.0};
    double resource_max_{0.0};
};

[[nodiscard]] double euclidean(const Point3& a, const Point3& b) noexcept;
[[nodiscard]] double euclidean(const ResourceVector& a, const ResourceVector& b) noexcept;

}  // namespace mic_scheduler
