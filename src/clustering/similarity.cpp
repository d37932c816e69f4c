/**
 * @file similarity.cpp
 * @brief SimilarityModel implementation.
 * @author Dimitris Kafetzis
 */

#include "clustering/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace mic_scheduler {

namespace {

/// Inverted min-max normalisation. A degenerate range means every pair is equally close.
double closeness(double d, double lo, double hi) noexcept {
    if (hi - lo <= 0.0) return 1.0;
    return 1.0 - std::clamp((d - lo) / (hi - lo), 0.0, 1.0);
}

}  // anonymous namespace

double euclidean(const Point3& a, const Point3& b) noexcept {
    auto dx = a.x - b.x;
    auto dy = a.y - b.y;
    auto dz = a.z - b.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

double euclidean(const ResourceVector& a, const ResourceVector& b) noexcept {
    double sum = 0.0;
    for (size_t r = 0; r < kResourceTypeCount; ++r) {
        auto d = static_cast<double>(a[r] - b[r]);
        sum += d * d;
    }
    return std::sqrt(sum);
}

SimilarityModel SimilarityModel::fit(std::span<const Task> tasks, const SimilarityWeights& weights) {
    SimilarityModel model;
    model.weights_ = weights;
    model.locations_.reserve(tasks.size());
    for (const auto& task : tasks) {
        model.locations_.push_back(task.location);
        model.systems_.push_back(task.system);
        model.demands_.push_back(task.demand);
        model.criticality_.push_back(task.criticality);
    }

    if (tasks.size() < 2) return model;

    model.spatial_min_ = std::numeric_limits<double>::max();
    model.resource_min_ = std::numeric_limits<double>::max();
    for (size_t i = 0; i < tasks.size(); ++i) {
        for (size_t j = i + 1; j < tasks.size(); ++j) {
            auto ds = euclidean(model.locations_[i], model.locations_[j]);
            auto dr = euclidean(model.demands_[i], model.demands_[j]);
            model.spatial_min_ = std::min(model.spatial_min_, ds);
            model.spatial_max_ = std::max(model.spatial_max_, ds);
            model.resource_min_ = std::min(model.resource_min_, dr);
            model.resource_max_ = std::max(model.resource_max_, dr);
        }
    }
    return model;
}

double SimilarityModel::similarity(size_t i, size_t j) const noexcept {
    if (i == j) return 1.0;

    auto spatial = closeness(euclidean(locations_[i], locations_[j]), spatial_min_, spatial_max_);
    auto system = systems_[i] == systems_[j] ? 1.0 : 0.0;
    auto resource = closeness(euclidean(demands_[i], demands_[j]), resource_min_, resource_max_);
    auto crit = 1.0 - std::abs(criticality_[i] - criticality_[j]) / 10.0;

    return weights_.spatial * spatial
         + weights_.system * system
         + weights_.resource * resource
         + weights_.criticality * crit;
}

std::vector<FeatureVector> SimilarityModel::embed() const {
    const auto spatial_scale = spatial_max_ > 0.0
        ? std::sqrt(weights_.spatial) / spatial_max_ : 0.0;
    const auto resource_scale = resource_max_ > 0.0
        ? std::sqrt(weights_.resource) / resource_max_ : 0.0;
    // One-hot vectors of different systems are sqrt(2) apart.
    const auto system_scale = std::sqrt(weights_.system / 2.0);
    const auto crit_scale = std::sqrt(weights_.criticality) / 10.0;

    std::vector<FeatureVector> out;
    out.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        FeatureVector f;
        f.reserve(3 + kSystemTypeCount + kResourceTypeCount + 1);
        f.push_back(locations_[i].x * spatial_scale);
        f.push_back(locations_[i].y * spatial_scale);
        f.push_back(locations_[i].z * spatial_scale);
        for (size_t s = 0; s < kSystemTypeCount; ++s) {
            f.push_back(static_cast<size_t>(systems_[i]) == s ? system_scale : 0.0);
        }
        for (size_t r = 0; r < kResourceTypeCount; ++r) {
            f.push_back(static_cast<double>(demands_[i][r]) * resource_scale);
        }
        f.push_back(static_cast<double>(criticality_[i]) * crit_scale);
        out.push_back(std::move(f));
    }
    return out;
}

}  // namespace mic_scheduler
