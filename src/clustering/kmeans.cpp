/**
 * @file kmeans.cpp
 * @brief k-means++ / Lloyd implementation.
 * @author Dimitris Kafetzis
 */

#include "clustering/kmeans.hpp"

#include <algorithm>
#include <limits>

namespace mic_scheduler {

namespace {

size_t nearest(const FeatureVector& point, const std::vector<FeatureVector>& centroids,
               double& best_distance) {
    size_t best = 0;
    best_distance = std::numeric_limits<double>::max();
    for (size_t c = 0; c < centroids.size(); ++c) {
        auto d = squared_distance(point, centroids[c]);
        if (d < best_distance) {
            best_distance = d;
            best = c;
        }
    }
    return best;
}

std::vector<FeatureVector> plus_plus_init(const std::vector<FeatureVector>& points,
                                          uint32_t k,
                                          std::mt19937_64& rng) {
    std::vector<FeatureVector> centroids;
    centroids.reserve(k);
    std::vector<bool> chosen(points.size(), false);

    std::uniform_int_distribution<size_t> first(0, points.size() - 1);
    auto idx = first(rng);
    centroids.push_back(points[idx]);
    chosen[idx] = true;

    std::vector<double> weight(points.size());
    while (centroids.size() < k) {
        double total = 0.0;
        for (size_t i = 0; i < points.size(); ++i) {
            double d = 0.0;
            nearest(points[i], centroids, d);
            weight[i] = chosen[i] ? 0.0 : d;
            total += weight[i];
        }

        size_t pick = points.size();
        if (total > 0.0) {
            std::uniform_real_distribution<double> dist(0.0, total);
            auto target = dist(rng);
            double acc = 0.0;
            for (size_t i = 0; i < points.size(); ++i) {
                if (weight[i] <= 0.0) continue;
                acc += weight[i];
                pick = i;
                if (acc >= target) break;
            }
        } else {
            // Remaining points coincide with centroids.
            auto it = std::find(chosen.begin(), chosen.end(), false);
            pick = static_cast<size_t>(it - chosen.begin());
        }

        centroids.push_back(points[pick]);
        chosen[pick] = true;
    }
    return centroids;
}

}  // anonymous namespace

double squared_distance(const FeatureVector& a, const FeatureVector& b) noexcept {
    double sum = 0.0;
    auto n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        auto d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

KMeansResult kmeans(const std::vector<FeatureVector>& points,
                    uint32_t k,
                    std::mt19937_64& rng,
                    uint32_t max_iterations) {
    KMeansResult result;
    if (points.empty() || k == 0) return result;
    k = std::min<uint32_t>(k, static_cast<uint32_t>(points.size()));

    const auto dims = points.front().size();
    result.centroids = plus_plus_init(points, k, rng);
    result.labels.assign(points.size(), 0);

    std::vector<double> dist_to_own(points.size(), 0.0);
    bool changed = true;
    for (uint32_t iter = 0; iter < std::max<uint32_t>(max_iterations, 1) && changed; ++iter) {
        changed = false;
        ++result.iterations;

        // Assignment step
        for (size_t i = 0; i < points.size(); ++i) {
            auto label = static_cast<uint32_t>(nearest(points[i], result.centroids, dist_to_own[i]));
            if (label != result.labels[i]) {
                result.labels[i] = label;
                changed = true;
            }
        }

        // Update step
        std::vector<FeatureVector> sums(k, FeatureVector(dims, 0.0));
        std::vector<size_t> counts(k, 0);
        for (size_t i = 0; i < points.size(); ++i) {
            auto c = result.labels[i];
            ++counts[c];
            for (size_t d = 0; d < dims; ++d) sums[c][d] += points[i][d];
        }

        for (uint32_t c = 0; c < k; ++c) {
            if (counts[c] > 0) {
                for (size_t d = 0; d < dims; ++d) {
                    sums[c][d] /= static_cast<double>(counts[c]);
                }
                result.centroids[c] = std::move(sums[c]);
                continue;
            }
            // Empty cluster: steal the worst-fitting point of a cluster that can spare it.
            size_t worst = points.size();
            double worst_d = -1.0;
            for (size_t i = 0; i < points.size(); ++i) {
                if (counts[result.labels[i]] > 1 && dist_to_own[i] > worst_d) {
                    worst_d = dist_to_own[i];
                    worst = i;
                }
            }
            if (worst == points.size()) continue;
            --counts[result.labels[worst]];
            result.labels[worst] = c;
            counts[c] = 1;
            dist_to_own[worst] = 0.0;
            result.centroids[c] = points[worst];
            changed = true;
        }
    }

    result.sse = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        result.sse += squared_distance(points[i], result.centroids[result.labels[i]]);
    }
    return result;
}

KMeansResult kmeans_best_of(const std::vector<FeatureVector>& points,
                            uint32_t k,
                            uint64_t seed,
                            uint32_t restarts,
                            uint32_t max_iterations) {
    std::mt19937_64 rng(seed);
    KMeansResult best;
    bool have_best = false;
    for (uint32_t r = 0; r < std::max<uint32_t>(restarts, 1); ++r) {
        auto candidate = kmeans(points, k, rng, max_iterations);
        if (!have_best || candidate.sse < best.sse) {
            best = std::move(candidate);
            have_best = true;
        }
    }
    return best;
}

}  // namespace mic_scheduler
