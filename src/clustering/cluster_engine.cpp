/**
 * @file cluster_engine.cpp
 * @brief ClusterEngine implementation.
 * @author Dimitris Kafetzis
 */

#include "clustering/cluster_engine.hpp"

#include "clustering/kmeans.hpp"
#include "project/validation.hpp"

#include <algorithm>
#include <format>
#include <limits>

namespace mic_scheduler {

namespace {

constexpr const char* kComponent = "clustering";

/// Per-K generator seed so that K values never share a random stream.
uint64_t seed_for_k(uint64_t seed, uint32_t k) noexcept {
    return seed ^ (0x9E3779B97F4A7C15ULL * (static_cast<uint64_t>(k) + 1));
}

/// Relabel so cluster ids follow the first appearance of each label in @p labels.
std::vector<ClusterId> canonical_ids(const std::vector<uint32_t>& labels, uint32_t k) {
    std::vector<ClusterId> mapping(k, kNoCluster);
    ClusterId next = 0;
    std::vector<ClusterId> out;
    out.reserve(labels.size());
    for (auto label : labels) {
        if (mapping[label] == kNoCluster) mapping[label] = next++;
        out.push_back(mapping[label]);
    }
    return out;
}

ClusteringResult build_result(const std::vector<Task>& tasks,
                              const std::vector<ClusterId>& ids,
                              const std::vector<double>& per_label_silhouette,
                              const std::vector<uint32_t>& labels) {
    ClusteringResult result;
    ClusterId count = 0;
    for (auto id : ids) count = std::max(count, id + 1);
    result.clusters.resize(count);

    std::vector<std::array<size_t, kSystemTypeCount>> system_votes(count);
    for (size_t i = 0; i < tasks.size(); ++i) {
        auto& cluster = result.clusters[ids[i]];
        const auto& task = tasks[i];
        cluster.id = ids[i];
        cluster.members.push_back(task.id);
        cluster.centroid.x += task.location.x;
        cluster.centroid.y += task.location.y;
        cluster.centroid.z += task.location.z;
        for (size_t r = 0; r < kResourceTypeCount; ++r) {
            cluster.mean_demand[r] += static_cast<double>(task.demand[r]);
        }
        cluster.mean_criticality += task.criticality;
        ++system_votes[ids[i]][static_cast<size_t>(task.system)];
        if (!per_label_silhouette.empty()) {
            cluster.silhouette = per_label_silhouette[labels[i]];
        }
        result.assignment.emplace(task.id, ids[i]);
    }

    std::map<TaskId, int> criticality;
    for (const auto& task : tasks) criticality.emplace(task.id, task.criticality);

    for (auto& cluster : result.clusters) {
        auto n = static_cast<double>(cluster.members.size());
        cluster.centroid.x /= n;
        cluster.centroid.y /= n;
        cluster.centroid.z /= n;
        for (auto& d : cluster.mean_demand) d /= n;
        cluster.mean_criticality /= n;

        const auto& votes = system_votes[cluster.id];
        auto top = std::max_element(votes.begin(), votes.end());
        cluster.dominant_system = static_cast<SystemType>(top - votes.begin());

        std::sort(cluster.members.begin(), cluster.members.end(),
                  [&criticality](const TaskId& a, const TaskId& b) {
                      auto ca = criticality.at(a);
                      auto cb = criticality.at(b);
                      if (ca != cb) return ca < cb;
                      return a < b;
                  });
    }
    return result;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// ClusteringResult
// ─────────────────────────────────────────────

std::optional<ClusterId> ClusteringResult::cluster_of(const TaskId& id) const {
    auto it = assignment.find(id);
    if (it == assignment.end()) return std::nullopt;
    return it->second;
}

// ─────────────────────────────────────────────
// Quality Measures
// ─────────────────────────────────────────────

uint32_t elbow_k(const std::vector<std::pair<uint32_t, double>>& sse_by_k) {
    if (sse_by_k.empty()) return 0;
    if (sse_by_k.size() < 3) return sse_by_k.front().first;

    uint32_t best_k = sse_by_k[1].first;
    double best_curvature = std::numeric_limits<double>::lowest();
    for (size_t i = 1; i + 1 < sse_by_k.size(); ++i) {
        auto curvature = sse_by_k[i - 1].second - 2.0 * sse_by_k[i].second
                       + sse_by_k[i + 1].second;
        if (curvature > best_curvature) {
            best_curvature = curvature;
            best_k = sse_by_k[i].first;
        }
    }
    return best_k;
}

double silhouette_score(const SimilarityModel& model,
                        const std::vector<uint32_t>& labels,
                        uint32_t k,
                        std::vector<double>* per_cluster) {
    const auto n = labels.size();
    std::vector<size_t> sizes(k, 0);
    for (auto label : labels) ++sizes[label];

    std::vector<double> cluster_sum(k, 0.0);
    double total = 0.0;

    if (k >= 2) {
        std::vector<double> dist_sum(k);
        for (size_t i = 0; i < n; ++i) {
            std::fill(dist_sum.begin(), dist_sum.end(), 0.0);
            for (size_t j = 0; j < n; ++j) {
                if (i != j) dist_sum[labels[j]] += model.distance(i, j);
            }

            auto own = labels[i];
            double s = 0.0;
            if (sizes[own] > 1) {
                auto a = dist_sum[own] / static_cast<double>(sizes[own] - 1);
                auto b = std::numeric_limits<double>::max();
                for (uint32_t c = 0; c < k; ++c) {
                    if (c == own || sizes[c] == 0) continue;
                    b = std::min(b, dist_sum[c] / static_cast<double>(sizes[c]));
                }
                auto denom = std::max(a, b);
                s = denom > 0.0 ? (b - a) / denom : 0.0;
            }
            cluster_sum[own] += s;
            total += s;
        }
    }

    if (per_cluster) {
        per_cluster->assign(k, 0.0);
        for (uint32_t c = 0; c < k; ++c) {
            if (sizes[c] > 0) (*per_cluster)[c] = cluster_sum[c] / static_cast<double>(sizes[c]);
        }
    }
    return n > 0 ? total / static_cast<double>(n) : 0.0;
}

// ─────────────────────────────────────────────
// ClusterEngine
// ─────────────────────────────────────────────

ClusterEngine::ClusterEngine(ClusteringConfig config, Logger* logger)
    : config_(config), logger_(logger) {}

Result<ClusteringResult> ClusterEngine::cluster(std::span<const Task> tasks,
                                                uint64_t seed) const {
    return cluster(tasks, KRange{config_.k_min, config_.k_max}, seed, config_.forced_k);
}

Result<ClusteringResult> ClusterEngine::cluster(std::span<const Task> tasks,
                                                KRange range,
                                                uint64_t seed,
                                                uint32_t forced_k) const {
    if (range.min < 1 || range.min > range.max) {
        return make_error<ClusteringResult>(
            ErrorCode::ConfigError,
            std::format("invalid cluster range [{}, {}]", range.min, range.max));
    }

    std::vector<Task> sorted(tasks.begin(), tasks.end());
    std::sort(sorted.begin(), sorted.end(),
              [](const Task& a, const Task& b) { return a.id < b.id; });
    resolve_criticality(sorted);

    const auto n = static_cast<uint32_t>(sorted.size());
    if (n == 0) return ClusteringResult{};

    if (n < 3) {
        std::vector<ClusterId> ids(n);
        for (uint32_t i = 0; i < n; ++i) ids[i] = i;
        auto result = build_result(sorted, ids, {}, {});
        result.chosen_k = n;
        return result;
    }

    const auto model = SimilarityModel::fit(sorted, config_.weights);
    const auto points = model.embed();

    std::map<uint32_t, KMeansResult> runs;
    auto run_k = [&](uint32_t k) -> const KMeansResult& {
        auto it = runs.find(k);
        if (it == runs.end()) {
            it = runs.emplace(k, kmeans_best_of(points, k, seed_for_k(seed, k),
                                                config_.restarts,
                                                config_.max_iterations)).first;
        }
        return it->second;
    };

    std::vector<std::pair<uint32_t, double>> sse_by_k;
    std::vector<Diagnostic> diagnostics;
    uint32_t chosen = 0;
    double chosen_silhouette = 0.0;
    bool quality_ok = false;
    uint32_t attempts = 0;

    if (forced_k > 0) {
        chosen = std::clamp<uint32_t>(forced_k, 1, n);
        const auto& run = run_k(chosen);
        sse_by_k.emplace_back(chosen, run.sse);
        chosen_silhouette = silhouette_score(model, run.labels, chosen);
        quality_ok = chosen_silhouette >= config_.silhouette_threshold;
        attempts = 1;
    } else {
        // Silhouette needs at least two clusters and one cluster with two members.
        const auto k_max = std::min(range.max, n - 1);
        const auto k_min = std::min(std::max<uint32_t>(range.min, 2), k_max);
        for (auto k = k_min; k <= k_max; ++k) {
            sse_by_k.emplace_back(k, run_k(k).sse);
        }

        const auto elbow = elbow_k(sse_by_k);
        std::vector<uint32_t> candidates{elbow};
        for (uint32_t step = 1; candidates.size() <= config_.max_retries; ++step) {
            bool any = false;
            if (elbow + step <= k_max) {
                candidates.push_back(elbow + step);
                any = true;
            }
            if (candidates.size() <= config_.max_retries && elbow >= k_min + step) {
                candidates.push_back(elbow - step);
                any = true;
            }
            if (!any) break;
        }

        double best_silhouette = std::numeric_limits<double>::lowest();
        for (auto k : candidates) {
            ++attempts;
            auto s = silhouette_score(model, run_k(k).labels, k);
            if (s > best_silhouette) {
                best_silhouette = s;
                chosen = k;
            }
            if (s >= config_.silhouette_threshold) {
                chosen = k;
                best_silhouette = s;
                quality_ok = true;
                break;
            }
        }
        chosen_silhouette = best_silhouette;
    }

    const auto& final_run = run_k(chosen);
    std::vector<double> per_label;
    silhouette_score(model, final_run.labels, chosen, &per_label);
    auto ids = canonical_ids(final_run.labels, chosen);
    auto result = build_result(sorted, ids, per_label, final_run.labels);

    result.sse_by_k = std::move(sse_by_k);
    result.chosen_k = chosen;
    result.silhouette = chosen_silhouette;
    result.quality_ok = quality_ok;
    result.attempts = attempts;

    if (!quality_ok) {
        Diagnostic warning{
            .severity = Severity::Warning,
            .code = ErrorCode::ClusteringQuality,
            .message = std::format("silhouette {:.3f} below {:.2f} after {} attempt(s); using K={}",
                                   chosen_silhouette, config_.silhouette_threshold,
                                   attempts, chosen),
        };
        for (const auto& cluster : result.clusters) {
            warning.cluster_ids.push_back(cluster.id);
        }
        if (logger_) logger_->warn(kComponent, warning.message);
        diagnostics.push_back(std::move(warning));
    } else if (logger_) {
        logger_->debug(kComponent, std::format("K={} silhouette={:.3f}", chosen, chosen_silhouette));
    }

    result.diagnostics = std::move(diagnostics);
    return result;
}

}  // namespace mic_scheduler
