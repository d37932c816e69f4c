/**
 * @file pareto.hpp
 * @brief Dominance, fast non-dominated sorting and crowding distance.
 * @author Dimitris Kafetzis
 *
 * Templated over any ObjectiveCarrier so the same code ranks optimizer
 * individuals and plain objective vectors in tests. All objectives are
 * minimised.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <vector>

namespace mic_scheduler {

/// @p a is no worse on every objective and strictly better on at least one.
[[nodiscard]] constexpr bool dominates(const Objectives& a, const Objectives& b) noexcept {
    bool strictly_better = false;
    for (size_t m = 0; m < kObjectiveCount; ++m) {
        if (a[m] > b[m]) return false;
        if (a[m] < b[m]) strictly_better = true;
    }
    return strictly_better;
}

/**
 * @brief Deb's fast non-dominated sort.
 * @return Fronts of indices into @p items, F1 first; each front ascending.
 */
template <ObjectiveCarrier T>
std::vector<std::vector<size_t>> fast_non_dominated_sort(const std::vector<T>& items) {
    const auto n = items.size();
    std::vector<std::vector<size_t>> dominated_by(n);
    std::vector<size_t> domination_count(n, 0);
    std::vector<std::vector<size_t>> fronts;

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (dominates(items[i].objectives, items[j].objectives)) {
                dominated_by[i].push_back(j);
                ++domination_count[j];
            } else if (dominates(items[j].objectives, items[i].objectives)) {
                dominated_by[j].push_back(i);
                ++domination_count[i];
            }
        }
    }

    std::vector<size_t> current;
    for (size_t i = 0; i < n; ++i) {
        if (domination_count[i] == 0) current.push_back(i);
    }

    while (!current.empty()) {
        std::vector<size_t> next;
        for (auto i : current) {
            for (auto j : dominated_by[i]) {
                if (--domination_count[j] == 0) next.push_back(j);
            }
        }
        std::sort(next.begin(), next.end());
        fronts.push_back(std::move(current));
        current = std::move(next);
    }
    return fronts;
}

/**
 * @brief Crowding distance of each member of @p front (same order as @p front).
 *
 * Per objective the front is sorted (ties by index), both boundary members get
 * infinity and interior members add the neighbour gap divided by the
 * objective's range. A zero range adds nothing.
 */
template <ObjectiveCarrier T>
std::vector<double> crowding_distance(const std::vector<T>& items,
                                      const std::vector<size_t>& front) {
    constexpr auto kInf = std::numeric_limits<double>::infinity();
    const auto n = front.size();
    std::vector<double> distance(n, 0.0);
    if (n <= 2) {
        std::fill(distance.begin(), distance.end(), kInf);
        return distance;
    }

    std::vector<size_t> order(n);
    for (size_t m = 0; m < kObjectiveCount; ++m) {
        std::iota(order.begin(), order.end(), size_t{0});
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            auto va = items[front[a]].objectives[m];
            auto vb = items[front[b]].objectives[m];
            if (va != vb) return va < vb;
            return front[a] < front[b];
        });

        distance[order.front()] = kInf;
        distance[order.back()] = kInf;

        auto lo = items[front[order.front()]].objectives[m];
        auto hi = items[front[order.back()]].objectives[m];
        auto range = hi - lo;
        if (range <= 0.0) continue;

        for (size_t k = 1; k + 1 < n; ++k) {
            auto& d = distance[order[k]];
            if (d == kInf) continue;
            auto gap = items[front[order[k + 1]]].objectives[m]
                     - items[front[order[k - 1]]].objectives[m];
            d += gap / range;
        }
    }
    return distance;
}

}  // namespace mic_scheduler
