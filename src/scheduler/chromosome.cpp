/**
 * @file chromosome.cpp
 * @brief Chromosome construction and variation operators.
 * @author Dimitris Kafetzis
 */

#include "scheduler/chromosome.hpp"

#include <algorithm>
#include <format>
#include <numeric>

namespace mic_scheduler {

Result<Chromosome> Chromosome::from_order(std::vector<ClusterId> genes) {
    std::vector<bool> seen(genes.size(), false);
    for (auto gene : genes) {
        if (gene >= genes.size() || seen[gene]) {
            return make_error<Chromosome>(
                ErrorCode::InvalidState,
                std::format("gene {} breaks the permutation of size {}", gene, genes.size()));
        }
        seen[gene] = true;
    }
    return Chromosome{std::move(genes)};
}

Chromosome Chromosome::identity(size_t n) {
    std::vector<ClusterId> genes(n);
    std::iota(genes.begin(), genes.end(), ClusterId{0});
    return Chromosome{std::move(genes)};
}

Chromosome Chromosome::random(size_t n, std::mt19937_64& rng) {
    auto out = identity(n);
    // Fisher-Yates with an explicit distribution, identical across runs for a seed.
    for (size_t i = n; i > 1; --i) {
        std::uniform_int_distribution<size_t> pick(0, i - 1);
        std::swap(out.genes_[i - 1], out.genes_[pick(rng)]);
    }
    return out;
}

// ─────────────────────────────────────────────
// Variation Operators
// ─────────────────────────────────────────────

Chromosome order_crossover(const Chromosome& first, const Chromosome& second,
                           std::mt19937_64& rng) {
    const auto n = first.size();
    if (n < 2 || second.size() != n) return first;

    std::uniform_int_distribution<size_t> cut(0, n - 1);
    auto lo = cut(rng);
    auto hi = cut(rng);
    if (lo > hi) std::swap(lo, hi);

    std::vector<ClusterId> child(n, kNoCluster);
    std::vector<bool> used(n, false);
    for (auto i = lo; i <= hi; ++i) {
        child[i] = first.genes_[i];
        used[child[i]] = true;
    }

    auto write = (hi + 1) % n;
    for (size_t step = 0; step < n; ++step) {
        auto gene = second.genes_[(hi + 1 + step) % n];
        if (used[gene]) continue;
        child[write] = gene;
        used[gene] = true;
        write = (write + 1) % n;
    }
    return Chromosome{std::move(child)};
}

Chromosome swap_mutation(const Chromosome& chromosome, double probability,
                         std::mt19937_64& rng) {
    auto genes = chromosome.genes_;
    const auto n = genes.size();
    if (n < 2) return Chromosome{std::move(genes)};

    std::uniform_real_distribution<double> coin(0.0, 1.0);
    std::uniform_int_distribution<size_t> other(0, n - 2);
    for (size_t i = 0; i < n; ++i) {
        if (coin(rng) >= probability) continue;
        auto j = other(rng);
        if (j >= i) ++j;
        std::swap(genes[i], genes[j]);
    }
    return Chromosome{std::move(genes)};
}

std::string to_string(const Chromosome& chromosome) {
    std::string out = "[";
    for (size_t i = 0; i < chromosome.size(); ++i) {
        if (i > 0) out += ',';
        out += std::to_string(chromosome[i]);
    }
    out += ']';
    return out;
}

}  // namespace mic_scheduler
