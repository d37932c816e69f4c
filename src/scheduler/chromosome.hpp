/**
 * @file chromosome.hpp
 * @brief Permutation chromosome over cluster ids and its variation operators.
 * @author Dimitris Kafetzis
 *
 * A chromosome of size n holds each of 0..n-1 exactly once. Operators take
 * parents by const reference and return new chromosomes.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <compare>
#include <random>
#include <string>
#include <vector>

namespace mic_scheduler {

class Chromosome {
public:
    Chromosome() = default;

    /// Rejects anything that is not a permutation of 0..genes.size()-1.
    static Result<Chromosome> from_order(std::vector<ClusterId> genes);

    static Chromosome identity(size_t n);
    static Chromosome random(size_t n, std::mt19937_64& rng);

    [[nodiscard]] const std::vector<ClusterId>& genes() const noexcept { return genes_; }
    [[nodiscard]] size_t size() const noexcept { return genes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return genes_.empty(); }
    [[nodiscard]] ClusterId operator[](size_t i) const noexcept { return genes_[i]; }

    bool operator==(const Chromosome&) const = default;
    auto operator<=>(const Chromosome&) const = default;

private:
    explicit Chromosome(std::vector<ClusterId> genes) : genes_(std::move(genes)) {}

    std::vector<ClusterId> genes_;

    friend Chromosome order_crossover(const Chromosome&, const Chromosome&, std::mt19937_64&);
    friend Chromosome swap_mutation(const Chromosome&, double, std::mt19937_64&);
};

/**
 * @brief Order crossover (OX1).
 *
 * Copies a random slice of @p first, then fills the remaining positions,
 * starting after the slice and wrapping, with the genes of @p second in the
 * order they appear after the same cut.
 */
[[nodiscard]] Chromosome order_crossover(const Chromosome& first,
                                         const Chromosome& second,
                                         std::mt19937_64& rng);

/// Each position swaps with a random other position with @p probability.
[[nodiscard]] Chromosome swap_mutation(const Chromosome& chromosome,
                                       double probability,
                                       std::mt19937_64& rng);

/// "[2,0,1]"
[[nodiscard]] std::string to_string(const Chromosome& chromosome);

}  // namespace mic_scheduler
