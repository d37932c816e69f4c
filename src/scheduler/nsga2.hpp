/**
 * @file nsga2.hpp
 * @brief NSGA-II search over cluster execution orders.
 * @author Dimitris Kafetzis
 *
 * Each generation breeds as many offspring as there are parents (binary
 * crowded tournament, order crossover, swap mutation), ranks the merged pool
 * by fast non-dominated sorting and keeps the best fronts, truncating the
 * last admitted front by descending crowding distance.
 *
 * Every random draw comes from one std::mt19937_64 seeded by the caller and
 * is taken on the calling thread, so parallel fitness evaluation cannot
 * change the result.
 */

#pragma once

#include "core/config.hpp"
#include "core/diagnostic.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "risk/risk_model.hpp"
#include "scheduler/chromosome.hpp"
#include "scheduler/decoder.hpp"
#include "scheduler/objectives.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace mic_scheduler {

struct Individual {
    Chromosome chromosome;
    Objectives objectives;
    bool feasible = true;
    size_t rank = 0;                    ///< Front index, 1 = non-dominated
    double crowding = 0.0;
};

struct ParetoFront {
    std::vector<Individual> members;    ///< Distinct chromosomes, ordered by objectives
    size_t recommended = 0;             ///< Index into members

    [[nodiscard]] bool empty() const noexcept { return members.empty(); }
    [[nodiscard]] size_t size() const noexcept { return members.size(); }
    [[nodiscard]] const Individual& best() const { return members.at(recommended); }
};

struct OptimizationResult {
    ParetoFront front;
    DecodeResult schedule;              ///< Decode of the recommended member
    uint32_t generations_run{0};
    bool converged{true};               ///< False when the deadline cut the run short
    bool early_stopped{false};
    std::vector<Diagnostic> diagnostics;
    std::chrono::milliseconds elapsed{0};
};

class NsgaOptimizer {
public:
    NsgaOptimizer(OptimizerConfig config,
                  CostConfig costs,
                  const IRiskProvider& risk,
                  Logger* logger = nullptr,
                  ThreadPool* pool = nullptr);

    /**
     * @brief Evolve orders for @p problem and return the final first front.
     *
     * When @p deadline passes, the run stops at the next generation boundary
     * and returns the current first front with converged = false.
     */
    [[nodiscard]] Result<OptimizationResult> optimize(
        const SchedulingProblem& problem,
        const WorkingCalendar& calendar,
        uint64_t seed,
        std::optional<SteadyTime> deadline = std::nullopt) const;

    [[nodiscard]] const OptimizerConfig& config() const noexcept { return config_; }

private:
    void evaluate(std::vector<Individual>& individuals,
                  const ScheduleDecoder& decoder,
                  const ObjectiveEvaluator& evaluator) const;

    OptimizerConfig config_;
    CostConfig costs_;
    const IRiskProvider* risk_;
    Logger* logger_;
    ThreadPool* pool_;
};

/**
 * @brief Index of the member minimising the weighted sum of per-objective
 *        min-max normalised values. Feasible members win over infeasible ones.
 */
[[nodiscard]] size_t recommend(const std::vector<Individual>& front,
                               const RecommendationWeights& weights);

/// Assign rank and crowding to every member of @p population in place.
void rank_population(std::vector<Individual>& population);

}  // namespace mic_scheduler
