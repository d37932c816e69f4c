/**
 * @file nsga2.cpp
 * @brief NsgaOptimizer implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/nsga2.hpp"

#include "scheduler/pareto.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <limits>
#include <numeric>
#include <random>

namespace mic_scheduler {

namespace {

constexpr const char* kComponent = "optimizer";

/// Crowded-comparison: lower rank, then larger crowding, then lower index.
bool crowded_better(const std::vector<Individual>& population, size_t a, size_t b) {
    const auto& ia = population[a];
    const auto& ib = population[b];
    if (ia.rank != ib.rank) return ia.rank < ib.rank;
    if (ia.crowding != ib.crowding) return ia.crowding > ib.crowding;
    return a < b;
}

size_t tournament(const std::vector<Individual>& population, std::mt19937_64& rng) {
    std::uniform_int_distribution<size_t> pick(0, population.size() - 1);
    auto a = pick(rng);
    auto b = pick(rng);
    return crowded_better(population, a, b) ? a : b;
}

std::vector<Objectives> first_front_objectives(const std::vector<Individual>& population) {
    std::vector<Objectives> out;
    for (const auto& ind : population) {
        if (ind.rank == 1) out.push_back(ind.objectives);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

/// Environmental selection: whole fronts while they fit, then the widest-spread members.
std::vector<Individual> select_survivors(std::vector<Individual> pool, size_t target) {
    auto fronts = fast_non_dominated_sort(pool);

    std::vector<Individual> next;
    next.reserve(target);
    for (size_t f = 0; f < fronts.size() && next.size() < target; ++f) {
        const auto& front = fronts[f];
        auto distance = crowding_distance(pool, front);
        for (size_t k = 0; k < front.size(); ++k) {
            pool[front[k]].rank = f + 1;
            pool[front[k]].crowding = distance[k];
        }

        std::vector<size_t> order(front.size());
        std::iota(order.begin(), order.end(), size_t{0});
        if (next.size() + front.size() > target) {
            std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return distance[a] > distance[b];
            });
        }
        for (auto k : order) {
            if (next.size() == target) break;
            next.push_back(pool[front[k]]);
        }
    }
    return next;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Free Functions
// ─────────────────────────────────────────────

void rank_population(std::vector<Individual>& population) {
    auto fronts = fast_non_dominated_sort(population);
    for (size_t f = 0; f < fronts.size(); ++f) {
        auto distance = crowding_distance(population, fronts[f]);
        for (size_t k = 0; k < fronts[f].size(); ++k) {
            population[fronts[f][k]].rank = f + 1;
            population[fronts[f][k]].crowding = distance[k];
        }
    }
}

size_t recommend(const std::vector<Individual>& front, const RecommendationWeights& weights) {
    if (front.empty()) return 0;

    bool any_feasible = std::any_of(front.begin(), front.end(),
                                    [](const Individual& ind) { return ind.feasible; });

    std::array<double, kObjectiveCount> lo;
    std::array<double, kObjectiveCount> hi;
    lo.fill(std::numeric_limits<double>::max());
    hi.fill(std::numeric_limits<double>::lowest());
    for (const auto& ind : front) {
        for (size_t m = 0; m < kObjectiveCount; ++m) {
            lo[m] = std::min(lo[m], ind.objectives[m]);
            hi[m] = std::max(hi[m], ind.objectives[m]);
        }
    }

    const std::array<double, kObjectiveCount> w{weights.cost, weights.risk, weights.delay};
    size_t best = 0;
    double best_score = std::numeric_limits<double>::max();
    for (size_t i = 0; i < front.size(); ++i) {
        if (any_feasible && !front[i].feasible) continue;
        double score = 0.0;
        for (size_t m = 0; m < kObjectiveCount; ++m) {
            auto range = hi[m] - lo[m];
            auto norm = range > 0.0 ? (front[i].objectives[m] - lo[m]) / range : 0.0;
            score += w[m] * norm;
        }
        if (score < best_score) {
            best_score = score;
            best = i;
        }
    }
    return best;
}

// ─────────────────────────────────────────────
// NsgaOptimizer
// ─────────────────────────────────────────────

NsgaOptimizer::NsgaOptimizer(OptimizerConfig config, CostConfig costs, const IRiskProvider& risk,
                             Logger* logger, ThreadPool* pool)
    : config_(config), costs_(costs), risk_(&risk), logger_(logger), pool_(pool) {}

void NsgaOptimizer::evaluate(std::vector<Individual>& individuals,
                             const ScheduleDecoder& decoder,
                             const ObjectiveEvaluator& evaluator) const {
    auto score = [&](size_t i) {
        auto& ind = individuals[i];
        auto decoded = decoder.decode(ind.chromosome);
        if (!decoded) {
            constexpr auto kInf = std::numeric_limits<double>::infinity();
            ind.objectives = Objectives{kInf, kInf, kInf};
            ind.feasible = false;
            return;
        }
        ind.objectives = evaluator.evaluate(*decoded, decoder);
        ind.feasible = decoded->feasible;
    };

    if (pool_ && pool_->thread_count() > 1 && individuals.size() > 1) {
        pool_->parallel_for(individuals.size(), score);
    } else {
        for (size_t i = 0; i < individuals.size(); ++i) score(i);
    }
}

Result<OptimizationResult> NsgaOptimizer::optimize(const SchedulingProblem& problem,
                                                   const WorkingCalendar& calendar,
                                                   uint64_t seed,
                                                   std::optional<SteadyTime> deadline) const {
    if (config_.population_size < 2) {
        return make_error<OptimizationResult>(ErrorCode::ConfigError,
                                              "population_size must be at least 2");
    }

    const auto started = std::chrono::steady_clock::now();
    const ScheduleDecoder decoder(problem, calendar);
    const ObjectiveEvaluator evaluator(costs_, *risk_, calendar);
    const auto n = problem.cluster_count();
    const size_t pop_size = config_.population_size;
    const double mutation = config_.mutation_probability > 0.0
        ? config_.mutation_probability
        : (n > 0 ? 1.0 / static_cast<double>(n) : 0.0);

    std::mt19937_64 rng(seed);
    OptimizationResult result;

    // ── Initial population ───────────────────
    std::vector<Individual> population;
    population.reserve(pop_size);
    population.push_back(Individual{.chromosome = Chromosome::identity(n)});
    while (population.size() < pop_size) {
        population.push_back(Individual{.chromosome = Chromosome::random(n, rng)});
    }
    evaluate(population, decoder, evaluator);
    rank_population(population);

    // A single ordering (n <= 1) leaves nothing to search.
    const bool searchable = n > 1;
    auto last_front = first_front_objectives(population);
    uint32_t stall = 0;

    for (uint32_t gen = 0; searchable && gen < config_.generations; ++gen) {
        if (deadline && std::chrono::steady_clock::now() >= *deadline) {
            result.converged = false;
            break;
        }

        // ── Variation ────────────────────────
        std::vector<Individual> offspring;
        offspring.reserve(pop_size);
        std::uniform_real_distribution<double> coin(0.0, 1.0);
        while (offspring.size() < pop_size) {
            const auto& a = population[tournament(population, rng)].chromosome;
            const auto& b = population[tournament(population, rng)].chromosome;

            Chromosome child_a = a;
            Chromosome child_b = b;
            if (coin(rng) < config_.crossover_probability) {
                child_a = order_crossover(a, b, rng);
                child_b = order_crossover(b, a, rng);
            }
            offspring.push_back(Individual{.chromosome = swap_mutation(child_a, mutation, rng)});
            if (offspring.size() < pop_size) {
                offspring.push_back(Individual{.chromosome = swap_mutation(child_b, mutation, rng)});
            }
        }
        evaluate(offspring, decoder, evaluator);

        // ── Environmental selection ──────────
        std::vector<Individual> pool = std::move(population);
        pool.insert(pool.end(), std::make_move_iterator(offspring.begin()),
                    std::make_move_iterator(offspring.end()));
        population = select_survivors(std::move(pool), pop_size);
        ++result.generations_run;

        auto front = first_front_objectives(population);
        stall = (front == last_front) ? stall + 1 : 0;
        last_front = std::move(front);
        if (config_.stall_generations > 0 && stall >= config_.stall_generations) {
            result.early_stopped = true;
            break;
        }
    }

    // ── Final front ──────────────────────────
    std::vector<Individual> members;
    for (const auto& ind : population) {
        if (ind.rank == 1) members.push_back(ind);
    }
    std::sort(members.begin(), members.end(), [](const Individual& a, const Individual& b) {
        if (a.objectives != b.objectives) return a.objectives < b.objectives;
        return a.chromosome < b.chromosome;
    });
    members.erase(std::unique(members.begin(), members.end(),
                              [](const Individual& a, const Individual& b) {
                                  return a.chromosome == b.chromosome;
                              }),
                  members.end());

    result.front.recommended = recommend(members, config_.recommendation);
    result.front.members = std::move(members);

    auto decoded = decoder.decode(result.front.best().chromosome);
    if (!decoded) return decoded.error();
    result.schedule = std::move(*decoded);
    result.diagnostics = result.schedule.diagnostics;
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result.converged) {
        auto message = std::format("budget exhausted after {} generation(s); using best-so-far front of {}",
                                   result.generations_run, result.front.size());
        result.diagnostics.push_back(Diagnostic{
            .severity = Severity::Warning,
            .code = ErrorCode::OptimizationBudgetExceeded,
            .message = message,
        });
        if (logger_) logger_->warn(kComponent, message);
    }
    if (logger_) {
        logger_->info(kComponent,
                      std::format("clusters={} generations={} front={} recommended={} elapsed_ms={}",
                                  n, result.generations_run, result.front.size(),
                                  to_string(result.front.best().chromosome),
                                  result.elapsed.count()));
    }
    return result;
}

}  // namespace mic_scheduler
