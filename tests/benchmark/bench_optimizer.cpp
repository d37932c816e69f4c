/**
 * @file bench_optimizer.cpp
 * @brief Performance benchmarks for clustering, decoding and NSGA-II search.
 * @author Dimitris Kafetzis
 *
 * Measures the cost of each re-planning stage on generated MiC projects of
 * increasing size.
 *
 * Usage: ./bench_optimizer [--csv]
 */

#include "clustering/cluster_engine.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "horizon/controller.hpp"
#include "project/calendar.hpp"
#include "project/generator.hpp"
#include "project/task_graph.hpp"
#include "project/validation.hpp"
#include "risk/risk_model.hpp"
#include "scheduler/decoder.hpp"
#include "scheduler/nsga2.hpp"
#include "scheduler/objectives.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace mic_scheduler;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

/// Generated project with resolved criticality; floors x 3 modules x 5 systems.
ProjectData make_project(size_t floors) {
    std::mt19937_64 rng(42);
    auto project = ProjectGenerator::mic_project(GeneratorOptions{.floors = floors}, rng);
    resolve_criticality(project.tasks);
    return project;
}

SchedulingProblem make_problem(const ProjectData& project, const ClusteringResult& clustering) {
    SchedulingProblem problem;
    problem.tasks = project.tasks;
    problem.capacities = project.capacities;
    attach_clusters(problem, clustering);
    return problem;
}

std::string tasks_label(const ProjectData& project) {
    return std::to_string(project.tasks.size()) + " tasks";
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_project() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t floors : {2, 4, 8, 16}) {
        R.push_back(run_bench("mic_project(" + std::to_string(floors) + "F)", "Project", N,
            [&]{ std::mt19937_64 rng(1); auto p = ProjectGenerator::mic_project({.floors = floors}, rng); (void)p; },
            std::to_string(floors * 15) + " tasks"));
    }

    auto p8 = make_project(8);
    R.push_back(run_bench("validate(8F)", "Project", N,
        [&]{ auto v = validate_tasks(p8.tasks, ProjectBounds{}); (void)v; }, tasks_label(p8)));
    R.push_back(run_bench("topo_order(8F)", "Project", N,
        [&]{ auto o = TaskGraph::from_tasks(p8.tasks).topological_order(); (void)o; }, tasks_label(p8)));
    R.push_back(run_bench("critical_path(8F)", "Project", N,
        [&]{ auto c = TaskGraph::from_tasks(p8.tasks).critical_path_length(); (void)c; }, tasks_label(p8)));

    return R;
}

std::vector<BenchResult> bench_clustering() {
    std::vector<BenchResult> R;
    ClusterEngine engine(ClusteringConfig{});
    ClusterEngine forced(ClusteringConfig{.forced_k = 4});

    for (size_t floors : {2, 4, 8}) {
        auto project = make_project(floors);
        R.push_back(run_bench("elbow_k2_10(" + std::to_string(floors) + "F)", "Clustering", 20,
            [&]{ auto c = engine.cluster(project.tasks, 7); (void)c; }, tasks_label(project)));
        R.push_back(run_bench("forced_k4(" + std::to_string(floors) + "F)", "Clustering", 50,
            [&]{ auto c = forced.cluster(project.tasks, 7); (void)c; }, tasks_label(project)));
    }
    return R;
}

std::vector<BenchResult> bench_decode() {
    std::vector<BenchResult> R;
    auto calendar = WorkingCalendar::standard();
    FlatRisk risk;
    ClusterEngine engine(ClusteringConfig{});

    for (size_t floors : {2, 4, 8}) {
        auto project = make_project(floors);
        auto clustering = engine.cluster(project.tasks, 7);
        if (!clustering) continue;
        auto problem = make_problem(project, *clustering);
        ScheduleDecoder decoder(problem, calendar);
        ObjectiveEvaluator evaluator(CostConfig{}, risk, calendar);
        auto chromosome = Chromosome::identity(problem.cluster_count());
        auto label = tasks_label(project) + ", K=" + std::to_string(clustering->chosen_k);

        R.push_back(run_bench("decode(" + std::to_string(floors) + "F)", "Decoding", 200,
            [&]{ auto d = decoder.decode(chromosome); (void)d; }, label));
        R.push_back(run_bench("decode+evaluate(" + std::to_string(floors) + "F)", "Decoding", 200,
            [&]{
                auto d = decoder.decode(chromosome);
                if (d) { auto o = evaluator.evaluate(*d, decoder); (void)o; }
            }, label));
    }
    return R;
}

std::vector<BenchResult> bench_optimizer() {
    std::vector<BenchResult> R;
    auto calendar = WorkingCalendar::standard();
    FlatRisk risk;
    ClusterEngine engine(ClusteringConfig{.forced_k = 8});
    OptimizerConfig config{.population_size = 50, .generations = 20, .stall_generations = 0};
    ThreadPool pool(4);

    for (size_t floors : {2, 4}) {
        auto project = make_project(floors);
        auto clustering = engine.cluster(project.tasks, 7);
        if (!clustering) continue;
        auto problem = make_problem(project, *clustering);
        auto label = tasks_label(project) + ", pop 50, 20 gen";

        NsgaOptimizer serial(config, CostConfig{}, risk);
        NsgaOptimizer parallel(config, CostConfig{}, risk, nullptr, &pool);
        R.push_back(run_bench("nsga2_serial(" + std::to_string(floors) + "F)", "Optimizer", 5,
            [&]{ auto r = serial.optimize(problem, calendar, 1); (void)r; }, label));
        R.push_back(run_bench("nsga2_4threads(" + std::to_string(floors) + "F)", "Optimizer", 5,
            [&]{ auto r = parallel.optimize(problem, calendar, 1); (void)r; }, label));
    }
    return R;
}

std::vector<BenchResult> bench_replan() {
    std::vector<BenchResult> R;
    Config config;
    config.optimizer.population_size = 30;
    config.optimizer.generations = 30;

    auto created = HorizonController::create(config, std::make_shared<MonthlyRiskTable>(config.risk));
    if (!created) return R;
    auto& controller = *created;
    auto project = make_project(4);
    if (!controller->load(project.tasks, project.capacities)) return R;

    R.push_back(run_bench("plan(4F)", "Rolling Horizon", 5,
        [&]{ auto u = controller->plan(); (void)u; }, tasks_label(project)));

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Rolling Horizon", 500, [&]{
        std::promise<void> p; auto f = p.get_future();
        tpool.submit([&p]{ p.set_value(); }); f.wait();
    }));
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  MiC Scheduler Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_project());
    append(bench_clustering());
    append(bench_decode());
    append(bench_optimizer());
    append(bench_replan());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
