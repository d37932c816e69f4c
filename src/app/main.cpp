/**
 * @file main.cpp
 * @brief MiC scheduler command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the engine into a batch pipeline:
 *   Config → Logger → Project → HorizonController → ticks/emergency → Report
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "horizon/controller.hpp"
#include "project/generator.hpp"
#include "project/project_file.hpp"
#include "risk/risk_model.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/report_writer.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>

using namespace mic_scheduler;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║          MiC Scheduler v1.0.0             ║
  ║   Dynamic Clustering + NSGA-II Planning   ║
  ║   for Modular Integrated Construction     ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path project_path;
    std::filesystem::path report_path;
    std::string log_dir;
    std::optional<int64_t> emergency_at;
    uint32_t shifts = 0;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: mic_scheduler [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --project <path>       Project file with tasks and resources\n"
              << "  --report <path>        NDJSON schedule report (default: from config)\n"
              << "  --log-dir <path>       Log output directory (empty: stdout)\n"
              << "  --shifts <n>           Advance the plan by n commit windows\n"
              << "  --emergency-at <hour>  Inject a crane emergency at this hour\n"
              << "  --demo                 Plan a generated MiC project, then exit\n"
              << "  --help, -h             Show this help message\n";
}

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    auto number = [](std::string_view flag, const char* text) -> Result<int64_t> {
        try {
            return static_cast<int64_t>(std::stoll(text));
        } catch (const std::exception&) {
            return Error{ErrorCode::ConfigError, std::format("{} expects an integer, got '{}'", flag, text)};
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--project" && i + 1 < argc) {
            args.project_path = argv[++i];
        } else if (arg == "--report" && i + 1 < argc) {
            args.report_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--shifts" && i + 1 < argc) {
            auto n = number(arg, argv[++i]);
            if (!n) return n.error();
            args.shifts = static_cast<uint32_t>(std::max<int64_t>(0, *n));
        } else if (arg == "--emergency-at" && i + 1 < argc) {
            auto n = number(arg, argv[++i]);
            if (!n) return n.error();
            args.emergency_at = *n;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            return Error{ErrorCode::ConfigError, "unknown or incomplete option: " + arg};
        }
    }
    if (!args.demo_mode && args.project_path.empty()) {
        return Error{ErrorCode::ConfigError, "either --project or --demo is required"};
    }
    return args;
}

std::unique_ptr<ILogSink> make_report_sink(const std::filesystem::path& report) {
    auto dir = report.has_parent_path() ? report.parent_path() : std::filesystem::path{"."};
    std::error_code ec;
    std::filesystem::remove(dir / (report.stem().string() + ".ndjson"), ec);
    return std::make_unique<JsonFileSink>(dir, report.stem().string(), 1024, 0);
}

void log_update(Logger& logger, const PlanUpdate& update) {
    std::string line = std::format(
        "t={}h: {} tasks planned, {} unscheduled, K={}, front={}, makespan {}h",
        update.origin.count(), update.schedule.entries.size(),
        update.schedule.unscheduled.size(), update.chosen_k, update.front.size(),
        update.schedule.makespan().count());
    if (!update.front.empty()) {
        const auto& best = update.front.best().objectives;
        line += std::format(", cost {:.0f}, risk {:.2f}, delay {:.1f}", best.cost, best.risk, best.delay);
    }
    logger.info("cli", line);
    for (const auto& split : update.splits) {
        logger.info("cli", std::format("preempted {} at {}h: {}h done, remainder {} ({}h)",
                                       split.original, split.preempted_at.count(),
                                       split.completed_work.count(), split.remainder,
                                       split.remaining_work.count()));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << std::endl;
        print_usage();
        return 2;
    }
    auto args = *args_result;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.report_path.empty()) config.telemetry.report_file = args.report_path;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "mic_scheduler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(std::move(log_sink), level);
    logger.info("cli", "MiC scheduler starting...");
    logger.info("cli", std::format("Project: {} (start {}), seed {}", config.project.name,
                                   config.project.start_date, config.engine.seed));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Project ──────────────────────────────
    ProjectData project;
    if (args.demo_mode) {
        std::mt19937_64 rng(config.engine.seed);
        project = ProjectGenerator::mic_project(GeneratorOptions{}, rng);
        project.capacities.base = config.resources.capacity;
        if (!args.emergency_at) args.emergency_at = 12;
        if (args.shifts == 0) args.shifts = 3;
        logger.info("cli", std::format("Generated demo project: {} tasks", project.tasks.size()));
    } else {
        auto loaded = load_project(args.project_path, config.resources.capacity);
        if (!loaded) {
            logger.error("cli", loaded.error().message);
            std::cerr << "Failed to load project: " << loaded.error().message << std::endl;
            return 1;
        }
        project = std::move(*loaded);
        logger.info("cli", std::format("Loaded {} tasks from {}", project.tasks.size(),
                                       args.project_path.string()));
    }

    // ── Controller ───────────────────────────
    auto risk = std::make_shared<MonthlyRiskTable>(config.risk);
    auto controller_result = HorizonController::create(config, risk, &logger);
    if (!controller_result) {
        std::cerr << "Invalid configuration: " << controller_result.error().message << std::endl;
        return 1;
    }
    auto controller = std::move(*controller_result);

    if (auto loaded = controller->load(project.tasks, project.capacities, project.origin); !loaded) {
        std::cerr << "Project rejected: " << loaded.error().message << std::endl;
        for (const auto& id : loaded.error().subject_ids) std::cerr << "  " << id << '\n';
        return 1;
    }

    ReportWriter report(make_report_sink(config.telemetry.report_file));

    auto emit = [&](const PlanUpdate& update) {
        log_update(logger, update);
        report.write_plan(update, controller->tasks(), controller->capacities());
    };

    auto initial = controller->plan();
    if (!initial) {
        std::cerr << "Planning failed: " << initial.error().message << std::endl;
        return 1;
    }
    emit(*initial);

    // ── Rolling horizon ──────────────────────
    const auto step = SimTime{config.horizon.commit_window_hours};
    bool emergency_done = false;
    for (uint32_t shift = 1; shift <= args.shifts && !g_shutdown_requested; ++shift) {
        auto now = controller->window().origin + step;
        if (args.emergency_at && !emergency_done && *args.emergency_at <= now.count()) {
            auto at = std::max(controller->window().origin, SimTime{*args.emergency_at});
            if (at > controller->window().origin) {
                auto ticked = controller->tick(at);
                if (!ticked) {
                    std::cerr << "Tick failed: " << ticked.error().message << std::endl;
                    return 1;
                }
                emit(*ticked);
            }
            auto injected = controller->inject_emergency(ProjectGenerator::crane_emergency(), at);
            if (!injected) {
                logger.error("cli", "Emergency rejected: " + injected.error().message);
            } else {
                emit(*injected);
            }
            emergency_done = true;
            if (now <= controller->window().origin) continue;
        }
        auto ticked = controller->tick(now);
        if (!ticked) {
            std::cerr << "Tick failed: " << ticked.error().message << std::endl;
            return 1;
        }
        emit(*ticked);
    }

    if (args.emergency_at && !emergency_done) {
        auto at = std::max(controller->window().origin, SimTime{*args.emergency_at});
        auto injected = controller->inject_emergency(ProjectGenerator::crane_emergency(), at);
        if (!injected) {
            logger.error("cli", "Emergency rejected: " + injected.error().message);
        } else {
            emit(*injected);
        }
    }

    report.flush();
    logger.info("cli", "Report written to " + config.telemetry.report_file.string());
    logger.flush();
    return 0;
}
