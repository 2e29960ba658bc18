/**
 * @file main.cpp
 * @brief SessionPlanner command-line entry point.
 *
 * Wires the modules into one planning run:
 *   Config → Logger → Scenario → ScheduleGenerator → Telemetry → Result JSON
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "io/result_writer.hpp"
#include "io/scenario_loader.hpp"
#include "scheduler/schedule_generator.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workload/scenario_generator.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>

using namespace session_planner;

namespace {

constexpr int EXIT_INPUT_ERROR = 1;
constexpr int EXIT_CONTRACT_VIOLATION = 2;

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path scenario_path;
    std::filesystem::path output_path;
    std::string log_dir;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: session_planner [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --scenario <path>  Scenario file (TOML) to schedule\n"
              << "  --output <path>    Write the JSON result to a file instead of stdout\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --demo             Schedule a generated week of requests, then exit\n"
              << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--scenario" && i + 1 < argc) {
            args.scenario_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(EXIT_INPUT_ERROR);
        }
    }
    return args;
}

/// Without a log directory, logs go to stderr while the result is printed to stdout.
std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix,
                                    bool result_on_stdout) {
    if (telemetry.log_dir.empty()) {
        if (result_on_stdout) return std::make_unique<StderrSink>();
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

/**
 * @brief A generated week for a demo trainer, Monday 2024-01-15 onwards.
 */
ScheduleInput demo_scenario(Logger& logger, MetricsCollector* metrics) {
    using namespace std::chrono;

    std::mt19937 rng(42);
    Day monday = sys_days{year{2024} / January / 15};
    auto input = ScenarioGenerator::random_week("demo-trainer", monday, 40, rng);

    logger.info("Generated demo scenario: " + std::to_string(input.requests.size())
                + " requests, " + std::to_string(input.existing_bookings.size())
                + " bookings, " + std::to_string(input.available_slots.size()) + " slots");
    if (metrics) {
        metrics->record_custom("demo_scenario",
            "{\"requests\":" + std::to_string(input.requests.size())
            + ",\"bookings\":" + std::to_string(input.existing_bookings.size())
            + ",\"slots\":" + std::to_string(input.available_slots.size()) + "}");
    }
    return input;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    if (!args.demo_mode && args.scenario_path.empty()) {
        std::cerr << "Either --scenario <path> or --demo is required.\n";
        print_usage();
        return EXIT_INPUT_ERROR;
    }

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    const bool result_on_stdout = args.output_path.empty();
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    Logger logger(make_sink(config.telemetry, "session_planner", result_on_stdout),
                  level, "session_planner");
    logger.info("SessionPlanner starting...");
    logger.info("Duration bonus policy: "
                + std::string{to_string(config.priority.duration_bonus)});

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.record_decisions) {
        metrics = std::make_unique<MetricsCollector>(
            make_sink(config.telemetry, "decisions", result_on_stdout));
        logger.info("Decision telemetry enabled");
    }

    // ── Load Scenario ────────────────────────
    ScheduleInput input;
    if (args.demo_mode) {
        input = demo_scenario(logger, metrics.get());
    } else {
        auto scenario = load_scenario(args.scenario_path, config.preferences);
        if (!scenario) {
            logger.error("Failed to load scenario: " + scenario.error().message);
            std::cerr << "Failed to load scenario: " << scenario.error().message << std::endl;
            return EXIT_INPUT_ERROR;
        }
        input = std::move(*scenario);
        logger.info("Loaded scenario for trainer " + input.trainer_id + ": "
                    + std::to_string(input.requests.size()) + " requests");
    }

    // ── Generate ─────────────────────────────
    ScheduleGenerator generator(config, logger, metrics.get());
    ScheduleResult result;
    try {
        result = generator.generate(input);
    } catch (const ContractViolation& violation) {
        logger.error(std::string{"Contract violation: "} + violation.what());
        std::cerr << "Contract violation: " << violation.what() << std::endl;
        logger.flush();
        return EXIT_CONTRACT_VIOLATION;
    }

    // ── Emit Result ──────────────────────────
    if (result_on_stdout) {
        std::cout << to_json(result) << std::endl;
    } else {
        auto written = write_result(result, args.output_path);
        if (!written) {
            logger.error(written.error().message);
            std::cerr << written.error().message << std::endl;
            return EXIT_INPUT_ERROR;
        }
        logger.info("Result written to " + args.output_path.string());
    }

    if (metrics) metrics->flush();
    logger.flush();
    return 0;
}
