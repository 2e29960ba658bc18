/**
 * @file bench_scheduler.cpp
 * @brief Performance benchmarks for ranking, placement and full planning runs.
 *
 * Measures per-stage cost over synthetic scenarios of increasing size so
 * regressions in the conflict index or placement checks show up early.
 *
 * Usage: ./bench_scheduler [--csv]
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "io/result_writer.hpp"
#include "scheduler/conflict_index.hpp"
#include "scheduler/placement_engine.hpp"
#include "scheduler/priority_ranker.hpp"
#include "scheduler/schedule_generator.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/scenario_generator.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace session_planner;
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

const Day BENCH_MONDAY = std::chrono::sys_days{std::chrono::year{2024} / std::chrono::January / 15};

ScheduleInput week_of(size_t requests, unsigned seed = 42) {
    std::mt19937 rng(seed);
    return ScenarioGenerator::random_week("bench", BENCH_MONDAY, requests, rng);
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_ranking() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    PriorityRanker ranker(PriorityConfig{});
    SchedulingPreferences prefs;

    for (size_t n : {10, 100, 1000}) {
        auto input = week_of(n);
        R.push_back(run_bench("rank(" + std::to_string(n) + ")", "Ranking", N,
            [&]{ auto r = ranker.rank(input.requests, prefs); (void)r; },
            std::to_string(n) + " requests"));
    }

    auto single = week_of(1).requests.front();
    R.push_back(run_bench("compute_score", "Ranking", N * 10,
        [&]{ auto s = ranker.compute(single, prefs); (void)s; }));

    return R;
}

std::vector<BenchResult> bench_conflict_index() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    for (size_t per_day : {4, 8}) {
        ConflictIndex index("bench");
        auto grid = ScenarioGenerator::hourly_grid("bench", BENCH_MONDAY, 28, per_day, 45);
        for (const auto& request : grid.requests) {
            index.add(CommittedInterval{
                .trainer_id = "bench",
                .interval = Interval{*request.start, *request.start + Minutes{45}},
                .request_id = request.id,
                .origin = CommittedInterval::Origin::ApprovedRequest
            });
        }

        auto day = BENCH_MONDAY + std::chrono::days{14};
        Interval candidate{at_time(day, TimeOfDay::at(10, 30)), at_time(day, TimeOfDay::at(11, 30))};
        auto label = std::to_string(index.size()) + " committed";

        R.push_back(run_bench("conflicts_with(" + std::to_string(per_day) + "/day)", "Conflict Index", N,
            [&]{ auto c = index.conflicts_with(candidate); (void)c; }, label));
        R.push_back(run_bench("breaks_break_rule(" + std::to_string(per_day) + "/day)", "Conflict Index", N,
            [&]{ auto b = index.breaks_break_rule(candidate, 15); (void)b; }, label));
    }

    return R;
}

std::vector<BenchResult> bench_placement() {
    std::vector<BenchResult> R;
    PriorityRanker ranker(PriorityConfig{});
    SchedulingPreferences prefs;

    auto place_all = [&](const ScheduleInput& input, uint32_t slot_minutes) {
        auto ranked = ranker.rank(input.requests, prefs);
        PlacementEngine engine(input.trainer_id, prefs,
                               PlacementOptions{.slot_minutes = slot_minutes},
                               input.available_slots);
        for (const auto& booking : input.existing_bookings) engine.seed(booking);
        size_t accepted = 0;
        for (const auto& entry : ranked) {
            if (is_placed(engine.place(entry))) ++accepted;
        }
        return accepted;
    };

    for (size_t n : {10, 50, 200}) {
        auto input = ScenarioGenerator::contended_hour("bench", BENCH_MONDAY, n);
        R.push_back(run_bench("contended_hour(" + std::to_string(n) + ")", "Placement", 200,
            [&]{ auto a = place_all(input, 0); (void)a; }, std::to_string(n) + " requests"));
    }

    for (size_t n : {10, 50, 200}) {
        auto input = ScenarioGenerator::preferred_times("bench", BENCH_MONDAY, n);
        R.push_back(run_bench("preferred_times(" + std::to_string(n) + ")", "Placement", 200,
            [&]{ auto a = place_all(input, 0); (void)a; }, "4 candidates each"));
    }

    for (size_t n : {50, 200}) {
        auto input = week_of(n);
        auto label = std::to_string(input.available_slots.size()) + " slots";
        R.push_back(run_bench("random_week(" + std::to_string(n) + ")", "Placement", 200,
            [&]{ auto a = place_all(input, 0); (void)a; }, label));
        R.push_back(run_bench("random_week_units(" + std::to_string(n) + ")", "Placement", 200,
            [&]{ auto a = place_all(input, 60); (void)a; }, label + ", 60 min units"));
    }

    return R;
}

std::vector<BenchResult> bench_generate() {
    std::vector<BenchResult> R;
    Logger logger(std::make_unique<NullSink>(), LogLevel::Info);
    ScheduleGenerator generator(default_config(), logger);

    for (size_t n : {10, 100, 500}) {
        auto input = week_of(n);
        R.push_back(run_bench("generate_week(" + std::to_string(n) + ")", "Generate", 100,
            [&]{ auto r = generator.generate(input); (void)r; }, std::to_string(n) + " requests"));
    }

    auto grid = ScenarioGenerator::hourly_grid("bench", BENCH_MONDAY, 5, 10);
    R.push_back(run_bench("generate_grid(5x10)", "Generate", 200,
        [&]{ auto r = generator.generate(grid); (void)r; }, "50 requests"));

    auto input = week_of(100);
    auto result = generator.generate(input);
    R.push_back(run_bench("to_json(week 100)", "Generate", 500,
        [&]{ auto j = to_json(result); (void)j; },
        std::to_string(result.proposed_entries.size()) + " proposed"));

    return R;
}

std::vector<BenchResult> bench_trainers() {
    std::vector<BenchResult> R;
    Logger logger(std::make_unique<NullSink>(), LogLevel::Info);
    ScheduleGenerator generator(default_config(), logger);

    // One generator shared by independent trainers, one thread each.
    for (size_t trainers : {2, 4, 8}) {
        std::vector<ScheduleInput> inputs;
        for (size_t t = 0; t < trainers; ++t) {
            inputs.push_back(week_of(100, static_cast<unsigned>(t + 1)));
        }
        R.push_back(run_bench("parallel_trainers(" + std::to_string(trainers) + ")", "Trainers", 50,
            [&]{
                std::vector<std::thread> workers;
                for (const auto& input : inputs) {
                    workers.emplace_back([&]{ auto r = generator.generate(input); (void)r; });
                }
                for (auto& w : workers) w.join();
            }, "100 requests each"));
    }

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  SessionPlanner Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_ranking());
    append(bench_conflict_index());
    append(bench_placement());
    append(bench_generate());
    append(bench_trainers());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
