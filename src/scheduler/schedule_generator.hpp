/**
 * @file schedule_generator.hpp
 * @brief Entry point: one optimal-schedule run for one trainer.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "scheduler/priority_ranker.hpp"
#include "scheduler/scheduler.hpp"

namespace session_planner {

class MetricsCollector;

/**
 * @brief Filters, ranks, places and summarizes the pending requests of one trainer.
 *
 * generate() is a pure planning function: it mutates neither its input nor
 * the generator, and identical inputs give identical results. Every
 * considered request ends up in exactly one of proposed_entries and
 * rejected_entries. Applying the decisions (APPROVED / REJECTED) is the
 * caller's job.
 *
 * A generator may be shared by threads scheduling different trainers; the
 * logger and metrics collector synchronize internally.
 */
class ScheduleGenerator {
public:
    ScheduleGenerator(Config config, Logger& logger, MetricsCollector* metrics = nullptr);

    /// Throws ContractViolation on malformed requests or unvalidated preferences.
    [[nodiscard]] ScheduleResult generate(const ScheduleInput& input) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<BookingRequest> considered_requests(const ScheduleInput& input) const;

    Config config_;
    PriorityRanker ranker_;
    Logger& logger_;
    MetricsCollector* metrics_;
};

}  // namespace session_planner
