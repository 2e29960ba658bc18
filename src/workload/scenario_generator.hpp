/**
 * @file scenario_generator.hpp
 * @brief Synthetic scheduling scenarios for the demo, tests and benchmarks.
 */

#pragma once

#include "scheduler/scheduler.hpp"

#include <random>

namespace session_planner {

/**
 * @brief Factory for synthetic trainer workloads with various request shapes.
 *
 * All generators are deterministic for a given seed/engine state.
 */
class ScenarioGenerator {
public:
    /// @p per_day fixed-start hourly requests on each of @p days consecutive days.
    static ScheduleInput hourly_grid(const TrainerId& trainer, Day first_day,
                                     size_t days, size_t per_day, int duration_minutes = 60);

    /// Requests that all contend for the same hour on @p day.
    static ScheduleInput contended_hour(const TrainerId& trainer, Day day, size_t requests);

    /// Preferred-time requests on @p day, each listing the same fallback times.
    static ScheduleInput preferred_times(const TrainerId& trainer, Day day, size_t requests);

    /// A week of mixed fixed and preferred-time requests with random attributes,
    /// a few confirmed bookings, and hourly slots across work hours.
    static ScheduleInput random_week(const TrainerId& trainer, Day first_day,
                                     size_t requests, std::mt19937& rng);
};

}  // namespace session_planner
