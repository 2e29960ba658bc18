/**
 * @file statistics.hpp
 * @brief Run summary metrics and the human-readable result message.
 */

#pragma once

#include "scheduler/scheduler.hpp"

#include <span>
#include <string>
#include <vector>

namespace session_planner {

/**
 * @brief Aggregate metrics for one run.
 *
 * Utilization is scheduled minutes over available minutes: the summed slot
 * minutes when slots were supplied, otherwise one work day per distinct day
 * that received an entry.
 */
[[nodiscard]] ScheduleStatistics build_statistics(std::span<const ProposedScheduleEntry> accepted,
                                                  size_t total_requests,
                                                  const SchedulingPreferences& prefs,
                                                  std::span<const AvailableSlot> slots = {});

/// Accepted pairs on the same day separated by exactly the minimum break.
[[nodiscard]] size_t count_gaps_minimized(std::span<const ProposedScheduleEntry> accepted,
                                          int min_break_minutes);

[[nodiscard]] std::string build_message(const ScheduleStatistics& stats);

}  // namespace session_planner
