/**
 * @file scenario_loader.hpp
 * @brief Reads a trainer scheduling scenario from TOML.
 *
 * Layout:
 *
 *   trainer_id = "t1"
 *   max_entries = 10                  # optional
 *   [range]                           # optional, both keys optional
 *   start = 2024-01-15T00:00:00Z
 *   end   = 2024-01-21T23:59:59Z
 *   [preferences]                     # optional, overlays the defaults
 *   [[requests]] ...
 *   [[bookings]] ...
 *   [[slots]] ...
 */

#pragma once

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

#include <filesystem>
#include <string_view>

namespace session_planner {

/**
 * @brief Load a scenario file. @p default_prefs is the base the
 *        scenario's [preferences] table is overlaid on.
 */
Result<ScheduleInput> load_scenario(const std::filesystem::path& path,
                                    const SchedulingPreferences& default_prefs = {});

/// Parse a scenario from TOML text.
Result<ScheduleInput> parse_scenario(std::string_view toml_text,
                                     const SchedulingPreferences& default_prefs = {});

/// Parse a request status name (PENDING, APPROVED, REJECTED, EXPIRED; any case).
[[nodiscard]] Result<RequestStatus> parse_request_status(std::string_view text);

}  // namespace session_planner
