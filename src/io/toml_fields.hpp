/**
 * @file toml_fields.hpp
 * @brief Field readers shared by the configuration and scenario loaders.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/scheduler.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string_view>
#include <vector>

namespace session_planner::toml_fields {

/// TOML integers are 64-bit. Fails with "<key> must be between <min> and <max>"
/// instead of letting a later narrowing cast wrap the value.
Result<int64_t> in_range(int64_t value, int64_t min, int64_t max, std::string_view key);

/// in_range() over the full range of int.
inline Result<int64_t> fits_int(int64_t value, std::string_view key) {
    return in_range(value, std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), key);
}

/// TOML offset or local date-time, normalized to UTC. A bare date means midnight.
Result<Timestamp> read_timestamp(const toml::node& node);

/// TOML date, or the day of a date-time.
Result<Day> read_day(const toml::node& node);

/// Array of "HH:MM" strings.
Result<std::vector<TimeOfDay>> read_times(const toml::node& node);

/**
 * @brief Overlay a [preferences] table onto @p base and validate the result.
 */
Result<SchedulingPreferences> read_preferences(const toml::table& tbl,
                                               SchedulingPreferences base);

}  // namespace session_planner::toml_fields
