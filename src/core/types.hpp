/**
 * @file types.hpp
 * @brief Fundamental types used throughout SessionPlanner.
 *
 * Defines identifier aliases, the timestamp representation, calendar helpers
 * and the TimeOfDay value type. All instants are UTC-normalized by the caller;
 * calendar day, weekday and time-of-day are derived in UTC.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace session_planner {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using RequestId = std::string;
using ClientId = std::string;
using TrainerId = std::string;
using SlotId = std::string;
using Timestamp = std::chrono::sys_seconds;
using Day = std::chrono::sys_days;
using Minutes = std::chrono::minutes;

// ─────────────────────────────────────────────
// Calendar Helpers
// ─────────────────────────────────────────────

/// Calendar day (UTC) an instant falls on.
[[nodiscard]] inline Day day_of(Timestamp t) noexcept {
    return std::chrono::floor<std::chrono::days>(t);
}

/// Weekday index with 0 = Monday … 6 = Sunday.
[[nodiscard]] inline int weekday_index(Day day) noexcept {
    return static_cast<int>(std::chrono::weekday{day}.iso_encoding()) - 1;
}

[[nodiscard]] constexpr std::string_view weekday_name(int index) noexcept {
    switch (index) {
        case 0: return "Monday";
        case 1: return "Tuesday";
        case 2: return "Wednesday";
        case 3: return "Thursday";
        case 4: return "Friday";
        case 5: return "Saturday";
        case 6: return "Sunday";
    }
    return "Unknown";
}

/// Formats a day as YYYY-MM-DD.
[[nodiscard]] std::string format_date(Day day);

/// Formats an instant as YYYY-MM-DDTHH:MM:SSZ.
[[nodiscard]] std::string format_timestamp(Timestamp t);

// ─────────────────────────────────────────────
// Time of Day
// ─────────────────────────────────────────────

/**
 * @brief Minutes past midnight, used for work hours and preferred times.
 */
struct TimeOfDay {
    int minutes{0};

    [[nodiscard]] static constexpr TimeOfDay at(int hour, int minute = 0) noexcept {
        return TimeOfDay{hour * 60 + minute};
    }

    [[nodiscard]] constexpr int hour() const noexcept { return minutes / 60; }
    [[nodiscard]] constexpr int minute() const noexcept { return minutes % 60; }

    /// HH:MM
    [[nodiscard]] std::string to_string() const;

    auto operator<=>(const TimeOfDay&) const = default;
};

/// Parses "HH:MM" (00:00–23:59).
[[nodiscard]] Result<TimeOfDay> parse_time_of_day(std::string_view text);

/// Time of day of an instant (UTC).
[[nodiscard]] inline TimeOfDay time_of_day(Timestamp t) noexcept {
    auto since_midnight = std::chrono::duration_cast<Minutes>(t - day_of(t));
    return TimeOfDay{static_cast<int>(since_midnight.count())};
}

/// The instant a time of day falls on for the given calendar day.
[[nodiscard]] inline Timestamp at_time(Day day, TimeOfDay tod) noexcept {
    return Timestamp{day} + Minutes{tod.minutes};
}

// ─────────────────────────────────────────────
// Request Lifecycle
// ─────────────────────────────────────────────

enum class RequestStatus : uint8_t {
    Pending,
    Approved,
    Rejected,
    Expired
};

[[nodiscard]] constexpr std::string_view to_string(RequestStatus status) noexcept {
    switch (status) {
        case RequestStatus::Pending:  return "PENDING";
        case RequestStatus::Approved: return "APPROVED";
        case RequestStatus::Rejected: return "REJECTED";
        case RequestStatus::Expired:  return "EXPIRED";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────
// Time Blocks
// ─────────────────────────────────────────────

enum class TimeBlock : uint8_t {
    Morning,     ///< 06:00–12:00
    Afternoon,   ///< 12:00–18:00
    Evening      ///< 18:00–22:00
};

[[nodiscard]] constexpr std::string_view to_string(TimeBlock block) noexcept {
    switch (block) {
        case TimeBlock::Morning:   return "morning";
        case TimeBlock::Afternoon: return "afternoon";
        case TimeBlock::Evening:   return "evening";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool in_block(TimeOfDay tod, TimeBlock block) noexcept {
    switch (block) {
        case TimeBlock::Morning:   return tod.hour() >= 6 && tod.hour() < 12;
        case TimeBlock::Afternoon: return tod.hour() >= 12 && tod.hour() < 18;
        case TimeBlock::Evening:   return tod.hour() >= 18 && tod.hour() < 22;
    }
    return false;
}

[[nodiscard]] Result<TimeBlock> parse_time_block(std::string_view text);

}  // namespace session_planner
