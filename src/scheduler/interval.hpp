/**
 * @file interval.hpp
 * @brief Half-open time interval [start, end) and its queries.
 */

#pragma once

#include "core/types.hpp"

#include <string>

namespace session_planner {

struct Interval {
    Timestamp start;
    Timestamp end;

    [[nodiscard]] Minutes duration() const noexcept {
        return std::chrono::duration_cast<Minutes>(end - start);
    }

    [[nodiscard]] Day day() const noexcept { return day_of(start); }

    /// "09:00 - 10:00"
    [[nodiscard]] std::string clock_range() const;

    auto operator<=>(const Interval&) const = default;
};

/// True iff the intervals share at least one instant. Touching intervals do not overlap.
[[nodiscard]] constexpr bool overlaps(const Interval& a, const Interval& b) noexcept {
    return a.start < b.end && b.start < a.end;
}

/**
 * @brief Signed distance in minutes between the nearer endpoints.
 *
 * Positive when the intervals are disjoint, zero when they touch, negative
 * (the overlap length) when they overlap. Symmetric in its arguments.
 */
[[nodiscard]] double gap_minutes(const Interval& a, const Interval& b) noexcept;

[[nodiscard]] constexpr bool within_window(const Interval& interval,
                                           Timestamp window_start,
                                           Timestamp window_end) noexcept {
    return interval.start >= window_start && interval.end <= window_end;
}

}  // namespace session_planner
