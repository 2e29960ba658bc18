/**
 * @file interval.cpp
 * @brief Interval queries.
 */

#include "scheduler/interval.hpp"

#include <algorithm>

namespace session_planner {

std::string Interval::clock_range() const {
    return time_of_day(start).to_string() + " - " + time_of_day(end).to_string();
}

double gap_minutes(const Interval& a, const Interval& b) noexcept {
    // Distance from the later start to the earlier end.
    auto later_start = std::max(a.start, b.start);
    auto earlier_end = std::min(a.end, b.end);
    return std::chrono::duration<double, std::ratio<60>>(later_start - earlier_end).count();
}

}  // namespace session_planner
