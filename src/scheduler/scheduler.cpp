/**
 * @file scheduler.cpp
 * @brief Request contract checks and preference validation.
 */

#include "scheduler/scheduler.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace session_planner {

void check_request_contract(const BookingRequest& request) {
    expects(request.duration_minutes > 0,
            "booking request " + request.id + " has non-positive duration "
            + std::to_string(request.duration_minutes));
    if (request.start && request.end) {
        expects(*request.end > *request.start,
                "booking request " + request.id + " ends before it starts");
    }
    if (request.priority_score) {
        expects(std::isfinite(*request.priority_score),
                "booking request " + request.id + " has a non-finite priority score");
    }
}

bool SchedulingPreferences::is_day_off(Day day) const noexcept {
    return std::find(days_off.begin(), days_off.end(), weekday_index(day)) != days_off.end();
}

bool SchedulingPreferences::in_preferred_block(TimeOfDay tod) const noexcept {
    return std::any_of(preferred_time_blocks.begin(), preferred_time_blocks.end(),
                       [tod](TimeBlock block) { return in_block(tod, block); });
}

Result<void> validate_preferences(const SchedulingPreferences& prefs) {
    if (prefs.max_sessions_per_day < 1 || prefs.max_sessions_per_day > 15) {
        return Error{"max_sessions_per_day must be between 1 and 15"};
    }
    if (prefs.min_break_minutes < 0 || prefs.min_break_minutes > 60) {
        return Error{"min_break_minutes must be between 0 and 60"};
    }
    if (prefs.work_start.minutes < 0 || prefs.work_end.minutes > 24 * 60) {
        return Error{"work hours must lie within one day"};
    }
    if (prefs.work_end <= prefs.work_start) {
        return Error{"work_end_time must be after work_start_time"};
    }

    std::set<int> distinct_days;
    for (int day : prefs.days_off) {
        if (day < 0 || day > 6) {
            return Error{"Days must be between 0 (Monday) and 6 (Sunday)"};
        }
        distinct_days.insert(day);
    }
    if (distinct_days.size() >= 7) {
        return Error{"You cannot mark all days as off. You must work at least one day per week."};
    }
    return {};
}

}  // namespace session_planner
