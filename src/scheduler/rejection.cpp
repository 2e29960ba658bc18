/**
 * @file rejection.cpp
 * @brief Rejection reason factories and message rendering.
 */

#include "scheduler/rejection.hpp"

#include <format>

namespace session_planner {

RejectionReason RejectionReason::no_time_specified() {
    return RejectionReason{.kind = RejectionKind::NoTimeSpecified};
}

RejectionReason RejectionReason::no_eligible_time() {
    return RejectionReason{.kind = RejectionKind::NoEligibleTime};
}

RejectionReason RejectionReason::no_slot_combination(int duration_minutes) {
    return RejectionReason{.kind = RejectionKind::NoSlotCombination, .limit = duration_minutes};
}

RejectionReason RejectionReason::day_off(Day day) {
    return RejectionReason{.kind = RejectionKind::DayOff, .day = day};
}

RejectionReason RejectionReason::outside_work_hours(Timestamp requested,
                                                    TimeOfDay start,
                                                    TimeOfDay end) {
    return RejectionReason{
        .kind = RejectionKind::OutsideWorkHours,
        .at = requested,
        .work_start = start,
        .work_end = end
    };
}

RejectionReason RejectionReason::daily_limit_reached(int max_sessions, Day day) {
    return RejectionReason{
        .kind = RejectionKind::DailyLimitReached,
        .day = day,
        .limit = max_sessions
    };
}

RejectionReason RejectionReason::slot_unavailable(Timestamp unit_start) {
    return RejectionReason{.kind = RejectionKind::SlotUnavailable, .at = unit_start};
}

RejectionReason RejectionReason::direct_conflict(const Interval& other, bool with_approved_request) {
    return RejectionReason{
        .kind = with_approved_request ? RejectionKind::DirectConflictApproved
                                      : RejectionKind::DirectConflictExisting,
        .other = other
    };
}

RejectionReason RejectionReason::insufficient_break_before(int min_break, const Interval& previous) {
    return RejectionReason{
        .kind = RejectionKind::InsufficientBreakBefore,
        .other = previous,
        .limit = min_break
    };
}

RejectionReason RejectionReason::insufficient_break_after(int min_break, const Interval& next) {
    return RejectionReason{
        .kind = RejectionKind::InsufficientBreakAfter,
        .other = next,
        .limit = min_break
    };
}

RejectionReason RejectionReason::result_cap_reached(int max_entries) {
    return RejectionReason{.kind = RejectionKind::ResultCapReached, .limit = max_entries};
}

std::string RejectionReason::render() const {
    switch (kind) {
        case RejectionKind::NoTimeSpecified:
            return "Request has no start/end time specified";

        case RejectionKind::NoEligibleTime:
            return "None of the preferred times is allowed by the request's weekend, evening "
                   "or avoid-time constraints";

        case RejectionKind::NoSlotCombination:
            return std::format("No contiguous available slots for a {}-minute session", limit);

        case RejectionKind::DayOff:
            return std::format("Requested day ({}) is marked as a day off in your preferences",
                               weekday_name(weekday_index(day.value())));

        case RejectionKind::OutsideWorkHours:
            return std::format("Requested time {} is outside work hours ({} - {})",
                               time_of_day(at.value()).to_string(),
                               work_start.value().to_string(),
                               work_end.value().to_string());

        case RejectionKind::DailyLimitReached:
            return std::format("Maximum sessions per day limit reached ({} sessions) for {}",
                               limit, format_date(day.value()));

        case RejectionKind::SlotUnavailable:
            return std::format("No available time slot at {} {}",
                               format_date(day_of(at.value())),
                               time_of_day(at.value()).to_string());

        case RejectionKind::DirectConflictExisting:
            return "Direct time conflict with existing booking at " + other.value().clock_range();

        case RejectionKind::DirectConflictApproved:
            return "Direct time conflict with other approved request at " + other.value().clock_range();

        case RejectionKind::InsufficientBreakBefore:
            return std::format("Insufficient break time ({} minutes required) before existing session ending at {}",
                               limit, time_of_day(other.value().end).to_string());

        case RejectionKind::InsufficientBreakAfter:
            return std::format("Insufficient break time ({} minutes required) after existing session starting at {}",
                               limit, time_of_day(other.value().start).to_string());

        case RejectionKind::ResultCapReached:
            return std::format("Maximum of {} proposed sessions reached for this run", limit);
    }
    return "Unknown rejection reason";
}

}  // namespace session_planner
