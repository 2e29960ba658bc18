/**
 * @file rejection.hpp
 * @brief Closed taxonomy of placement rejection reasons.
 *
 * A reason is a kind plus the structured parameters its message needs.
 * Callers match on the kind; the human-readable text is rendered on demand.
 */

#pragma once

#include "core/types.hpp"
#include "scheduler/interval.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace session_planner {

enum class RejectionKind : uint8_t {
    NoTimeSpecified,
    NoEligibleTime,
    NoSlotCombination,
    DayOff,
    OutsideWorkHours,
    DailyLimitReached,
    SlotUnavailable,
    DirectConflictExisting,
    DirectConflictApproved,
    InsufficientBreakBefore,
    InsufficientBreakAfter,
    ResultCapReached
};

[[nodiscard]] constexpr std::string_view to_string(RejectionKind kind) noexcept {
    switch (kind) {
        case RejectionKind::NoTimeSpecified:         return "no_time_specified";
        case RejectionKind::NoEligibleTime:          return "no_eligible_time";
        case RejectionKind::NoSlotCombination:       return "no_slot_combination";
        case RejectionKind::DayOff:                  return "day_off";
        case RejectionKind::OutsideWorkHours:        return "outside_work_hours";
        case RejectionKind::DailyLimitReached:       return "daily_limit_reached";
        case RejectionKind::SlotUnavailable:         return "slot_unavailable";
        case RejectionKind::DirectConflictExisting:  return "direct_conflict_existing";
        case RejectionKind::DirectConflictApproved:  return "direct_conflict_approved";
        case RejectionKind::InsufficientBreakBefore: return "insufficient_break_before";
        case RejectionKind::InsufficientBreakAfter:  return "insufficient_break_after";
        case RejectionKind::ResultCapReached:        return "result_cap_reached";
    }
    return "unknown";
}

/**
 * @brief One rejection reason. Only the fields relevant to the kind are set.
 */
struct RejectionReason {
    RejectionKind kind = RejectionKind::NoTimeSpecified;

    std::optional<Day> day;                 ///< DayOff, DailyLimitReached
    std::optional<Timestamp> at;            ///< OutsideWorkHours, SlotUnavailable
    std::optional<TimeOfDay> work_start;    ///< OutsideWorkHours
    std::optional<TimeOfDay> work_end;      ///< OutsideWorkHours
    std::optional<Interval> other;          ///< conflicts and break violations
    int limit = 0;                          ///< sessions per day, break minutes, result cap, duration

    [[nodiscard]] std::string render() const;

    // ── Factories ─────────────────────────────
    static RejectionReason no_time_specified();
    static RejectionReason no_eligible_time();
    static RejectionReason no_slot_combination(int duration_minutes);
    static RejectionReason day_off(Day day);
    static RejectionReason outside_work_hours(Timestamp requested, TimeOfDay start, TimeOfDay end);
    static RejectionReason daily_limit_reached(int max_sessions, Day day);
    static RejectionReason slot_unavailable(Timestamp unit_start);
    static RejectionReason direct_conflict(const Interval& other, bool with_approved_request);
    static RejectionReason insufficient_break_before(int min_break, const Interval& previous);
    static RejectionReason insufficient_break_after(int min_break, const Interval& next);
    static RejectionReason result_cap_reached(int max_entries);
};

}  // namespace session_planner
