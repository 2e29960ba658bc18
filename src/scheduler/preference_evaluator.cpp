/**
 * @file preference_evaluator.cpp
 * @brief PreferenceEvaluator implementation.
 */

#include "scheduler/preference_evaluator.hpp"

namespace session_planner {

PreferenceEvaluator::PreferenceEvaluator(const SchedulingPreferences& prefs)
    : prefs_(prefs) {
    auto valid = validate_preferences(prefs_);
    if (!valid) {
        throw ContractViolation("unvalidated scheduling preferences: " + valid.error().message);
    }
}

std::optional<RejectionReason>
PreferenceEvaluator::is_structurally_allowed(const Interval& candidate,
                                             const ConflictIndex& index) const {
    if (auto reason = check_day_off(candidate)) return reason;
    if (auto reason = check_work_hours(candidate)) return reason;
    return check_capacity(candidate, index);
}

std::optional<RejectionReason> PreferenceEvaluator::check_day_off(const Interval& candidate) const {
    if (prefs_.is_day_off(candidate.day())) {
        return RejectionReason::day_off(candidate.day());
    }
    return std::nullopt;
}

std::optional<RejectionReason> PreferenceEvaluator::check_work_hours(const Interval& candidate) const {
    auto day = candidate.day();
    auto opens = at_time(day, prefs_.work_start);
    auto closes = at_time(day, prefs_.work_end);

    // A session may end exactly at closing time.
    if (!within_window(candidate, opens, closes)) {
        return RejectionReason::outside_work_hours(candidate.start, prefs_.work_start, prefs_.work_end);
    }
    return std::nullopt;
}

std::optional<RejectionReason>
PreferenceEvaluator::check_capacity(const Interval& candidate, const ConflictIndex& index) const {
    auto day = candidate.day();
    if (index.sessions_on(day) >= static_cast<size_t>(prefs_.max_sessions_per_day)) {
        return RejectionReason::daily_limit_reached(prefs_.max_sessions_per_day, day);
    }
    return std::nullopt;
}

}  // namespace session_planner
