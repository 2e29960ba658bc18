/**
 * @file preference_evaluator.hpp
 * @brief Structural admissibility of a candidate interval under trainer preferences.
 */

#pragma once

#include "scheduler/conflict_index.hpp"
#include "scheduler/scheduler.hpp"

#include <optional>

namespace session_planner {

/**
 * @brief Applies day-off, work-hours and daily-capacity checks.
 *
 * is_structurally_allowed() runs the checks in that fixed order and reports
 * the first failure. The individual checks are public so multi-unit
 * placements can run them per unit.
 */
class PreferenceEvaluator {
public:
    /// Throws ContractViolation when the preferences were never validated.
    explicit PreferenceEvaluator(const SchedulingPreferences& prefs);

    [[nodiscard]] std::optional<RejectionReason>
    is_structurally_allowed(const Interval& candidate, const ConflictIndex& index) const;

    [[nodiscard]] std::optional<RejectionReason> check_day_off(const Interval& candidate) const;
    [[nodiscard]] std::optional<RejectionReason> check_work_hours(const Interval& candidate) const;
    [[nodiscard]] std::optional<RejectionReason> check_capacity(const Interval& candidate,
                                                                const ConflictIndex& index) const;

    [[nodiscard]] const SchedulingPreferences& preferences() const noexcept { return prefs_; }

private:
    SchedulingPreferences prefs_;
};

}  // namespace session_planner
