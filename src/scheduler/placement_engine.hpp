/**
 * @file placement_engine.hpp
 * @brief Greedy single-pass placement of ranked booking requests.
 */

#pragma once

#include "scheduler/conflict_index.hpp"
#include "scheduler/preference_evaluator.hpp"
#include "scheduler/priority_ranker.hpp"
#include "scheduler/scheduler.hpp"

#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace session_planner {

struct PlacementOptions {
    uint32_t slot_minutes = 0;             ///< Unit size for multi-unit placements; 0 = one unit
    std::optional<int> max_entries;        ///< Stop accepting after this many entries
    std::optional<Day> fallback_anchor;    ///< Day for preferred times when a request has no date
};

using PlacementDecision = std::variant<ProposedScheduleEntry, RejectedEntry>;

[[nodiscard]] inline bool is_placed(const PlacementDecision& decision) noexcept {
    return std::holds_alternative<ProposedScheduleEntry>(decision);
}

/**
 * @brief Places requests one at a time in the order given.
 *
 * Every accepted request is committed to the conflict index immediately, so
 * it constrains all later requests. Decisions are final: no retries and no
 * backtracking.
 */
class PlacementEngine {
public:
    PlacementEngine(TrainerId trainer_id,
                    const SchedulingPreferences& prefs,
                    PlacementOptions options = {},
                    std::span<const AvailableSlot> slots = {});

    /// Add a confirmed booking. Call before the first place().
    void seed(const CommittedInterval& booking);

    /// Throws ContractViolation when the request breaks its invariants.
    PlacementDecision place(const RankedRequest& ranked);

    [[nodiscard]] const ConflictIndex& index() const noexcept { return index_; }
    [[nodiscard]] size_t accepted_count() const noexcept { return accepted_; }

private:
    [[nodiscard]] std::vector<Interval> resolve_candidates(const BookingRequest& request) const;
    [[nodiscard]] std::vector<Interval> slot_candidates(const BookingRequest& request) const;
    [[nodiscard]] bool eligible_start(const BookingRequest& request, Timestamp start) const;
    [[nodiscard]] bool follows_committed(const Interval& candidate) const;
    [[nodiscard]] RejectionReason unresolved_reason(const BookingRequest& request) const;
    [[nodiscard]] std::optional<RejectionReason> check(const Interval& candidate) const;
    [[nodiscard]] std::vector<Interval> split_units(const Interval& candidate) const;
    [[nodiscard]] bool covered_by_slots(const Interval& unit) const;
    [[nodiscard]] std::vector<SlotId> slots_for(const Interval& interval) const;

    ProposedScheduleEntry commit(const RankedRequest& ranked, const Interval& placed);
    [[nodiscard]] RejectedEntry reject(const RankedRequest& ranked,
                                       const std::vector<Interval>& candidates,
                                       RejectionReason reason) const;

    TrainerId trainer_id_;
    PreferenceEvaluator evaluator_;
    PlacementOptions options_;
    std::vector<AvailableSlot> slots_;     ///< Sorted by start
    std::vector<Interval> open_ranges_;    ///< Union of slots, merged where they touch
    ConflictIndex index_;
    size_t accepted_{0};
};

}  // namespace session_planner
