/**
 * @file placement_engine.cpp
 * @brief PlacementEngine: resolves candidates, checks them, commits or rejects.
 *
 * Check order for one candidate:
 *   day off → work hours (per unit) → slot coverage (per unit, when slots
 *   were supplied) → daily capacity → direct conflict (per unit)
 *   → break before → break after
 * The first failure is the reason. A multi-unit candidate is committed only
 * after all of its units passed, as one interval.
 *
 * Complexity: O(R × C × D) where R = requests, C = candidates per request,
 * D = committed intervals on the candidate's day.
 */

#include "scheduler/placement_engine.hpp"

#include <algorithm>

namespace session_planner {

namespace {

bool is_weekend(Day day) {
    return weekday_index(day) >= 5;
}

constexpr int EVENING_START_HOUR = 18;

}  // anonymous namespace

PlacementEngine::PlacementEngine(TrainerId trainer_id,
                                 const SchedulingPreferences& prefs,
                                 PlacementOptions options,
                                 std::span<const AvailableSlot> slots)
    : trainer_id_(trainer_id)
    , evaluator_(prefs)
    , options_(options)
    , slots_(slots.begin(), slots.end())
    , index_(std::move(trainer_id)) {
    std::sort(slots_.begin(), slots_.end(), [](const AvailableSlot& a, const AvailableSlot& b) {
        return a.interval.start < b.interval.start;
    });

    for (const auto& slot : slots_) {
        if (!open_ranges_.empty() && slot.interval.start <= open_ranges_.back().end) {
            open_ranges_.back().end = std::max(open_ranges_.back().end, slot.interval.end);
        } else {
            open_ranges_.push_back(slot.interval);
        }
    }
}

void PlacementEngine::seed(const CommittedInterval& booking) {
    CommittedInterval seeded = booking;
    seeded.origin = CommittedInterval::Origin::ExistingBooking;
    index_.add(std::move(seeded));
}

PlacementDecision PlacementEngine::place(const RankedRequest& ranked) {
    const auto& request = *ranked.request;
    check_request_contract(request);

    auto candidates = resolve_candidates(request);

    if (options_.max_entries && accepted_ >= static_cast<size_t>(*options_.max_entries)) {
        return reject(ranked, candidates, RejectionReason::result_cap_reached(*options_.max_entries));
    }
    if (candidates.empty()) {
        return reject(ranked, candidates, unresolved_reason(request));
    }

    std::optional<RejectionReason> first_failure;
    for (const auto& candidate : candidates) {
        auto failure = check(candidate);
        if (!failure) {
            return commit(ranked, candidate);
        }
        if (!first_failure) first_failure = std::move(failure);
    }
    return reject(ranked, candidates, std::move(*first_failure));
}

std::vector<Interval> PlacementEngine::resolve_candidates(const BookingRequest& request) const {
    Minutes duration{request.duration_minutes};

    if (request.start) {
        auto end = request.end.value_or(*request.start + duration);
        return {Interval{*request.start, end}};
    }
    if (request.end) {
        return {Interval{*request.end - duration, *request.end}};
    }
    if (request.preferred_times.empty()) {
        return slot_candidates(request);
    }

    std::vector<Interval> candidates;
    auto anchor = request.preferred_date ? request.preferred_date : options_.fallback_anchor;
    if (!anchor) {
        return candidates;
    }

    for (auto tod : request.preferred_times) {
        auto start = at_time(*anchor, tod);
        if (eligible_start(request, start)) {
            candidates.push_back(Interval{start, start + duration});
        }
    }
    return candidates;
}

bool PlacementEngine::eligible_start(const BookingRequest& request, Timestamp start) const {
    auto tod = time_of_day(start);
    if (!request.allow_weekends && is_weekend(day_of(start))) return false;
    if (!request.allow_evenings && tod.hour() >= EVENING_START_HOUR) return false;
    return std::find(request.avoid_times.begin(), request.avoid_times.end(), tod)
           == request.avoid_times.end();
}

// ─────────────────────────────────────────────
// Slot search: every slot start that opens a contiguous run of slots long
// enough for the request. Ordered by sessions that directly follow a
// committed one (when preferred), then distance to the preferred date,
// then start.
// ─────────────────────────────────────────────

std::vector<Interval> PlacementEngine::slot_candidates(const BookingRequest& request) const {
    std::vector<Interval> candidates;
    Minutes duration{request.duration_minutes};

    for (size_t i = 0; i < slots_.size(); ++i) {
        auto start = slots_[i].interval.start;
        auto run_end = slots_[i].interval.end;
        for (size_t j = i + 1; j < slots_.size() && run_end < start + duration; ++j) {
            if (slots_[j].interval.start != run_end) break;
            run_end = slots_[j].interval.end;
        }
        if (run_end >= start + duration && eligible_start(request, start)) {
            candidates.push_back(Interval{start, start + duration});
        }
    }

    // Identical starts from overlapping slots collapse to one candidate.
    std::sort(candidates.begin(), candidates.end());
    candidates.erase(std::unique(candidates.begin(), candidates.end()), candidates.end());

    const bool prefer_consecutive = evaluator_.preferences().prefer_consecutive_sessions;
    auto distance = [&](const Interval& candidate) {
        if (!request.preferred_date) return std::chrono::seconds{0};
        auto diff = candidate.start - Timestamp{*request.preferred_date};
        return diff < diff.zero() ? -diff : diff;
    };

    std::stable_sort(candidates.begin(), candidates.end(),
                     [&](const Interval& a, const Interval& b) {
                         if (prefer_consecutive) {
                             bool a_follows = follows_committed(a);
                             bool b_follows = follows_committed(b);
                             if (a_follows != b_follows) return a_follows;
                         }
                         return distance(a) < distance(b);
                     });
    return candidates;
}

bool PlacementEngine::follows_committed(const Interval& candidate) const {
    Minutes gap{evaluator_.preferences().min_break_minutes};
    auto same_day = index_.intervals_on(candidate.day());
    return std::any_of(same_day.begin(), same_day.end(), [&](const CommittedInterval& c) {
        return c.interval.end + gap == candidate.start;
    });
}

RejectionReason PlacementEngine::unresolved_reason(const BookingRequest& request) const {
    if (!request.preferred_times.empty()) {
        bool anchored = request.preferred_date || options_.fallback_anchor;
        return anchored ? RejectionReason::no_eligible_time() : RejectionReason::no_time_specified();
    }
    if (!slots_.empty()) {
        return RejectionReason::no_slot_combination(request.duration_minutes);
    }
    return RejectionReason::no_time_specified();
}

std::optional<RejectionReason> PlacementEngine::check(const Interval& candidate) const {
    const auto& prefs = evaluator_.preferences();
    auto units = split_units(candidate);

    if (auto reason = evaluator_.check_day_off(candidate)) return reason;

    for (const auto& unit : units) {
        if (auto reason = evaluator_.check_work_hours(unit)) return reason;
    }

    if (!slots_.empty()) {
        for (const auto& unit : units) {
            if (!covered_by_slots(unit)) return RejectionReason::slot_unavailable(unit.start);
        }
    }

    if (auto reason = evaluator_.check_capacity(candidate, index_)) return reason;

    for (const auto& unit : units) {
        if (auto conflict = index_.conflicts_with(unit)) {
            bool approved = conflict->origin == CommittedInterval::Origin::ApprovedRequest;
            return RejectionReason::direct_conflict(conflict->interval, approved);
        }
    }

    if (auto violation = index_.breaks_break_rule(candidate, prefs.min_break_minutes)) {
        if (violation->side == ConflictIndex::BreakViolation::Side::Before) {
            return RejectionReason::insufficient_break_before(prefs.min_break_minutes,
                                                              violation->neighbor.interval);
        }
        return RejectionReason::insufficient_break_after(prefs.min_break_minutes,
                                                         violation->neighbor.interval);
    }

    return std::nullopt;
}

std::vector<Interval> PlacementEngine::split_units(const Interval& candidate) const {
    if (options_.slot_minutes == 0) {
        return {candidate};
    }

    Minutes unit{options_.slot_minutes};
    std::vector<Interval> units;
    for (auto start = candidate.start; start < candidate.end; start += unit) {
        units.push_back(Interval{start, std::min<Timestamp>(start + unit, candidate.end)});
    }
    return units;
}

bool PlacementEngine::covered_by_slots(const Interval& unit) const {
    return std::any_of(open_ranges_.begin(), open_ranges_.end(), [&](const Interval& range) {
        return within_window(unit, range.start, range.end);
    });
}

std::vector<SlotId> PlacementEngine::slots_for(const Interval& interval) const {
    std::vector<SlotId> ids;
    for (const auto& slot : slots_) {
        if (overlaps(slot.interval, interval)) ids.push_back(slot.id);
    }
    return ids;
}

ProposedScheduleEntry PlacementEngine::commit(const RankedRequest& ranked, const Interval& placed) {
    const auto& request = *ranked.request;
    const auto& prefs = evaluator_.preferences();

    ProposedScheduleEntry entry{
        .request_id = request.id,
        .client_id = request.client_id,
        .client_name = request.client_name,
        .session_type = request.session_type,
        .training_type = request.training_type,
        .location = request.location,
        .special_requests = request.special_requests,
        .duration_minutes = static_cast<int>(placed.duration().count()),
        .interval = placed,
        .slot_ids = slots_for(placed),
        .is_contiguous = false,
        .priority_score = ranked.score,
        .preferred_date = request.preferred_date,
        .reason = "Fits schedule with no conflicts",
        .in_preferred_block = prefs.in_preferred_block(time_of_day(placed.start)),
        .back_to_back = index_.back_to_back(placed, prefs.min_break_minutes)
    };
    entry.is_contiguous = slots_.empty() ? split_units(placed).size() > 1
                                         : entry.slot_ids.size() > 1;

    index_.add(CommittedInterval{
        .trainer_id = trainer_id_,
        .interval = placed,
        .request_id = request.id,
        .origin = CommittedInterval::Origin::ApprovedRequest
    });
    ++accepted_;
    return entry;
}

RejectedEntry PlacementEngine::reject(const RankedRequest& ranked,
                                      const std::vector<Interval>& candidates,
                                      RejectionReason reason) const {
    const auto& request = *ranked.request;

    RejectedEntry entry{
        .request_id = request.id,
        .client_id = request.client_id,
        .client_name = request.client_name,
        .session_type = request.session_type,
        .training_type = request.training_type,
        .duration_minutes = request.duration_minutes,
        .requested_start = request.start,
        .requested_end = request.end,
        .priority_score = ranked.score,
        .reason = std::move(reason)
    };
    if (!candidates.empty()) {
        entry.requested_start = candidates.front().start;
        entry.requested_end = candidates.front().end;
    }
    return entry;
}

}  // namespace session_planner
