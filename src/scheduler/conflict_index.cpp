/**
 * @file conflict_index.cpp
 * @brief ConflictIndex implementation.
 */

#include "scheduler/conflict_index.hpp"

#include <algorithm>

namespace session_planner {

ConflictIndex::ConflictIndex(TrainerId trainer_id)
    : trainer_id_(std::move(trainer_id)) {}

void ConflictIndex::add(CommittedInterval interval) {
    expects(interval.interval.end > interval.interval.start,
            "committed interval for " + interval.request_id + " is empty");

    auto& day = by_day_[interval.interval.day()];
    auto pos = std::upper_bound(day.begin(), day.end(), interval.interval.start,
        [](Timestamp start, const CommittedInterval& c) { return start < c.interval.start; });
    day.insert(pos, std::move(interval));
    ++size_;
}

std::optional<CommittedInterval> ConflictIndex::conflicts_with(const Interval& candidate) const {
    // Intervals are bucketed by start day, so one starting the previous day may
    // still run into the candidate.
    auto first_day = candidate.day() - std::chrono::days{1};
    auto last_day = day_of(candidate.end - std::chrono::seconds{1});

    for (auto it = by_day_.lower_bound(first_day);
         it != by_day_.end() && it->first <= last_day; ++it) {
        for (const auto& committed : it->second) {
            if (committed.interval.start >= candidate.end) break;
            if (overlaps(committed.interval, candidate)) return committed;
        }
    }
    return std::nullopt;
}

std::optional<ConflictIndex::BreakViolation>
ConflictIndex::breaks_break_rule(const Interval& candidate, int min_break_minutes) const {
    auto it = by_day_.find(candidate.day());
    if (it == by_day_.end()) return std::nullopt;

    const CommittedInterval* previous = nullptr;
    const CommittedInterval* next = nullptr;
    for (const auto& committed : it->second) {
        if (committed.interval.end <= candidate.start) {
            if (!previous || committed.interval.end > previous->interval.end) {
                previous = &committed;
            }
        } else if (committed.interval.start >= candidate.end) {
            if (!next) next = &committed;
        }
    }

    auto min_gap = static_cast<double>(min_break_minutes);
    if (previous && gap_minutes(previous->interval, candidate) < min_gap) {
        return BreakViolation{BreakViolation::Side::Before, *previous};
    }
    if (next && gap_minutes(candidate, next->interval) < min_gap) {
        return BreakViolation{BreakViolation::Side::After, *next};
    }
    return std::nullopt;
}

bool ConflictIndex::back_to_back(const Interval& candidate, int min_break_minutes) const {
    auto it = by_day_.find(candidate.day());
    if (it == by_day_.end()) return false;

    Minutes gap{min_break_minutes};
    return std::any_of(it->second.begin(), it->second.end(), [&](const CommittedInterval& c) {
        return c.interval.end + gap == candidate.start || candidate.end + gap == c.interval.start;
    });
}

size_t ConflictIndex::sessions_on(Day day) const {
    auto it = by_day_.find(day);
    return it == by_day_.end() ? 0 : it->second.size();
}

std::span<const CommittedInterval> ConflictIndex::intervals_on(Day day) const {
    auto it = by_day_.find(day);
    if (it == by_day_.end()) return {};
    return it->second;
}

}  // namespace session_planner
