/**
 * @file conflict_index.hpp
 * @brief Per-day index of committed intervals for one trainer.
 *
 * Holds confirmed bookings (seeded before placement) and requests accepted
 * during the current run. Each day's intervals are kept sorted by start.
 * Daily counts are bounded by max_sessions_per_day, so sorted insertion
 * into a vector is cheap.
 */

#pragma once

#include "scheduler/scheduler.hpp"

#include <map>
#include <optional>
#include <span>
#include <vector>

namespace session_planner {

class ConflictIndex {
public:
    struct BreakViolation {
        enum class Side : uint8_t {
            Before,     ///< Neighbor ends too shortly before the candidate starts
            After       ///< Neighbor starts too shortly after the candidate ends
        } side;
        CommittedInterval neighbor;
    };

    explicit ConflictIndex(TrainerId trainer_id);

    void add(CommittedInterval interval);

    /// First committed interval (by start) overlapping the candidate.
    [[nodiscard]] std::optional<CommittedInterval> conflicts_with(const Interval& candidate) const;

    /// Nearest same-day neighbor closer than min_break_minutes. Before is checked first.
    [[nodiscard]] std::optional<BreakViolation> breaks_break_rule(const Interval& candidate,
                                                                  int min_break_minutes) const;

    /// True if a same-day neighbor sits exactly min_break_minutes away.
    [[nodiscard]] bool back_to_back(const Interval& candidate, int min_break_minutes) const;

    [[nodiscard]] size_t sessions_on(Day day) const;
    [[nodiscard]] std::span<const CommittedInterval> intervals_on(Day day) const;
    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] const TrainerId& trainer_id() const noexcept { return trainer_id_; }

private:
    TrainerId trainer_id_;
    std::map<Day, std::vector<CommittedInterval>> by_day_;
    size_t size_{0};
};

}  // namespace session_planner
