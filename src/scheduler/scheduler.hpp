/**
 * @file scheduler.hpp
 * @brief Scheduling inputs, trainer preferences and plan structures.
 *
 * Everything here is transient: built by the caller (or the scenario
 * loader), consumed by one ScheduleGenerator::generate() call, and never
 * mutated by the engine.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "scheduler/interval.hpp"
#include "scheduler/rejection.hpp"

#include <optional>
#include <string>
#include <vector>

namespace session_planner {

// ─────────────────────────────────────────────
// Booking Request
// ─────────────────────────────────────────────

/**
 * @brief A client's ask for time with a trainer.
 *
 * Either a fixed start (and optionally end) or a list of preferred times of
 * day applied to an anchor day. duration_minutes must be positive and, when
 * both are present, end must be after start.
 */
struct BookingRequest {
    RequestId id;
    ClientId client_id;
    std::string client_name;
    TrainerId trainer_id;
    std::string session_type;
    std::string training_type;
    std::string location;
    std::string location_type;                     ///< "home", "gym", ...
    int duration_minutes = 60;

    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    std::optional<Day> preferred_date;
    std::vector<TimeOfDay> preferred_times;
    std::vector<TimeOfDay> avoid_times;
    bool allow_weekends = true;
    bool allow_evenings = true;

    bool is_recurring = false;
    std::string recurring_pattern;                 ///< "weekly", "biweekly", "monthly"
    std::string special_requests;
    std::optional<double> priority_score;          ///< Recomputed by the ranker when absent
    RequestStatus status = RequestStatus::Pending;

    /// Start used for ordering: the fixed start, else midnight of the
    /// preferred date.
    [[nodiscard]] std::optional<Timestamp> requested_start() const noexcept {
        if (start) return start;
        if (preferred_date) return Timestamp{*preferred_date};
        return std::nullopt;
    }
};

/// Throws ContractViolation on a non-positive duration, end <= start or a
/// non-finite priority score.
void check_request_contract(const BookingRequest& request);

// ─────────────────────────────────────────────
// Committed Capacity
// ─────────────────────────────────────────────

struct CommittedInterval {
    enum class Origin : uint8_t {
        ExistingBooking,     ///< Confirmed before this run
        ApprovedRequest      ///< Accepted earlier in this run
    };

    TrainerId trainer_id;
    Interval interval;
    RequestId request_id;
    Origin origin = Origin::ExistingBooking;
};

/**
 * @brief An open unit of trainer capacity published by the trainer.
 */
struct AvailableSlot {
    SlotId id;
    Interval interval;
};

// ─────────────────────────────────────────────
// Trainer Preferences
// ─────────────────────────────────────────────

struct SchedulingPreferences {
    int max_sessions_per_day = 8;
    int min_break_minutes = 15;
    bool prefer_consecutive_sessions = true;
    TimeOfDay work_start = TimeOfDay::at(8);
    TimeOfDay work_end = TimeOfDay::at(18);
    std::vector<int> days_off;                     ///< 0 = Monday … 6 = Sunday
    std::vector<TimeBlock> preferred_time_blocks{TimeBlock::Morning, TimeBlock::Afternoon};
    bool prioritize_recurring_clients = true;
    std::optional<bool> prioritize_high_value_sessions;

    [[nodiscard]] bool is_day_off(Day day) const noexcept;
    [[nodiscard]] bool in_preferred_block(TimeOfDay tod) const noexcept;
    [[nodiscard]] Minutes work_day_length() const noexcept {
        return Minutes{work_end.minutes - work_start.minutes};
    }
};

/**
 * @brief Validates preferences the way preference intake does.
 *
 * The engine assumes validated preferences; callers accepting preferences
 * from outside run this first.
 */
[[nodiscard]] Result<void> validate_preferences(const SchedulingPreferences& prefs);

// ─────────────────────────────────────────────
// Plan Structures
// ─────────────────────────────────────────────

struct ProposedScheduleEntry {
    RequestId request_id;
    ClientId client_id;
    std::string client_name;
    std::string session_type;
    std::string training_type;
    std::string location;
    std::string special_requests;
    int duration_minutes = 0;
    Interval interval;
    std::vector<SlotId> slot_ids;
    bool is_contiguous = false;                    ///< Spans more than one underlying unit
    double priority_score = 0.0;
    std::optional<Day> preferred_date;
    std::string reason = "Fits schedule with no conflicts";
    bool in_preferred_block = false;
    bool back_to_back = false;
};

struct RejectedEntry {
    RequestId request_id;
    ClientId client_id;
    std::string client_name;
    std::string session_type;
    std::string training_type;
    int duration_minutes = 0;
    std::optional<Timestamp> requested_start;
    std::optional<Timestamp> requested_end;
    double priority_score = 0.0;
    RejectionReason reason;

    [[nodiscard]] std::string reason_text() const { return reason.render(); }
};

struct ScheduleStatistics {
    size_t total_requests = 0;
    size_t scheduled_requests = 0;
    size_t unscheduled_requests = 0;
    double total_hours = 0.0;
    size_t gaps_minimized = 0;
    double utilization_rate = 0.0;                 ///< [0, 100]
    double scheduling_efficiency = 0.0;            ///< [0, 100]
};

struct ScheduleResult {
    TrainerId trainer_id;
    std::vector<ProposedScheduleEntry> proposed_entries;   ///< By start time
    std::vector<RejectedEntry> rejected_entries;           ///< In ranked order
    ScheduleStatistics statistics;
    std::string message;
};

// ─────────────────────────────────────────────
// Engine Input
// ─────────────────────────────────────────────

struct DateRange {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;

    [[nodiscard]] bool contains(Timestamp t) const noexcept {
        if (start && t < *start) return false;
        if (end && t > *end) return false;
        return true;
    }

    /// True when any part of @p day lies within the range.
    [[nodiscard]] bool overlaps_day(Day day) const noexcept {
        if (start && day < day_of(*start)) return false;
        if (end && day > day_of(*end)) return false;
        return true;
    }
};

struct ScheduleInput {
    TrainerId trainer_id;
    DateRange range;
    std::optional<int> max_entries;
    std::vector<BookingRequest> requests;
    std::optional<SchedulingPreferences> preferences;      ///< Defaults when absent
    std::vector<CommittedInterval> existing_bookings;
    std::vector<AvailableSlot> available_slots;            ///< Empty: no slot constraint
};

}  // namespace session_planner
