/**
 * @file scenario_generator.cpp
 * @brief Synthetic scenario generator, all shapes.
 *
 * Shapes model common booking situations:
 * - Hourly grids (a busy trainer with a request per free hour)
 * - Contended hours (many clients asking for the same time)
 * - Preferred times (flexible clients, fallback resolution)
 * - Random weeks (mixed load for stress testing and benchmarking)
 */

#include "workload/scenario_generator.hpp"

#include <array>
#include <format>
#include <string_view>

namespace session_planner {

namespace {

constexpr std::array<std::string_view, 8> TRAINING_TYPES{
    "Personal Training", "Nutrition Coaching", "Rehabilitation", "Calisthenics",
    "Gym Weights", "Cardio", "Yoga", "Pilates"};

constexpr std::array<std::string_view, 2> LOCATION_TYPES{"home", "gym"};

constexpr std::array<int, 4> DURATIONS{45, 60, 90, 120};

BookingRequest make_request(const TrainerId& trainer, size_t index) {
    return BookingRequest{
        .id = std::format("req_{}", index),
        .client_id = std::format("client_{}", index),
        .client_name = std::format("Client {}", index),
        .trainer_id = trainer,
        .session_type = "one_on_one",
        .training_type = "Personal Training",
        .location = "Main Gym",
        .location_type = "gym",
    };
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Hourly grid: one request per hour from 08:00, per_day per day.
// ─────────────────────────────────────────────

ScheduleInput ScenarioGenerator::hourly_grid(const TrainerId& trainer, Day first_day,
                                             size_t days, size_t per_day, int duration_minutes) {
    ScheduleInput input{.trainer_id = trainer};

    size_t index = 0;
    for (size_t d = 0; d < days; ++d) {
        Day day = first_day + std::chrono::days{static_cast<int>(d)};
        for (size_t h = 0; h < per_day; ++h) {
            auto request = make_request(trainer, index++);
            request.duration_minutes = duration_minutes;
            request.start = at_time(day, TimeOfDay::at(8 + static_cast<int>(h)));
            input.requests.push_back(std::move(request));
        }
    }
    return input;
}

// ─────────────────────────────────────────────
// Contended hour: every request wants 09:00 on the same day. Scores
// descend so the expected winner is req_0.
// ─────────────────────────────────────────────

ScheduleInput ScenarioGenerator::contended_hour(const TrainerId& trainer, Day day, size_t requests) {
    ScheduleInput input{.trainer_id = trainer};

    for (size_t i = 0; i < requests; ++i) {
        auto request = make_request(trainer, i);
        request.start = at_time(day, TimeOfDay::at(9));
        request.priority_score = 10.0 - static_cast<double>(i % 10);
        input.requests.push_back(std::move(request));
    }
    return input;
}

// ─────────────────────────────────────────────
// Preferred times: each request lists 09:00, 11:00, 14:00 and 16:00, so
// the first four win one time each and the rest fall back or lose.
// ─────────────────────────────────────────────

ScheduleInput ScenarioGenerator::preferred_times(const TrainerId& trainer, Day day, size_t requests) {
    ScheduleInput input{.trainer_id = trainer};

    for (size_t i = 0; i < requests; ++i) {
        auto request = make_request(trainer, i);
        request.preferred_date = day;
        request.preferred_times = {TimeOfDay::at(9), TimeOfDay::at(11),
                                   TimeOfDay::at(14), TimeOfDay::at(16)};
        input.requests.push_back(std::move(request));
    }
    return input;
}

// ─────────────────────────────────────────────
// Random week: requests spread over seven days with random attributes,
// one confirmed booking per weekday at 12:00, hourly slots 08:00-18:00.
// ─────────────────────────────────────────────

ScheduleInput ScenarioGenerator::random_week(const TrainerId& trainer, Day first_day,
                                             size_t requests, std::mt19937& rng) {
    ScheduleInput input{.trainer_id = trainer};
    input.range.start = Timestamp{first_day};
    input.range.end = Timestamp{first_day + std::chrono::days{7}} - std::chrono::seconds{1};

    std::uniform_int_distribution<int> day_dist(0, 6);
    std::uniform_int_distribution<int> hour_dist(7, 18);
    std::uniform_int_distribution<size_t> type_dist(0, TRAINING_TYPES.size() - 1);
    std::uniform_int_distribution<size_t> location_dist(0, LOCATION_TYPES.size() - 1);
    std::uniform_int_distribution<size_t> duration_dist(0, DURATIONS.size() - 1);
    std::bernoulli_distribution coin(0.5);
    std::bernoulli_distribution rare(0.2);

    for (size_t i = 0; i < requests; ++i) {
        Day day = first_day + std::chrono::days{day_dist(rng)};

        auto request = make_request(trainer, i);
        request.training_type = std::string{TRAINING_TYPES[type_dist(rng)]};
        request.location_type = std::string{LOCATION_TYPES[location_dist(rng)]};
        request.duration_minutes = DURATIONS[duration_dist(rng)];
        request.is_recurring = rare(rng);
        if (rare(rng)) {
            request.special_requests = "Focus on mobility";
        }

        if (coin(rng)) {
            request.start = at_time(day, TimeOfDay::at(hour_dist(rng)));
        } else {
            request.preferred_date = day;
            request.preferred_times = {TimeOfDay::at(hour_dist(rng)),
                                       TimeOfDay::at(hour_dist(rng))};
        }
        input.requests.push_back(std::move(request));
    }

    for (int d = 0; d < 7; ++d) {
        Day day = first_day + std::chrono::days{d};
        if (weekday_index(day) < 5) {
            auto start = at_time(day, TimeOfDay::at(12));
            input.existing_bookings.push_back(CommittedInterval{
                .trainer_id = trainer,
                .interval = Interval{start, start + Minutes{60}},
                .request_id = std::format("booking_{}", d),
                .origin = CommittedInterval::Origin::ExistingBooking
            });
        }
        for (int h = 8; h < 18; ++h) {
            auto start = at_time(day, TimeOfDay::at(h));
            input.available_slots.push_back(AvailableSlot{
                .id = std::format("slot_{}_{}", d, h),
                .interval = Interval{start, start + Minutes{60}}
            });
        }
    }
    return input;
}

}  // namespace session_planner
