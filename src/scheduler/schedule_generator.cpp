/**
 * @file schedule_generator.cpp
 * @brief ScheduleGenerator: filter → rank → place → summarize.
 */

#include "scheduler/schedule_generator.hpp"

#include "scheduler/placement_engine.hpp"
#include "scheduler/statistics.hpp"
#include "telemetry/metrics_collector.hpp"

#include <algorithm>

namespace session_planner {

namespace {

bool same_trainer(const TrainerId& expected, const TrainerId& actual) {
    return actual.empty() || actual == expected;
}

}  // anonymous namespace

ScheduleGenerator::ScheduleGenerator(Config config, Logger& logger, MetricsCollector* metrics)
    : config_(std::move(config))
    , ranker_(config_.priority)
    , logger_(logger)
    , metrics_(metrics) {}

std::vector<BookingRequest> ScheduleGenerator::considered_requests(const ScheduleInput& input) const {
    std::vector<BookingRequest> considered;
    considered.reserve(input.requests.size());

    for (const auto& request : input.requests) {
        if (request.status != RequestStatus::Pending) {
            logger_.debug("Skipping request " + request.id + ": status "
                          + std::string{to_string(request.status)});
            continue;
        }
        if (!same_trainer(input.trainer_id, request.trainer_id)) {
            logger_.warn("Skipping request " + request.id + ": belongs to trainer "
                         + request.trainer_id);
            continue;
        }
        // Fixed starts are compared as instants, preferred dates as whole days.
        bool in_range = request.start ? input.range.contains(*request.start)
                      : request.preferred_date ? input.range.overlaps_day(*request.preferred_date)
                      : true;
        if (!in_range) {
            logger_.debug("Skipping request " + request.id + ": outside date range");
            continue;
        }
        considered.push_back(request);
    }
    return considered;
}

ScheduleResult ScheduleGenerator::generate(const ScheduleInput& input) const {
    const SchedulingPreferences prefs = input.preferences.value_or(config_.preferences);

    ScheduleResult result;
    result.trainer_id = input.trainer_id;

    auto requests = considered_requests(input);
    auto ranked = ranker_.rank(requests, prefs);

    PlacementOptions options{
        .slot_minutes = config_.engine.slot_minutes,
        .max_entries = input.max_entries ? input.max_entries : config_.engine.max_entries,
        .fallback_anchor = input.range.start ? std::optional<Day>{day_of(*input.range.start)}
                                             : std::nullopt
    };
    PlacementEngine engine(input.trainer_id, prefs, options, input.available_slots);

    for (const auto& booking : input.existing_bookings) {
        if (same_trainer(input.trainer_id, booking.trainer_id)) {
            engine.seed(booking);
        }
    }

    for (const auto& entry : ranked) {
        auto decision = engine.place(entry);

        if (logger_.enabled(LogLevel::Debug)) {
            if (const auto* placed = std::get_if<ProposedScheduleEntry>(&decision)) {
                logger_.debug("Placed " + placed->request_id + " at "
                              + format_timestamp(placed->interval.start)
                              + " (score " + std::to_string(entry.score) + ")");
            } else {
                const auto& rejected = std::get<RejectedEntry>(decision);
                logger_.debug("Rejected " + rejected.request_id + ": " + rejected.reason_text());
            }
        }
        if (metrics_) {
            metrics_->record_decision(input.trainer_id, decision);
        }

        if (auto* placed = std::get_if<ProposedScheduleEntry>(&decision)) {
            result.proposed_entries.push_back(std::move(*placed));
        } else {
            result.rejected_entries.push_back(std::get<RejectedEntry>(std::move(decision)));
        }
    }

    std::stable_sort(result.proposed_entries.begin(), result.proposed_entries.end(),
                     [](const ProposedScheduleEntry& a, const ProposedScheduleEntry& b) {
                         return a.interval.start < b.interval.start;
                     });

    result.statistics = build_statistics(result.proposed_entries, requests.size(), prefs,
                                         input.available_slots);
    result.message = build_message(result.statistics);

    logger_.info("Trainer " + input.trainer_id + ": " + result.message + " ("
                 + std::to_string(result.rejected_entries.size()) + " rejected, "
                 + std::to_string(engine.index().size()) + " committed intervals)");
    if (metrics_) {
        metrics_->record_summary(result);
    }
    return result;
}

}  // namespace session_planner
