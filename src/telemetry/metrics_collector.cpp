/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace session_planner {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_decision(const TrainerId& trainer, const PlacementDecision& decision) {
    std::ostringstream oss;
    oss << R"({"event":"placement_decision")"
        << R"(,"trainer":")" << json_escape(trainer) << "\"";

    if (const auto* placed = std::get_if<ProposedScheduleEntry>(&decision)) {
        oss << R"(,"request":")" << json_escape(placed->request_id) << "\""
            << R"(,"outcome":"placed")"
            << R"(,"start":")" << format_timestamp(placed->interval.start) << "\""
            << R"(,"end":")" << format_timestamp(placed->interval.end) << "\""
            << R"(,"score":)" << placed->priority_score;
    } else {
        const auto& rejected = std::get<RejectedEntry>(decision);
        oss << R"(,"request":")" << json_escape(rejected.request_id) << "\""
            << R"(,"outcome":"rejected")"
            << R"(,"reason_kind":")" << to_string(rejected.reason.kind) << "\""
            << R"(,"reason":")" << json_escape(rejected.reason_text()) << "\""
            << R"(,"score":)" << rejected.priority_score;
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_summary(const ScheduleResult& result) {
    const auto& stats = result.statistics;
    std::ostringstream oss;
    oss << R"({"event":"schedule_summary")"
        << R"(,"trainer":")" << json_escape(result.trainer_id) << "\""
        << R"(,"total":)" << stats.total_requests
        << R"(,"scheduled":)" << stats.scheduled_requests
        << R"(,"unscheduled":)" << stats.unscheduled_requests
        << R"(,"hours":)" << stats.total_hours
        << R"(,"utilization":)" << stats.utilization_rate
        << R"(,"efficiency":)" << stats.scheduling_efficiency
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace session_planner
