/**
 * @file metrics_collector.hpp
 * @brief Structured NDJSON events for placement decisions and run summaries.
 */

#pragma once

#include "core/logger.hpp"
#include "scheduler/placement_engine.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <mutex>

namespace session_planner {

class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_decision(const TrainerId& trainer, const PlacementDecision& decision);
    void record_summary(const ScheduleResult& result);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace session_planner
