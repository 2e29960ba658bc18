/**
 * @file statistics.cpp
 * @brief Statistics and report builder.
 */

#include "scheduler/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace session_planner {

namespace {

double round2(double value) {
    return std::round(value * 100.0) / 100.0;
}

}  // anonymous namespace

size_t count_gaps_minimized(std::span<const ProposedScheduleEntry> accepted,
                            int min_break_minutes) {
    if (accepted.size() <= 1) return 0;

    std::vector<Interval> sorted;
    sorted.reserve(accepted.size());
    for (const auto& entry : accepted) sorted.push_back(entry.interval);
    std::sort(sorted.begin(), sorted.end());

    size_t gaps = 0;
    Minutes gap{min_break_minutes};
    for (size_t i = 0; i + 1 < sorted.size(); ++i) {
        if (sorted[i].day() == sorted[i + 1].day() && sorted[i].end + gap == sorted[i + 1].start) {
            ++gaps;
        }
    }
    return gaps;
}

ScheduleStatistics build_statistics(std::span<const ProposedScheduleEntry> accepted,
                                    size_t total_requests,
                                    const SchedulingPreferences& prefs,
                                    std::span<const AvailableSlot> slots) {
    ScheduleStatistics stats;
    stats.total_requests = total_requests;
    stats.scheduled_requests = accepted.size();
    stats.unscheduled_requests = total_requests - accepted.size();

    Minutes scheduled{0};
    std::set<Day> days;
    for (const auto& entry : accepted) {
        scheduled += entry.interval.duration();
        days.insert(entry.interval.day());
    }
    stats.total_hours = round2(static_cast<double>(scheduled.count()) / 60.0);
    stats.gaps_minimized = count_gaps_minimized(accepted, prefs.min_break_minutes);

    Minutes available{0};
    if (!slots.empty()) {
        for (const auto& slot : slots) available += slot.interval.duration();
    } else {
        available = prefs.work_day_length() * static_cast<int64_t>(days.size());
    }
    if (available.count() > 0) {
        auto rate = 100.0 * static_cast<double>(scheduled.count())
                    / static_cast<double>(available.count());
        stats.utilization_rate = round2(std::min(rate, 100.0));
    }

    if (total_requests > 0) {
        stats.scheduling_efficiency = round2(100.0 * static_cast<double>(accepted.size())
                                             / static_cast<double>(total_requests));
    }
    return stats;
}

std::string build_message(const ScheduleStatistics& stats) {
    if (stats.total_requests == 0) {
        return "No pending booking requests found";
    }
    return "Generated optimal schedule with " + std::to_string(stats.scheduled_requests)
           + " proposed sessions";
}

}  // namespace session_planner
