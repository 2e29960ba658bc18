/**
 * @file result_writer.cpp
 * @brief ScheduleResult → JSON.
 */

#include "io/result_writer.hpp"

#include "core/logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace session_planner {

namespace {

std::string json_quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

template <typename T, typename F>
std::string optional_json(const std::optional<T>& value, F&& render) {
    return value ? render(*value) : std::string{"null"};
}

void write_entry(std::ostringstream& oss, const ProposedScheduleEntry& entry) {
    oss << "{"
        << R"("request_id":)" << json_quoted(entry.request_id)
        << R"(,"client_id":)" << json_quoted(entry.client_id)
        << R"(,"client_name":)" << json_quoted(entry.client_name)
        << R"(,"session_type":)" << json_quoted(entry.session_type)
        << R"(,"training_type":)" << json_quoted(entry.training_type)
        << R"(,"location":)" << json_quoted(entry.location)
        << R"(,"special_requests":)" << json_quoted(entry.special_requests)
        << R"(,"start_time":)" << json_quoted(format_timestamp(entry.interval.start))
        << R"(,"end_time":)" << json_quoted(format_timestamp(entry.interval.end))
        << R"(,"duration_minutes":)" << entry.duration_minutes
        << R"(,"slot_ids":[)";
    for (size_t i = 0; i < entry.slot_ids.size(); ++i) {
        if (i > 0) oss << ",";
        oss << json_quoted(entry.slot_ids[i]);
    }
    oss << "]"
        << R"(,"is_contiguous":)" << (entry.is_contiguous ? "true" : "false")
        << R"(,"priority_score":)" << entry.priority_score
        << R"(,"preferred_date":)"
        << optional_json(entry.preferred_date, [](Day d) { return json_quoted(format_date(d)); })
        << R"(,"in_preferred_block":)" << (entry.in_preferred_block ? "true" : "false")
        << R"(,"back_to_back":)" << (entry.back_to_back ? "true" : "false")
        << R"(,"reason":)" << json_quoted(entry.reason)
        << R"(,"recommendation":"APPROVE")"
        << "}";
}

void write_entry(std::ostringstream& oss, const RejectedEntry& entry) {
    auto timestamp = [](Timestamp t) { return json_quoted(format_timestamp(t)); };
    oss << "{"
        << R"("request_id":)" << json_quoted(entry.request_id)
        << R"(,"client_id":)" << json_quoted(entry.client_id)
        << R"(,"client_name":)" << json_quoted(entry.client_name)
        << R"(,"session_type":)" << json_quoted(entry.session_type)
        << R"(,"training_type":)" << json_quoted(entry.training_type)
        << R"(,"duration_minutes":)" << entry.duration_minutes
        << R"(,"requested_start":)" << optional_json(entry.requested_start, timestamp)
        << R"(,"requested_end":)" << optional_json(entry.requested_end, timestamp)
        << R"(,"priority_score":)" << entry.priority_score
        << R"(,"reason":)" << json_quoted(entry.reason_text())
        << R"(,"reason_kind":)" << json_quoted(to_string(entry.reason.kind))
        << R"(,"recommendation":"REJECT")"
        << "}";
}

template <typename Entry>
void write_list(std::ostringstream& oss, std::string_view name, const std::vector<Entry>& entries) {
    oss << json_quoted(name) << ":[";
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) oss << ",";
        write_entry(oss, entries[i]);
    }
    oss << "]";
}

}  // anonymous namespace

std::string to_json(const ScheduleResult& result) {
    const auto& stats = result.statistics;
    std::ostringstream oss;

    oss << "{" << R"("trainer_id":)" << json_quoted(result.trainer_id) << ",";
    write_list(oss, "proposed_entries", result.proposed_entries);
    oss << ",";
    write_list(oss, "rejected_entries", result.rejected_entries);
    oss << R"(,"statistics":{)"
        << R"("total_requests":)" << stats.total_requests
        << R"(,"scheduled_requests":)" << stats.scheduled_requests
        << R"(,"unscheduled_requests":)" << stats.unscheduled_requests
        << R"(,"total_hours":)" << stats.total_hours
        << R"(,"gaps_minimized":)" << stats.gaps_minimized
        << R"(,"utilization_rate":)" << stats.utilization_rate
        << R"(,"scheduling_efficiency":)" << stats.scheduling_efficiency
        << "}"
        << R"(,"message":)" << json_quoted(result.message)
        << "}";
    return oss.str();
}

Result<void> write_result(const ScheduleResult& result, const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{"Cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{"Cannot open " + path.string() + " for writing"};
    }
    out << to_json(result) << '\n';
    if (!out) {
        return Error{"Failed writing " + path.string()};
    }
    return {};
}

}  // namespace session_planner
