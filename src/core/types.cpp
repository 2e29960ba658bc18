/**
 * @file types.cpp
 * @brief Calendar formatting and time-of-day parsing.
 */

#include "core/types.hpp"

#include <charconv>
#include <format>

namespace session_planner {

std::string format_date(Day day) {
    std::chrono::year_month_day ymd{day};
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::string format_timestamp(Timestamp t) {
    auto day = day_of(t);
    auto secs = (t - Timestamp{day}).count();
    return std::format("{}T{:02}:{:02}:{:02}Z", format_date(day),
                       secs / 3600, (secs / 60) % 60, secs % 60);
}

std::string TimeOfDay::to_string() const {
    return std::format("{:02}:{:02}", hour(), minute());
}

Result<TimeOfDay> parse_time_of_day(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 >= text.size()) {
        return Error{"Time must be in HH:MM format: '" + std::string{text} + "'"};
    }

    int hours = -1;
    int minutes = -1;
    auto h_part = text.substr(0, colon);
    auto m_part = text.substr(colon + 1);
    auto [h_end, h_ec] = std::from_chars(h_part.data(), h_part.data() + h_part.size(), hours);
    auto [m_end, m_ec] = std::from_chars(m_part.data(), m_part.data() + m_part.size(), minutes);
    if (h_ec != std::errc{} || m_ec != std::errc{}
        || h_end != h_part.data() + h_part.size()
        || m_end != m_part.data() + m_part.size()) {
        return Error{"Time must be in HH:MM format: '" + std::string{text} + "'"};
    }
    if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        return Error{"Invalid time values: '" + std::string{text} + "'"};
    }
    return TimeOfDay::at(hours, minutes);
}

Result<TimeBlock> parse_time_block(std::string_view text) {
    if (text == "morning")   return TimeBlock::Morning;
    if (text == "afternoon") return TimeBlock::Afternoon;
    if (text == "evening")   return TimeBlock::Evening;
    return Error{"Time block must be one of: morning, afternoon, evening (got '"
                 + std::string{text} + "')"};
}

}  // namespace session_planner
