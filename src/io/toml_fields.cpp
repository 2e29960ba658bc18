/**
 * @file toml_fields.cpp
 * @brief Shared TOML field readers.
 */

#include "io/toml_fields.hpp"

#include <format>

namespace session_planner::toml_fields {

namespace {

Day to_day(const toml::date& date) {
    return std::chrono::year_month_day{
        std::chrono::year{date.year},
        std::chrono::month{date.month},
        std::chrono::day{date.day}};
}

Minutes to_minutes(const toml::time& time) {
    return std::chrono::hours{time.hour} + Minutes{time.minute};
}

}  // anonymous namespace

Result<int64_t> in_range(int64_t value, int64_t min, int64_t max, std::string_view key) {
    if (value < min || value > max) {
        return Error{std::format("{} must be between {} and {}", key, min, max)};
    }
    return value;
}

Result<Timestamp> read_timestamp(const toml::node& node) {
    if (auto dt = node.value<toml::date_time>()) {
        auto ts = Timestamp{to_day(dt->date)} + to_minutes(dt->time)
                  + std::chrono::seconds{dt->time.second};
        if (dt->offset) {
            ts -= Minutes{dt->offset->minutes};
        }
        return ts;
    }
    if (auto date = node.value<toml::date>()) {
        return Timestamp{to_day(*date)};
    }
    return Error{"expected a TOML date-time"};
}

Result<Day> read_day(const toml::node& node) {
    if (auto date = node.value<toml::date>()) {
        return to_day(*date);
    }
    return read_timestamp(node).and_then([](const Timestamp& ts) -> Result<Day> {
        return day_of(ts);
    });
}

Result<std::vector<TimeOfDay>> read_times(const toml::node& node) {
    const auto* arr = node.as_array();
    if (!arr) return Error{"expected an array of \"HH:MM\" strings"};

    std::vector<TimeOfDay> times;
    times.reserve(arr->size());
    for (const auto& el : *arr) {
        auto text = el.value<std::string>();
        if (!text) return Error{"expected an array of \"HH:MM\" strings"};
        auto tod = parse_time_of_day(*text);
        if (!tod) return tod.error();
        times.push_back(*tod);
    }
    return times;
}

Result<SchedulingPreferences> read_preferences(const toml::table& tbl,
                                               SchedulingPreferences base) {
    SchedulingPreferences prefs = std::move(base);

    if (auto value = tbl["max_sessions_per_day"].value<int64_t>()) {
        auto checked = fits_int(*value, "max_sessions_per_day");
        if (!checked) return checked.error();
        prefs.max_sessions_per_day = static_cast<int>(*checked);
    }
    if (auto value = tbl["min_break_minutes"].value<int64_t>()) {
        auto checked = fits_int(*value, "min_break_minutes");
        if (!checked) return checked.error();
        prefs.min_break_minutes = static_cast<int>(*checked);
    }
    prefs.prefer_consecutive_sessions =
        tbl["prefer_consecutive_sessions"].value_or(prefs.prefer_consecutive_sessions);
    prefs.prioritize_recurring_clients =
        tbl["prioritize_recurring_clients"].value_or(prefs.prioritize_recurring_clients);

    if (auto flag = tbl["prioritize_high_value_sessions"].value<bool>()) {
        prefs.prioritize_high_value_sessions = *flag;
    }

    if (auto text = tbl["work_start_time"].value<std::string>()) {
        auto tod = parse_time_of_day(*text);
        if (!tod) return tod.error().in("work_start_time");
        prefs.work_start = *tod;
    }
    if (auto text = tbl["work_end_time"].value<std::string>()) {
        auto tod = parse_time_of_day(*text);
        if (!tod) return tod.error().in("work_end_time");
        prefs.work_end = *tod;
    }

    if (const auto* days = tbl["days_off"].as_array()) {
        prefs.days_off.clear();
        for (const auto& el : *days) {
            auto day = el.value<int64_t>();
            if (!day || *day < 0 || *day > 6) return Error{"days_off: expected integers 0-6"};
            prefs.days_off.push_back(static_cast<int>(*day));
        }
    }

    if (const auto* blocks = tbl["preferred_time_blocks"].as_array()) {
        prefs.preferred_time_blocks.clear();
        for (const auto& el : *blocks) {
            auto text = el.value<std::string>();
            if (!text) return Error{"preferred_time_blocks: expected strings"};
            auto block = parse_time_block(*text);
            if (!block) return block.error().in("preferred_time_blocks");
            prefs.preferred_time_blocks.push_back(*block);
        }
    }

    auto valid = validate_preferences(prefs);
    if (!valid) return valid.error();
    return prefs;
}

}  // namespace session_planner::toml_fields
