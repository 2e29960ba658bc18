/**
 * @file scenario_loader.cpp
 * @brief Scenario deserialization with toml++.
 */

#include "io/scenario_loader.hpp"

#include "io/toml_fields.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <toml++/toml.hpp>

namespace session_planner {

Result<RequestStatus> parse_request_status(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "PENDING")  return RequestStatus::Pending;
    if (upper == "APPROVED") return RequestStatus::Approved;
    if (upper == "REJECTED") return RequestStatus::Rejected;
    if (upper == "EXPIRED")  return RequestStatus::Expired;
    return Error{"unknown request status '" + std::string{text} + "'"};
}

namespace {

// Reads an optional timestamp field into @p out; absent keys leave it unset.
Result<void> read_optional_timestamp(const toml::table& tbl, std::string_view key,
                                     std::optional<Timestamp>& out) {
    const auto* node = tbl.get(key);
    if (!node) return {};
    auto ts = toml_fields::read_timestamp(*node);
    if (!ts) return ts.error().in(key);
    out = *ts;
    return {};
}

Result<BookingRequest> read_request(const toml::table& tbl) {
    BookingRequest request;

    auto id = tbl["id"].value<std::string>();
    if (!id || id->empty()) return Error{"id is required"};
    request.id = *id;

    request.client_id = tbl["client_id"].value_or(std::string{});
    request.client_name = tbl["client_name"].value_or(std::string{});
    request.trainer_id = tbl["trainer_id"].value_or(std::string{});
    request.session_type = tbl["session_type"].value_or(std::string{});
    request.training_type = tbl["training_type"].value_or(std::string{});
    request.location = tbl["location"].value_or(std::string{});
    request.location_type = tbl["location_type"].value_or(std::string{});
    request.is_recurring = tbl["is_recurring"].value_or(false);
    request.recurring_pattern = tbl["recurring_pattern"].value_or(std::string{});
    request.special_requests = tbl["special_requests"].value_or(std::string{});
    request.allow_weekends = tbl["allow_weekends"].value_or(true);
    request.allow_evenings = tbl["allow_evenings"].value_or(true);

    if (auto score = tbl["priority_score"].value<double>()) {
        if (!std::isfinite(*score)) return Error{"priority_score must be a finite number"};
        request.priority_score = *score;
    }

    if (auto status = tbl["status"].value<std::string>()) {
        auto parsed = parse_request_status(*status);
        if (!parsed) return parsed.error().in("status");
        request.status = *parsed;
    }

    if (auto r = read_optional_timestamp(tbl, "start", request.start); !r) return r.error();
    if (auto r = read_optional_timestamp(tbl, "end", request.end); !r) return r.error();

    if (const auto* date = tbl.get("preferred_date")) {
        auto day = toml_fields::read_day(*date);
        if (!day) return day.error().in("preferred_date");
        request.preferred_date = *day;
    }
    if (const auto* times = tbl.get("preferred_times")) {
        auto parsed = toml_fields::read_times(*times);
        if (!parsed) return parsed.error().in("preferred_times");
        request.preferred_times = std::move(*parsed);
    }
    if (const auto* times = tbl.get("avoid_times")) {
        auto parsed = toml_fields::read_times(*times);
        if (!parsed) return parsed.error().in("avoid_times");
        request.avoid_times = std::move(*parsed);
    }

    // A fixed start and end without an explicit duration imply it.
    std::optional<int64_t> duration = tbl["duration_minutes"].value<int64_t>();
    if (!duration && request.start && request.end) {
        duration = std::chrono::duration_cast<Minutes>(*request.end - *request.start).count();
    }
    if (duration) {
        auto checked = toml_fields::fits_int(*duration, "duration_minutes");
        if (!checked) return checked.error();
        request.duration_minutes = static_cast<int>(*checked);
    }

    return request;
}

Result<CommittedInterval> read_booking(const toml::table& tbl, const TrainerId& trainer) {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    if (auto r = read_optional_timestamp(tbl, "start", start); !r) return r.error();
    if (auto r = read_optional_timestamp(tbl, "end", end); !r) return r.error();
    if (!start || !end) return Error{"start and end are required"};
    if (*end <= *start) return Error{"end must be after start"};

    return CommittedInterval{
        .trainer_id = tbl["trainer_id"].value_or(trainer),
        .interval = Interval{*start, *end},
        .request_id = tbl["id"].value_or(std::string{}),
        .origin = CommittedInterval::Origin::ExistingBooking
    };
}

Result<AvailableSlot> read_slot(const toml::table& tbl, size_t position) {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;
    if (auto r = read_optional_timestamp(tbl, "start", start); !r) return r.error();
    if (auto r = read_optional_timestamp(tbl, "end", end); !r) return r.error();
    if (!start || !end) return Error{"start and end are required"};
    if (*end <= *start) return Error{"end must be after start"};

    return AvailableSlot{
        .id = tbl["id"].value_or(std::format("slot-{}", position)),
        .interval = Interval{*start, *end}
    };
}

// Applies @p reader to every table of the array at @p key.
template <typename T, typename Reader>
Result<std::vector<T>> read_array(const toml::table& tbl, std::string_view key, Reader reader) {
    std::vector<T> out;
    const auto* node = tbl.get(key);
    if (!node) return out;

    const auto* arr = node->as_array();
    if (!arr) return Error{std::string{key} + ": expected an array of tables"};

    for (size_t i = 0; i < arr->size(); ++i) {
        auto context = std::format("{}[{}]", key, i);
        const auto* entry = arr->get(i)->as_table();
        if (!entry) return Error{context + ": expected a table"};
        Result<T> parsed = reader(*entry, i);
        if (!parsed) return parsed.error().in(context);
        out.push_back(std::move(*parsed));
    }
    return out;
}

Result<ScheduleInput> from_table(const toml::table& tbl, const SchedulingPreferences& default_prefs) {
    ScheduleInput input;

    auto trainer = tbl["trainer_id"].value<std::string>();
    if (!trainer || trainer->empty()) return Error{"trainer_id is required"};
    input.trainer_id = *trainer;

    if (auto max_entries = tbl["max_entries"].value<int64_t>()) {
        if (*max_entries < 1 || *max_entries > 100) {
            return Error{"max_entries must be between 1 and 100"};
        }
        input.max_entries = static_cast<int>(*max_entries);
    }

    if (const auto* range = tbl["range"].as_table()) {
        if (auto r = read_optional_timestamp(*range, "start", input.range.start); !r) {
            return r.error().in("range");
        }
        if (auto r = read_optional_timestamp(*range, "end", input.range.end); !r) {
            return r.error().in("range");
        }
        if (input.range.start && input.range.end && *input.range.end < *input.range.start) {
            return Error{"range: end must not be before start"};
        }
    }

    if (const auto* prefs = tbl["preferences"].as_table()) {
        auto parsed = toml_fields::read_preferences(*prefs, default_prefs);
        if (!parsed) return parsed.error().in("preferences");
        input.preferences = std::move(*parsed);
    }

    auto requests = read_array<BookingRequest>(tbl, "requests",
        [](const toml::table& t, size_t) { return read_request(t); });
    if (!requests) return requests.error();
    input.requests = std::move(*requests);

    auto bookings = read_array<CommittedInterval>(tbl, "bookings",
        [&](const toml::table& t, size_t) { return read_booking(t, input.trainer_id); });
    if (!bookings) return bookings.error();
    input.existing_bookings = std::move(*bookings);

    auto slots = read_array<AvailableSlot>(tbl, "slots",
        [](const toml::table& t, size_t i) { return read_slot(t, i); });
    if (!slots) return slots.error();
    input.available_slots = std::move(*slots);

    return input;
}

}  // anonymous namespace

Result<ScheduleInput> load_scenario(const std::filesystem::path& path,
                                    const SchedulingPreferences& default_prefs) {
    if (!std::filesystem::exists(path)) {
        return Error{"Scenario file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl, default_prefs);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<ScheduleInput> parse_scenario(std::string_view toml_text,
                                     const SchedulingPreferences& default_prefs) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl, default_prefs);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

}  // namespace session_planner
