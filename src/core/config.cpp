/**
 * @file config.cpp
 * @brief Configuration loading from TOML using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"
#include "io/toml_fields.hpp"

#include <algorithm>
#include <cmath>
#include <toml++/toml.hpp>

namespace session_planner {

Result<DurationBonusPolicy> parse_duration_bonus_policy(std::string_view text) {
    if (text == "auto")   return DurationBonusPolicy::Auto;
    if (text == "always") return DurationBonusPolicy::Always;
    if (text == "gated")  return DurationBonusPolicy::Gated;
    return Error{"duration_bonus_policy must be one of: auto, always, gated (got '"
                 + std::string{text} + "')"};
}

namespace {

constexpr int64_t MINUTES_PER_DAY = 24 * 60;

void read_weight_table(const toml::table& tbl, std::map<std::string, double, std::less<>>& out) {
    for (auto&& [key, value] : tbl) {
        out[std::string{key.str()}] = value.value_or(0.0);
    }
}

bool all_weights_finite(const PriorityWeights& w) {
    auto finite = [](double v) { return std::isfinite(v); };
    auto finite_table = [&](const std::map<std::string, double, std::less<>>& table) {
        return std::all_of(table.begin(), table.end(), [&](const auto& kv) { return finite(kv.second); });
    };
    return finite(w.base) && finite(w.recurring_bonus) && finite(w.unknown_training_type)
        && finite(w.short_session_bonus) && finite(w.special_request_bonus)
        && finite(w.boilerplate_bonus)
        && finite_table(w.training_types) && finite_table(w.location_types)
        && std::all_of(w.duration_tiers.begin(), w.duration_tiers.end(),
                       [&](const DurationTier& t) { return finite(t.bonus); });
}

Result<Config> from_table(const toml::table& tbl) {
    Config config;

    // [engine]
    if (auto engine = tbl["engine"]; engine.is_table()) {
        auto slot_minutes = toml_fields::in_range(engine["slot_minutes"].value_or(int64_t{0}),
                                                  0, MINUTES_PER_DAY, "engine.slot_minutes");
        if (!slot_minutes) return slot_minutes.error();
        config.engine.slot_minutes = static_cast<uint32_t>(*slot_minutes);
        if (auto max_entries = engine["max_entries"].value<int64_t>()) {
            if (*max_entries < 1 || *max_entries > 100) {
                return Error{"engine.max_entries must be between 1 and 100"};
            }
            config.engine.max_entries = static_cast<int>(*max_entries);
        }
    }

    // [priority]
    if (auto priority = tbl["priority"]; priority.is_table()) {
        auto& weights = config.priority.weights;

        if (auto policy = priority["duration_bonus_policy"].value<std::string>()) {
            auto parsed = parse_duration_bonus_policy(*policy);
            if (!parsed) return parsed.error();
            config.priority.duration_bonus = *parsed;
        }

        weights.base = priority["base"].value_or(weights.base);
        weights.recurring_bonus = priority["recurring_bonus"].value_or(weights.recurring_bonus);
        weights.unknown_training_type =
            priority["unknown_training_type"].value_or(weights.unknown_training_type);
        weights.short_session_bonus =
            priority["short_session_bonus"].value_or(weights.short_session_bonus);
        weights.special_request_bonus =
            priority["special_request_bonus"].value_or(weights.special_request_bonus);
        weights.boilerplate_bonus = priority["boilerplate_bonus"].value_or(weights.boilerplate_bonus);
        weights.boilerplate_marker =
            priority["boilerplate_marker"].value_or(weights.boilerplate_marker);

        // [priority.training_types] and [priority.locations] replace the defaults
        if (const auto* types = priority["training_types"].as_table()) {
            weights.training_types.clear();
            read_weight_table(*types, weights.training_types);
        }
        if (const auto* locations = priority["locations"].as_table()) {
            weights.location_types.clear();
            read_weight_table(*locations, weights.location_types);
        }

        // [[priority.duration_tiers]]
        if (const auto* tiers = priority["duration_tiers"].as_array()) {
            weights.duration_tiers.clear();
            for (const auto& el : *tiers) {
                const auto* tier = el.as_table();
                if (!tier) return Error{"priority.duration_tiers: expected tables"};
                auto min_minutes = toml_fields::fits_int((*tier)["min_minutes"].value_or(int64_t{0}),
                                                         "priority.duration_tiers.min_minutes");
                if (!min_minutes) return min_minutes.error();
                weights.duration_tiers.push_back(DurationTier{
                    .min_minutes = static_cast<int>(*min_minutes),
                    .bonus = (*tier)["bonus"].value_or(0.0)
                });
            }
            std::sort(weights.duration_tiers.begin(), weights.duration_tiers.end(),
                      [](const DurationTier& a, const DurationTier& b) {
                          return a.min_minutes > b.min_minutes;
                      });
        }
    }

    if (!all_weights_finite(config.priority.weights)) {
        return Error{"priority weights must be finite numbers"};
    }

    // [preferences]
    if (const auto* prefs = tbl["preferences"].as_table()) {
        auto parsed = toml_fields::read_preferences(*prefs, config.preferences);
        if (!parsed) return parsed.error().in("preferences");
        config.preferences = std::move(*parsed);
    }

    // [telemetry]
    if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
        config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
        auto max_size = toml_fields::in_range(telemetry["max_file_size_mb"].value_or(int64_t{50}),
                                              1, 4096, "telemetry.max_file_size_mb");
        if (!max_size) return max_size.error();
        config.telemetry.max_file_size_mb = static_cast<uint32_t>(*max_size);

        auto rotate_count = toml_fields::in_range(telemetry["rotate_count"].value_or(int64_t{5}),
                                                  0, 100, "telemetry.rotate_count");
        if (!rotate_count) return rotate_count.error();
        config.telemetry.rotate_count = static_cast<uint32_t>(*rotate_count);
        config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        config.telemetry.record_decisions = telemetry["record_decisions"].value_or(false);

        if (auto level = parse_log_level(config.telemetry.log_level); !level) {
            return level.error().in("telemetry");
        }
    }

    return config;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<Config> parse_config(std::string_view toml_text) {
    try {
        auto tbl = toml::parse(toml_text);
        return from_table(tbl);
    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace session_planner
