/**
 * @file config.hpp
 * @brief Planner configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "scheduler/scheduler.hpp"

namespace session_planner {

struct EngineConfig {
    uint32_t slot_minutes = 0;             ///< 0 = continuous capacity, no unit splitting
    std::optional<int> max_entries;        ///< Default result cap when the input sets none
};

/**
 * @brief Whether the duration bonus depends on prioritize_high_value_sessions.
 */
enum class DurationBonusPolicy : uint8_t {
    Auto,       ///< Gate on the preference flag when present, apply when absent
    Always,     ///< Ignore the flag
    Gated       ///< Apply only when the flag is present and true
};

[[nodiscard]] constexpr std::string_view to_string(DurationBonusPolicy policy) noexcept {
    switch (policy) {
        case DurationBonusPolicy::Auto:   return "auto";
        case DurationBonusPolicy::Always: return "always";
        case DurationBonusPolicy::Gated:  return "gated";
    }
    return "unknown";
}

[[nodiscard]] Result<DurationBonusPolicy> parse_duration_bonus_policy(std::string_view text);

struct DurationTier {
    int min_minutes;
    double bonus;
};

/**
 * @brief Business-policy weights of the priority score.
 */
struct PriorityWeights {
    double base = 3.0;
    double recurring_bonus = 3.0;

    std::map<std::string, double, std::less<>> training_types{
        {"Personal Training", 2.5},
        {"Nutrition Coaching", 2.0},
        {"Rehabilitation", 2.0},
        {"Calisthenics", 1.5},
        {"Gym Weights", 1.0},
        {"Cardio", 0.8},
        {"Yoga", 0.5},
        {"Pilates", 0.5}
    };
    double unknown_training_type = 1.0;

    std::vector<DurationTier> duration_tiers{{120, 1.5}, {90, 1.0}, {60, 0.5}};  ///< Descending
    double short_session_bonus = 0.2;

    double special_request_bonus = 1.5;
    double boilerplate_bonus = 0.5;
    std::string boilerplate_marker = "Booked via optimal scheduling algorithm";

    std::map<std::string, double, std::less<>> location_types{
        {"home", 1.0},
        {"gym", 0.3}
    };
};

struct PriorityConfig {
    DurationBonusPolicy duration_bonus = DurationBonusPolicy::Auto;
    PriorityWeights weights;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;         ///< Empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool record_decisions = false;         ///< Write placement_decision events
};

/**
 * @brief Top-level planner configuration.
 */
struct Config {
    EngineConfig engine;
    PriorityConfig priority;
    SchedulingPreferences preferences;     ///< Defaults for trainers without preferences
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse configuration from TOML text.
 */
Result<Config> parse_config(std::string_view toml_text);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace session_planner
