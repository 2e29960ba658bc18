/**
 * @file priority_ranker.cpp
 * @brief PriorityRanker implementation.
 */

#include "scheduler/priority_ranker.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace session_planner {

namespace {

constexpr double MIN_SCORE = 1.0;
constexpr double MAX_SCORE = 10.0;

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

double lookup(const std::map<std::string, double, std::less<>>& table,
              const std::string& key, double fallback) {
    auto it = table.find(key);
    return it == table.end() ? fallback : it->second;
}

}  // anonymous namespace

PriorityRanker::PriorityRanker(PriorityConfig config)
    : config_(std::move(config)) {}

double PriorityRanker::score(const BookingRequest& request,
                             const SchedulingPreferences& prefs) const {
    if (request.priority_score) {
        return std::clamp(*request.priority_score, 0.0, MAX_SCORE);
    }
    return compute(request, prefs);
}

double PriorityRanker::compute(const BookingRequest& request,
                               const SchedulingPreferences& prefs) const {
    const auto& w = config_.weights;
    double total = w.base;

    if (request.is_recurring && prefs.prioritize_recurring_clients) {
        total += w.recurring_bonus;
    }

    if (!request.training_type.empty()) {
        total += lookup(w.training_types, request.training_type, w.unknown_training_type);
    }

    total += duration_bonus(request, prefs);
    total += special_request_bonus(request);

    if (!request.location_type.empty()) {
        total += lookup(w.location_types, request.location_type, 0.0);
    }

    total = std::clamp(total, MIN_SCORE, MAX_SCORE);
    return std::round(total * 10.0) / 10.0;
}

double PriorityRanker::duration_bonus(const BookingRequest& request,
                                      const SchedulingPreferences& prefs) const {
    switch (config_.duration_bonus) {
        case DurationBonusPolicy::Always:
            break;
        case DurationBonusPolicy::Auto:
            if (prefs.prioritize_high_value_sessions && !*prefs.prioritize_high_value_sessions) {
                return 0.0;
            }
            break;
        case DurationBonusPolicy::Gated:
            if (!prefs.prioritize_high_value_sessions.value_or(false)) {
                return 0.0;
            }
            break;
    }

    for (const auto& tier : config_.weights.duration_tiers) {
        if (request.duration_minutes >= tier.min_minutes) {
            return tier.bonus;
        }
    }
    return config_.weights.short_session_bonus;
}

double PriorityRanker::special_request_bonus(const BookingRequest& request) const {
    const auto& w = config_.weights;
    if (is_blank(request.special_requests)) return 0.0;
    if (!w.boilerplate_marker.empty()
        && request.special_requests.find(w.boilerplate_marker) != std::string::npos) {
        return w.boilerplate_bonus;
    }
    return w.special_request_bonus;
}

std::vector<RankedRequest> PriorityRanker::rank(const std::vector<BookingRequest>& requests,
                                                const SchedulingPreferences& prefs) const {
    std::vector<RankedRequest> ranked;
    ranked.reserve(requests.size());
    for (const auto& request : requests) {
        check_request_contract(request);
        ranked.push_back({&request, score(request, prefs)});
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const RankedRequest& a, const RankedRequest& b) {
        if (a.score != b.score) return a.score > b.score;

        auto a_start = a.request->requested_start().value_or(Timestamp::max());
        auto b_start = b.request->requested_start().value_or(Timestamp::max());
        if (a_start != b_start) return a_start < b_start;

        return a.request->id < b.request->id;
    });
    return ranked;
}

}  // namespace session_planner
