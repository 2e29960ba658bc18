/**
 * @file priority_ranker.hpp
 * @brief Deterministic priority scoring and placement order.
 */

#pragma once

#include "core/config.hpp"
#include "scheduler/scheduler.hpp"

#include <vector>

namespace session_planner {

struct RankedRequest {
    const BookingRequest* request;
    double score;
};

/**
 * @brief Scores requests and produces the total order used for placement.
 *
 * score = base
 *       + recurring bonus        (recurring client, preference enabled)
 *       + training-type weight   (table lookup)
 *       + duration bonus         (tiered; gated per DurationBonusPolicy)
 *       + special-request bonus  (substantive text vs. boilerplate)
 *       + location-type weight   (table lookup)
 * clamped to [1.0, 10.0] and rounded to one decimal. A score already set on
 * the request is used as given.
 *
 * Order: score descending, earliest requested start, request id.
 */
class PriorityRanker {
public:
    explicit PriorityRanker(PriorityConfig config = {});

    [[nodiscard]] double score(const BookingRequest& request,
                               const SchedulingPreferences& prefs) const;

    /// Computed score, ignoring any score already set on the request.
    [[nodiscard]] double compute(const BookingRequest& request,
                                 const SchedulingPreferences& prefs) const;

    /// The returned pointers refer into @p requests.
    [[nodiscard]] std::vector<RankedRequest> rank(const std::vector<BookingRequest>& requests,
                                                  const SchedulingPreferences& prefs) const;

    [[nodiscard]] const PriorityConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] double duration_bonus(const BookingRequest& request,
                                        const SchedulingPreferences& prefs) const;
    [[nodiscard]] double special_request_bonus(const BookingRequest& request) const;

    PriorityConfig config_;
};

}  // namespace session_planner
