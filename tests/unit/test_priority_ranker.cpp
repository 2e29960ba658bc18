/**
 * @file test_priority_ranker.cpp
 * @brief Priority scoring table, duration bonus policy and ranking order.
 */

#include "scheduler/priority_ranker.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace session_planner;
using namespace std::chrono;

// ─── Test Fixtures ───────────────────────────

namespace {

const Day MONDAY = sys_days{year{2024} / January / 15};

BookingRequest make_request(const std::string& id,
                            const std::string& training_type = "",
                            int duration = 60,
                            const std::string& location_type = "") {
    BookingRequest request;
    request.id = id;
    request.training_type = training_type;
    request.duration_minutes = duration;
    request.location_type = location_type;
    return request;
}

PriorityRanker ranker_with(DurationBonusPolicy policy) {
    return PriorityRanker(PriorityConfig{.duration_bonus = policy});
}

}  // namespace

// ─── Score Table ─────────────────────────────

TEST(PriorityRankerTest, BaseScoreWithDefaultDuration) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r"), prefs), 3.5);
}

TEST(PriorityRankerTest, TrainingTypeAndLocationWeights) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r", "Yoga", 45, "gym"), prefs), 4.0);
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r", "Cardio", 90, "gym"), prefs), 5.1);
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r", "Boxing", 60, "park"), prefs), 4.5);
}

TEST(PriorityRankerTest, ClampedToTen) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    auto request = make_request("r", "Personal Training", 120, "home");
    request.is_recurring = true;
    request.special_requests = "Knee rehab focus";
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 10.0);
}

TEST(PriorityRankerTest, RecurringBonusFollowsPreference) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    auto request = make_request("r");
    request.is_recurring = true;
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 6.5);

    prefs.prioritize_recurring_clients = false;
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 3.5);
}

TEST(PriorityRankerTest, SpecialRequestBonus) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    auto request = make_request("r");

    request.special_requests = "   ";
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 3.5);

    request.special_requests = "Bring resistance bands";
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 5.0);

    request.special_requests = "Booked via optimal scheduling algorithm";
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 4.0);
}

TEST(PriorityRankerTest, ExplicitScoreIsUsedAndClamped) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    auto request = make_request("r", "Personal Training", 120, "home");

    request.priority_score = 2.0;
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 2.0);
    EXPECT_DOUBLE_EQ(ranker.compute(request, prefs), 8.0);

    request.priority_score = 14.0;
    EXPECT_DOUBLE_EQ(ranker.score(request, prefs), 10.0);
}

TEST(PriorityRankerTest, InjectedWeights) {
    PriorityConfig config;
    config.weights.training_types = {{"Boxing", 4.0}};
    config.weights.base = 1.0;
    PriorityRanker ranker(config);
    SchedulingPreferences prefs;
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r", "Boxing"), prefs), 5.5);
    EXPECT_DOUBLE_EQ(ranker.score(make_request("r", "Yoga"), prefs), 2.5);
}

// ─── Duration Bonus Policy ───────────────────

TEST(DurationBonusPolicyTest, AutoAppliesWhenFlagAbsent) {
    SchedulingPreferences prefs;
    auto request = make_request("r", "", 120);
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Auto).score(request, prefs), 4.5);
}

TEST(DurationBonusPolicyTest, AutoHonorsExplicitFlag) {
    SchedulingPreferences prefs;
    auto request = make_request("r", "", 120);
    prefs.prioritize_high_value_sessions = false;
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Auto).score(request, prefs), 3.0);
    prefs.prioritize_high_value_sessions = true;
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Auto).score(request, prefs), 4.5);
}

TEST(DurationBonusPolicyTest, AlwaysIgnoresFlag) {
    SchedulingPreferences prefs;
    prefs.prioritize_high_value_sessions = false;
    auto request = make_request("r", "", 90);
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Always).score(request, prefs), 4.0);
}

TEST(DurationBonusPolicyTest, GatedRequiresFlag) {
    SchedulingPreferences prefs;
    auto request = make_request("r", "", 90);
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Gated).score(request, prefs), 3.0);
    prefs.prioritize_high_value_sessions = true;
    EXPECT_DOUBLE_EQ(ranker_with(DurationBonusPolicy::Gated).score(request, prefs), 4.0);
}

TEST(DurationBonusPolicyTest, ParsePolicy) {
    EXPECT_EQ(*parse_duration_bonus_policy("gated"), DurationBonusPolicy::Gated);
    EXPECT_FALSE(parse_duration_bonus_policy("sometimes").has_value());
    EXPECT_EQ(to_string(DurationBonusPolicy::Always), "always");
}

// ─── Ranking ─────────────────────────────────

TEST(PriorityRankerTest, RankByScoreThenStartThenId) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;

    std::vector<BookingRequest> requests;
    auto low = make_request("low");
    low.priority_score = 4.0;
    low.start = at_time(MONDAY, TimeOfDay::at(8));

    auto late = make_request("late");
    late.priority_score = 9.0;
    late.start = at_time(MONDAY, TimeOfDay::at(11));

    auto early_b = make_request("b");
    early_b.priority_score = 9.0;
    early_b.start = at_time(MONDAY, TimeOfDay::at(9));

    auto early_a = make_request("a");
    early_a.priority_score = 9.0;
    early_a.start = at_time(MONDAY, TimeOfDay::at(9));

    auto undated = make_request("undated");
    undated.priority_score = 9.0;

    requests = {low, late, early_b, undated, early_a};
    auto ranked = ranker.rank(requests, prefs);

    ASSERT_EQ(ranked.size(), 5u);
    EXPECT_EQ(ranked[0].request->id, "a");
    EXPECT_EQ(ranked[1].request->id, "b");
    EXPECT_EQ(ranked[2].request->id, "late");
    EXPECT_EQ(ranked[3].request->id, "undated");
    EXPECT_EQ(ranked[4].request->id, "low");
    EXPECT_DOUBLE_EQ(ranked[4].score, 4.0);
}

TEST(PriorityRankerTest, RankRejectsNonFiniteScore) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;

    auto a = make_request("a");
    a.priority_score = 2.0;
    auto b = make_request("b");
    b.priority_score = std::numeric_limits<double>::quiet_NaN();
    auto c = make_request("c");
    c.priority_score = 9.0;

    std::vector<BookingRequest> requests{a, b, c};
    EXPECT_THROW((void)ranker.rank(requests, prefs), ContractViolation);

    requests[1].priority_score = std::numeric_limits<double>::infinity();
    EXPECT_THROW((void)ranker.rank(requests, prefs), ContractViolation);

    requests[1].priority_score = 5.0;
    auto ranked = ranker.rank(requests, prefs);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].request->id, "c");
    EXPECT_EQ(ranked[1].request->id, "b");
    EXPECT_EQ(ranked[2].request->id, "a");
}

TEST(PriorityRankerTest, RankIsDeterministic) {
    PriorityRanker ranker;
    SchedulingPreferences prefs;
    std::vector<BookingRequest> requests;
    for (int i = 0; i < 20; ++i) {
        auto r = make_request("r" + std::to_string(i), i % 2 ? "Yoga" : "Cardio", 60 + (i % 3) * 30);
        r.start = at_time(MONDAY, TimeOfDay::at(8 + i % 5));
        requests.push_back(r);
    }

    auto first = ranker.rank(requests, prefs);
    auto second = ranker.rank(requests, prefs);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].request->id, second[i].request->id);
    }
}
