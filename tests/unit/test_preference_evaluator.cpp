/**
 * @file test_preference_evaluator.cpp
 * @brief Preference validation and structural admissibility checks.
 */

#include "scheduler/preference_evaluator.hpp"

#include <gtest/gtest.h>

using namespace session_planner;
using namespace std::chrono;

namespace {

const Day MONDAY = sys_days{year{2024} / January / 15};
const Day SATURDAY = sys_days{year{2024} / January / 20};

Interval clock(int h1, int m1, int h2, int m2, Day day = MONDAY) {
    return Interval{at_time(day, TimeOfDay::at(h1, m1)), at_time(day, TimeOfDay::at(h2, m2))};
}

SchedulingPreferences morning_prefs() {
    SchedulingPreferences prefs;
    prefs.work_start = TimeOfDay::at(8);
    prefs.work_end = TimeOfDay::at(12);
    prefs.max_sessions_per_day = 2;
    prefs.days_off = {5, 6};
    return prefs;
}

}  // namespace

// ─── Validation ──────────────────────────────

TEST(PreferenceValidationTest, DefaultsAreValid) {
    SchedulingPreferences prefs;
    EXPECT_TRUE(validate_preferences(prefs).has_value());
    EXPECT_EQ(prefs.max_sessions_per_day, 8);
    EXPECT_EQ(prefs.min_break_minutes, 15);
    EXPECT_EQ(prefs.work_start, TimeOfDay::at(8));
    EXPECT_EQ(prefs.work_end, TimeOfDay::at(18));
}

TEST(PreferenceValidationTest, RejectsOutOfRange) {
    SchedulingPreferences prefs;
    prefs.max_sessions_per_day = 16;
    EXPECT_FALSE(validate_preferences(prefs).has_value());

    prefs = {};
    prefs.min_break_minutes = 61;
    EXPECT_FALSE(validate_preferences(prefs).has_value());

    prefs = {};
    prefs.work_end = prefs.work_start;
    EXPECT_FALSE(validate_preferences(prefs).has_value());
}

TEST(PreferenceValidationTest, RejectsAllDaysOff) {
    SchedulingPreferences prefs;
    prefs.days_off = {0, 1, 2, 3, 4, 5, 6};
    auto valid = validate_preferences(prefs);
    ASSERT_FALSE(valid.has_value());
    EXPECT_NE(valid.error().message.find("at least one day"), std::string::npos);

    prefs.days_off = {7};
    EXPECT_FALSE(validate_preferences(prefs).has_value());
}

TEST(PreferenceEvaluatorTest, UnvalidatedPreferencesThrow) {
    SchedulingPreferences prefs;
    prefs.work_end = TimeOfDay::at(7);
    EXPECT_THROW(PreferenceEvaluator{prefs}, ContractViolation);
}

// ─── Checks ──────────────────────────────────

TEST(PreferenceEvaluatorTest, DayOffComesFirst) {
    PreferenceEvaluator evaluator(morning_prefs());
    ConflictIndex index("t1");
    auto reason = evaluator.is_structurally_allowed(clock(14, 0, 15, 0, SATURDAY), index);
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->kind, RejectionKind::DayOff);
}

TEST(PreferenceEvaluatorTest, OutsideWorkHours) {
    PreferenceEvaluator evaluator(morning_prefs());
    auto reason = evaluator.check_work_hours(clock(14, 30, 15, 30));
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->render(), "Requested time 14:30 is outside work hours (08:00 - 12:00)");
}

TEST(PreferenceEvaluatorTest, WorkHourBoundaries) {
    PreferenceEvaluator evaluator(morning_prefs());
    EXPECT_FALSE(evaluator.check_work_hours(clock(8, 0, 9, 0)).has_value());
    EXPECT_FALSE(evaluator.check_work_hours(clock(11, 0, 12, 0)).has_value());
    EXPECT_TRUE(evaluator.check_work_hours(clock(11, 30, 12, 30)).has_value());
    EXPECT_TRUE(evaluator.check_work_hours(clock(7, 45, 8, 45)).has_value());
}

TEST(PreferenceEvaluatorTest, CapacityCountsCommittedSessions) {
    PreferenceEvaluator evaluator(morning_prefs());
    ConflictIndex index("t1");
    index.add(CommittedInterval{.trainer_id = "t1", .interval = clock(8, 0, 9, 0), .request_id = "a"});
    EXPECT_FALSE(evaluator.check_capacity(clock(10, 0, 11, 0), index).has_value());

    index.add(CommittedInterval{.trainer_id = "t1", .interval = clock(9, 15, 9, 45), .request_id = "b"});
    auto reason = evaluator.check_capacity(clock(10, 0, 11, 0), index);
    ASSERT_TRUE(reason.has_value());
    EXPECT_EQ(reason->render(), "Maximum sessions per day limit reached (2 sessions) for 2024-01-15");
}

TEST(PreferenceEvaluatorTest, AllowedCandidate) {
    PreferenceEvaluator evaluator(morning_prefs());
    ConflictIndex index("t1");
    EXPECT_FALSE(evaluator.is_structurally_allowed(clock(9, 0, 10, 0), index).has_value());
}

TEST(PreferenceEvaluatorTest, PreferredBlocks) {
    SchedulingPreferences prefs;
    EXPECT_TRUE(prefs.in_preferred_block(TimeOfDay::at(9)));
    EXPECT_TRUE(prefs.in_preferred_block(TimeOfDay::at(15)));
    EXPECT_FALSE(prefs.in_preferred_block(TimeOfDay::at(19)));
    EXPECT_EQ(prefs.work_day_length(), minutes{600});
}
