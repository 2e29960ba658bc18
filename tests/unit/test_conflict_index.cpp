/**
 * @file test_conflict_index.cpp
 * @brief Unit tests for the per-day conflict index.
 */

#include "scheduler/conflict_index.hpp"

#include <gtest/gtest.h>

using namespace session_planner;
using namespace std::chrono;

// ─── Test Fixtures ───────────────────────────

namespace {

const Day MONDAY = sys_days{year{2024} / January / 15};

Interval clock(int h1, int m1, int h2, int m2, Day day = MONDAY) {
    return Interval{at_time(day, TimeOfDay::at(h1, m1)), at_time(day, TimeOfDay::at(h2, m2))};
}

CommittedInterval booking(const std::string& id, Interval interval,
                          CommittedInterval::Origin origin = CommittedInterval::Origin::ExistingBooking) {
    return CommittedInterval{
        .trainer_id = "t1",
        .interval = interval,
        .request_id = id,
        .origin = origin
    };
}

}  // namespace

class ConflictIndexTest : public ::testing::Test {
protected:
    ConflictIndex index_{"t1"};
};

// ─── Conflicts ───────────────────────────────

TEST_F(ConflictIndexTest, EmptyIndexHasNoConflicts) {
    EXPECT_FALSE(index_.conflicts_with(clock(9, 0, 10, 0)).has_value());
    EXPECT_EQ(index_.size(), 0u);
    EXPECT_EQ(index_.trainer_id(), "t1");
}

TEST_F(ConflictIndexTest, ReportsOverlappingInterval) {
    index_.add(booking("b1", clock(9, 0, 10, 0)));
    auto conflict = index_.conflicts_with(clock(9, 30, 10, 30));
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->request_id, "b1");
}

TEST_F(ConflictIndexTest, TouchingIsNotAConflict) {
    index_.add(booking("b1", clock(9, 0, 10, 0)));
    EXPECT_FALSE(index_.conflicts_with(clock(10, 0, 11, 0)).has_value());
    EXPECT_FALSE(index_.conflicts_with(clock(8, 0, 9, 0)).has_value());
}

TEST_F(ConflictIndexTest, FirstConflictByStart) {
    index_.add(booking("late", clock(11, 0, 12, 0)));
    index_.add(booking("early", clock(9, 0, 10, 0)));
    auto conflict = index_.conflicts_with(clock(8, 0, 12, 0));
    ASSERT_TRUE(conflict.has_value());
    EXPECT_EQ(conflict->request_id, "early");
}

TEST_F(ConflictIndexTest, OvernightIntervalConflictsNextDay) {
    auto sunday = MONDAY - days{1};
    index_.add(booking("overnight", Interval{at_time(sunday, TimeOfDay::at(23)),
                                              at_time(MONDAY, TimeOfDay::at(1))}));
    EXPECT_TRUE(index_.conflicts_with(clock(0, 30, 1, 30)).has_value());
    EXPECT_EQ(index_.sessions_on(MONDAY), 0u);
    EXPECT_EQ(index_.sessions_on(sunday), 1u);
}

TEST_F(ConflictIndexTest, EmptyIntervalIsAContractViolation) {
    auto t = at_time(MONDAY, TimeOfDay::at(9));
    EXPECT_THROW(index_.add(booking("bad", Interval{t, t})), ContractViolation);
}

// ─── Break Rule ──────────────────────────────

TEST_F(ConflictIndexTest, BreakBeforeUsesPreviousNeighbor) {
    index_.add(booking("b1", clock(9, 0, 10, 0)));
    auto violation = index_.breaks_break_rule(clock(10, 5, 11, 5), 15);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->side, ConflictIndex::BreakViolation::Side::Before);
    EXPECT_EQ(violation->neighbor.request_id, "b1");
}

TEST_F(ConflictIndexTest, BreakAfterUsesNextNeighbor) {
    index_.add(booking("b1", clock(11, 0, 12, 0)));
    auto violation = index_.breaks_break_rule(clock(9, 55, 10, 55), 15);
    ASSERT_TRUE(violation.has_value());
    EXPECT_EQ(violation->side, ConflictIndex::BreakViolation::Side::After);
}

TEST_F(ConflictIndexTest, ExactBreakIsAllowed) {
    index_.add(booking("b1", clock(9, 0, 10, 0)));
    index_.add(booking("b2", clock(11, 30, 12, 30)));
    EXPECT_FALSE(index_.breaks_break_rule(clock(10, 15, 11, 15), 15).has_value());
    EXPECT_TRUE(index_.back_to_back(clock(10, 15, 11, 15), 15));
    EXPECT_FALSE(index_.back_to_back(clock(10, 20, 11, 0), 15));
}

TEST_F(ConflictIndexTest, ZeroBreakAllowsTouching) {
    index_.add(booking("b1", clock(9, 0, 10, 0)));
    EXPECT_FALSE(index_.breaks_break_rule(clock(10, 0, 11, 0), 0).has_value());
}

TEST_F(ConflictIndexTest, BreakRuleIgnoresOtherDays) {
    auto tuesday = MONDAY + days{1};
    index_.add(booking("b1", clock(9, 0, 10, 0, tuesday)));
    EXPECT_FALSE(index_.breaks_break_rule(clock(10, 5, 11, 0), 15).has_value());
}

// ─── Per-day view ────────────────────────────

TEST_F(ConflictIndexTest, IntervalsOnDaySortedByStart) {
    index_.add(booking("c", clock(14, 0, 15, 0)));
    index_.add(booking("a", clock(8, 0, 9, 0)));
    index_.add(booking("b", clock(11, 0, 12, 0), CommittedInterval::Origin::ApprovedRequest));

    auto on_monday = index_.intervals_on(MONDAY);
    ASSERT_EQ(on_monday.size(), 3u);
    EXPECT_EQ(on_monday[0].request_id, "a");
    EXPECT_EQ(on_monday[1].request_id, "b");
    EXPECT_EQ(on_monday[2].request_id, "c");
    EXPECT_EQ(index_.sessions_on(MONDAY), 3u);
    EXPECT_TRUE(index_.intervals_on(MONDAY + days{1}).empty());
}
