#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

#include <stdexcept>

using namespace quotawatch;

namespace {

UsageRecord priced(Timestamp ts, double cost, const std::string& model = "claude-opus-4-6") {
    UsageRecord r;
    r.timestamp = ts;
    r.model = model;
    r.cost = cost;
    return r;
}

} // anonymous namespace

// ===========================================================================
// Run-rate
// ===========================================================================

class ProjectionTest : public ::testing::Test {
protected:
    ProjectionEngine engine;
    Timestamp week_start = make_timestamp(2026, 2, 14);
    Timestamp now = make_timestamp(2026, 2, 19, 12);
};

TEST_F(ProjectionTest, RunRateCountsOnlyActiveDays) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 14, 10), 20.0),
        priced(make_timestamp(2026, 2, 17, 15), 30.0),
        priced(make_timestamp(2026, 2, 19, 9), 10.0),
    };
    TimeWindowAggregator agg(records);

    RunRate rate = engine.run_rate(agg, week_start, now);
    EXPECT_EQ(rate.window_days, 3);
    EXPECT_EQ(rate.active_days, 2);
    ASSERT_TRUE(rate.per_day.has_value());
    EXPECT_DOUBLE_EQ(rate.per_day.value, 20.0);
}

TEST_F(ProjectionTest, WeekProjectionUsesRemainingDays) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 14, 10), 20.0),
        priced(make_timestamp(2026, 2, 17, 15), 30.0),
        priced(make_timestamp(2026, 2, 19, 9), 10.0),
    };
    TimeWindowAggregator agg(records);
    WindowAggregate current = agg.aggregate(week_start, now);
    ASSERT_DOUBLE_EQ(current.total_cost, 60.0);

    Projection p = engine.project_period(agg, current, week_start, ONE_WEEK, now);
    EXPECT_NEAR(p.remaining_days, 1.5, 1e-12);
    EXPECT_NEAR(p.elapsed_fraction, 132.0 / 168.0, 1e-12);
    EXPECT_NEAR(p.projected_total, 90.0, 1e-9);
    EXPECT_FALSE(p.low_confidence);
    EXPECT_EQ(p.active_days, 2);
}

TEST_F(ProjectionTest, NoActiveDaysIsLowConfidence) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 14, 10), 20.0),
    };
    TimeWindowAggregator agg(records);
    WindowAggregate current = agg.aggregate(week_start, now);

    Projection p = engine.project_period(agg, current, week_start, ONE_WEEK, now);
    EXPECT_TRUE(p.low_confidence);
    EXPECT_EQ(p.run_rate_per_day.status, MetricStatus::InsufficientData);
    EXPECT_DOUBLE_EQ(p.projected_total, 20.0);
}

TEST_F(ProjectionTest, RunRateWindowClipsToPeriodStart) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 17, 15), 30.0),
        priced(make_timestamp(2026, 2, 19, 9), 10.0),
    };
    TimeWindowAggregator agg(records);

    RunRate rate = engine.run_rate(agg, make_timestamp(2026, 2, 19), now);
    EXPECT_EQ(rate.window_days, 1);
    EXPECT_EQ(rate.active_days, 1);
    EXPECT_DOUBLE_EQ(rate.per_day.value, 10.0);
}

TEST_F(ProjectionTest, RunRateHonoursFilter) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 18, 9), 30.0, "claude-opus-4-6"),
        priced(make_timestamp(2026, 2, 19, 9), 12.0, "claude-sonnet-4-6"),
    };
    TimeWindowAggregator agg(records);

    Cap sonnet{"sonnet-only", 300.0, "claude-sonnet", std::nullopt};
    RecordFilter filter = [&](const UsageRecord& r) { return sonnet.applies_to(r.model); };

    RunRate rate = engine.run_rate(agg, week_start, now, filter);
    EXPECT_EQ(rate.active_days, 1);
    EXPECT_DOUBLE_EQ(rate.per_day.value, 12.0);
}

TEST_F(ProjectionTest, ProjectionAfterPeriodEndIsCurrentTotal) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 19, 9), 10.0),
    };
    TimeWindowAggregator agg(records);
    Timestamp old_start = make_timestamp(2026, 2, 7);
    WindowAggregate current = agg.aggregate(old_start, old_start + ONE_WEEK);

    Projection p = engine.project_period(agg, current, old_start, ONE_WEEK, now);
    EXPECT_DOUBLE_EQ(p.remaining_days, 0.0);
    EXPECT_DOUBLE_EQ(p.elapsed_fraction, 1.0);
    EXPECT_DOUBLE_EQ(p.projected_total, 0.0);
}

// ===========================================================================
// Partial hour and day
// ===========================================================================

TEST(PartialProjectionTest, DayExtrapolatesElapsedFraction) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 20, 9), 25.0),
        priced(make_timestamp(2026, 2, 20, 14), 15.0),
    };
    TimeWindowAggregator agg(records);
    ProjectionEngine engine;

    PartialProjection p = engine.project_day(agg, make_timestamp(2026, 2, 20, 18));
    EXPECT_DOUBLE_EQ(p.cost_so_far, 40.0);
    EXPECT_DOUBLE_EQ(p.elapsed_fraction, 0.75);
    ASSERT_TRUE(p.projected.has_value());
    EXPECT_NEAR(p.projected.value, 53.33, 0.005);
}

TEST(PartialProjectionTest, HourTooEarlyIsInsufficientData) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 20, 18), 2.0),
    };
    TimeWindowAggregator agg(records);
    ProjectionEngine engine;

    PartialProjection early = engine.project_hour(agg, make_timestamp(2026, 2, 20, 18, 0, 15));
    EXPECT_EQ(early.projected.status, MetricStatus::InsufficientData);
    EXPECT_DOUBLE_EQ(early.cost_so_far, 2.0);

    PartialProjection half = engine.project_hour(agg, make_timestamp(2026, 2, 20, 18, 30));
    ASSERT_TRUE(half.projected.has_value());
    EXPECT_DOUBLE_EQ(half.projected.value, 4.0);
}

TEST(PartialProjectionTest, DailyTotalsGiveNoHourProjection) {
    UsageRecord total = priced(make_timestamp(2026, 2, 20), 40.0);
    total.resolution = Resolution::Day;
    std::vector<UsageRecord> records = {total};
    TimeWindowAggregator agg(records);
    ProjectionEngine engine;
    Timestamp now = make_timestamp(2026, 2, 20, 18, 30);

    EXPECT_FALSE(agg.has_hourly_detail(now));
    EXPECT_DOUBLE_EQ(agg.hourly(now)[0].total_cost, 0.0);

    PartialProjection hour = engine.project_hour(agg, now);
    EXPECT_EQ(hour.projected.status, MetricStatus::InsufficientData);

    // The day still extrapolates from the total
    PartialProjection day = engine.project_day(agg, make_timestamp(2026, 2, 20, 18));
    ASSERT_TRUE(day.projected.has_value());
    EXPECT_NEAR(day.projected.value, 53.33, 0.005);
}

TEST(PartialProjectionTest, HourDetailFeedsHourNotTotals) {
    UsageRecord total = priced(make_timestamp(2026, 2, 20), 40.0);
    total.resolution = Resolution::Day;
    UsageRecord detail = priced(make_timestamp(2026, 2, 20, 18), 3.0);
    detail.detail_only = true;
    std::vector<UsageRecord> records = {total, detail};
    TimeWindowAggregator agg(records);
    ProjectionEngine engine;
    Timestamp now = make_timestamp(2026, 2, 20, 18, 30);

    EXPECT_TRUE(agg.has_hourly_detail(now));
    EXPECT_DOUBLE_EQ(agg.hourly(now)[18].total_cost, 3.0);
    Timestamp day = make_timestamp(2026, 2, 20);
    EXPECT_DOUBLE_EQ(agg.aggregate(day, day + ONE_DAY).total_cost, 40.0);

    PartialProjection hour = engine.project_hour(agg, now);
    EXPECT_DOUBLE_EQ(hour.cost_so_far, 3.0);
    ASSERT_TRUE(hour.projected.has_value());
    EXPECT_DOUBLE_EQ(hour.projected.value, 6.0);
}

TEST(PartialProjectionTest, EmptyDayProjectsZero) {
    std::vector<UsageRecord> records;
    TimeWindowAggregator agg(records);
    ProjectionEngine engine;

    PartialProjection p = engine.project_day(agg, make_timestamp(2026, 2, 20, 12));
    ASSERT_TRUE(p.projected.has_value());
    EXPECT_DOUBLE_EQ(p.projected.value, 0.0);
}

TEST(PartialProjectionTest, RejectsInvalidConfig) {
    ProjectionConfig no_days;
    no_days.run_rate_days = 0;
    EXPECT_THROW(ProjectionEngine{no_days}, std::invalid_argument);

    ProjectionConfig no_epsilon;
    no_epsilon.min_elapsed_fraction = 0.0;
    EXPECT_THROW(ProjectionEngine{no_epsilon}, std::invalid_argument);
}
