#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

using namespace quotawatch;

namespace {

UsageRecord priced(Timestamp ts, const std::string& model, double cost) {
    UsageRecord r;
    r.timestamp = ts;
    r.model = model;
    r.cost = cost;
    return r;
}

Calibration two_caps() {
    Calibration c;
    c.anchor = BillingAnchor{CivilDate{2026, 2, 14}, 0};
    c.caps.push_back(Cap{"all-models", 500.0, "", std::nullopt});
    c.caps.push_back(Cap{"sonnet-only", 300.0, "claude-sonnet", std::nullopt});
    c.calibrated_on = "2026-02-14";
    return c;
}

} // anonymous namespace

// ===========================================================================
// Uncalibrated
// ===========================================================================

TEST(SnapshotBuilderTest, UncalibratedStillReportsTotals) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 20, 9), "claude-opus-4-6", 25.0),
        priced(make_timestamp(2026, 2, 20, 14), "claude-sonnet-4-6", 15.0),
    };
    SnapshotBuilder builder{Config{}};

    KpiSnapshot snap = builder.build(records, std::nullopt, make_timestamp(2026, 2, 20, 18));

    EXPECT_FALSE(snap.calibrated);
    EXPECT_DOUBLE_EQ(snap.today.total_cost, 40.0);
    EXPECT_DOUBLE_EQ(snap.rolling_7d.total_cost, 40.0);
    EXPECT_DOUBLE_EQ(snap.today_by_hour[9].total_cost, 25.0);
    EXPECT_EQ(snap.models_today.size(), 2u);

    // Default anchor is a Saturday at midnight
    EXPECT_EQ(snap.billing_week.start, make_timestamp(2026, 2, 14));
    EXPECT_EQ(snap.next_billing_reset, make_timestamp(2026, 2, 21));

    EXPECT_EQ(snap.efficiency_today.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(snap.efficiency_7d.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(snap.spend_ratio.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(snap.day_spend_ratio.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(snap.quota.binding_utilization.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(snap.quota.headroom.status, MetricStatus::Uncalibrated);
    EXPECT_TRUE(snap.quota.caps.empty());
    EXPECT_EQ(snap.quota.gate, GateDecision::Permit);

    // Partial-period projections need no calibration
    ASSERT_TRUE(snap.day_projection.projected.has_value());
    EXPECT_NEAR(snap.day_projection.projected.value, 53.33, 0.005);
}

TEST(SnapshotBuilderTest, EmptyHistoryHasNoData) {
    std::vector<UsageRecord> records;
    SnapshotBuilder builder{Config{}};

    KpiSnapshot snap = builder.build(records, Calibration::defaults(),
                                     make_timestamp(2026, 2, 20, 18));
    EXPECT_DOUBLE_EQ(snap.today.total_cost, 0.0);
    EXPECT_EQ(snap.efficiency_today.status, MetricStatus::InsufficientData);
    EXPECT_TRUE(snap.week_projection.low_confidence);
    ASSERT_EQ(snap.quota.caps.size(), 2u);
    EXPECT_DOUBLE_EQ(snap.quota.binding_utilization.value, 0.0);
    EXPECT_EQ(snap.quota.gate, GateDecision::Permit);
}

// ===========================================================================
// Calibrated
// ===========================================================================

class CalibratedSnapshotTest : public ::testing::Test {
protected:
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 15, 10), "claude-opus-4-6", 400.0),
        priced(make_timestamp(2026, 2, 16, 10), "claude-sonnet-4-6", 200.0),
    };
    Timestamp now = make_timestamp(2026, 2, 17, 12);
    SnapshotBuilder builder{Config{}};
};

TEST_F(CalibratedSnapshotTest, BindingCapDeniesPastAbort) {
    KpiSnapshot snap = builder.build(records, two_caps(), now);

    ASSERT_TRUE(snap.calibrated);
    ASSERT_EQ(snap.quota.caps.size(), 2u);
    EXPECT_DOUBLE_EQ(snap.quota.caps[0].window.total_cost, 600.0);
    EXPECT_DOUBLE_EQ(snap.quota.caps[1].window.total_cost, 200.0);

    ASSERT_NE(snap.quota.binding_cap(), nullptr);
    EXPECT_EQ(snap.quota.binding_cap()->name, "all-models");
    EXPECT_NEAR(snap.quota.binding_utilization.value, 1.2, 1e-12);
    EXPECT_EQ(snap.quota.gate, GateDecision::Deny);
    EXPECT_DOUBLE_EQ(snap.quota.headroom.value, 0.0);
    EXPECT_FALSE(snap.quota.dead_zone);
    EXPECT_EQ(snap.quota.caps[0].next_reset, make_timestamp(2026, 2, 21));
}

TEST_F(CalibratedSnapshotTest, CapProjectionsUseFilteredRunRate) {
    KpiSnapshot snap = builder.build(records, two_caps(), now);

    // all-models: 600 + 300/day * 3.5 days
    EXPECT_NEAR(snap.quota.caps[0].projection.projected_total, 1650.0, 1e-9);
    // sonnet-only: 200 + 200/day * 3.5 days
    EXPECT_NEAR(snap.quota.caps[1].projection.projected_total, 900.0, 1e-9);
    EXPECT_NEAR(snap.quota.projected_binding.value, 3.3, 1e-12);
    EXPECT_EQ(snap.quota.projected_gate, GateDecision::Deny);
    EXPECT_EQ(snap.week_projection.band, RiskBand::Critical);
}

TEST_F(CalibratedSnapshotTest, DailyTrendCoversSevenDays) {
    KpiSnapshot snap = builder.build(records, two_caps(), now);

    ASSERT_EQ(snap.daily_trend.size(), 7u);
    EXPECT_EQ(snap.daily_trend.front().date, (CivilDate{2026, 2, 11}));
    EXPECT_EQ(snap.daily_trend.back().date, (CivilDate{2026, 2, 17}));

    const DailyPoint& sonnet_day = snap.daily_trend[5];
    EXPECT_EQ(sonnet_day.date, (CivilDate{2026, 2, 16}));
    EXPECT_DOUBLE_EQ(sonnet_day.cost, 200.0);
    ASSERT_EQ(sonnet_day.models.size(), 1u);
    EXPECT_EQ(sonnet_day.models[0], "claude-sonnet-4-6");
    EXPECT_NEAR(sonnet_day.efficiency.value, 60.0, 1e-9);

    EXPECT_EQ(snap.daily_trend.back().efficiency.status, MetricStatus::InsufficientData);
}

TEST_F(CalibratedSnapshotTest, ModelMixIsCostliestFirst) {
    KpiSnapshot snap = builder.build(records, two_caps(), now);

    ASSERT_EQ(snap.model_costs_7d.size(), 2u);
    EXPECT_EQ(snap.model_costs_7d[0].first, "claude-opus-4-6");
    EXPECT_EQ(snap.model_costs_7d[1].first, "claude-sonnet-4-6");
    EXPECT_EQ(snap.calibrated_on, "2026-02-14");
    EXPECT_EQ(snap.records_ingested, 2u);
}

TEST_F(CalibratedSnapshotTest, DeadZoneBetweenStaggeredResets) {
    Calibration c = two_caps();
    c.caps[1].reset_hour = 14;   // Saturday 14:00

    KpiSnapshot inside = builder.build(records, c, make_timestamp(2026, 2, 21, 9));
    EXPECT_TRUE(inside.quota.dead_zone);

    KpiSnapshot after = builder.build(records, c, make_timestamp(2026, 2, 21, 15));
    EXPECT_FALSE(after.quota.dead_zone);
}

// ===========================================================================
// Day spend
// ===========================================================================

TEST(SnapshotBuilderTest, DaySpendAgainstDailyBaseline) {
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 20, 9), "claude-opus-4-6", 25.0),
        priced(make_timestamp(2026, 2, 20, 14), "claude-sonnet-4-6", 15.0),
    };
    Config config;
    config.thresholds.spend = Cutoffs{1.00, 1.30};
    SnapshotBuilder builder(config);

    Calibration c = Calibration::defaults();
    c.baseline.daily_spend_baseline = 55.0;

    KpiSnapshot snap = builder.build(records, c, make_timestamp(2026, 2, 20, 18));
    ASSERT_TRUE(snap.day_spend_ratio.has_value());
    EXPECT_NEAR(snap.day_spend_ratio.value, 0.9697, 1e-4);
    EXPECT_EQ(snap.day_spend_ratio.band, RiskBand::Nominal);

    // 40 / (100 / 30) on one day with data
    EXPECT_NEAR(snap.efficiency_today.value, 12.0, 1e-9);
    EXPECT_EQ(snap.efficiency_today.band, RiskBand::Elevated);
    EXPECT_NEAR(snap.spend_ratio.value, 40.0 / 55.0, 1e-12);
}

// ===========================================================================
// Daily totals with hour detail
// ===========================================================================

TEST(SnapshotBuilderTest, DailyTotalWithoutDetailHasNoHourlyView) {
    UsageRecord total = priced(make_timestamp(2026, 2, 20), "claude-opus-4-6", 40.0);
    total.resolution = Resolution::Day;
    SnapshotBuilder builder{Config{}};

    KpiSnapshot snap = builder.build({total}, std::nullopt, make_timestamp(2026, 2, 20, 18, 30));

    EXPECT_DOUBLE_EQ(snap.today.total_cost, 40.0);
    EXPECT_FALSE(snap.today_hourly);
    EXPECT_DOUBLE_EQ(snap.today_by_hour[0].total_cost, 0.0);
    EXPECT_EQ(snap.hour_projection.projected.status, MetricStatus::InsufficientData);
    EXPECT_TRUE(snap.day_projection.projected.has_value());
}

TEST(SnapshotBuilderTest, HourDetailFillsHourlyViewOnly) {
    UsageRecord total = priced(make_timestamp(2026, 2, 20), "claude-opus-4-6", 40.0);
    total.resolution = Resolution::Day;
    UsageRecord morning = priced(make_timestamp(2026, 2, 20, 9), "claude-opus-4-6", 30.0);
    morning.detail_only = true;
    UsageRecord evening = priced(make_timestamp(2026, 2, 20, 18), "claude-opus-4-6", 3.0);
    evening.detail_only = true;
    SnapshotBuilder builder{Config{}};

    KpiSnapshot snap = builder.build({total, morning, evening}, std::nullopt,
                                     make_timestamp(2026, 2, 20, 18, 30));

    // Totals come from the daily record alone
    EXPECT_DOUBLE_EQ(snap.today.total_cost, 40.0);
    EXPECT_DOUBLE_EQ(snap.rolling_7d.total_cost, 40.0);
    ASSERT_EQ(snap.model_costs_7d.size(), 1u);
    EXPECT_DOUBLE_EQ(snap.model_costs_7d[0].second, 40.0);

    EXPECT_TRUE(snap.today_hourly);
    EXPECT_DOUBLE_EQ(snap.today_by_hour[0].total_cost, 0.0);
    EXPECT_DOUBLE_EQ(snap.today_by_hour[9].total_cost, 30.0);
    EXPECT_DOUBLE_EQ(snap.today_by_hour[18].total_cost, 3.0);
    ASSERT_TRUE(snap.hour_projection.projected.has_value());
    EXPECT_DOUBLE_EQ(snap.hour_projection.projected.value, 6.0);
}
