#include "quotawatch/snapshot_builder.hpp"
#include "quotawatch/aggregator.hpp"
#include "quotawatch/calendar.hpp"

namespace quotawatch {

SnapshotBuilder::SnapshotBuilder(const Config& config)
    : calculator_(config.thresholds, config.scheduled_reserve)
    , projection_(config.projection)
{}

KpiSnapshot SnapshotBuilder::build(const std::vector<UsageRecord>& records,
                                   const std::optional<Calibration>& calibration,
                                   Timestamp now) const {
    KpiSnapshot snap;
    snap.computed_at = now;
    snap.calibrated = calibration.has_value();
    if (calibration) {
        snap.calibrated_on = calibration->calibrated_on;
    }
    snap.records_ingested = records.size();

    TimeWindowAggregator aggregator(records);

    // ---- Windows ----
    Timestamp day = start_of_day(now);
    snap.today = aggregator.aggregate(day, day + ONE_DAY);
    snap.today_by_hour = aggregator.hourly(now);
    snap.today_hourly = aggregator.has_hourly_detail(now);
    snap.rolling_7d = aggregator.rolling_days(now, 7);
    snap.rolling_30d = aggregator.rolling_days(now, 30);
    snap.models_today = aggregator.models_in(day, day + ONE_DAY);
    snap.model_costs_7d = aggregator.cost_by_model(snap.rolling_7d.start, snap.rolling_7d.end);

    // Raw totals never wait on calibration; the default anchor stands in
    BillingAnchor anchor = calibration ? calibration->anchor : BillingAnchor{};
    Timestamp week_start = TimeWindowAggregator::billing_week_start(now, anchor);
    snap.billing_week = aggregator.aggregate(week_start, week_start + ONE_WEEK);
    snap.next_billing_reset = week_start + ONE_WEEK;

    // ---- Projections ----
    snap.week_projection = projection_.project_period(aggregator, snap.billing_week,
                                                      week_start, ONE_WEEK, now);
    snap.hour_projection = projection_.project_hour(aggregator, now);
    snap.day_projection = projection_.project_day(aggregator, now);

    // ---- Ratios ----
    for (auto& d : aggregator.daily(now, 7)) {
        DailyPoint point;
        point.date = civil_date(d.start);
        point.cost = d.total_cost;
        point.tokens = d.tokens;
        point.models = aggregator.models_in(d.start, d.end);
        point.efficiency = calibration
            ? calculator_.efficiency_ratio(d.total_cost, d.empty() ? 0 : 1, calibration->baseline)
            : Metric::uncalibrated();
        snap.daily_trend.push_back(point);
    }

    if (!calibration) {
        snap.efficiency_today = Metric::uncalibrated();
        snap.efficiency_7d = Metric::uncalibrated();
        snap.spend_ratio = Metric::uncalibrated();
        snap.day_spend_ratio = Metric::uncalibrated();
        snap.quota.binding_utilization = Metric::uncalibrated();
        snap.quota.projected_binding = Metric::uncalibrated();
        snap.quota.headroom = Metric::uncalibrated();
        return snap;
    }

    const Baseline& baseline = calibration->baseline;
    snap.efficiency_today = calculator_.efficiency_ratio(
        snap.today.total_cost, aggregator.days_with_data(day, day + ONE_DAY), baseline);
    snap.efficiency_7d = calculator_.efficiency_ratio(
        snap.rolling_7d.total_cost,
        aggregator.days_with_data(snap.rolling_7d.start, snap.rolling_7d.end), baseline);
    snap.spend_ratio = calculator_.spend_ratio(snap.billing_week.total_cost,
                                               baseline.weekly_spend_baseline);
    snap.day_spend_ratio = snap.day_projection.projected.has_value()
        ? calculator_.spend_ratio(snap.day_projection.projected.value, baseline.daily_spend())
        : Metric::insufficient_data();

    fill_quota(snap, aggregator, *calibration, now);
    snap.week_projection.band = snap.quota.projected_binding.band;
    return snap;
}

void SnapshotBuilder::fill_quota(KpiSnapshot& snap, const TimeWindowAggregator& aggregator,
                                 const Calibration& calibration, Timestamp now) const {
    QuotaSummary& quota = snap.quota;

    for (const Cap& cap : calibration.caps) {
        RecordFilter applies = [&cap](const UsageRecord& r) { return cap.applies_to(r.model); };
        Timestamp start = TimeWindowAggregator::cap_week_start(now, calibration.anchor, cap);

        CapUsage usage;
        usage.name = cap.name;
        usage.limit = cap.weekly_limit;
        usage.window = aggregator.aggregate(start, start + ONE_WEEK, applies);
        usage.next_reset = start + ONE_WEEK;
        usage.utilization = QuotaCalculator::utilization(usage.window.total_cost, cap.weekly_limit);
        usage.projection = projection_.project_period(aggregator, usage.window, start,
                                                      ONE_WEEK, now, applies);
        usage.projected_utilization =
            QuotaCalculator::utilization(usage.projection.projected_total, cap.weekly_limit);
        quota.caps.push_back(std::move(usage));
    }

    quota.dead_zone = TimeWindowAggregator::in_dead_zone(now, calibration.anchor, calibration.caps);
    calculator_.summarize(quota);
}

} // namespace quotawatch
