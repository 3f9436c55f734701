#include "quotawatch/projection.hpp"
#include "quotawatch/calendar.hpp"

#include <algorithm>
#include <stdexcept>

namespace quotawatch {

ProjectionEngine::ProjectionEngine(ProjectionConfig config)
    : config_(config)
{
    if (config_.run_rate_days < 1) {
        throw std::invalid_argument("run_rate_days must be at least 1");
    }
    if (config_.min_elapsed_fraction <= 0.0 || config_.min_elapsed_fraction >= 1.0) {
        throw std::invalid_argument("min_elapsed_fraction must lie in (0, 1)");
    }
}

const ProjectionConfig& ProjectionEngine::config() const noexcept {
    return config_;
}

RunRate ProjectionEngine::run_rate(const TimeWindowAggregator& aggregator,
                                   Timestamp period_start, Timestamp now,
                                   const RecordFilter& filter) const {
    RunRate rate;
    double cost = 0.0;
    Timestamp today = start_of_day(now);

    for (int i = 0; i < config_.run_rate_days; ++i) {
        Timestamp day_start = today - ONE_DAY * i;
        Timestamp day_end = day_start + ONE_DAY;
        if (day_end <= period_start) break;

        rate.window_days++;
        auto day = aggregator.aggregate(std::max(day_start, period_start), day_end, filter);
        if (day.total_cost > 0.0) {
            rate.active_days++;
            cost += day.total_cost;
        }
    }

    if (rate.active_days > 0) {
        rate.per_day = Metric::of(cost / rate.active_days);
    }
    return rate;
}

Projection ProjectionEngine::project_period(const TimeWindowAggregator& aggregator,
                                            const WindowAggregate& current,
                                            Timestamp period_start, Duration period_length,
                                            Timestamp now,
                                            const RecordFilter& filter) const {
    Projection p;
    p.basis = current;

    double total_hours = hours_between(period_start, period_start + period_length);
    double elapsed_hours = std::clamp(hours_between(period_start, now), 0.0, total_hours);
    p.elapsed_fraction = (total_hours > 0.0) ? elapsed_hours / total_hours : 1.0;
    p.remaining_days = (total_hours - elapsed_hours) / 24.0;

    RunRate rate = run_rate(aggregator, period_start, now, filter);
    p.run_rate_per_day = rate.per_day;
    p.active_days = rate.active_days;

    if (rate.per_day.has_value()) {
        p.projected_total = current.total_cost + rate.per_day.value * p.remaining_days;
        p.low_confidence = false;
    } else {
        p.projected_total = current.total_cost;
        p.low_confidence = true;
    }
    return p;
}

Metric ProjectionEngine::extrapolate(double cost_so_far, double elapsed_fraction) const {
    if (elapsed_fraction < config_.min_elapsed_fraction) {
        return Metric::insufficient_data();
    }
    return Metric::of(cost_so_far / std::min(elapsed_fraction, 1.0));
}

PartialProjection ProjectionEngine::project_hour(const TimeWindowAggregator& aggregator,
                                                 Timestamp now) const {
    PartialProjection p;
    Timestamp hour = start_of_hour(now);
    p.elapsed_fraction = hours_between(hour, now);

    // A daily total says nothing about the current hour
    if (!aggregator.has_hourly_detail(now)) {
        p.projected = Metric::insufficient_data();
        return p;
    }
    p.cost_so_far = aggregator.hourly(now)[hour_of_day(now)].total_cost;
    p.projected = extrapolate(p.cost_so_far, p.elapsed_fraction);
    return p;
}

PartialProjection ProjectionEngine::project_day(const TimeWindowAggregator& aggregator,
                                                Timestamp now) const {
    PartialProjection p;
    Timestamp day = start_of_day(now);
    p.cost_so_far = aggregator.aggregate(day, day + ONE_DAY).total_cost;
    p.elapsed_fraction = hours_between(day, now) / 24.0;
    p.projected = extrapolate(p.cost_so_far, p.elapsed_fraction);
    return p;
}

} // namespace quotawatch
