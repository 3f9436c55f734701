#pragma once

#include "quotawatch/aggregator.hpp"
#include "quotawatch/config.hpp"
#include "quotawatch/snapshot.hpp"

namespace quotawatch {

struct RunRate {
    Metric per_day;      // InsufficientData when no day was active
    int active_days{0};
    int window_days{0};
};

// Extrapolates partial periods to full-period estimates
class ProjectionEngine {
public:
    explicit ProjectionEngine(ProjectionConfig config = ProjectionConfig{});

    // Cost per active day over the trailing run_rate_days calendar days
    // ending with the day containing `now`, clipped to [period_start, now].
    // Days with zero cost are not active.
    RunRate run_rate(const TimeWindowAggregator& aggregator,
                     Timestamp period_start, Timestamp now,
                     const RecordFilter& filter = {}) const;

    // projected = current + run_rate * remaining_days. Without a run-rate
    // the projection is the current total, flagged low-confidence.
    Projection project_period(const TimeWindowAggregator& aggregator,
                              const WindowAggregate& current,
                              Timestamp period_start, Duration period_length,
                              Timestamp now,
                              const RecordFilter& filter = {}) const;

    // cost_so_far / elapsed_fraction, or InsufficientData while the
    // elapsed fraction is below the configured epsilon
    Metric extrapolate(double cost_so_far, double elapsed_fraction) const;

    // InsufficientData when today is known only as a daily total
    PartialProjection project_hour(const TimeWindowAggregator& aggregator, Timestamp now) const;
    PartialProjection project_day(const TimeWindowAggregator& aggregator, Timestamp now) const;

    const ProjectionConfig& config() const noexcept;

private:
    ProjectionConfig config_;
};

} // namespace quotawatch
