#pragma once

#include "quotawatch/rate_table.hpp"
#include "quotawatch/types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>

namespace quotawatch {

// Two cutoffs for one family of metrics. For rising metrics warn < abort;
// for falling metrics (efficiency) warn > abort.
struct Cutoffs {
    double warn;
    double abort;
};

struct ThresholdConfig {
    Cutoffs quota{0.80, 0.90};         // fraction of a cap
    Cutoffs projection{0.65, 0.85};    // projected fraction of the binding cap
    Cutoffs spend{0.75, 1.30};         // fraction of the spend baseline
};

struct ProjectionConfig {
    // Trailing calendar days used for the run-rate
    int run_rate_days = 3;

    // Below this elapsed fraction a partial period is not extrapolated
    double min_elapsed_fraction = 0.02;
};

struct SchedulerConfig {
    // Background refresh cadence
    std::chrono::milliseconds refresh_interval = std::chrono::seconds(60);

    // Upper bound on a single fetch from the usage source
    // A non-positive timeout calls the source inline, unbounded.
    std::chrono::milliseconds source_timeout = std::chrono::seconds(30);
};

struct Config {
    // History requested from the source on every refresh
    int lookback_days = 30;

    // Share of the binding cap kept back for scheduled jobs
    double scheduled_reserve = 0.05;

    ThresholdConfig thresholds;
    ProjectionConfig projection;
    SchedulerConfig scheduler;

    // Prices tokens for records that arrive without a cost
    RateTable rates = RateTable::builtin();

    // Source of "now". Tests pin it to a fixed instant.
    std::function<Timestamp()> clock = [] { return LocalClock::now(); };
};

} // namespace quotawatch
