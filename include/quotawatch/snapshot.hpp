#pragma once

#include "quotawatch/calendar.hpp"
#include "quotawatch/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace quotawatch {

// Totals over the half-open range [start, end). Always recomputed whole.
struct WindowAggregate {
    Timestamp   start{};
    Timestamp   end{};
    double      total_cost{0.0};
    TokenCounts tokens;
    std::size_t record_count{0};

    bool empty() const noexcept { return record_count == 0; }
};

struct DailyPoint {
    CivilDate date;
    double cost{0.0};
    TokenCounts tokens;
    std::vector<std::string> models;
    Metric efficiency;
};

// End-of-period extrapolation from a trailing run-rate
struct Projection {
    WindowAggregate basis;
    double elapsed_fraction{0.0};
    Metric run_rate_per_day;
    int active_days{0};
    double remaining_days{0.0};
    double projected_total{0.0};
    bool low_confidence{true};
    RiskBand band{RiskBand::Nominal};
};

// cost_so_far / elapsed_fraction for the current hour or day
struct PartialProjection {
    double cost_so_far{0.0};
    double elapsed_fraction{0.0};
    Metric projected;
};

struct CapUsage {
    std::string name;
    double limit{0.0};
    WindowAggregate window;       // the cap's own current week
    Timestamp next_reset{};
    Metric utilization;           // unbounded above 1.0
    Projection projection;
    Metric projected_utilization;
};

struct QuotaSummary {
    std::vector<CapUsage> caps;
    std::optional<std::size_t> binding;   // index into caps
    Metric binding_utilization;
    GateDecision gate{GateDecision::Permit};
    Metric projected_binding;
    GateDecision projected_gate{GateDecision::Permit};
    Metric headroom;                      // USD before the warn cutoff
    bool dead_zone{false};

    const CapUsage* binding_cap() const {
        return binding ? &caps[*binding] : nullptr;
    }
};

// Everything one refresh cycle produced. Immutable once published.
struct KpiSnapshot {
    std::uint64_t generation{0};
    Timestamp computed_at{};

    bool calibrated{false};
    std::string calibrated_on;

    std::size_t records_ingested{0};
    std::size_t duplicates_dropped{0};

    // Windows
    WindowAggregate today;
    std::array<WindowAggregate, 24> today_by_hour{};
    bool today_hourly{true};   // false when today has only daily totals
    WindowAggregate rolling_7d;
    WindowAggregate rolling_30d;
    WindowAggregate billing_week;
    Timestamp next_billing_reset{};

    std::vector<DailyPoint> daily_trend;                        // oldest first
    std::vector<std::pair<std::string, double>> model_costs_7d; // costliest first
    std::vector<std::string> models_today;

    // Ratios
    QuotaSummary quota;
    Metric efficiency_today;
    Metric efficiency_7d;
    Metric spend_ratio;        // week cost / weekly spend baseline

    // Projections
    Projection week_projection;
    PartialProjection hour_projection;
    PartialProjection day_projection;
    Metric day_spend_ratio;    // projected day / daily spend baseline

    bool has_data() const noexcept { return generation > 0; }
};

} // namespace quotawatch
