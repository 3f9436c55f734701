#pragma once

#include "quotawatch/calibration.hpp"
#include "quotawatch/config.hpp"
#include "quotawatch/snapshot.hpp"
#include "quotawatch/threshold.hpp"

#include <optional>
#include <vector>

namespace quotawatch {

class QuotaCalculator {
public:
    QuotaCalculator(ThresholdConfig thresholds, double scheduled_reserve);

    // used / limit, never clamped. A non-positive limit has no ratio.
    static Metric utilization(double used, double limit);

    // Highest utilization wins; ties go to the earliest cap. nullopt when
    // no cap carries a value.
    static std::optional<std::size_t> binding_index(const std::vector<CapUsage>& caps);

    // Fills the binding cap, gate, headroom and projected binding of a
    // summary whose caps already carry utilization and projections.
    void summarize(QuotaSummary& summary) const;

    // cost / (plan daily cost * days with data), banded against the
    // baseline target (warn) and floor (abort)
    Metric efficiency_ratio(double cost, int days_with_data, const Baseline& baseline) const;

    // cost / baseline, banded with the spend cutoffs
    Metric spend_ratio(double cost, double baseline) const;

    const ThresholdEvaluator& quota_evaluator() const noexcept;
    const ThresholdEvaluator& projection_evaluator() const noexcept;
    const ThresholdEvaluator& spend_evaluator() const noexcept;

private:
    ThresholdEvaluator quota_;
    ThresholdEvaluator projection_;
    ThresholdEvaluator spend_;
    double scheduled_reserve_;
};

} // namespace quotawatch
