#include "quotawatch/quota_calculator.hpp"

#include <algorithm>
#include <stdexcept>

namespace quotawatch {

QuotaCalculator::QuotaCalculator(ThresholdConfig thresholds, double scheduled_reserve)
    : quota_(thresholds.quota, CutoffDirection::Rising)
    , projection_(thresholds.projection, CutoffDirection::Rising)
    , spend_(thresholds.spend, CutoffDirection::Rising)
    , scheduled_reserve_(scheduled_reserve)
{
    if (scheduled_reserve_ < 0.0 || scheduled_reserve_ >= 1.0) {
        throw std::invalid_argument("scheduled_reserve must lie in [0, 1)");
    }
}

Metric QuotaCalculator::utilization(double used, double limit) {
    if (limit <= 0.0) {
        return Metric::insufficient_data();
    }
    return Metric::of(used / limit);
}

std::optional<std::size_t> QuotaCalculator::binding_index(const std::vector<CapUsage>& caps) {
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < caps.size(); ++i) {
        const Metric& u = caps[i].utilization;
        if (!u.has_value()) continue;
        // Strictly greater keeps the first declared cap on ties
        if (!best || u.value > caps[*best].utilization.value) {
            best = i;
        }
    }
    return best;
}

void QuotaCalculator::summarize(QuotaSummary& summary) const {
    for (auto& cap : summary.caps) {
        cap.utilization = quota_.apply(cap.utilization);
        cap.projected_utilization = projection_.apply(cap.projected_utilization);
        cap.projection.band = cap.projected_utilization.band;
    }

    summary.binding = binding_index(summary.caps);
    if (!summary.binding) {
        summary.binding_utilization = Metric::insufficient_data();
        summary.gate = GateDecision::Permit;
        summary.headroom = Metric::insufficient_data();
    } else {
        const CapUsage& cap = summary.caps[*summary.binding];
        summary.binding_utilization = cap.utilization;
        summary.gate = quota_.gate(cap.utilization);

        double reserve = cap.limit * scheduled_reserve_;
        double room = cap.limit * quota_.cutoffs().warn - cap.window.total_cost - reserve;
        summary.headroom = Metric::of(std::max(room, 0.0));
    }

    // Projected binding is the worst projected cap, which need not be the
    // cap that binds today
    std::optional<std::size_t> worst;
    for (std::size_t i = 0; i < summary.caps.size(); ++i) {
        const Metric& p = summary.caps[i].projected_utilization;
        if (!p.has_value()) continue;
        if (!worst || p.value > summary.caps[*worst].projected_utilization.value) {
            worst = i;
        }
    }
    if (worst) {
        summary.projected_binding = summary.caps[*worst].projected_utilization;
        summary.projected_gate = projection_.gate(summary.projected_binding);
    } else {
        summary.projected_binding = Metric::insufficient_data();
        summary.projected_gate = GateDecision::Permit;
    }
}

Metric QuotaCalculator::efficiency_ratio(double cost, int days_with_data,
                                         const Baseline& baseline) const {
    double reference = baseline.plan_daily_cost() * days_with_data;
    if (reference <= 0.0) {
        return Metric::insufficient_data();
    }
    ThresholdEvaluator evaluator(Cutoffs{baseline.target_ratio, baseline.floor_ratio},
                                 CutoffDirection::Falling);
    return evaluator.apply(Metric::of(cost / reference));
}

Metric QuotaCalculator::spend_ratio(double cost, double baseline) const {
    if (baseline <= 0.0) {
        return Metric::insufficient_data();
    }
    return spend_.apply(Metric::of(cost / baseline));
}

const ThresholdEvaluator& QuotaCalculator::quota_evaluator() const noexcept { return quota_; }
const ThresholdEvaluator& QuotaCalculator::projection_evaluator() const noexcept { return projection_; }
const ThresholdEvaluator& QuotaCalculator::spend_evaluator() const noexcept { return spend_; }

} // namespace quotawatch
