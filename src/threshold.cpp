#include "quotawatch/threshold.hpp"

#include <cmath>
#include <stdexcept>

namespace quotawatch {

ThresholdEvaluator::ThresholdEvaluator(Cutoffs cutoffs, CutoffDirection direction)
    : cutoffs_(cutoffs)
    , direction_(direction)
{
    if (!std::isfinite(cutoffs_.warn) || !std::isfinite(cutoffs_.abort)) {
        throw std::invalid_argument("Cutoffs must be finite");
    }
    if (direction_ == CutoffDirection::Rising && cutoffs_.warn > cutoffs_.abort) {
        throw std::invalid_argument("Rising cutoffs need warn <= abort");
    }
    if (direction_ == CutoffDirection::Falling && cutoffs_.warn < cutoffs_.abort) {
        throw std::invalid_argument("Falling cutoffs need warn >= abort");
    }
}

RiskBand ThresholdEvaluator::classify(double value) const noexcept {
    if (direction_ == CutoffDirection::Rising) {
        if (value >= cutoffs_.abort) return RiskBand::Critical;
        if (value >= cutoffs_.warn)  return RiskBand::Elevated;
        return RiskBand::Nominal;
    }
    if (value >= cutoffs_.warn)  return RiskBand::Nominal;
    if (value >= cutoffs_.abort) return RiskBand::Elevated;
    return RiskBand::Critical;
}

GateDecision ThresholdEvaluator::gate(double value) const noexcept {
    return gate_for(classify(value));
}

Metric ThresholdEvaluator::apply(Metric metric) const noexcept {
    metric.band = metric.has_value() ? classify(metric.value) : RiskBand::Nominal;
    return metric;
}

GateDecision ThresholdEvaluator::gate(const Metric& metric) const noexcept {
    return metric.has_value() ? gate(metric.value) : GateDecision::Permit;
}

const Cutoffs& ThresholdEvaluator::cutoffs() const noexcept { return cutoffs_; }
CutoffDirection ThresholdEvaluator::direction() const noexcept { return direction_; }

GateDecision gate_for(RiskBand band) noexcept {
    switch (band) {
        case RiskBand::Nominal:  return GateDecision::Permit;
        case RiskBand::Elevated: return GateDecision::Warn;
        case RiskBand::Critical: return GateDecision::Deny;
    }
    return GateDecision::Deny;
}

} // namespace quotawatch
