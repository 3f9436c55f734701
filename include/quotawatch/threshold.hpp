#pragma once

#include "quotawatch/config.hpp"
#include "quotawatch/types.hpp"

namespace quotawatch {

// Maps a metric onto three ordered bands using two cutoffs, and the same
// cutoffs onto a permit/warn/deny gate. A pure function of its inputs.
//
// Rising:  value < warn -> Nominal, value < abort -> Elevated, else Critical
// Falling: value >= warn -> Nominal, value >= abort -> Elevated, else Critical
class ThresholdEvaluator {
public:
    explicit ThresholdEvaluator(Cutoffs cutoffs,
                                CutoffDirection direction = CutoffDirection::Rising);

    RiskBand classify(double value) const noexcept;
    GateDecision gate(double value) const noexcept;

    // Bands a metric that carries a value; metrics without one stay
    // Nominal and gate to Permit.
    Metric apply(Metric metric) const noexcept;
    GateDecision gate(const Metric& metric) const noexcept;

    const Cutoffs& cutoffs() const noexcept;
    CutoffDirection direction() const noexcept;

private:
    Cutoffs cutoffs_;
    CutoffDirection direction_;
};

GateDecision gate_for(RiskBand band) noexcept;

} // namespace quotawatch
