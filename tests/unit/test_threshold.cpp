#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

#include <stdexcept>

using namespace quotawatch;

// ===========================================================================
// Rising metrics (utilization, spend)
// ===========================================================================

TEST(ThresholdTest, RisingBands) {
    ThresholdEvaluator eval(Cutoffs{0.80, 0.90});

    EXPECT_EQ(eval.classify(0.10), RiskBand::Nominal);
    EXPECT_EQ(eval.classify(0.7999), RiskBand::Nominal);
    EXPECT_EQ(eval.classify(0.80), RiskBand::Elevated);
    EXPECT_EQ(eval.classify(0.8999), RiskBand::Elevated);
    EXPECT_EQ(eval.classify(0.90), RiskBand::Critical);
    EXPECT_EQ(eval.classify(3.00), RiskBand::Critical);
}

TEST(ThresholdTest, GateFollowsBand) {
    ThresholdEvaluator eval(Cutoffs{0.80, 0.90});

    EXPECT_EQ(eval.gate(0.5), GateDecision::Permit);
    EXPECT_EQ(eval.gate(0.85), GateDecision::Warn);
    EXPECT_EQ(eval.gate(0.95), GateDecision::Deny);
}

// ===========================================================================
// Falling metrics (efficiency: higher is better)
// ===========================================================================

TEST(ThresholdTest, FallingBands) {
    ThresholdEvaluator eval(Cutoffs{15.5, 12.0}, CutoffDirection::Falling);

    EXPECT_EQ(eval.classify(20.0), RiskBand::Nominal);
    EXPECT_EQ(eval.classify(15.5), RiskBand::Nominal);
    EXPECT_EQ(eval.classify(13.0), RiskBand::Elevated);
    EXPECT_EQ(eval.classify(12.0), RiskBand::Elevated);
    EXPECT_EQ(eval.classify(11.9), RiskBand::Critical);
    EXPECT_EQ(eval.gate(5.0), GateDecision::Deny);
}

// ===========================================================================
// Metrics without a value
// ===========================================================================

TEST(ThresholdTest, MetricsWithoutValueStayNominal) {
    ThresholdEvaluator eval(Cutoffs{0.80, 0.90});

    Metric none = eval.apply(Metric::insufficient_data());
    EXPECT_EQ(none.band, RiskBand::Nominal);
    EXPECT_EQ(none.status, MetricStatus::InsufficientData);
    EXPECT_EQ(eval.gate(none), GateDecision::Permit);

    Metric uncal = eval.apply(Metric::uncalibrated());
    EXPECT_EQ(uncal.status, MetricStatus::Uncalibrated);
    EXPECT_EQ(eval.gate(uncal), GateDecision::Permit);
}

TEST(ThresholdTest, ApplyKeepsValue) {
    ThresholdEvaluator eval(Cutoffs{0.80, 0.90});
    Metric m = eval.apply(Metric::of(1.2));
    EXPECT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ(m.value, 1.2);
    EXPECT_EQ(m.band, RiskBand::Critical);
}

TEST(ThresholdTest, RejectsMisorderedCutoffs) {
    EXPECT_THROW(ThresholdEvaluator(Cutoffs{0.9, 0.8}), std::invalid_argument);
    EXPECT_THROW(ThresholdEvaluator(Cutoffs{12.0, 15.5}, CutoffDirection::Falling),
                 std::invalid_argument);
    EXPECT_NO_THROW(ThresholdEvaluator(Cutoffs{0.8, 0.8}));
}

TEST(ThresholdTest, GateForBand) {
    EXPECT_EQ(gate_for(RiskBand::Nominal), GateDecision::Permit);
    EXPECT_EQ(gate_for(RiskBand::Elevated), GateDecision::Warn);
    EXPECT_EQ(gate_for(RiskBand::Critical), GateDecision::Deny);
}
