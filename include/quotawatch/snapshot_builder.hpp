#pragma once

#include "quotawatch/calibration.hpp"
#include "quotawatch/config.hpp"
#include "quotawatch/projection.hpp"
#include "quotawatch/quota_calculator.hpp"
#include "quotawatch/snapshot.hpp"

#include <optional>
#include <vector>

namespace quotawatch {

// Runs one full computation: aggregation, ratios, projections and gates.
// Pure with respect to its inputs; the Engine adds concurrency on top.
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(const Config& config);

    // `records` must already be ingested (priced, de-duplicated). Without a
    // calibration the raw totals are still produced and every ratio reports
    // Uncalibrated.
    KpiSnapshot build(const std::vector<UsageRecord>& records,
                      const std::optional<Calibration>& calibration,
                      Timestamp now) const;

private:
    QuotaCalculator calculator_;
    ProjectionEngine projection_;

    void fill_quota(KpiSnapshot& snap, const TimeWindowAggregator& aggregator,
                    const Calibration& calibration, Timestamp now) const;
};

} // namespace quotawatch
