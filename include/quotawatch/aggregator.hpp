#pragma once

#include "quotawatch/calibration.hpp"
#include "quotawatch/rate_table.hpp"
#include "quotawatch/snapshot.hpp"
#include "quotawatch/types.hpp"

#include <array>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace quotawatch {

using RecordFilter = std::function<bool(const UsageRecord&)>;

struct IngestResult {
    std::vector<UsageRecord> records;   // every record carries a cost
    std::size_t duplicates_dropped{0};
    std::size_t future_dropped{0};
};

// Validates raw source output, truncates stamps to the hour, prices records
// that lack a cost, drops records stamped after `now` and de-duplicates by
// (hour, model) keeping the last occurrence. Hour detail and totals are
// de-duplicated separately. Throws
// SourceUnavailableException on malformed records.
IngestResult ingest(std::vector<UsageRecord> raw, const RateTable& rates, Timestamp now);

// Rolls priced records into calendar-aligned windows. Every call is a full
// recompute over the records it is given. detail_only records are seen by
// hourly() alone.
class TimeWindowAggregator {
public:
    explicit TimeWindowAggregator(const std::vector<UsageRecord>& records);

    WindowAggregate aggregate(Timestamp start, Timestamp end,
                              const RecordFilter& filter = {}) const;

    // Local hours 0..23 of the day containing `day`; all 24 always present.
    // Built from hour-resolution records only, detail included.
    std::array<WindowAggregate, 24> hourly(Timestamp day) const;

    // False when the day is known only as day-resolution totals
    bool has_hourly_detail(Timestamp day) const;

    // `days` calendar days ending with the day containing `now`
    WindowAggregate rolling_days(Timestamp now, int days) const;

    // One aggregate per calendar day, oldest first
    std::vector<WindowAggregate> daily(Timestamp now, int days,
                                       const RecordFilter& filter = {}) const;

    // Cost per model in [start, end), costliest first
    std::vector<std::pair<std::string, double>> cost_by_model(Timestamp start,
                                                              Timestamp end) const;
    std::vector<std::string> models_in(Timestamp start, Timestamp end) const;

    // Number of calendar days in [start, end) with at least one record
    int days_with_data(Timestamp start, Timestamp end) const;

    // ==================== Week boundaries ====================

    // Most recent anchor weekday at the reset hour that is <= now
    static Timestamp billing_week_start(Timestamp now, const BillingAnchor& anchor);

    // Start of the cap's current week. Cap reset hours count from midnight
    // of the anchor weekday and may run past it (26 = 02:00 the next day).
    static Timestamp cap_week_start(Timestamp now, const BillingAnchor& anchor, const Cap& cap);

    // True while caps disagree about which weekly cycle is current, i.e.
    // one meter has reset and another has not yet.
    static bool in_dead_zone(Timestamp now, const BillingAnchor& anchor, const CapSet& caps);

private:
    const std::vector<UsageRecord>& records_;
};

} // namespace quotawatch
