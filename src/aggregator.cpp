#include "quotawatch/aggregator.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace quotawatch {

namespace {

std::int64_t floor_mod(std::int64_t a, std::int64_t b) {
    std::int64_t r = a % b;
    return r < 0 ? r + b : r;
}

void check_record(const UsageRecord& r) {
    if (r.model.empty()) {
        throw SourceUnavailableException("malformed record: empty model identifier");
    }
    const TokenCounts& t = r.tokens;
    if (t.input < 0 || t.output < 0 || t.cache_write < 0 || t.cache_read < 0) {
        throw SourceUnavailableException("malformed record: negative token count for " + r.model);
    }
    if (r.cost && (!std::isfinite(*r.cost) || *r.cost < 0.0)) {
        throw SourceUnavailableException("malformed record: invalid cost for " + r.model);
    }
}

void accumulate(WindowAggregate& agg, const UsageRecord& r) {
    agg.total_cost += r.cost.value_or(0.0);
    agg.tokens += r.tokens;
    agg.record_count++;
}

} // anonymous namespace

IngestResult ingest(std::vector<UsageRecord> raw, const RateTable& rates, Timestamp now) {
    IngestResult result;

    // (hour, model, detail) -> position in result.records
    std::map<std::tuple<Timestamp::rep, std::string, bool>, std::size_t> seen;

    for (auto& r : raw) {
        check_record(r);
        r.timestamp = start_of_hour(r.timestamp);
        if (r.timestamp > now) {
            result.future_dropped++;
            continue;
        }
        if (!r.cost) {
            r.cost = rates.cost_of(r.model, r.tokens);
        }

        auto key = std::make_tuple(r.timestamp.time_since_epoch().count(), r.model, r.detail_only);
        auto it = seen.find(key);
        if (it != seen.end()) {
            // Later deliveries correct earlier ones
            result.records[it->second] = std::move(r);
            result.duplicates_dropped++;
            continue;
        }
        seen.emplace(std::move(key), result.records.size());
        result.records.push_back(std::move(r));
    }

    std::stable_sort(result.records.begin(), result.records.end(),
        [](const UsageRecord& a, const UsageRecord& b) {
            return a.timestamp < b.timestamp;
        });
    return result;
}

// ========== TimeWindowAggregator ==========

TimeWindowAggregator::TimeWindowAggregator(const std::vector<UsageRecord>& records)
    : records_(records) {}

WindowAggregate TimeWindowAggregator::aggregate(Timestamp start, Timestamp end,
                                                const RecordFilter& filter) const {
    WindowAggregate agg;
    agg.start = start;
    agg.end = end;
    for (auto& r : records_) {
        if (r.detail_only || r.timestamp < start || r.timestamp >= end) continue;
        if (filter && !filter(r)) continue;
        accumulate(agg, r);
    }
    return agg;
}

std::array<WindowAggregate, 24> TimeWindowAggregator::hourly(Timestamp day) const {
    std::array<WindowAggregate, 24> buckets{};
    Timestamp day_start = start_of_day(day);
    for (int h = 0; h < 24; ++h) {
        buckets[h].start = day_start + ONE_HOUR * h;
        buckets[h].end = buckets[h].start + ONE_HOUR;
    }
    Timestamp day_end = day_start + ONE_DAY;
    for (auto& r : records_) {
        if (r.resolution != Resolution::Hour) continue;
        if (r.timestamp < day_start || r.timestamp >= day_end) continue;
        accumulate(buckets[hour_of_day(r.timestamp)], r);
    }
    return buckets;
}

bool TimeWindowAggregator::has_hourly_detail(Timestamp day) const {
    Timestamp day_start = start_of_day(day);
    Timestamp day_end = day_start + ONE_DAY;
    bool daily_total = false;
    for (auto& r : records_) {
        if (r.timestamp < day_start || r.timestamp >= day_end) continue;
        if (r.resolution == Resolution::Hour) return true;
        daily_total = true;
    }
    return !daily_total;
}

WindowAggregate TimeWindowAggregator::rolling_days(Timestamp now, int days) const {
    Timestamp end = start_of_day(now) + ONE_DAY;
    return aggregate(end - ONE_DAY * days, end);
}

std::vector<WindowAggregate> TimeWindowAggregator::daily(Timestamp now, int days,
                                                         const RecordFilter& filter) const {
    std::vector<WindowAggregate> out;
    out.reserve(days > 0 ? static_cast<std::size_t>(days) : 0);
    Timestamp today = start_of_day(now);
    for (int i = days - 1; i >= 0; --i) {
        Timestamp start = today - ONE_DAY * i;
        out.push_back(aggregate(start, start + ONE_DAY, filter));
    }
    return out;
}

std::vector<std::pair<std::string, double>>
TimeWindowAggregator::cost_by_model(Timestamp start, Timestamp end) const {
    std::unordered_map<std::string, double> totals;
    for (auto& r : records_) {
        if (r.detail_only || r.timestamp < start || r.timestamp >= end) continue;
        totals[r.model] += r.cost.value_or(0.0);
    }
    std::vector<std::pair<std::string, double>> out(totals.begin(), totals.end());
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    return out;
}

std::vector<std::string> TimeWindowAggregator::models_in(Timestamp start, Timestamp end) const {
    std::set<std::string> models;
    for (auto& r : records_) {
        if (r.detail_only) continue;
        if (r.timestamp >= start && r.timestamp < end) models.insert(r.model);
    }
    return {models.begin(), models.end()};
}

int TimeWindowAggregator::days_with_data(Timestamp start, Timestamp end) const {
    std::set<Timestamp::rep> days;
    for (auto& r : records_) {
        if (r.detail_only || r.timestamp < start || r.timestamp >= end) continue;
        days.insert(start_of_day(r.timestamp).time_since_epoch().count());
    }
    return static_cast<int>(days.size());
}

// ==================== Week boundaries ====================

Timestamp TimeWindowAggregator::billing_week_start(Timestamp now, const BillingAnchor& anchor) {
    return aligned_period_start(now, anchor.origin(), ONE_WEEK);
}

Timestamp TimeWindowAggregator::cap_week_start(Timestamp now, const BillingAnchor& anchor,
                                               const Cap& cap) {
    if (!cap.reset_hour) {
        return billing_week_start(now, anchor);
    }
    Timestamp origin = to_timestamp(anchor.date) + ONE_HOUR * *cap.reset_hour;
    return aligned_period_start(now, origin, ONE_WEEK);
}

bool TimeWindowAggregator::in_dead_zone(Timestamp now, const BillingAnchor& anchor,
                                        const CapSet& caps) {
    // Reset offsets within the week, measured from anchor midnight
    std::vector<Duration::rep> offsets;
    for (auto& cap : caps) {
        int hours = cap.reset_hour ? *cap.reset_hour : anchor.reset_hour;
        offsets.push_back(floor_mod(hours * ONE_HOUR.count(), ONE_WEEK.count()));
    }
    std::sort(offsets.begin(), offsets.end());
    offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());
    if (offsets.size() < 2) return false;

    // The widest gap between consecutive resets is the span in which every
    // meter is on the same cycle. Everything else lies between the first
    // reset after that gap and the last one before it.
    std::size_t quiet = 0;
    Duration::rep widest = -1;
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        Duration::rep next = (i + 1 < offsets.size()) ? offsets[i + 1]
                                                      : offsets.front() + ONE_WEEK.count();
        if (next - offsets[i] > widest) {
            widest = next - offsets[i];
            quiet = i;
        }
    }

    Timestamp midnight = to_timestamp(anchor.date);
    Duration::rep position = (now - aligned_period_start(now, midnight, ONE_WEEK)).count();
    Duration::rep since_quiet = floor_mod(position - offsets[quiet], ONE_WEEK.count());
    return since_quiet >= widest;
}

} // namespace quotawatch
