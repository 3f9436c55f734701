#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace quotawatch {

// Wall-clock time in the user's local zone. Sources convert UTC stamps to
// local time on ingest, so every calendar computation downstream is plain
// arithmetic on seconds.
struct LocalClock {
    using duration   = std::chrono::seconds;
    using rep        = duration::rep;
    using period     = duration::period;
    using time_point = std::chrono::time_point<LocalClock, duration>;
    static constexpr bool is_steady = false;

    static time_point now();
};

using Timestamp = LocalClock::time_point;
using Duration = LocalClock::duration;

using Hours = std::chrono::hours;
constexpr Duration ONE_HOUR = std::chrono::hours(1);
constexpr Duration ONE_DAY  = std::chrono::hours(24);
constexpr Duration ONE_WEEK = std::chrono::hours(24 * 7);

using TokenCount = std::int64_t;

struct TokenCounts {
    TokenCount input{0};
    TokenCount output{0};
    TokenCount cache_write{0};
    TokenCount cache_read{0};

    TokenCount total() const noexcept {
        return input + output + cache_write + cache_read;
    }

    TokenCounts& operator+=(const TokenCounts& other) noexcept {
        input += other.input;
        output += other.output;
        cache_write += other.cache_write;
        cache_read += other.cache_read;
        return *this;
    }
};

inline bool operator==(const TokenCounts& a, const TokenCounts& b) noexcept {
    return a.input == b.input && a.output == b.output &&
           a.cache_write == b.cache_write && a.cache_read == b.cache_read;
}

// How finely a source knows when usage happened
enum class Resolution {
    Hour,   // stamped at the hour the usage occurred
    Day     // a whole day's total, stamped at local midnight
};

// One hour (or one day, for day-resolution sources) of usage for one
// model, as delivered by a UsageSource. cost is absent when the source
// only knows token counts.
struct UsageRecord {
    Timestamp   timestamp{};
    std::string model;
    TokenCounts tokens;
    std::optional<double> cost;
    Resolution  resolution{Resolution::Hour};

    // Hour-level breakdown of a day that day-resolution records already
    // total. Feeds the hourly view only and never counts toward windows.
    bool detail_only{false};
};

// Ordered risk bands
enum class RiskBand {
    Nominal,
    Elevated,
    Critical
};

enum class GateDecision {
    Permit,
    Warn,
    Deny
};

// Why a derived metric does or does not carry a value
enum class MetricStatus {
    Ok,
    InsufficientData,
    Uncalibrated
};

// Which side of the cutoffs is the bad side
enum class CutoffDirection {
    Rising,   // higher values are worse (utilization, spend)
    Falling   // lower values are worse (efficiency)
};

// A derived ratio. value is meaningful only when status == Ok; "no data"
// is never encoded as zero or infinity.
struct Metric {
    MetricStatus status{MetricStatus::InsufficientData};
    double value{0.0};
    RiskBand band{RiskBand::Nominal};

    bool has_value() const noexcept { return status == MetricStatus::Ok; }

    static Metric of(double v) { return Metric{MetricStatus::Ok, v, RiskBand::Nominal}; }
    static Metric insufficient_data() { return Metric{}; }
    static Metric uncalibrated() {
        return Metric{MetricStatus::Uncalibrated, 0.0, RiskBand::Nominal};
    }
};

inline const char* to_string(RiskBand b) {
    switch (b) {
        case RiskBand::Nominal:  return "Nominal";
        case RiskBand::Elevated: return "Elevated";
        case RiskBand::Critical: return "Critical";
    }
    return "Unknown";
}

inline const char* to_string(GateDecision g) {
    switch (g) {
        case GateDecision::Permit: return "Permit";
        case GateDecision::Warn:   return "Warn";
        case GateDecision::Deny:   return "Deny";
    }
    return "Unknown";
}

inline const char* to_string(MetricStatus s) {
    switch (s) {
        case MetricStatus::Ok:               return "Ok";
        case MetricStatus::InsufficientData: return "InsufficientData";
        case MetricStatus::Uncalibrated:     return "Uncalibrated";
    }
    return "Unknown";
}

inline const char* to_string(Resolution r) {
    switch (r) {
        case Resolution::Hour: return "Hour";
        case Resolution::Day:  return "Day";
    }
    return "Unknown";
}

inline const char* to_string(CutoffDirection d) {
    switch (d) {
        case CutoffDirection::Rising:  return "Rising";
        case CutoffDirection::Falling: return "Falling";
    }
    return "Unknown";
}

} // namespace quotawatch
