#pragma once

#include "quotawatch/calendar.hpp"
#include "quotawatch/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quotawatch {

constexpr int HOURS_PER_WEEK = 24 * 7;

// One weekly quota ceiling. An empty model_prefix makes the cap apply to
// every record; otherwise only records whose model starts with the prefix
// count against it.
struct Cap {
    std::string name;
    double weekly_limit{0.0};
    std::string model_prefix;

    // Hours after midnight of the anchor weekday (0..167). Unset means the
    // cap resets with the billing week.
    std::optional<int> reset_hour;

    bool applies_to(const std::string& model) const {
        return model_prefix.empty() ||
               model.compare(0, model_prefix.size(), model_prefix) == 0;
    }
};

using CapSet = std::vector<Cap>;

struct Baseline {
    double target_ratio{15.5};
    double floor_ratio{12.0};
    double plan_monthly_cost{100.0};
    double weekly_spend_baseline{55.0};
    std::optional<double> daily_spend_baseline;   // weekly / 7 when unset

    double plan_daily_cost() const noexcept { return plan_monthly_cost / 30.0; }
    double daily_spend() const noexcept {
        return daily_spend_baseline.value_or(weekly_spend_baseline / 7.0);
    }
};

// The anchor date fixes the weekday on which billing weeks begin
struct BillingAnchor {
    CivilDate date{2026, 2, 7};
    int reset_hour{0};   // 0..23

    Timestamp origin() const { return to_timestamp(date, reset_hour); }
    Weekday day_of_week() const { return weekday(date); }
};

struct Calibration {
    CapSet caps;
    Baseline baseline;
    BillingAnchor anchor;
    std::string calibrated_on;
    std::string note;

    // Index of the named cap, if present
    std::optional<std::size_t> find_cap(const std::string& name) const;

    // Two caps (all-models, sonnet-only) on a Saturday anchor with the
    // sonnet meter resetting 14 hours after the all-models one.
    static Calibration defaults();
};

// Throws InvalidCalibrationException describing the first violation.
void validate(const Calibration& calibration);

} // namespace quotawatch
