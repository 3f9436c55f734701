#include "quotawatch/calibration.hpp"
#include "quotawatch/exceptions.hpp"

#include <cmath>
#include <unordered_set>

namespace quotawatch {

std::optional<std::size_t> Calibration::find_cap(const std::string& name) const {
    for (std::size_t i = 0; i < caps.size(); ++i) {
        if (caps[i].name == name) return i;
    }
    return std::nullopt;
}

Calibration Calibration::defaults() {
    Calibration c;
    c.anchor.date = CivilDate{2026, 2, 7};
    c.anchor.reset_hour = 12;

    Cap all_models;
    all_models.name = "all-models";
    all_models.weekly_limit = 607.0;
    all_models.reset_hour = 12;
    c.caps.push_back(all_models);

    Cap sonnet;
    sonnet.name = "sonnet-only";
    sonnet.weekly_limit = 789.0;
    sonnet.model_prefix = "claude-sonnet";
    sonnet.reset_hour = 26;
    c.caps.push_back(sonnet);

    return c;
}

void validate(const Calibration& calibration) {
    if (calibration.caps.empty()) {
        throw InvalidCalibrationException("at least one cap is required");
    }

    std::unordered_set<std::string> names;
    for (auto& cap : calibration.caps) {
        if (cap.name.empty()) {
            throw InvalidCalibrationException("cap name must not be empty");
        }
        if (!names.insert(cap.name).second) {
            throw InvalidCalibrationException("duplicate cap name '" + cap.name + "'");
        }
        if (!std::isfinite(cap.weekly_limit) || cap.weekly_limit <= 0.0) {
            throw InvalidCalibrationException("cap '" + cap.name +
                                              "' must have a positive weekly limit");
        }
        if (cap.reset_hour && (*cap.reset_hour < 0 || *cap.reset_hour >= HOURS_PER_WEEK)) {
            throw InvalidCalibrationException("cap '" + cap.name + "' reset hour " +
                                              std::to_string(*cap.reset_hour) +
                                              " is outside 0.." +
                                              std::to_string(HOURS_PER_WEEK - 1));
        }
    }

    const auto& anchor = calibration.anchor;
    if (anchor.reset_hour < 0 || anchor.reset_hour > 23) {
        throw InvalidCalibrationException("billing reset hour " +
                                          std::to_string(anchor.reset_hour) +
                                          " is outside 0..23");
    }
    if (!parse_date(format_date(anchor.date)).has_value()) {
        throw InvalidCalibrationException("anchor date " + format_date(anchor.date) +
                                          " is not a calendar date");
    }

    const auto& b = calibration.baseline;
    if (!std::isfinite(b.plan_monthly_cost) || b.plan_monthly_cost <= 0.0) {
        throw InvalidCalibrationException("plan cost must be positive");
    }
    if (!std::isfinite(b.target_ratio) || !std::isfinite(b.floor_ratio) ||
        b.floor_ratio < 0.0 || b.floor_ratio > b.target_ratio) {
        throw InvalidCalibrationException("efficiency floor must lie between 0 and the target");
    }
    if (!std::isfinite(b.weekly_spend_baseline) || b.weekly_spend_baseline <= 0.0) {
        throw InvalidCalibrationException("weekly spend baseline must be positive");
    }
    if (b.daily_spend_baseline &&
        (!std::isfinite(*b.daily_spend_baseline) || *b.daily_spend_baseline <= 0.0)) {
        throw InvalidCalibrationException("daily spend baseline must be positive");
    }
}

} // namespace quotawatch
