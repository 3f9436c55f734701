#include "quotawatch/report.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace quotawatch {

namespace {

std::string money(double v) {
    std::ostringstream os;
    os << "$" << std::fixed << std::setprecision(2) << v;
    return os.str();
}

std::string number(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}

std::string metric_text(const Metric& m) {
    if (!m.has_value()) return to_string(m.status);
    return number(m.value) + " (" + to_string(m.band) + ")";
}

void field(std::ostream& os, const std::string& key, const std::string& value) {
    os << "- " << key << ": " << value << "\n";
}

json metric_json(const Metric& m) {
    json j;
    j["status"] = to_string(m.status);
    j["value"] = m.has_value() ? json(m.value) : json(nullptr);
    j["band"] = to_string(m.band);
    return j;
}

json window_json(const WindowAggregate& w) {
    json j;
    j["start"] = format_datetime(w.start);
    j["end"] = format_datetime(w.end);
    j["cost"] = w.total_cost;
    j["records"] = w.record_count;
    j["tokens"] = {
        {"input", w.tokens.input},
        {"output", w.tokens.output},
        {"cache_write", w.tokens.cache_write},
        {"cache_read", w.tokens.cache_read}
    };
    return j;
}

json projection_json(const Projection& p) {
    json j;
    j["basis"] = window_json(p.basis);
    j["elapsed_fraction"] = p.elapsed_fraction;
    j["run_rate_per_day"] = metric_json(p.run_rate_per_day);
    j["active_days"] = p.active_days;
    j["remaining_days"] = p.remaining_days;
    j["projected_total"] = p.projected_total;
    j["low_confidence"] = p.low_confidence;
    j["band"] = to_string(p.band);
    return j;
}

json partial_json(const PartialProjection& p) {
    return {
        {"cost_so_far", p.cost_so_far},
        {"elapsed_fraction", p.elapsed_fraction},
        {"projected", metric_json(p.projected)}
    };
}

std::vector<std::string> collect_alerts(const KpiSnapshot& s) {
    std::vector<std::string> alerts;
    for (auto& cap : s.quota.caps) {
        if (cap.utilization.has_value() && cap.utilization.band != RiskBand::Nominal) {
            alerts.push_back(std::string(to_string(cap.utilization.band)) + ": " + cap.name +
                             " at " + number(100.0 * cap.utilization.value) + "% of its weekly cap");
        }
    }
    if (s.quota.projected_binding.has_value() && s.quota.projected_binding.band != RiskBand::Nominal) {
        alerts.push_back(std::string(to_string(s.quota.projected_binding.band)) +
                         ": week projected to reach " +
                         number(100.0 * s.quota.projected_binding.value) + "% of the binding cap");
    }
    if (s.efficiency_7d.has_value() && s.efficiency_7d.band != RiskBand::Nominal) {
        alerts.push_back(std::string(to_string(s.efficiency_7d.band)) +
                         ": 7-day efficiency " + number(s.efficiency_7d.value) + "x below target");
    }
    if (s.spend_ratio.has_value() && s.spend_ratio.band != RiskBand::Nominal) {
        alerts.push_back(std::string(to_string(s.spend_ratio.band)) +
                         ": week spend at " + number(100.0 * s.spend_ratio.value) + "% of baseline");
    }
    if (s.quota.dead_zone) {
        alerts.push_back("Dead zone: caps are on different weekly cycles");
    }
    return alerts;
}

} // anonymous namespace

std::string render_report(const KpiSnapshot& s) {
    std::ostringstream os;

    os << "# Usage Report " << format_date(s.computed_at) << "\n\n";
    os << "Generated " << format_datetime(s.computed_at)
       << " | snapshot " << s.generation
       << " | " << (s.calibrated ? "calibrated " + s.calibrated_on : std::string("uncalibrated"))
       << "\n\n";

    os << "## Totals\n";
    field(os, "today_cost", money(s.today.total_cost));
    field(os, "rolling_7d_cost", money(s.rolling_7d.total_cost));
    field(os, "rolling_30d_cost", money(s.rolling_30d.total_cost));
    field(os, "billing_week_cost", money(s.billing_week.total_cost));
    field(os, "next_reset", format_datetime(s.next_billing_reset));
    os << "\n";

    os << "## Quota\n";
    for (auto& cap : s.quota.caps) {
        std::string key = "cap." + cap.name;
        field(os, key + ".cost", money(cap.window.total_cost));
        field(os, key + ".limit", money(cap.limit));
        field(os, key + ".utilization", metric_text(cap.utilization));
        field(os, key + ".projected_utilization", metric_text(cap.projected_utilization));
        field(os, key + ".resets", format_datetime(cap.next_reset));
    }
    const CapUsage* binding = s.quota.binding_cap();
    field(os, "binding_cap", binding ? binding->name : std::string("none"));
    field(os, "binding_utilization", metric_text(s.quota.binding_utilization));
    field(os, "headroom", s.quota.headroom.has_value() ? money(s.quota.headroom.value)
                                                       : to_string(s.quota.headroom.status));
    field(os, "gate", to_string(s.quota.gate));
    field(os, "dead_zone", s.quota.dead_zone ? "yes" : "no");
    os << "\n";

    os << "## Efficiency\n";
    field(os, "efficiency_today", metric_text(s.efficiency_today));
    field(os, "efficiency_7d", metric_text(s.efficiency_7d));
    field(os, "spend_ratio", metric_text(s.spend_ratio));
    os << "\n";

    os << "## Projections\n";
    const Projection& week = s.week_projection;
    field(os, "week_projected_total", money(week.projected_total) +
          (week.low_confidence ? " (low confidence)" : ""));
    field(os, "week_run_rate", week.run_rate_per_day.has_value()
          ? money(week.run_rate_per_day.value) : to_string(week.run_rate_per_day.status));
    field(os, "projected_binding", metric_text(s.quota.projected_binding));
    field(os, "projected_gate", to_string(s.quota.projected_gate));
    field(os, "hour_projected", s.hour_projection.projected.has_value()
          ? money(s.hour_projection.projected.value) : to_string(s.hour_projection.projected.status));
    field(os, "day_projected", s.day_projection.projected.has_value()
          ? money(s.day_projection.projected.value) : to_string(s.day_projection.projected.status));
    field(os, "day_spend_ratio", metric_text(s.day_spend_ratio));
    os << "\n";

    os << "## Alerts\n";
    auto alerts = collect_alerts(s);
    if (alerts.empty()) {
        os << "No alerts\n";
    }
    for (auto& a : alerts) {
        os << "* " << a << "\n";
    }
    os << "\n";

    os << "## Models (7-day)\n";
    for (auto& [model, cost] : s.model_costs_7d) {
        os << "* " << model << ": " << money(cost) << "\n";
    }

    return os.str();
}

std::map<std::string, double> parse_report_fields(const std::string& report) {
    std::map<std::string, double> fields;
    std::istringstream in(report);
    std::string line;

    while (std::getline(in, line)) {
        if (line.rfind("- ", 0) != 0) continue;
        auto sep = line.find(": ", 2);
        if (sep == std::string::npos) continue;

        std::string key = line.substr(2, sep - 2);
        std::string value = line.substr(sep + 2);
        if (!value.empty() && value[0] == '$') value.erase(0, 1);
        if (value.empty()) continue;

        // Dates such as 2026-02-28 parse partially as numbers; require the
        // number to end at the value's end or at a space.
        const char* begin = value.c_str();
        char* end = nullptr;
        double v = std::strtod(begin, &end);
        if (end == begin) continue;
        if (*end != '\0' && *end != ' ') continue;

        fields[key] = v;
    }
    return fields;
}

std::string to_json(const KpiSnapshot& s, int indent) {
    json j;
    j["generation"] = s.generation;
    j["computed_at"] = format_datetime(s.computed_at);
    j["calibrated"] = s.calibrated;
    j["calibrated_on"] = s.calibrated_on;
    j["records_ingested"] = s.records_ingested;
    j["duplicates_dropped"] = s.duplicates_dropped;

    j["today"] = window_json(s.today);
    if (s.today_hourly) {
        json hours = json::array();
        for (auto& h : s.today_by_hour) {
            hours.push_back(h.total_cost);
        }
        j["today_by_hour"] = std::move(hours);
    } else {
        j["today_by_hour"] = nullptr;   // only daily totals for today
    }
    j["rolling_7d"] = window_json(s.rolling_7d);
    j["rolling_30d"] = window_json(s.rolling_30d);
    j["billing_week"] = window_json(s.billing_week);
    j["next_billing_reset"] = format_datetime(s.next_billing_reset);

    json trend = json::array();
    for (auto& d : s.daily_trend) {
        trend.push_back({
            {"date", format_date(d.date)},
            {"cost", d.cost},
            {"models", d.models},
            {"efficiency", metric_json(d.efficiency)}
        });
    }
    j["daily_trend"] = std::move(trend);

    json models = json::array();
    for (auto& [model, cost] : s.model_costs_7d) {
        models.push_back({{"model", model}, {"cost", cost}});
    }
    j["model_costs_7d"] = std::move(models);
    j["models_today"] = s.models_today;

    json caps = json::array();
    for (auto& cap : s.quota.caps) {
        caps.push_back({
            {"name", cap.name},
            {"limit", cap.limit},
            {"window", window_json(cap.window)},
            {"next_reset", format_datetime(cap.next_reset)},
            {"utilization", metric_json(cap.utilization)},
            {"projection", projection_json(cap.projection)},
            {"projected_utilization", metric_json(cap.projected_utilization)}
        });
    }
    json quota;
    quota["caps"] = std::move(caps);
    const CapUsage* binding = s.quota.binding_cap();
    quota["binding"] = binding ? json(binding->name) : json(nullptr);
    quota["binding_utilization"] = metric_json(s.quota.binding_utilization);
    quota["gate"] = to_string(s.quota.gate);
    quota["projected_binding"] = metric_json(s.quota.projected_binding);
    quota["projected_gate"] = to_string(s.quota.projected_gate);
    quota["headroom"] = metric_json(s.quota.headroom);
    quota["dead_zone"] = s.quota.dead_zone;
    j["quota"] = std::move(quota);

    j["efficiency_today"] = metric_json(s.efficiency_today);
    j["efficiency_7d"] = metric_json(s.efficiency_7d);
    j["spend_ratio"] = metric_json(s.spend_ratio);
    j["week_projection"] = projection_json(s.week_projection);
    j["hour_projection"] = partial_json(s.hour_projection);
    j["day_projection"] = partial_json(s.day_projection);
    j["day_spend_ratio"] = metric_json(s.day_spend_ratio);

    return j.dump(indent);
}

std::filesystem::path write_report(const std::filesystem::path& dir, const KpiSnapshot& snapshot) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw QuotaWatchException("cannot create report directory " + dir.string() +
                                  ": " + ec.message());
    }

    auto path = dir / ("USAGE_REPORT_" + format_date(snapshot.computed_at) + ".md");
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw QuotaWatchException("cannot write report " + path.string());
    }
    out << render_report(snapshot);
    if (!out.good()) {
        throw QuotaWatchException("short write to " + path.string());
    }
    return path;
}

} // namespace quotawatch
