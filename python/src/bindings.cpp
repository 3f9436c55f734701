#include "bind_forward.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>
#include <pybind11/functional.h>

#include <quotawatch/quotawatch.hpp>

using namespace quotawatch;

namespace {

// Timestamps cross into Python as local-time seconds since the epoch
std::int64_t seconds_of(Timestamp ts) {
    return ts.time_since_epoch().count();
}

Timestamp timestamp_of(std::int64_t seconds) {
    return Timestamp(Duration(seconds));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Module entry point
// ---------------------------------------------------------------------------
PYBIND11_MODULE(_quotawatch, m) {
    m.doc() = "QuotaWatch: usage KPIs, quota gates and projections for LLM plans";

    bind_enums_and_structs(m);
    bind_exceptions(m);
    bind_calibration(m);
    bind_sources(m);
    bind_monitors(m);
    bind_core(m);
}

// ---------------------------------------------------------------------------
// Enums & structs
// ---------------------------------------------------------------------------
void bind_enums_and_structs(py::module_& m) {

    // ---- Enums ------------------------------------------------------------

    py::enum_<RiskBand>(m, "RiskBand")
        .value("Nominal",  RiskBand::Nominal)
        .value("Elevated", RiskBand::Elevated)
        .value("Critical", RiskBand::Critical)
        .export_values();

    py::enum_<GateDecision>(m, "GateDecision")
        .value("Permit", GateDecision::Permit)
        .value("Warn",   GateDecision::Warn)
        .value("Deny",   GateDecision::Deny)
        .export_values();

    py::enum_<MetricStatus>(m, "MetricStatus")
        .value("Ok",               MetricStatus::Ok)
        .value("InsufficientData", MetricStatus::InsufficientData)
        .value("Uncalibrated",     MetricStatus::Uncalibrated)
        .export_values();

    py::enum_<CutoffDirection>(m, "CutoffDirection")
        .value("Rising",  CutoffDirection::Rising)
        .value("Falling", CutoffDirection::Falling)
        .export_values();

    py::enum_<Resolution>(m, "Resolution")
        .value("Hour", Resolution::Hour)
        .value("Day",  Resolution::Day)
        .export_values();

    py::enum_<Weekday>(m, "Weekday")
        .value("Sunday",    Weekday::Sunday)
        .value("Monday",    Weekday::Monday)
        .value("Tuesday",   Weekday::Tuesday)
        .value("Wednesday", Weekday::Wednesday)
        .value("Thursday",  Weekday::Thursday)
        .value("Friday",    Weekday::Friday)
        .value("Saturday",  Weekday::Saturday)
        .export_values();

    py::enum_<EventType>(m, "EventType")
        .value("RefreshStarted",      EventType::RefreshStarted)
        .value("RefreshCompleted",    EventType::RefreshCompleted)
        .value("RefreshFailed",       EventType::RefreshFailed)
        .value("RefreshCoalesced",    EventType::RefreshCoalesced)
        .value("SourceTimedOut",      EventType::SourceTimedOut)
        .value("RecordsDeduplicated", EventType::RecordsDeduplicated)
        .value("CalibrationLoaded",   EventType::CalibrationLoaded)
        .value("CalibrationMissing",  EventType::CalibrationMissing)
        .value("CalibrationSaved",    EventType::CalibrationSaved)
        .value("CalibrationRejected", EventType::CalibrationRejected)
        .value("GateChanged",         EventType::GateChanged)
        .value("SchedulerStarted",    EventType::SchedulerStarted)
        .value("SchedulerStopped",    EventType::SchedulerStopped)
        .export_values();

    py::enum_<ConsoleMonitor::Verbosity>(m, "Verbosity")
        .value("Quiet",   ConsoleMonitor::Verbosity::Quiet)
        .value("Normal",  ConsoleMonitor::Verbosity::Normal)
        .value("Verbose", ConsoleMonitor::Verbosity::Verbose)
        .value("Debug",   ConsoleMonitor::Verbosity::Debug)
        .export_values();

    // ---- Time helpers -----------------------------------------------------

    m.def("make_timestamp",
          [](int y, int mo, int d, int h, int mi, int s) {
              return seconds_of(make_timestamp(y, mo, d, h, mi, s));
          },
          py::arg("year"), py::arg("month"), py::arg("day"),
          py::arg("hour") = 0, py::arg("minute") = 0, py::arg("second") = 0);
    m.def("now", [] { return seconds_of(LocalClock::now()); });
    m.def("format_datetime", [](std::int64_t ts) { return format_datetime(timestamp_of(ts)); },
          py::arg("timestamp"));

    // ---- Structs ----------------------------------------------------------

    // CivilDate
    py::class_<CivilDate>(m, "CivilDate")
        .def(py::init<>())
        .def(py::init([](int y, int mo, int d) { return CivilDate{y, mo, d}; }),
             py::arg("year"), py::arg("month"), py::arg("day"))
        .def_readwrite("year",  &CivilDate::year)
        .def_readwrite("month", &CivilDate::month)
        .def_readwrite("day",   &CivilDate::day)
        .def("__repr__", [](const CivilDate& d) { return format_date(d); });

    // TokenCounts
    py::class_<TokenCounts>(m, "TokenCounts")
        .def(py::init<>())
        .def_readwrite("input",       &TokenCounts::input)
        .def_readwrite("output",      &TokenCounts::output)
        .def_readwrite("cache_write", &TokenCounts::cache_write)
        .def_readwrite("cache_read",  &TokenCounts::cache_read)
        .def("total", &TokenCounts::total);

    // UsageRecord
    py::class_<UsageRecord>(m, "UsageRecord")
        .def(py::init<>())
        .def_property("timestamp",
            [](const UsageRecord& r) { return seconds_of(r.timestamp); },
            [](UsageRecord& r, std::int64_t ts) { r.timestamp = timestamp_of(ts); })
        .def_readwrite("model",  &UsageRecord::model)
        .def_readwrite("tokens", &UsageRecord::tokens)
        .def_readwrite("cost",   &UsageRecord::cost)
        .def_readwrite("resolution",  &UsageRecord::resolution)
        .def_readwrite("detail_only", &UsageRecord::detail_only);

    // Metric
    py::class_<Metric>(m, "Metric")
        .def(py::init<>())
        .def_readwrite("status", &Metric::status)
        .def_readwrite("value",  &Metric::value)
        .def_readwrite("band",   &Metric::band)
        .def("has_value", &Metric::has_value)
        .def("__repr__", [](const Metric& metric) {
            if (!metric.has_value()) return std::string("<Metric ") + to_string(metric.status) + ">";
            return "<Metric " + std::to_string(metric.value) + " " + to_string(metric.band) + ">";
        });

    // Cutoffs / ThresholdConfig / ProjectionConfig / SchedulerConfig
    py::class_<Cutoffs>(m, "Cutoffs")
        .def(py::init([](double warn, double abort) { return Cutoffs{warn, abort}; }),
             py::arg("warn"), py::arg("abort"))
        .def_readwrite("warn",  &Cutoffs::warn)
        .def_readwrite("abort", &Cutoffs::abort);

    py::class_<ThresholdConfig>(m, "ThresholdConfig")
        .def(py::init<>())
        .def_readwrite("quota",      &ThresholdConfig::quota)
        .def_readwrite("projection", &ThresholdConfig::projection)
        .def_readwrite("spend",      &ThresholdConfig::spend);

    py::class_<ProjectionConfig>(m, "ProjectionConfig")
        .def(py::init<>())
        .def_readwrite("run_rate_days",        &ProjectionConfig::run_rate_days)
        .def_readwrite("min_elapsed_fraction", &ProjectionConfig::min_elapsed_fraction);

    py::class_<SchedulerConfig>(m, "SchedulerConfig")
        .def(py::init<>())
        .def_readwrite("refresh_interval", &SchedulerConfig::refresh_interval)
        .def_readwrite("source_timeout",   &SchedulerConfig::source_timeout);

    // Config (top-level, embeds the sub-configs)
    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_readwrite("lookback_days",     &Config::lookback_days)
        .def_readwrite("scheduled_reserve", &Config::scheduled_reserve)
        .def_readwrite("thresholds",        &Config::thresholds)
        .def_readwrite("projection",        &Config::projection)
        .def_readwrite("scheduler",         &Config::scheduler)
        .def("pin_clock", [](Config& c, std::int64_t ts) {
                 Timestamp fixed = timestamp_of(ts);
                 c.clock = [fixed] { return fixed; };
             },
             py::arg("timestamp"),
             "Freeze \"now\" at a local timestamp (seconds).");

    // MonitorEvent
    py::class_<MonitorEvent>(m, "MonitorEvent")
        .def(py::init<>())
        .def_readwrite("type",          &MonitorEvent::type)
        .def_property_readonly("timestamp",
            [](const MonitorEvent& e) { return seconds_of(e.timestamp); })
        .def_readwrite("message",       &MonitorEvent::message)
        .def_readwrite("generation",    &MonitorEvent::generation)
        .def_readwrite("cap_name",      &MonitorEvent::cap_name)
        .def_readwrite("record_count",  &MonitorEvent::record_count)
        .def_readwrite("gate",          &MonitorEvent::gate)
        .def_readwrite("previous_gate", &MonitorEvent::previous_gate)
        .def_readwrite("duration_us",   &MonitorEvent::duration_us);

    // WindowAggregate
    py::class_<WindowAggregate>(m, "WindowAggregate")
        .def(py::init<>())
        .def_property_readonly("start", [](const WindowAggregate& w) { return seconds_of(w.start); })
        .def_property_readonly("end",   [](const WindowAggregate& w) { return seconds_of(w.end); })
        .def_readonly("total_cost",   &WindowAggregate::total_cost)
        .def_readonly("tokens",       &WindowAggregate::tokens)
        .def_readonly("record_count", &WindowAggregate::record_count)
        .def("empty", &WindowAggregate::empty);

    // DailyPoint
    py::class_<DailyPoint>(m, "DailyPoint")
        .def_readonly("date",       &DailyPoint::date)
        .def_readonly("cost",       &DailyPoint::cost)
        .def_readonly("tokens",     &DailyPoint::tokens)
        .def_readonly("models",     &DailyPoint::models)
        .def_readonly("efficiency", &DailyPoint::efficiency);

    // Projection / PartialProjection
    py::class_<Projection>(m, "Projection")
        .def_readonly("basis",            &Projection::basis)
        .def_readonly("elapsed_fraction", &Projection::elapsed_fraction)
        .def_readonly("run_rate_per_day", &Projection::run_rate_per_day)
        .def_readonly("active_days",      &Projection::active_days)
        .def_readonly("remaining_days",   &Projection::remaining_days)
        .def_readonly("projected_total",  &Projection::projected_total)
        .def_readonly("low_confidence",   &Projection::low_confidence)
        .def_readonly("band",             &Projection::band);

    py::class_<PartialProjection>(m, "PartialProjection")
        .def_readonly("cost_so_far",      &PartialProjection::cost_so_far)
        .def_readonly("elapsed_fraction", &PartialProjection::elapsed_fraction)
        .def_readonly("projected",        &PartialProjection::projected);

    // CapUsage / QuotaSummary
    py::class_<CapUsage>(m, "CapUsage")
        .def_readonly("name",   &CapUsage::name)
        .def_readonly("limit",  &CapUsage::limit)
        .def_readonly("window", &CapUsage::window)
        .def_property_readonly("next_reset", [](const CapUsage& c) { return seconds_of(c.next_reset); })
        .def_readonly("utilization",           &CapUsage::utilization)
        .def_readonly("projection",            &CapUsage::projection)
        .def_readonly("projected_utilization", &CapUsage::projected_utilization);

    py::class_<QuotaSummary>(m, "QuotaSummary")
        .def_readonly("caps",                &QuotaSummary::caps)
        .def_readonly("binding",             &QuotaSummary::binding)
        .def_readonly("binding_utilization", &QuotaSummary::binding_utilization)
        .def_readonly("gate",                &QuotaSummary::gate)
        .def_readonly("projected_binding",   &QuotaSummary::projected_binding)
        .def_readonly("projected_gate",      &QuotaSummary::projected_gate)
        .def_readonly("headroom",            &QuotaSummary::headroom)
        .def_readonly("dead_zone",           &QuotaSummary::dead_zone);

    // KpiSnapshot
    py::class_<KpiSnapshot, std::shared_ptr<KpiSnapshot>>(m, "KpiSnapshot")
        .def_readonly("generation", &KpiSnapshot::generation)
        .def_property_readonly("computed_at", [](const KpiSnapshot& s) { return seconds_of(s.computed_at); })
        .def_readonly("calibrated",         &KpiSnapshot::calibrated)
        .def_readonly("calibrated_on",      &KpiSnapshot::calibrated_on)
        .def_readonly("records_ingested",   &KpiSnapshot::records_ingested)
        .def_readonly("duplicates_dropped", &KpiSnapshot::duplicates_dropped)
        .def_readonly("today",              &KpiSnapshot::today)
        .def_readonly("today_by_hour",      &KpiSnapshot::today_by_hour)
        .def_readonly("today_hourly",       &KpiSnapshot::today_hourly)
        .def_readonly("rolling_7d",         &KpiSnapshot::rolling_7d)
        .def_readonly("rolling_30d",        &KpiSnapshot::rolling_30d)
        .def_readonly("billing_week",       &KpiSnapshot::billing_week)
        .def_property_readonly("next_billing_reset",
            [](const KpiSnapshot& s) { return seconds_of(s.next_billing_reset); })
        .def_readonly("daily_trend",        &KpiSnapshot::daily_trend)
        .def_readonly("model_costs_7d",     &KpiSnapshot::model_costs_7d)
        .def_readonly("models_today",       &KpiSnapshot::models_today)
        .def_readonly("quota",              &KpiSnapshot::quota)
        .def_readonly("efficiency_today",   &KpiSnapshot::efficiency_today)
        .def_readonly("efficiency_7d",      &KpiSnapshot::efficiency_7d)
        .def_readonly("spend_ratio",        &KpiSnapshot::spend_ratio)
        .def_readonly("week_projection",    &KpiSnapshot::week_projection)
        .def_readonly("hour_projection",    &KpiSnapshot::hour_projection)
        .def_readonly("day_projection",     &KpiSnapshot::day_projection)
        .def_readonly("day_spend_ratio",    &KpiSnapshot::day_spend_ratio)
        .def("has_data", &KpiSnapshot::has_data)
        .def("__repr__", [](const KpiSnapshot& s) {
            return "<KpiSnapshot generation=" + std::to_string(s.generation)
                 + " gate=" + std::string(to_string(s.quota.gate)) + ">";
        });

    // MetricsMonitor::Metrics (bound as module-level "Metrics")
    py::class_<MetricsMonitor::Metrics>(m, "Metrics")
        .def(py::init<>())
        .def_readwrite("total_refreshes",             &MetricsMonitor::Metrics::total_refreshes)
        .def_readwrite("completed_refreshes",         &MetricsMonitor::Metrics::completed_refreshes)
        .def_readwrite("failed_refreshes",            &MetricsMonitor::Metrics::failed_refreshes)
        .def_readwrite("timed_out_refreshes",         &MetricsMonitor::Metrics::timed_out_refreshes)
        .def_readwrite("coalesced_refreshes",         &MetricsMonitor::Metrics::coalesced_refreshes)
        .def_readwrite("duplicates_dropped",          &MetricsMonitor::Metrics::duplicates_dropped)
        .def_readwrite("gate_changes",                &MetricsMonitor::Metrics::gate_changes)
        .def_readwrite("average_refresh_duration_us", &MetricsMonitor::Metrics::average_refresh_duration_us)
        .def_readwrite("binding_utilization",         &MetricsMonitor::Metrics::binding_utilization)
        .def_readwrite("last_generation",             &MetricsMonitor::Metrics::last_generation);
}

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------
void bind_exceptions(py::module_& m) {
    // Base exception -> RuntimeError
    static auto py_QuotaWatchError =
        py::register_exception<QuotaWatchException>(m, "QuotaWatchError", PyExc_RuntimeError);

    // Derived from QuotaWatchError
    static auto py_SourceUnavailableError =
        py::register_exception<SourceUnavailableException>(m, "SourceUnavailableError", py_QuotaWatchError.ptr());
    static auto py_InvalidCalibrationError =
        py::register_exception<InvalidCalibrationException>(m, "InvalidCalibrationError", py_QuotaWatchError.ptr());
    static auto py_CalibrationStoreError =
        py::register_exception<CalibrationStoreException>(m, "CalibrationStoreError", py_QuotaWatchError.ptr());
    static auto py_UnknownCapError =
        py::register_exception<UnknownCapException>(m, "UnknownCapError", py_QuotaWatchError.ptr());
}
