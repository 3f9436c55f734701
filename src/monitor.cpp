#include "quotawatch/monitor.hpp"
#include "quotawatch/calendar.hpp"

#include <iomanip>
#include <iostream>

namespace quotawatch {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::RefreshStarted:      return "RefreshStarted";
        case EventType::RefreshCompleted:    return "RefreshCompleted";
        case EventType::RefreshFailed:       return "RefreshFailed";
        case EventType::RefreshCoalesced:    return "RefreshCoalesced";
        case EventType::SourceTimedOut:      return "SourceTimedOut";
        case EventType::RecordsDeduplicated: return "RecordsDeduplicated";
        case EventType::CalibrationLoaded:   return "CalibrationLoaded";
        case EventType::CalibrationMissing:  return "CalibrationMissing";
        case EventType::CalibrationSaved:    return "CalibrationSaved";
        case EventType::CalibrationRejected: return "CalibrationRejected";
        case EventType::GateChanged:         return "GateChanged";
        case EventType::SchedulerStarted:    return "SchedulerStarted";
        case EventType::SchedulerStopped:    return "SchedulerStopped";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::RefreshFailed:
        case EventType::SourceTimedOut:
        case EventType::CalibrationMissing:
        case EventType::CalibrationSaved:
        case EventType::CalibrationRejected:
        case EventType::GateChanged:
        case EventType::SchedulerStarted:
        case EventType::SchedulerStopped:
            return true;
        default:
            return false;
    }
}

void print_metric(std::ostream& os, const char* label, const Metric& m) {
    os << "  " << label << ": ";
    if (m.has_value()) {
        os << std::fixed << std::setprecision(2) << m.value << " (" << to_string(m.band) << ")";
    } else {
        os << to_string(m.status);
    }
    os << "\n";
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[QuotaWatch] " << to_string(event.type);

    if (event.generation.has_value()) {
        std::cout << " generation=" << event.generation.value();
    }
    if (event.cap_name.has_value()) {
        std::cout << " cap=" << event.cap_name.value();
    }
    if (event.record_count.has_value()) {
        std::cout << " records=" << event.record_count.value();
    }
    if (event.previous_gate.has_value()) {
        std::cout << " from=" << to_string(event.previous_gate.value());
    }
    if (event.gate.has_value()) {
        std::cout << " gate=" << to_string(event.gate.value());
    }
    if (verbosity_ == Verbosity::Debug && event.duration_us.has_value()) {
        std::cout << " duration_us=" << std::fixed << std::setprecision(0)
                  << event.duration_us.value();
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const KpiSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[QuotaWatch] === Snapshot " << snapshot.generation << " ===\n";
    std::cout << "  Computed: " << format_datetime(snapshot.computed_at) << "\n";
    std::cout << "  Calibrated: " << (snapshot.calibrated ? "YES" : "NO") << "\n";
    std::cout << "  Records: " << snapshot.records_ingested << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Today: $" << snapshot.today.total_cost << "\n";
    std::cout << "  Week:  $" << snapshot.billing_week.total_cost << "\n";

    for (auto& cap : snapshot.quota.caps) {
        std::cout << "    [" << cap.name << "] used=$" << cap.window.total_cost
                  << " limit=$" << cap.limit;
        if (cap.utilization.has_value()) {
            std::cout << " util=" << std::setprecision(1)
                      << 100.0 * cap.utilization.value << "%" << std::setprecision(2);
        }
        std::cout << "\n";
    }
    print_metric(std::cout, "Binding", snapshot.quota.binding_utilization);
    print_metric(std::cout, "Efficiency 7d", snapshot.efficiency_7d);
    std::cout << "  Gate: " << to_string(snapshot.quota.gate) << "\n";
    std::cout << "  ========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    switch (event.type) {
        case EventType::RefreshStarted:
            metrics_.total_refreshes++;
            break;
        case EventType::RefreshCompleted:
            metrics_.completed_refreshes++;
            if (event.duration_us.has_value()) {
                duration_sample_count_++;
                duration_sum_us_ += event.duration_us.value();
                metrics_.average_refresh_duration_us =
                    duration_sum_us_ / static_cast<double>(duration_sample_count_);
            }
            break;
        case EventType::RefreshFailed:
            metrics_.failed_refreshes++;
            break;
        case EventType::SourceTimedOut:
            metrics_.timed_out_refreshes++;
            break;
        case EventType::RefreshCoalesced:
            metrics_.coalesced_refreshes++;
            break;
        case EventType::RecordsDeduplicated:
            metrics_.duplicates_dropped += event.record_count.value_or(0);
            break;
        case EventType::GateChanged:
            metrics_.gate_changes++;
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const KpiSnapshot& snapshot) {
    AlertCallback cb;
    std::string alert;
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.last_generation = snapshot.generation;

        const Metric& binding = snapshot.quota.binding_utilization;
        metrics_.binding_utilization = binding.has_value() ? binding.value : 0.0;

        if (utilization_cb_ && binding.has_value() && binding.value > utilization_threshold_) {
            const CapUsage* cap = snapshot.quota.binding_cap();
            cb = utilization_cb_;
            alert = "Binding cap " + (cap ? cap->name : std::string("?")) +
                    " at " + std::to_string(100.0 * binding.value) +
                    "% exceeds threshold";
        }
    }

    // Outside the lock so the callback may query get_metrics()
    if (cb) cb(alert);
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
    duration_sample_count_ = 0;
    duration_sum_us_ = 0.0;
}

void MetricsMonitor::set_utilization_alert_threshold(double threshold, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    utilization_threshold_ = threshold;
    utilization_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const KpiSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace quotawatch
