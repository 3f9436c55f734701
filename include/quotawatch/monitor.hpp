#pragma once

#include "quotawatch/snapshot.hpp"
#include "quotawatch/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quotawatch {

enum class EventType {
    RefreshStarted,
    RefreshCompleted,
    RefreshFailed,
    RefreshCoalesced,
    SourceTimedOut,
    RecordsDeduplicated,
    // Calibration events
    CalibrationLoaded,
    CalibrationMissing,
    CalibrationSaved,
    CalibrationRejected,
    // Gate transitions between published snapshots
    GateChanged,
    // Background scheduler
    SchedulerStarted,
    SchedulerStopped
};

const char* to_string(EventType t);

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<std::uint64_t> generation;
    std::optional<std::string> cap_name;
    std::optional<std::size_t> record_count;
    std::optional<GateDecision> gate;
    std::optional<GateDecision> previous_gate;

    // Refresh duration in microseconds
    std::optional<double> duration_us;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const KpiSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const KpiSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t total_refreshes{0};
        std::uint64_t completed_refreshes{0};
        std::uint64_t failed_refreshes{0};
        std::uint64_t timed_out_refreshes{0};
        std::uint64_t coalesced_refreshes{0};
        std::uint64_t duplicates_dropped{0};
        std::uint64_t gate_changes{0};
        double average_refresh_duration_us{0.0};
        double binding_utilization{0.0};
        std::uint64_t last_generation{0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const KpiSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires on every snapshot whose binding utilization exceeds threshold
    void set_utilization_alert_threshold(double threshold, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double utilization_threshold_{0.0};
    AlertCallback utilization_cb_;

    std::uint64_t duration_sample_count_{0};
    double duration_sum_us_{0.0};
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const KpiSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

} // namespace quotawatch
