// 02_live_dashboard.cpp
//
// Dual cadence: a background scheduler refreshes from the usage source
// while a fast display loop only peeks at the last published snapshot.
//
// Scenario:
//   - A synthetic source simulates a busy afternoon of usage that grows on
//     every fetch.
//   - The scheduler refreshes every 500ms; the display reads every 100ms
//     and never blocks on I/O.
//   - A MetricsMonitor raises an alert once the binding cap passes 80%.

#include <quotawatch/quotawatch.hpp>

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <thread>

using namespace quotawatch;
using namespace std::chrono_literals;

// Emits one more hour of opus usage on every fetch
class GrowingSource : public UsageSource {
public:
    explicit GrowingSource(Timestamp start) : start_(start) {}

    std::vector<UsageRecord> fetch_usage(Timestamp since) override {
        std::lock_guard<std::mutex> lock(mutex_);
        hours_++;
        std::vector<UsageRecord> records;
        for (int h = 0; h < hours_; ++h) {
            UsageRecord r;
            r.timestamp = start_ + ONE_HOUR * h;
            if (r.timestamp < since) continue;
            r.model = (h % 3 == 0) ? "claude-sonnet-4-6" : "claude-opus-4-6";
            r.tokens.input = 400'000;
            r.tokens.output = 120'000;
            r.tokens.cache_read = 2'000'000;
            records.push_back(r);
        }
        return records;
    }

    std::string name() const override { return "growing"; }

private:
    std::mutex mutex_;
    Timestamp start_;
    int hours_ = 0;
};

int main() {
    std::cout << "=== QuotaWatch: Live Dashboard Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Configure a fast scheduler and a small calibrated cap set.
    // ----------------------------------------------------------------
    Timestamp now = start_of_hour(LocalClock::now());
    Config config;
    config.scheduler.refresh_interval = 500ms;
    config.scheduler.source_timeout = 2s;

    Calibration calibration = Calibration::defaults();
    calibration.caps[0].weekly_limit = 150.0;
    calibration.note = "demo limits";

    auto source = std::make_shared<GrowingSource>(now - ONE_HOUR * 20);
    Engine engine(source, std::make_shared<MemoryCalibrationStore>(), config);
    engine.calibrate(calibration);

    // ----------------------------------------------------------------
    // 2. Console for important events, metrics with a utilization alert.
    // ----------------------------------------------------------------
    auto metrics = std::make_shared<MetricsMonitor>();
    std::atomic<int> alerts{0};
    metrics->set_utilization_alert_threshold(0.80, [&](const std::string& msg) {
        if (alerts++ == 0) std::cout << "  ALERT: " << msg << "\n";
    });

    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);
    engine.set_monitor(composite);

    // ----------------------------------------------------------------
    // 3. Start the scheduler and run the display loop.
    // ----------------------------------------------------------------
    engine.start();

    std::cout << std::fixed << std::setprecision(2);
    std::uint64_t shown = 0;
    for (int tick = 0; tick < 40; ++tick) {
        SnapshotPtr snap = engine.peek();   // never blocks
        if (snap->generation != shown && snap->has_data()) {
            shown = snap->generation;
            const auto& q = snap->quota;
            std::cout << "[gen " << std::setw(2) << shown << "] week $"
                      << snap->billing_week.total_cost;
            if (q.binding_utilization.has_value()) {
                std::cout << "  binding " << 100.0 * q.binding_utilization.value << "%"
                          << "  gate " << to_string(q.gate);
            }
            if (snap->hour_projection.projected.has_value()) {
                std::cout << "  hour -> $" << snap->hour_projection.projected.value;
            }
            std::cout << "\n";
        }
        std::this_thread::sleep_for(100ms);
    }

    engine.stop();

    // ----------------------------------------------------------------
    // 4. Summary.
    // ----------------------------------------------------------------
    auto m = metrics->get_metrics();
    std::cout << "\n=== Metrics ===\n";
    std::cout << "Refreshes:   " << m.total_refreshes << " (" << m.completed_refreshes
              << " completed, " << m.failed_refreshes << " failed)\n";
    std::cout << "Gate changes: " << m.gate_changes << "\n";
    std::cout << "Avg refresh:  " << m.average_refresh_duration_us << " us\n";
    std::cout << "Alerts fired: " << alerts.load() << "\n";

    std::cout << "\n=== Done ===\n";
    return 0;
}
