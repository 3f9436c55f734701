#pragma once

#include "quotawatch/calibration.hpp"
#include "quotawatch/calibration_store.hpp"
#include "quotawatch/config.hpp"
#include "quotawatch/monitor.hpp"
#include "quotawatch/snapshot.hpp"
#include "quotawatch/snapshot_builder.hpp"
#include "quotawatch/types.hpp"
#include "quotawatch/usage_source.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace quotawatch {

using SnapshotPtr = std::shared_ptr<const KpiSnapshot>;

// Owns the dual-cadence contract: peek() is a cheap read of the last
// published snapshot, refresh() re-ingests and publishes a new one.
class Engine {
public:
    // A null store runs with an in-memory calibration store
    Engine(std::shared_ptr<UsageSource> source,
           std::shared_ptr<CalibrationStore> store,
           Config config = Config{});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ==================== Dual Cadence ====================

    // Latest complete snapshot. Never blocks on a refresh and performs no
    // I/O. Before the first successful refresh the snapshot has
    // generation 0 and no data.
    SnapshotPtr peek() const;

    // Fetches, aggregates and publishes a new snapshot. A call made while
    // another refresh is running waits for that one and returns its
    // result. Throws SourceUnavailableException on source failure or
    // timeout; the previously published snapshot stays current.
    SnapshotPtr refresh();

    std::future<SnapshotPtr> refresh_async();

    // ==================== Calibration ====================

    // Validates and persists. Throws InvalidCalibrationException without
    // touching the store when validation fails.
    void calibrate(Calibration calibration);

    // Derives one cap's weekly limit from an externally observed usage
    // percentage: limit = used / (percent / 100), where `used` is this
    // week's cost subject to the cap in the latest snapshot. Every other
    // calibration value is kept. Throws UnknownCapException when the cap
    // is not part of the current calibration.
    Calibration calibrate_from_usage(const std::string& cap_name, double observed_percent);

    // The stored calibration, if any
    std::optional<Calibration> calibration() const;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    const Config& config() const noexcept;

    // Background refresh every scheduler.refresh_interval
    void start();
    void stop();
    bool is_running() const noexcept;

private:
    struct Published {
        SnapshotPtr snapshot;
        std::shared_ptr<const std::vector<UsageRecord>> records;
    };

    Config config_;
    std::shared_ptr<UsageSource> source_;
    std::shared_ptr<CalibrationStore> store_;
    SnapshotBuilder builder_;
    std::shared_ptr<Monitor> monitor_;

    // Swapped atomically; the only state peek() and refresh() share
    std::shared_ptr<const Published> published_;

    // Refresh coalescing
    std::mutex refresh_mutex_;
    std::condition_variable refresh_cv_;
    bool refresh_in_flight_{false};
    std::uint64_t refreshes_finished_{0};
    SnapshotPtr last_result_;
    std::exception_ptr last_error_;
    std::uint64_t generation_{0};   // touched only by the in-flight refresh

    // A timed-out fetch that has not returned yet; in-flight refresh only
    std::future<std::vector<UsageRecord>> outstanding_fetch_;

    // Serializes store writes against the refresh's calibration read
    mutable std::mutex calibration_mutex_;

    // Background scheduler
    std::thread scheduler_thread_;
    std::atomic<bool> running_{false};
    std::mutex scheduler_mutex_;
    std::condition_variable scheduler_cv_;

    // Internal helpers
    SnapshotPtr run_refresh();
    std::vector<UsageRecord> fetch_with_timeout(Timestamp since);
    std::optional<Calibration> load_calibration();
    void persist(Calibration& calibration);
    void scheduler_loop();
    void emit_event(EventType type, const std::string& message,
                    std::optional<std::uint64_t> generation = std::nullopt,
                    std::optional<std::string> cap_name = std::nullopt,
                    std::optional<std::size_t> record_count = std::nullopt,
                    std::optional<double> duration_us = std::nullopt);
};

} // namespace quotawatch
