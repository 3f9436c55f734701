#include "quotawatch/engine.hpp"
#include "quotawatch/aggregator.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace quotawatch {

Engine::Engine(std::shared_ptr<UsageSource> source,
               std::shared_ptr<CalibrationStore> store,
               Config config)
    : config_(std::move(config))
    , source_(std::move(source))
    , store_(std::move(store))
    , builder_(config_)
{
    if (!source_) {
        throw std::invalid_argument("Engine requires a usage source");
    }
    if (!store_) {
        store_ = std::make_shared<MemoryCalibrationStore>();
    }
    if (config_.lookback_days < 1) {
        throw std::invalid_argument("lookback_days must be at least 1");
    }
    if (!config_.clock) {
        config_.clock = [] { return LocalClock::now(); };
    }

    auto initial = std::make_shared<Published>();
    initial->snapshot = std::make_shared<const KpiSnapshot>();
    initial->records = std::make_shared<const std::vector<UsageRecord>>();
    published_ = std::move(initial);
}

Engine::~Engine() {
    stop();
}

// ==================== Dual Cadence ====================

SnapshotPtr Engine::peek() const {
    return std::atomic_load(&published_)->snapshot;
}

SnapshotPtr Engine::refresh() {
    std::unique_lock<std::mutex> lock(refresh_mutex_);

    if (refresh_in_flight_) {
        std::uint64_t ticket = refreshes_finished_;
        // Monitors run unlocked; the ticket still catches a refresh that
        // finishes in between
        lock.unlock();
        emit_event(EventType::RefreshCoalesced, "Joined the refresh in flight");
        lock.lock();
        refresh_cv_.wait(lock, [&] { return refreshes_finished_ != ticket; });
        if (last_error_) std::rethrow_exception(last_error_);
        return last_result_;
    }

    refresh_in_flight_ = true;
    lock.unlock();

    SnapshotPtr result;
    std::exception_ptr error;
    try {
        result = run_refresh();
    } catch (...) {
        // Handed to every coalesced waiter, then rethrown below
        error = std::current_exception();
    }

    lock.lock();
    refresh_in_flight_ = false;
    refreshes_finished_++;
    last_result_ = result;
    last_error_ = error;
    lock.unlock();
    refresh_cv_.notify_all();

    if (error) std::rethrow_exception(error);
    return result;
}

std::future<SnapshotPtr> Engine::refresh_async() {
    return std::async(std::launch::async, [this] { return refresh(); });
}

SnapshotPtr Engine::run_refresh() {
    auto t0 = std::chrono::steady_clock::now();
    Timestamp now = config_.clock();
    emit_event(EventType::RefreshStarted, "Refresh started via " + source_->name());

    IngestResult ingested;
    std::optional<Calibration> calibration;
    KpiSnapshot snap;
    try {
        Timestamp since = start_of_day(now) - ONE_DAY * (config_.lookback_days - 1);
        ingested = ingest(fetch_with_timeout(since), config_.rates, now);

        // One immutable calibration copy for the whole computation
        calibration = load_calibration();
        snap = builder_.build(ingested.records, calibration, now);
    } catch (const SourceUnavailableException& e) {
        if (e.timed_out()) {
            emit_event(EventType::SourceTimedOut, e.what());
        }
        emit_event(EventType::RefreshFailed, e.what());
        throw;
    } catch (const std::exception& e) {
        emit_event(EventType::RefreshFailed, e.what());
        throw;
    }

    snap.generation = ++generation_;
    snap.duplicates_dropped = ingested.duplicates_dropped;

    auto next = std::make_shared<Published>();
    next->snapshot = std::make_shared<const KpiSnapshot>(std::move(snap));
    next->records = std::make_shared<const std::vector<UsageRecord>>(std::move(ingested.records));
    SnapshotPtr published = next->snapshot;

    auto previous = std::atomic_load(&published_);
    std::atomic_store(&published_, std::shared_ptr<const Published>(std::move(next)));

    auto t1 = std::chrono::steady_clock::now();
    double us = std::chrono::duration<double, std::micro>(t1 - t0).count();

    if (ingested.duplicates_dropped > 0) {
        emit_event(EventType::RecordsDeduplicated, "Duplicate (hour, model) records replaced",
                   published->generation, std::nullopt, ingested.duplicates_dropped);
    }

    const KpiSnapshot& prior = *previous->snapshot;
    if (prior.has_data() && prior.quota.gate != published->quota.gate) {
        auto monitor = std::atomic_load(&monitor_);
        if (monitor) {
            MonitorEvent event;
            event.type = EventType::GateChanged;
            event.timestamp = config_.clock();
            event.message = "Quota gate changed";
            event.generation = published->generation;
            if (const CapUsage* cap = published->quota.binding_cap()) {
                event.cap_name = cap->name;
            }
            event.previous_gate = prior.quota.gate;
            event.gate = published->quota.gate;
            monitor->on_event(event);
        }
    }

    emit_event(EventType::RefreshCompleted, "Snapshot published", published->generation,
               std::nullopt, published->records_ingested, us);

    if (auto monitor = std::atomic_load(&monitor_)) {
        monitor->on_snapshot(*published);
    }
    return published;
}

std::vector<UsageRecord> Engine::fetch_with_timeout(Timestamp since) {
    auto timeout = config_.scheduler.source_timeout;
    if (timeout <= std::chrono::milliseconds::zero()) {
        return source_->fetch_usage(since);
    }

    // A fetch abandoned by an earlier timeout may still be inside the
    // source. The source is never entered twice.
    if (outstanding_fetch_.valid()) {
        if (outstanding_fetch_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            throw SourceUnavailableException(
                source_->name() + ": previous fetch still outstanding");
        }
        outstanding_fetch_ = std::future<std::vector<UsageRecord>>();
    }

    // The fetch runs detached so an abandoned call cannot hold up the
    // refresh; it keeps the source alive until it returns.
    auto promise = std::make_shared<std::promise<std::vector<UsageRecord>>>();
    auto future = promise->get_future();
    std::thread([source = source_, promise, since] {
        try {
            promise->set_value(source->fetch_usage(since));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) == std::future_status::timeout) {
        std::ostringstream msg;
        msg << source_->name() << " did not answer within " << timeout.count() << "ms";
        outstanding_fetch_ = std::move(future);
        throw SourceUnavailableException(msg.str(), /*timed_out=*/true);
    }

    try {
        return future.get();
    } catch (const SourceUnavailableException&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailableException(source_->name() + ": " + e.what());
    }
}

std::optional<Calibration> Engine::load_calibration() {
    std::lock_guard<std::mutex> lock(calibration_mutex_);

    std::optional<Calibration> loaded;
    try {
        loaded = store_->load();
    } catch (const CalibrationStoreException& e) {
        // Raw totals still publish; every ratio reports Uncalibrated
        emit_event(EventType::CalibrationMissing, e.what());
        return std::nullopt;
    }

    if (!loaded) {
        emit_event(EventType::CalibrationMissing, "No calibration stored");
        return std::nullopt;
    }

    try {
        validate(*loaded);
    } catch (const InvalidCalibrationException& e) {
        emit_event(EventType::CalibrationRejected, std::string("Stored record ignored: ") + e.what());
        return std::nullopt;
    }

    emit_event(EventType::CalibrationLoaded, "Calibrated " + loaded->calibrated_on);
    return loaded;
}

// ==================== Calibration ====================

void Engine::persist(Calibration& calibration) {
    // Caller must hold calibration_mutex_
    if (calibration.calibrated_on.empty()) {
        calibration.calibrated_on = format_date(config_.clock());
    }

    try {
        validate(calibration);
    } catch (const InvalidCalibrationException& e) {
        emit_event(EventType::CalibrationRejected, e.what());
        throw;
    }

    store_->save(calibration);
    emit_event(EventType::CalibrationSaved, "Calibration saved (" +
               std::to_string(calibration.caps.size()) + " caps)");
}

void Engine::calibrate(Calibration calibration) {
    std::lock_guard<std::mutex> lock(calibration_mutex_);
    persist(calibration);
}

Calibration Engine::calibrate_from_usage(const std::string& cap_name, double observed_percent) {
    if (!std::isfinite(observed_percent) || observed_percent <= 0.0) {
        throw InvalidCalibrationException("observed percent must be a positive number");
    }

    auto state = std::atomic_load(&published_);
    if (!state->snapshot->has_data()) {
        throw InvalidCalibrationException("no usage snapshot yet; refresh before calibrating");
    }

    std::lock_guard<std::mutex> lock(calibration_mutex_);

    Calibration calibration = store_->load().value_or(Calibration::defaults());
    auto index = calibration.find_cap(cap_name);
    if (!index) {
        throw UnknownCapException(cap_name);
    }
    Cap& cap = calibration.caps[*index];

    // Usage is measured against the cap definition being calibrated, so
    // an uncalibrated snapshot still yields the right window.
    TimeWindowAggregator aggregator(*state->records);
    Timestamp now = state->snapshot->computed_at;
    Timestamp start = TimeWindowAggregator::cap_week_start(now, calibration.anchor, cap);
    double used = aggregator.aggregate(start, start + ONE_WEEK,
        [&cap](const UsageRecord& r) { return cap.applies_to(r.model); }).total_cost;

    if (used <= 0.0) {
        throw InvalidCalibrationException("cap " + cap_name + " has no usage this week");
    }

    cap.weekly_limit = used / (observed_percent / 100.0);
    calibration.calibrated_on = format_date(config_.clock());

    std::ostringstream note;
    note << cap_name << " derived from " << observed_percent << "% observed";
    calibration.note = note.str();

    persist(calibration);
    return calibration;
}

std::optional<Calibration> Engine::calibration() const {
    std::lock_guard<std::mutex> lock(calibration_mutex_);
    return store_->load();
}

// ==================== Configuration ====================

void Engine::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::atomic_store(&monitor_, std::move(monitor));
}

const Config& Engine::config() const noexcept {
    return config_;
}

void Engine::start() {
    if (running_.exchange(true)) return;  // Already running

    emit_event(EventType::SchedulerStarted, "Background refresh every " +
               std::to_string(config_.scheduler.refresh_interval.count()) + "ms");
    scheduler_thread_ = std::thread([this] { scheduler_loop(); });
}

void Engine::stop() {
    if (!running_.exchange(false)) return;  // Already stopped

    {
        std::lock_guard<std::mutex> lock(scheduler_mutex_);
    }
    scheduler_cv_.notify_all();

    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    emit_event(EventType::SchedulerStopped, "Background refresh stopped");
}

bool Engine::is_running() const noexcept {
    return running_.load();
}

// ==================== Internal Helpers ====================

void Engine::scheduler_loop() {
    while (running_.load()) {
        try {
            refresh();
        } catch (const std::exception&) {
            // Already reported as RefreshFailed; the previous snapshot
            // stays current until the next cycle
        }

        std::unique_lock<std::mutex> lock(scheduler_mutex_);
        scheduler_cv_.wait_for(lock, config_.scheduler.refresh_interval,
                               [this] { return !running_.load(); });
    }
}

void Engine::emit_event(EventType type, const std::string& message,
                        std::optional<std::uint64_t> generation,
                        std::optional<std::string> cap_name,
                        std::optional<std::size_t> record_count,
                        std::optional<double> duration_us) {
    auto monitor = std::atomic_load(&monitor_);
    if (!monitor) return;

    MonitorEvent event;
    event.type = type;
    event.timestamp = config_.clock();
    event.message = message;
    event.generation = generation;
    event.cap_name = std::move(cap_name);
    event.record_count = record_count;
    event.duration_us = duration_us;

    monitor->on_event(event);
}

} // namespace quotawatch
