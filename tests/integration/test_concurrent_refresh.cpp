#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace quotawatch;
using namespace std::chrono_literals;

// ===========================================================================
// GatedSource: fetches block until the test opens the gate
// ===========================================================================

class GatedSource : public UsageSource {
public:
    explicit GatedSource(std::vector<UsageRecord> records) : records_(std::move(records)) {}

    std::vector<UsageRecord> fetch_usage(Timestamp) override {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_++;
        entered_cv_.notify_all();
        open_cv_.wait(lock, [this] { return open_; });
        if (fail_) throw SourceUnavailableException("gated source failed");
        return records_;
    }

    std::string name() const override { return "gated"; }

    bool wait_until_entered(int calls, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return entered_cv_.wait_for(lock, timeout, [&] { return calls_ >= calls; });
    }

    void open(bool fail = false) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
            fail_ = fail;
        }
        open_cv_.notify_all();
    }

    int calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::condition_variable entered_cv_;
    std::condition_variable open_cv_;
    std::vector<UsageRecord> records_;
    bool open_ = false;
    bool fail_ = false;
    int calls_ = 0;
};

namespace {

UsageRecord priced(Timestamp ts, const std::string& model, double cost) {
    UsageRecord r;
    r.timestamp = ts;
    r.model = model;
    r.cost = cost;
    return r;
}

// Polls until pred holds or the deadline passes
bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // anonymous namespace

// ===========================================================================
// Test Fixture
// ===========================================================================

class ConcurrentRefreshTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = std::make_shared<GatedSource>(std::vector<UsageRecord>{
            priced(make_timestamp(2026, 2, 16, 10), "claude-opus-4-6", 120.0),
        });
        metrics = std::make_shared<MetricsMonitor>();

        config.clock = [] { return make_timestamp(2026, 2, 17, 12); };
        config.scheduler.source_timeout = 5s;
        engine = std::make_unique<Engine>(source, nullptr, config);
        engine->set_monitor(metrics);
    }

    void TearDown() override {
        source->open();
        engine.reset();
    }

    Config config;
    std::shared_ptr<GatedSource> source;
    std::shared_ptr<MetricsMonitor> metrics;
    std::unique_ptr<Engine> engine;
};

// ===========================================================================
// Coalescing
// ===========================================================================

TEST_F(ConcurrentRefreshTest, ConcurrentRefreshesShareOneFetch) {
    auto first = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(source->wait_until_entered(1));

    auto second = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(eventually([&] { return metrics->get_metrics().coalesced_refreshes == 1; }));

    source->open();
    SnapshotPtr a = first.get();
    SnapshotPtr b = second.get();

    EXPECT_EQ(a, b);
    EXPECT_EQ(a->generation, 1u);
    EXPECT_EQ(source->calls(), 1);
    EXPECT_EQ(metrics->get_metrics().total_refreshes, 1u);
}

TEST_F(ConcurrentRefreshTest, CoalescedWaitersSeeTheFailure) {
    auto first = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(source->wait_until_entered(1));

    auto second = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(eventually([&] { return metrics->get_metrics().coalesced_refreshes == 1; }));

    source->open(/*fail=*/true);
    EXPECT_THROW(first.get(), SourceUnavailableException);
    EXPECT_THROW(second.get(), SourceUnavailableException);
    EXPECT_FALSE(engine->peek()->has_data());
}

// Holds the coalescing caller inside on_event until released
class StallOnCoalesceMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        if (event.type != EventType::RefreshCoalesced) return;
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return released_; });
    }
    void on_snapshot(const KpiSnapshot&) override {}

    bool wait_until_entered() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 5s, [this] { return entered_; });
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool entered_ = false;
    bool released_ = false;
};

TEST_F(ConcurrentRefreshTest, SlowMonitorDoesNotHoldUpRefresh) {
    auto stall = std::make_shared<StallOnCoalesceMonitor>();
    engine->set_monitor(stall);

    auto first = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(source->wait_until_entered(1));
    auto second = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(stall->wait_until_entered());

    // The waiter is still inside the monitor; the refresh must finish anyway
    source->open();
    bool finished = first.wait_for(2s) == std::future_status::ready;
    stall->release();

    ASSERT_TRUE(finished);
    SnapshotPtr a = first.get();
    EXPECT_EQ(second.get(), a);
    EXPECT_EQ(source->calls(), 1);
}

TEST_F(ConcurrentRefreshTest, PeekDoesNotWaitForRefresh) {
    auto pending = std::async(std::launch::async, [&] { return engine->refresh(); });
    ASSERT_TRUE(source->wait_until_entered(1));

    auto t0 = std::chrono::steady_clock::now();
    SnapshotPtr during = engine->peek();
    auto waited = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(during->generation, 0u);
    EXPECT_LT(waited, 100ms);

    source->open();
    SnapshotPtr after = pending.get();
    EXPECT_EQ(engine->peek(), after);
}

TEST_F(ConcurrentRefreshTest, RefreshAfterCompletionFetchesAgain) {
    source->open();
    engine->refresh();
    engine->refresh();
    EXPECT_EQ(source->calls(), 2);
    EXPECT_EQ(engine->peek()->generation, 2u);
    EXPECT_EQ(metrics->get_metrics().coalesced_refreshes, 0u);
}

TEST_F(ConcurrentRefreshTest, RefreshAsyncDelivers) {
    source->open();
    auto future = engine->refresh_async();
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(future.get()->generation, 1u);
}

// ===========================================================================
// Readers during refreshes
// ===========================================================================

TEST_F(ConcurrentRefreshTest, ReadersSeeMonotonicGenerations) {
    source->open();
    std::atomic<bool> done{false};
    std::atomic<int> regressions{0};

    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            std::uint64_t last = 0;
            while (!done.load()) {
                SnapshotPtr snap = engine->peek();
                if (snap->generation < last) regressions++;
                last = snap->generation;
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        engine->refresh();
    }
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(regressions.load(), 0);
    EXPECT_EQ(engine->peek()->generation, 20u);
}

// ===========================================================================
// Background scheduler
// ===========================================================================

TEST_F(ConcurrentRefreshTest, SchedulerRefreshesUntilStopped) {
    source->open();
    Config fast = config;
    fast.scheduler.refresh_interval = 20ms;
    Engine scheduled(source, nullptr, fast);

    auto scheduler_metrics = std::make_shared<MetricsMonitor>();
    scheduled.set_monitor(scheduler_metrics);

    scheduled.start();
    EXPECT_TRUE(scheduled.is_running());
    ASSERT_TRUE(eventually([&] { return scheduled.peek()->generation >= 3; }));

    scheduled.stop();
    EXPECT_FALSE(scheduled.is_running());
    std::uint64_t settled = scheduled.peek()->generation;

    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(scheduled.peek()->generation, settled);
    EXPECT_GE(scheduler_metrics->get_metrics().completed_refreshes, 3u);
}

TEST_F(ConcurrentRefreshTest, SchedulerSurvivesSourceFailures) {
    source->open(/*fail=*/true);
    Config fast = config;
    fast.scheduler.refresh_interval = 10ms;
    Engine scheduled(source, nullptr, fast);

    auto scheduler_metrics = std::make_shared<MetricsMonitor>();
    scheduled.set_monitor(scheduler_metrics);

    scheduled.start();
    ASSERT_TRUE(eventually([&] { return scheduler_metrics->get_metrics().failed_refreshes >= 3; }));
    EXPECT_TRUE(scheduled.is_running());
    scheduled.stop();

    EXPECT_FALSE(scheduled.peek()->has_data());
}

TEST_F(ConcurrentRefreshTest, StartAndStopAreIdempotent) {
    source->open();
    Config slow = config;
    slow.scheduler.refresh_interval = 10s;
    Engine scheduled(source, nullptr, slow);

    scheduled.start();
    scheduled.start();
    EXPECT_TRUE(scheduled.is_running());

    // stop() must not wait out the interval
    auto t0 = std::chrono::steady_clock::now();
    scheduled.stop();
    scheduled.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_FALSE(scheduled.is_running());
}
