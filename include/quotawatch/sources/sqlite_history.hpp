#pragma once

#include "quotawatch/snapshot.hpp"
#include "quotawatch/usage_source.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace quotawatch::sources {

// One row of the efficiency_daily table
struct HistoryRow {
    std::string date;                      // YYYY-MM-DD
    double cost{0.0};
    double plan_prorata{0.0};
    std::optional<double> efficiency_ratio;
    TokenCounts tokens;
    std::vector<std::string> models;
    std::optional<double> week_budget_fraction;
    std::string recorded_at;
};

// Daily rollups persisted in SQLite. Serves as a fallback record source for
// days no finer-grained source covers, and records each refresh's daily
// trend so history survives transcript rotation.
//
// As a source, each row becomes one record stamped at local midnight. A row
// that names exactly one model is attributed to it; otherwise the record
// carries the model "mixed".
class SqliteHistorySource : public UsageSource {
public:
    explicit SqliteHistorySource(std::filesystem::path db_path);
    ~SqliteHistorySource() override;

    SqliteHistorySource(const SqliteHistorySource&) = delete;
    SqliteHistorySource& operator=(const SqliteHistorySource&) = delete;

    std::vector<UsageRecord> fetch_usage(Timestamp since) override;
    std::string name() const override;

    // Rows dated on or after `since_date` (YYYY-MM-DD), oldest first
    std::vector<HistoryRow> read_rows(const std::string& since_date);

    // INSERT OR REPLACE keyed by date
    void upsert(const HistoryRow& row);

    // Writes the snapshot's daily trend and stamps the billing-week rows
    // with the week's share of the weekly spend baseline.
    void record(const KpiSnapshot& snapshot, double plan_daily_cost,
                double weekly_spend_baseline);

private:
    std::filesystem::path path_;
    sqlite3* db_{nullptr};
    std::mutex mutex_;

    void open();
    void exec(const char* sql);
};

} // namespace quotawatch::sources
