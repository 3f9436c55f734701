#include "quotawatch/sources/sqlite_history.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <cmath>
#include <system_error>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

using nlohmann::json;

namespace quotawatch::sources {

namespace {

const char* SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS efficiency_daily ("
    " date TEXT PRIMARY KEY,"
    " api_cost_usd REAL,"
    " plan_prorata_usd REAL,"
    " efficiency_ratio REAL,"
    " input_tokens INTEGER,"
    " output_tokens INTEGER,"
    " cache_read_tokens INTEGER,"
    " cache_write_tokens INTEGER,"
    " models_used TEXT,"
    " week_budget_pct REAL,"
    " recorded_at TEXT"
    ");";

// Finalizes the statement when it leaves scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            (void)sqlite3_finalize(stmt_);
            throw SourceUnavailableException("sqlite prepare failed: " + msg);
        }
    }
    ~Statement() { (void)sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const noexcept { return stmt_; }

private:
    sqlite3_stmt* stmt_{nullptr};
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string{};
}

std::optional<double> column_optional_double(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt, col);
}

void bind_optional_double(sqlite3_stmt* stmt, int index, const std::optional<double>& v) {
    if (v) {
        sqlite3_bind_double(stmt, index, *v);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::vector<std::string> parse_models(const std::string& text) {
    std::vector<std::string> models;
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_array()) return models;
    for (auto& m : j) {
        if (m.is_string()) models.push_back(m.get<std::string>());
    }
    return models;
}

double round_to(double v, int places) {
    double scale = std::pow(10.0, places);
    return std::round(v * scale) / scale;
}

} // anonymous namespace

SqliteHistorySource::SqliteHistorySource(std::filesystem::path db_path)
    : path_(std::move(db_path)) {
    open();
}

SqliteHistorySource::~SqliteHistorySource() {
    if (db_) {
        (void)sqlite3_close(db_);
    }
}

void SqliteHistorySource::open() {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    if (sqlite3_open_v2(path_.string().c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        (void)sqlite3_close(db_);
        db_ = nullptr;
        throw SourceUnavailableException("cannot open history " + path_.string() + ": " + msg);
    }
    exec(SCHEMA_SQL);
}

void SqliteHistorySource::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw SourceUnavailableException("sqlite: " + msg);
    }
}

std::string SqliteHistorySource::name() const {
    return "history:" + path_.filename().string();
}

std::vector<HistoryRow> SqliteHistorySource::read_rows(const std::string& since_date) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "SELECT date, api_cost_usd, plan_prorata_usd, efficiency_ratio,"
        " input_tokens, output_tokens, cache_read_tokens, cache_write_tokens,"
        " models_used, week_budget_pct, recorded_at"
        " FROM efficiency_daily WHERE date >= ? ORDER BY date;");
    sqlite3_bind_text(stmt.get(), 1, since_date.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<HistoryRow> rows;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        HistoryRow row;
        row.date = column_text(stmt.get(), 0);
        row.cost = sqlite3_column_double(stmt.get(), 1);
        row.plan_prorata = sqlite3_column_double(stmt.get(), 2);
        row.efficiency_ratio = column_optional_double(stmt.get(), 3);
        row.tokens.input = sqlite3_column_int64(stmt.get(), 4);
        row.tokens.output = sqlite3_column_int64(stmt.get(), 5);
        row.tokens.cache_read = sqlite3_column_int64(stmt.get(), 6);
        row.tokens.cache_write = sqlite3_column_int64(stmt.get(), 7);
        row.models = parse_models(column_text(stmt.get(), 8));
        row.week_budget_fraction = column_optional_double(stmt.get(), 9);
        row.recorded_at = column_text(stmt.get(), 10);
        rows.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE) {
        throw SourceUnavailableException(std::string("sqlite read failed: ") + sqlite3_errmsg(db_));
    }
    return rows;
}

std::vector<UsageRecord> SqliteHistorySource::fetch_usage(Timestamp since) {
    std::vector<UsageRecord> records;
    for (auto& row : read_rows(format_date(since))) {
        auto date = parse_date(row.date);
        if (!date) continue;

        UsageRecord r;
        r.timestamp = to_timestamp(*date);
        r.resolution = Resolution::Day;
        r.model = (row.models.size() == 1) ? row.models.front() : "mixed";
        r.tokens = row.tokens;
        r.cost = row.cost;
        records.push_back(std::move(r));
    }
    return records;
}

void SqliteHistorySource::upsert(const HistoryRow& row) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_,
        "INSERT OR REPLACE INTO efficiency_daily"
        " (date, api_cost_usd, plan_prorata_usd, efficiency_ratio,"
        "  input_tokens, output_tokens, cache_read_tokens, cache_write_tokens,"
        "  models_used, week_budget_pct, recorded_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");

    std::string models = json(row.models).dump();
    sqlite3_stmt* s = stmt.get();
    sqlite3_bind_text(s, 1, row.date.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(s, 2, round_to(row.cost, 4));
    sqlite3_bind_double(s, 3, round_to(row.plan_prorata, 4));
    bind_optional_double(s, 4, row.efficiency_ratio);
    sqlite3_bind_int64(s, 5, row.tokens.input);
    sqlite3_bind_int64(s, 6, row.tokens.output);
    sqlite3_bind_int64(s, 7, row.tokens.cache_read);
    sqlite3_bind_int64(s, 8, row.tokens.cache_write);
    sqlite3_bind_text(s, 9, models.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional_double(s, 10, row.week_budget_fraction);
    sqlite3_bind_text(s, 11, row.recorded_at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(s) != SQLITE_DONE) {
        throw SourceUnavailableException(std::string("sqlite write failed: ") + sqlite3_errmsg(db_));
    }
}

void SqliteHistorySource::record(const KpiSnapshot& snapshot, double plan_daily_cost,
                                 double weekly_spend_baseline) {
    std::string week_start = format_date(snapshot.billing_week.start);
    std::optional<double> week_fraction;
    if (weekly_spend_baseline > 0.0) {
        week_fraction = round_to(snapshot.billing_week.total_cost / weekly_spend_baseline, 4);
    }

    for (auto& point : snapshot.daily_trend) {
        HistoryRow row;
        row.date = format_date(point.date);
        row.cost = point.cost;
        row.plan_prorata = plan_daily_cost;
        if (point.efficiency.has_value()) {
            row.efficiency_ratio = round_to(point.efficiency.value, 2);
        }
        row.tokens = point.tokens;
        row.models = point.models;
        if (row.date >= week_start) {
            row.week_budget_fraction = week_fraction;
        }
        row.recorded_at = format_datetime(snapshot.computed_at);
        upsert(row);
    }
}

} // namespace quotawatch::sources
