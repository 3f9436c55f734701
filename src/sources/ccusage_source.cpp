#include "quotawatch/sources/ccusage_source.hpp"
#include "quotawatch/calendar.hpp"
#include "quotawatch/exceptions.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace quotawatch::sources {

namespace {

TokenCounts tokens_from(const json& j) {
    TokenCounts t;
    t.input = j.value("inputTokens", TokenCount{0});
    t.output = j.value("outputTokens", TokenCount{0});
    t.cache_write = j.value("cacheCreationTokens", TokenCount{0});
    t.cache_read = j.value("cacheReadTokens", TokenCount{0});
    return t;
}

} // anonymous namespace

CcusageReportSource::CcusageReportSource(std::filesystem::path report_path)
    : path_(std::move(report_path)) {}

const std::filesystem::path& CcusageReportSource::path() const noexcept {
    return path_;
}

std::string CcusageReportSource::name() const {
    return "ccusage:" + path_.filename().string();
}

std::vector<UsageRecord> CcusageReportSource::fetch_usage(Timestamp since) {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        throw SourceUnavailableException("report not found: " + path_.string());
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        throw SourceUnavailableException("cannot open " + path_.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str(), since);
}

std::vector<UsageRecord> CcusageReportSource::parse(const std::string& text, Timestamp since) {
    std::vector<UsageRecord> records;
    // Day-level records: keep any day that overlaps [since, ...)
    Timestamp first_day = start_of_day(since);

    try {
        json j = json::parse(text);

        for (auto& day : j.at("daily")) {
            std::string date_text = day.at("date").get<std::string>();
            auto date = parse_date(date_text);
            if (!date) {
                throw SourceUnavailableException("bad date in report: " + date_text);
            }
            Timestamp stamp = to_timestamp(*date);
            if (stamp < first_day) continue;

            const json breakdowns = day.value("modelBreakdowns", json::array());
            if (breakdowns.empty()) {
                UsageRecord r;
                r.timestamp = stamp;
                r.resolution = Resolution::Day;
                r.model = "unattributed";
                r.tokens = tokens_from(day);
                r.cost = day.value("totalCost", 0.0);
                records.push_back(std::move(r));
                continue;
            }

            for (auto& b : breakdowns) {
                UsageRecord r;
                r.timestamp = stamp;
                r.resolution = Resolution::Day;
                r.model = b.at("modelName").get<std::string>();
                r.tokens = tokens_from(b);
                if (b.contains("cost") && !b["cost"].is_null()) {
                    r.cost = b["cost"].get<double>();
                }
                records.push_back(std::move(r));
            }
        }
    } catch (const json::exception& e) {
        throw SourceUnavailableException(std::string("malformed report: ") + e.what());
    }
    return records;
}

} // namespace quotawatch::sources
