#pragma once

#include "quotawatch/usage_source.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace quotawatch::sources {

// Reads a daily report in the `ccusage daily --json --breakdown` layout:
//
//   {"daily": [{"date": "2026-02-20", "totalCost": 12.5,
//               "modelBreakdowns": [{"modelName": "...", "cost": 9.1,
//                                    "inputTokens": ..., ...}]}]}
//
// Each model breakdown becomes one record stamped at local midnight of its
// day. A day without breakdowns becomes a single record for model
// "unattributed" carrying totalCost.
class CcusageReportSource : public UsageSource {
public:
    explicit CcusageReportSource(std::filesystem::path report_path);

    std::vector<UsageRecord> fetch_usage(Timestamp since) override;
    std::string name() const override;

    const std::filesystem::path& path() const noexcept;

    // Throws SourceUnavailableException on malformed input
    static std::vector<UsageRecord> parse(const std::string& text, Timestamp since);

private:
    std::filesystem::path path_;
};

} // namespace quotawatch::sources
