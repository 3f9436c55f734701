#pragma once

#include "quotawatch/snapshot.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace quotawatch {

// Markdown summary of a snapshot. Numeric fields are written as
// "- key: value" lines with two decimals so parse_report_fields() can read
// them back. Metrics without a value print their status instead.
std::string render_report(const KpiSnapshot& snapshot);

// Every numeric "- key: value" line of a rendered report. A leading '$' is
// ignored; lines whose value is not a number are skipped.
std::map<std::string, double> parse_report_fields(const std::string& report);

// Structured form of the full snapshot
std::string to_json(const KpiSnapshot& snapshot, int indent = 2);

// Writes render_report() to <dir>/USAGE_REPORT_<YYYY-MM-DD>.md, creating
// the directory when needed. Returns the written path.
std::filesystem::path write_report(const std::filesystem::path& dir, const KpiSnapshot& snapshot);

} // namespace quotawatch
