// 03_calibrate.cpp
//
// Calibration from an observed usage percentage, then a daily report.
//
// Usage:
//   03_calibrate <ccusage-daily.json> <cap-name> <observed-percent> [state-dir]
//
// Scenario:
//   - Usage comes from a ccusage daily report, falling back to the SQLite
//     history for days the report no longer covers.
//   - The plan's usage page shows e.g. "sonnet-only: 42% used"; the cap's
//     weekly limit is derived from that figure and persisted as JSON.
//   - The refreshed snapshot is written as a markdown report and its daily
//     trend is recorded in the history database.

#include <quotawatch/quotawatch.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace quotawatch;

int main(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: " << argv[0]
                  << " <ccusage-daily.json> <cap-name> <observed-percent> [state-dir]\n";
        return 2;
    }
    std::filesystem::path report_path = argv[1];
    std::string cap_name = argv[2];
    double percent = std::strtod(argv[3], nullptr);
    std::filesystem::path state_dir = argc > 4 ? argv[4] : "quotawatch-state";

    std::cout << "=== QuotaWatch: Calibration Example ===\n\n";

    try {
        // ----------------------------------------------------------------
        // 1. Report first, history as fallback.
        // ----------------------------------------------------------------
        auto history = std::make_shared<sources::SqliteHistorySource>(state_dir / "usage.db");
        auto source = std::make_shared<sources::CompositeSource>();
        source->add_source(std::make_shared<sources::CcusageReportSource>(report_path));
        source->add_source(history);

        auto store = std::make_shared<JsonCalibrationStore>(state_dir / "calibration.json");
        Engine engine(source, store);
        engine.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));

        // ----------------------------------------------------------------
        // 2. Refresh, then derive the cap's limit from the observation.
        // ----------------------------------------------------------------
        engine.refresh();
        Calibration calibration = engine.calibrate_from_usage(cap_name, percent);

        auto index = calibration.find_cap(cap_name);
        std::cout << "\n" << cap_name << " weekly limit is now $"
                  << calibration.caps[*index].weekly_limit << "\n";
        std::cout << "Note: " << calibration.note << "\n\n";

        // ----------------------------------------------------------------
        // 3. Refresh with the new calibration and write the outputs.
        // ----------------------------------------------------------------
        SnapshotPtr snap = engine.refresh();
        auto written = write_report(state_dir, *snap);
        history->record(*snap, calibration.baseline.plan_daily_cost(),
                        calibration.baseline.weekly_spend_baseline);

        std::cout << render_report(*snap) << "\n";
        std::cout << "Report written to " << written << "\n";
    } catch (const QuotaWatchException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
