// 01_single_refresh.cpp
//
// Minimal QuotaWatch example: one refresh over local session transcripts.
//
// Scenario:
//   - Transcripts live under ~/.claude/projects (or the directory given on
//     the command line).
//   - The Engine prices every assistant turn, rolls usage into calendar
//     windows and publishes a snapshot.
//   - No calibration is stored, so raw totals are reported while every
//     ratio shows "Uncalibrated".

#include <quotawatch/quotawatch.hpp>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace quotawatch;

int main(int argc, char** argv) {
    std::cout << "=== QuotaWatch: Single Refresh Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Pick the transcript root.
    // ----------------------------------------------------------------
    std::filesystem::path root;
    if (argc > 1) {
        root = argv[1];
    } else {
        const char* home = std::getenv("HOME");
        root = std::filesystem::path(home ? home : ".") / ".claude" / "projects";
    }
    std::cout << "Reading transcripts under " << root << "\n\n";

    // ----------------------------------------------------------------
    // 2. Build the engine around a transcript source.
    // ----------------------------------------------------------------
    auto source = std::make_shared<sources::TranscriptSource>(root, RateTable::builtin());
    Engine engine(source, nullptr);
    engine.set_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // Before the first refresh there is nothing to read yet.
    std::cout << "Generation before refresh: " << engine.peek()->generation << "\n\n";

    // ----------------------------------------------------------------
    // 3. Refresh once and print the totals.
    // ----------------------------------------------------------------
    SnapshotPtr snap;
    try {
        snap = engine.refresh();
    } catch (const SourceUnavailableException& e) {
        std::cerr << "Refresh failed: " << e.what() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Today:        $" << snap->today.total_cost << "\n";
    std::cout << "Last 7 days:  $" << snap->rolling_7d.total_cost << "\n";
    std::cout << "Last 30 days: $" << snap->rolling_30d.total_cost << "\n";
    std::cout << "Billing week: $" << snap->billing_week.total_cost
              << " (resets " << format_datetime(snap->next_billing_reset) << ")\n\n";

    std::cout << "Cost by hour today:\n";
    for (int h = 0; h < 24; ++h) {
        const auto& bucket = snap->today_by_hour[h];
        if (bucket.empty()) continue;
        std::cout << "  " << std::setw(2) << h << ":00  $" << bucket.total_cost << "\n";
    }

    std::cout << "\nModels this week:\n";
    for (const auto& [model, cost] : snap->model_costs_7d) {
        std::cout << "  " << model << ": $" << cost << "\n";
    }

    std::cout << "\n=== Done ===\n";
    return 0;
}
