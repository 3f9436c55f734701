#include <gtest/gtest.h>
#include <quotawatch/quotawatch.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using namespace quotawatch;

namespace fs = std::filesystem;

namespace {

UsageRecord priced(Timestamp ts, const std::string& model, double cost) {
    UsageRecord r;
    r.timestamp = ts;
    r.model = model;
    r.cost = cost;
    return r;
}

Calibration two_caps() {
    Calibration c;
    c.anchor = BillingAnchor{CivilDate{2026, 2, 14}, 0};
    c.caps.push_back(Cap{"all-models", 500.0, "", std::nullopt});
    c.caps.push_back(Cap{"sonnet-only", 300.0, "claude-sonnet", std::nullopt});
    c.calibrated_on = "2026-02-14";
    return c;
}

} // anonymous namespace

class ReportTest : public ::testing::Test {
protected:
    std::vector<UsageRecord> records = {
        priced(make_timestamp(2026, 2, 15, 10), "claude-opus-4-6", 400.0),
        priced(make_timestamp(2026, 2, 16, 10), "claude-sonnet-4-6", 200.0),
        priced(make_timestamp(2026, 2, 17, 9), "claude-sonnet-4-6", 12.25),
    };
    Timestamp now = make_timestamp(2026, 2, 17, 12);
    SnapshotBuilder builder{Config{}};

    KpiSnapshot calibrated() {
        KpiSnapshot s = builder.build(records, two_caps(), now);
        s.generation = 3;
        return s;
    }
};

// ===========================================================================
// Markdown
// ===========================================================================

TEST_F(ReportTest, RenderedFieldsParseBack) {
    KpiSnapshot snap = calibrated();
    auto fields = parse_report_fields(render_report(snap));

    EXPECT_NEAR(fields.at("today_cost"), snap.today.total_cost, 0.005);
    EXPECT_NEAR(fields.at("rolling_7d_cost"), snap.rolling_7d.total_cost, 0.005);
    EXPECT_NEAR(fields.at("billing_week_cost"), snap.billing_week.total_cost, 0.005);
    EXPECT_NEAR(fields.at("cap.all-models.utilization"),
                snap.quota.caps[0].utilization.value, 0.005);
    EXPECT_NEAR(fields.at("cap.sonnet-only.limit"), 300.0, 0.005);
    EXPECT_NEAR(fields.at("binding_utilization"), snap.quota.binding_utilization.value, 0.005);
    EXPECT_NEAR(fields.at("headroom"), 0.0, 0.005);
    EXPECT_NEAR(fields.at("week_projected_total"), snap.week_projection.projected_total, 0.005);
    EXPECT_NEAR(fields.at("efficiency_today"), snap.efficiency_today.value, 0.005);
}

TEST_F(ReportTest, DatesAndWordsAreNotNumericFields) {
    auto fields = parse_report_fields(render_report(calibrated()));

    EXPECT_EQ(fields.count("next_reset"), 0u);
    EXPECT_EQ(fields.count("cap.all-models.resets"), 0u);
    EXPECT_EQ(fields.count("gate"), 0u);
    EXPECT_EQ(fields.count("binding_cap"), 0u);
    EXPECT_EQ(fields.count("dead_zone"), 0u);
}

TEST_F(ReportTest, ReportNamesGateAndAlerts) {
    std::string report = render_report(calibrated());

    EXPECT_NE(report.find("# Usage Report 2026-02-17"), std::string::npos);
    EXPECT_NE(report.find("- gate: Deny"), std::string::npos);
    EXPECT_NE(report.find("- binding_cap: all-models"), std::string::npos);
    EXPECT_NE(report.find("* Critical: all-models at"), std::string::npos);
    EXPECT_NE(report.find("* claude-opus-4-6: $400.00"), std::string::npos);
}

TEST_F(ReportTest, UncalibratedRatiosAreAbsent) {
    KpiSnapshot snap = builder.build(records, std::nullopt, now);
    std::string report = render_report(snap);
    auto fields = parse_report_fields(report);

    EXPECT_EQ(fields.count("efficiency_today"), 0u);
    EXPECT_EQ(fields.count("spend_ratio"), 0u);
    EXPECT_EQ(fields.count("binding_utilization"), 0u);
    EXPECT_EQ(fields.count("headroom"), 0u);
    EXPECT_NEAR(fields.at("today_cost"), 12.25, 0.005);
    EXPECT_NE(report.find("- efficiency_today: Uncalibrated"), std::string::npos);
    EXPECT_NE(report.find("No alerts"), std::string::npos);
}

TEST(ReportParseTest, SkipsMalformedLines) {
    std::string text =
        "# heading\n"
        "- cost: $12.50\n"
        "- ratio: 0.83 (Elevated)\n"
        "- when: 2026-02-28 10:00\n"
        "- status: InsufficientData\n"
        "- trailing: 3.5x\n"
        "not a field: 4\n";
    auto fields = parse_report_fields(text);

    ASSERT_EQ(fields.size(), 2u);
    EXPECT_DOUBLE_EQ(fields.at("cost"), 12.5);
    EXPECT_DOUBLE_EQ(fields.at("ratio"), 0.83);
}

// ===========================================================================
// JSON
// ===========================================================================

TEST_F(ReportTest, JsonCarriesQuotaAndMetrics) {
    auto j = nlohmann::json::parse(to_json(calibrated()));

    EXPECT_EQ(j["generation"].get<int>(), 3);
    EXPECT_TRUE(j["calibrated"].get<bool>());
    EXPECT_EQ(j["quota"]["binding"].get<std::string>(), "all-models");
    EXPECT_EQ(j["quota"]["gate"].get<std::string>(), "Deny");
    ASSERT_EQ(j["quota"]["caps"].size(), 2u);
    EXPECT_EQ(j["today_by_hour"].size(), 24u);
    EXPECT_EQ(j["daily_trend"].size(), 7u);
    EXPECT_EQ(j["efficiency_today"]["status"].get<std::string>(), "Ok");
    EXPECT_NEAR(j["billing_week"]["cost"].get<double>(), 612.25, 1e-9);
}

TEST_F(ReportTest, JsonMetricWithoutValueIsNull) {
    auto j = nlohmann::json::parse(to_json(builder.build(records, std::nullopt, now)));

    EXPECT_TRUE(j["spend_ratio"]["value"].is_null());
    EXPECT_EQ(j["spend_ratio"]["status"].get<std::string>(), "Uncalibrated");
    EXPECT_TRUE(j["quota"]["binding"].is_null());
}

// ===========================================================================
// Files
// ===========================================================================

TEST_F(ReportTest, WriteReportUsesDatedName) {
    fs::path dir = fs::temp_directory_path() / "quotawatch_report_test";
    fs::remove_all(dir);

    fs::path path = write_report(dir / "reports", calibrated());
    EXPECT_EQ(path.filename().string(), "USAGE_REPORT_2026-02-17.md");
    ASSERT_TRUE(fs::exists(path));

    std::ifstream in(path);
    std::stringstream buf;
    buf << in.rdbuf();
    EXPECT_EQ(buf.str(), render_report(calibrated()));

    fs::remove_all(dir);
}
