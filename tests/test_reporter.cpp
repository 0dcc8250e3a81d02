#include <gtest/gtest.h>

#include "pv_cleaning.h"
#include "pv_reporter.h"
#include "test_helpers.h"

class ReporterTest : public LoggedTest {
protected:
    void SetUp() override {
        LoggedTest::SetUp();
        ASSERT_TRUE(createSchema(db, logFile));

        const std::vector<RawRecord> raw = {
            std::nullopt, std::nullopt, std::string("ahgve1276f"), std::string("AHGVE1276F "), std::string("invalid"), std::string("")
        };
        ASSERT_TRUE(insertRawValues(db, raw, logFile));
        ASSERT_TRUE(storeResults(db, cleanAndClassify(raw).results, logFile));

        options.silentMode = true;
    }

    Database db{ ":memory:" };
    ProgramOptions options;
};

TEST_F(ReporterTest, SummaryCountsRowsByStatus) {
    const auto summary = fetchSummaryCounts(db, logFile);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total, 6u);
    EXPECT_EQ(summary->valid, 1u);
    EXPECT_EQ(summary->invalid, 1u);
    EXPECT_EQ(summary->missingOrIncomplete(), 4u);
}

TEST_F(ReporterTest, FetchesSortedValuesByStatus) {
    ASSERT_TRUE(storeResults(db, { { "AAA", PanStatus::Invalid }, { "BNZPM2501K", PanStatus::Valid } }, logFile));

    const auto valid = fetchPansByStatus(db, PanStatus::Valid, logFile);
    ASSERT_TRUE(valid.has_value());
    EXPECT_EQ(*valid, (std::vector<std::string>{ "AHGVE1276F", "BNZPM2501K" }));

    const auto invalid = fetchPansByStatus(db, PanStatus::Invalid, logFile);
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ(*invalid, (std::vector<std::string>{ "AAA", "INVALID" }));
}

TEST(SummaryCountsTest, MissingNeverUnderflows) {
    const SummaryCounts summary{ 1, 1, 1 };
    EXPECT_EQ(summary.missingOrIncomplete(), 0u);
}

TEST(ReportJsonTest, ContainsSummaryAndValueLists) {
    const SummaryCounts summary{ 6, 1, 1 };
    const auto report = buildReportJson(summary, { "AHGVE1276F" }, { "INVALID" });

    EXPECT_EQ(report["summary"]["total"], 6);
    EXPECT_EQ(report["summary"]["valid"], 1);
    EXPECT_EQ(report["summary"]["invalid"], 1);
    EXPECT_EQ(report["summary"]["missing_or_incomplete"], 4);
    EXPECT_EQ(report["valid"], ordered_json::array({ "AHGVE1276F" }));
    EXPECT_EQ(report["invalid"], ordered_json::array({ "INVALID" }));
    EXPECT_EQ(report.begin().key(), "summary");
}

TEST(ReportJsonTest, SummaryTextListsEveryCount) {
    const std::string text = formatSummary(SummaryCounts{ 6, 1, 1 });
    EXPECT_NE(text.find("Total records:         6"), std::string::npos);
    EXPECT_NE(text.find("Valid PANs:            1"), std::string::npos);
    EXPECT_NE(text.find("Invalid PANs:          1"), std::string::npos);
    EXPECT_NE(text.find("Missing or incomplete: 4"), std::string::npos);
}

TEST_F(ReporterTest, ReportPathForDirectoryUsesInputStem) {
    EXPECT_EQ(resolveReportPath(tempDir.path(), "/data/pans.csv"), tempDir.path() / "pans_report.json");
    EXPECT_EQ(resolveReportPath(tempDir.path() / "out.json", "/data/pans.csv"), tempDir.path() / "out.json");
}

TEST_F(ReporterTest, SavedReportIsReadableJson) {
    const auto reportPath = tempDir.path() / "report.json";
    const auto report = buildReportJson(SummaryCounts{ 6, 1, 1 }, { "AHGVE1276F" }, { "INVALID" });
    ASSERT_TRUE(saveReportToFile(reportPath, report, options, logFile));

    std::ifstream in(reportPath);
    const auto loaded = ordered_json::parse(in);
    EXPECT_EQ(loaded, report);
}

TEST_F(ReporterTest, ExistingReportIsBackedUp) {
    const auto reportPath = tempDir.path() / "report.json";
    const auto report = buildReportJson(SummaryCounts{ 6, 1, 1 }, {}, {});

    ASSERT_TRUE(saveReportToFile(reportPath, report, options, logFile));
    ASSERT_TRUE(saveReportToFile(reportPath, report, options, logFile));
    ASSERT_TRUE(saveReportToFile(reportPath, report, options, logFile));

    EXPECT_TRUE(std::filesystem::exists(reportPath));
    EXPECT_TRUE(std::filesystem::exists(tempDir.path() / "report.json.bac"));
    EXPECT_TRUE(std::filesystem::exists(tempDir.path() / "report.json.000.bac"));
}
