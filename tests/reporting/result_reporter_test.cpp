// File: tests/reporting/result_reporter_test.cpp

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>

#include <json/json.h>

#include "common/formatting/fmt_score.hpp"
#include "reporting/result_reporter.hpp"

using namespace reporting;
using ::testing::HasSubstr;

class ResultReporterTest : public ::testing::Test {
protected:
    types::RankedReport directory_report;
    types::RankedReport match_report;

    void SetUp() override {
        directory_report.mode = types::ComparisonMode::AllPairs;
        directory_report.candidates = 4;
        directory_report.results = {{0.9, "a.png", "b.png"}, {0.25, "a.png", "c.png"}};
        directory_report.skipped = {{"bad.png", "", types::ErrorKind::Decode, "Could not read image: bad.png"}};

        match_report.mode = types::ComparisonMode::Match;
        match_report.candidates = 2;
        match_report.results = {{0.5, "target.png", "near.png"}, {0.126, "target.png", "far.png"}};
    }

    static std::string render(const ResultReporter &reporter, const types::RankedReport &report) {
        std::ostringstream out;
        reporter.report(report, out);
        return out.str();
    }
};

TEST_F(ResultReporterTest, LinesListPairsThenSkips) {
    EXPECT_EQ(render(LineReporter(3), directory_report),
              "0.900 \"a.png\" \"b.png\"\n"
              "0.250 \"a.png\" \"c.png\"\n"
              "skipped \"bad.png\": decode: Could not read image: bad.png\n");
}

TEST_F(ResultReporterTest, LinesShowOnlyTheCandidateInMatchMode) {
    EXPECT_EQ(render(LineReporter(2), match_report), "0.50 \"near.png\"\n0.13 \"far.png\"\n");
}

TEST_F(ResultReporterTest, LinesUseTheScoreFormatter) {
    std::string expected;
    for (const auto &score: directory_report.results) {
        expected += fmt::format("{:.4}\n", score);
    }
    directory_report.skipped.clear();

    EXPECT_EQ(render(LineReporter(4), directory_report), expected);
    EXPECT_EQ(fmt::format("{:.2}", types::SimilarityScore{0.5, "near.png", {}}), "0.50 \"near.png\"");
}

TEST_F(ResultReporterTest, LinesFlagCancelledRuns) {
    directory_report.cancelled = true;
    EXPECT_THAT(render(LineReporter(), directory_report), HasSubstr("# cancelled, results are partial\n"));
}

TEST_F(ResultReporterTest, TableHasHeaderRanksAndSummary) {
    const auto output = render(TableReporter(3), directory_report);

    EXPECT_THAT(output, HasSubstr("rank"));
    EXPECT_THAT(output, HasSubstr("image_a"));
    EXPECT_THAT(output, HasSubstr("   1  0.900  a.png    b.png\n"));
    EXPECT_THAT(output, HasSubstr("2 results from 4 candidates, 1 skipped\n"));
    EXPECT_THAT(output, HasSubstr("skipped \"bad.png\""));
}

TEST_F(ResultReporterTest, JsonDocumentRoundTrips) {
    const auto output = render(JsonReporter(), directory_report);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(output);
    ASSERT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;

    EXPECT_EQ(root["mode"].asString(), "directory");
    EXPECT_FALSE(root["cancelled"].asBool());
    EXPECT_EQ(root["candidates"].asUInt64(), 4u);
    ASSERT_EQ(root["results"].size(), 2u);
    EXPECT_DOUBLE_EQ(root["results"][0]["score"].asDouble(), 0.9);
    EXPECT_EQ(root["results"][0]["image_a"].asString(), "a.png");
    EXPECT_EQ(root["results"][0]["image_b"].asString(), "b.png");
    ASSERT_EQ(root["skipped"].size(), 1u);
    EXPECT_EQ(root["skipped"][0]["kind"].asString(), "decode");
    EXPECT_FALSE(root["skipped"][0].isMember("other_path"));
}

TEST_F(ResultReporterTest, JsonNamesTargetAndCandidateInMatchMode) {
    const auto output = render(JsonReporter(), match_report);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream in(output);
    ASSERT_TRUE(Json::parseFromStream(builder, in, &root, &errors)) << errors;

    EXPECT_EQ(root["mode"].asString(), "match");
    EXPECT_EQ(root["results"][0]["target"].asString(), "target.png");
    EXPECT_EQ(root["results"][0]["candidate"].asString(), "near.png");
}

TEST_F(ResultReporterTest, FactoryKnowsEveryFormat) {
    EXPECT_NE(dynamic_cast<LineReporter *>(ResultReporter::create("lines").get()), nullptr);
    EXPECT_NE(dynamic_cast<TableReporter *>(ResultReporter::create("table").get()), nullptr);
    EXPECT_NE(dynamic_cast<JsonReporter *>(ResultReporter::create("json").get()), nullptr);
    EXPECT_THROW((void) ResultReporter::create("xml"), std::invalid_argument);
}
