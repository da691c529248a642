/**
 * @file test_report.cpp
 * @brief Tests for Report assembly and its JSON form
 */

#include <dynadiag/core/CoreTypes.hpp>
#include <dynadiag/report/Aggregator.hpp>
#include <dynadiag/report/ReportJson.hpp>

#include <TempRunDir.hpp>

#include <gtest/gtest.h>

#include <array>
#include <fstream>
#include <string>
#include <vector>

using namespace dynadiag;

namespace {

RunData MinimalData() {
    RunData data;
    EnergySample s;
    s.cycle = 100;
    s.kinetic = 10.0;
    s.internal = 5.0;
    data.glstat_energy.push_back(s);
    data.present = {SourceKind::Glstat, SourceKind::Hsp};
    data.missing = {SourceKind::Nodout};
    data.skipped = {{SourceKind::Glstat, 2}};
    data.message_logs = 3;
    return data;
}

NamedResult Result(std::string analyzer, std::vector<Finding> findings) {
    NamedResult named;
    named.analyzer = std::move(analyzer);
    named.result.findings = std::move(findings);
    return named;
}

Finding Note(FindingSeverity severity, const std::string &title) {
    return FindingBuilder(severity, "test", title)
        .Evidence(EvidenceRef{.source = SourceKind::Glstat,
                              .entity = "sample",
                              .id = 4,
                              .cycle = 400,
                              .cycle_end = std::nullopt,
                              .time = 2e-3,
                              .value = std::nullopt})
        .Build();
}

} // namespace

// =============================================================================
// Aggregator
// =============================================================================

TEST(Aggregator, NothingUsableThrows) {
    RunData data;
    data.present = {SourceKind::Glstat};
    EXPECT_FALSE(Aggregator::HasUsableData(data));
    EXPECT_THROW((void)Aggregator::Aggregate(data, {}), AggregationError);
}

TEST(Aggregator, TagsFindingsInAnalyzerOrder) {
    std::vector<NamedResult> results;
    results.push_back(Result("energy", {Note(FindingSeverity::Warning, "a"),
                                        Note(FindingSeverity::Info, "b")}));
    results.push_back(Result("timestep", {}));
    results.push_back(Result("failure", {Note(FindingSeverity::Critical, "c")}));

    auto report = Aggregator::Aggregate(MinimalData(), std::move(results));
    ASSERT_EQ(report.findings.size(), 3u);
    EXPECT_EQ(report.findings[0].title, "a");
    EXPECT_EQ(report.findings[0].analyzer, "energy");
    EXPECT_EQ(report.findings[1].analyzer, "energy");
    EXPECT_EQ(report.findings[2].title, "c");
    EXPECT_EQ(report.findings[2].analyzer, "failure");
    EXPECT_EQ(report.tool_version, Version());
    EXPECT_EQ(report.SeverityCounts(), (std::array<std::size_t, 3>{1, 1, 1}));
}

TEST(Aggregator, FirstSummaryWins) {
    auto first = Result("energy", {});
    first.result.summaries.energy = EnergySummary{.source = SourceKind::Glstat, .samples = 7};
    auto second = Result("other", {});
    second.result.summaries.energy = EnergySummary{.source = SourceKind::Hsp, .samples = 2};
    second.result.summaries.scaling = ScalingSummary{.current_cores = 8};

    std::vector<NamedResult> results;
    results.push_back(std::move(first));
    results.push_back(std::move(second));
    auto report = Aggregator::Aggregate(MinimalData(), std::move(results));

    ASSERT_TRUE(report.summaries.energy.has_value());
    EXPECT_EQ(report.summaries.energy->samples, 7u);
    ASSERT_TRUE(report.summaries.scaling.has_value());
    EXPECT_EQ(report.summaries.scaling->current_cores, 8);
    EXPECT_FALSE(report.summaries.timestep.has_value());
}

TEST(Aggregator, CopiesCoverage) {
    auto report = Aggregator::Aggregate(MinimalData(), {});
    EXPECT_EQ(report.coverage.present,
              (std::vector<SourceKind>{SourceKind::Glstat, SourceKind::Hsp}));
    EXPECT_EQ(report.coverage.missing, (std::vector<SourceKind>{SourceKind::Nodout}));
    EXPECT_EQ(report.coverage.skipped.at(SourceKind::Glstat), 2u);
    EXPECT_EQ(report.coverage.message_logs, 3u);
    EXPECT_TRUE(report.coverage.Degraded());
}

TEST(Coverage, DegradedOnlyWithGapsOrSkips) {
    Coverage coverage;
    EXPECT_FALSE(coverage.Degraded());
    coverage.skipped[SourceKind::Matsum] = 0;
    EXPECT_FALSE(coverage.Degraded());
    coverage.skipped[SourceKind::Matsum] = 1;
    EXPECT_TRUE(coverage.Degraded());
}

// =============================================================================
// JSON
// =============================================================================

TEST(ReportJson, TopLevelShape) {
    auto report = Aggregator::Aggregate(MinimalData(), {});
    auto j = ReportToJSON(report);

    for (const char *key : {"tool_version", "model", "parts", "contacts", "mass", "timing",
                            "termination", "estimate", "summaries", "findings", "counts",
                            "coverage"}) {
        EXPECT_TRUE(j.contains(key)) << key;
    }
    EXPECT_TRUE(j["model"].is_null());
    EXPECT_TRUE(j["timing"].is_null());
    EXPECT_TRUE(j["termination"].is_null());
    EXPECT_TRUE(j["summaries"]["energy"].is_null());
    EXPECT_TRUE(j["findings"].is_array());
    EXPECT_EQ(j["counts"]["critical"], 0);

    const auto &coverage = j["coverage"];
    EXPECT_EQ(coverage["present"], (nlohmann::json{"glstat", "d3hsp"}));
    EXPECT_EQ(coverage["missing"], (nlohmann::json{"nodout"}));
    EXPECT_EQ(coverage["skipped"]["glstat"], 2);
    EXPECT_EQ(coverage["message_logs"], 3);
    EXPECT_EQ(coverage["degraded"], true);
}

TEST(ReportJson, FindingFields) {
    auto f = Note(FindingSeverity::Critical, "Shooting node 7");
    f.analyzer = "instability";
    f.occurrences = 2;
    auto j = FindingToJSON(f);

    EXPECT_EQ(j["severity"], "critical");
    EXPECT_EQ(j["category"], "test");
    EXPECT_EQ(j["occurrences"], 2);
    EXPECT_EQ(j["analyzer"], "instability");
    ASSERT_EQ(j["evidence"].size(), 1u);
    const auto &e = j["evidence"][0];
    EXPECT_EQ(e["source"], "glstat");
    EXPECT_EQ(e["entity"], "sample");
    EXPECT_EQ(e["id"], 4);
    EXPECT_EQ(e["cycle"], 400);
    EXPECT_TRUE(e["cycle_end"].is_null());
    EXPECT_DOUBLE_EQ(e["time"].get<double>(), 2e-3);
    EXPECT_TRUE(e["value"].is_null());
}

TEST(ReportJson, ScalingIsMarkedAsProjection) {
    Report report;
    report.summaries.scaling = ScalingSummary{.current_cores = 16};
    auto j = ReportToJSON(report);
    EXPECT_EQ(j["summaries"]["scaling"]["projection"], true);
    EXPECT_EQ(j["summaries"]["scaling"]["current_cores"], 16);
}

TEST(ReportJson, WriteAndFailure) {
    fixtures::TempRunDir dir;
    auto report = Aggregator::Aggregate(MinimalData(), {});
    auto path = dir.Path() / "report.json";
    WriteReportJSON(report, path.string());

    std::ifstream in(path);
    auto parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed, ReportToJSON(report));

    EXPECT_THROW(WriteReportJSON(report, (dir.Path() / "missing" / "r.json").string()), IOError);
}
