/**
 * @file test_pipeline.cpp
 * @brief End-to-end tests over scratch result directories
 */

#include <dynadiag/pipeline/DiagnosisPipeline.hpp>
#include <dynadiag/report/ReportJson.hpp>

#include <Fixtures.hpp>
#include <TempRunDir.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace dynadiag;

namespace {

struct RunFile {
    const char *name;
    SourceKind source;
};

const std::vector<RunFile> &OptionalFiles() {
    static const std::vector<RunFile> files{
        {"glstat", SourceKind::Glstat},
        {"status.out", SourceKind::Status},
        {"matsum", SourceKind::Matsum},
        {"nodout", SourceKind::Nodout},
        {"bndout", SourceKind::Bndout},
        {"load_profile.csv", SourceKind::LoadProfile},
        {"cont_profile.csv", SourceKind::ContactProfile},
        {"model.k", SourceKind::InputDeck},
    };
    return files;
}

/// A complete, healthy result directory
void WriteHealthyRun(const fixtures::TempRunDir &dir) {
    dir.Write("d3hsp", fixtures::HspNormalRun(4));
    dir.Write("glstat", fixtures::GlstatText(fixtures::HealthyGlstat()));
    dir.Write("status.out", fixtures::StatusText());
    dir.Write("matsum", fixtures::MatsumText({{.part = 1}, {.part = 2}}));
    dir.Write("messag", fixtures::MessagLog());

    std::string nodout;
    std::string bndout;
    for (int step = 1; step <= 6; ++step) {
        nodout += fixtures::NodoutState(step, step * 1e-3, {{.node = 1, .vx = 5.0}, {.node = 2}});
        bndout += fixtures::BndoutState(step * 1e-3, 7, 100.0);
    }
    dir.Write("nodout", nodout);
    dir.Write("bndout", bndout);
    dir.Write("load_profile.csv", fixtures::LoadProfileText({10.0, 10.0, 10.0, 10.0}));
    dir.Write("cont_profile.csv", fixtures::ContactProfileText({3.0, 3.0, 3.0, 3.0}));
    dir.Write("model.k", fixtures::DeckText());
}

std::size_t Referencing(const Report &report, SourceKind source) {
    return static_cast<std::size_t>(std::count_if(
        report.findings.begin(), report.findings.end(),
        [source](const Finding &f) { return f.References(source); }));
}

const Finding *FindTitle(const Report &report, const std::string &title) {
    for (const auto &f : report.findings) {
        if (f.title == title) {
            return &f;
        }
    }
    return nullptr;
}

std::string SkipSummary(const Report &report) {
    std::string out;
    for (const auto &[source, count] : report.coverage.skipped) {
        out += std::string(SourceName(source)) + "=" + std::to_string(count) + " ";
    }
    return out;
}

class ThrowingAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "throwing"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext & /*ctx*/) const override {
        throw std::runtime_error("vector index out of range");
    }
};

class EchoAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "echo"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override {
        DYNADIAG_LOG_INFO("saw " + std::to_string(ctx.data.present.size()) + " sources");
        return {};
    }
};

/// Records every batch handed to its sink; removes the sink on destruction
class TranscriptCapture {
  public:
    TranscriptCapture() {
        GetLogService().SetMinLevel(LogLevel::Trace);
        GetLogService().AddSink(
            [this](const std::vector<LogEntry> &batch) { batches.push_back(batch); });
    }
    ~TranscriptCapture() {
        GetLogService().ClearSinks();
        GetLogService().SetMinLevel(LogLevel::Info);
    }

    TranscriptCapture(const TranscriptCapture &) = delete;
    TranscriptCapture &operator=(const TranscriptCapture &) = delete;

    std::vector<std::vector<LogEntry>> batches;
};

} // namespace

// =============================================================================
// Outcomes
// =============================================================================

TEST(OutcomeMapping, ExitCodesAndNames) {
    EXPECT_EQ(ExitCode(Outcome::Success), 0);
    EXPECT_EQ(ExitCode(Outcome::FatalInput), 2);
    EXPECT_EQ(ExitCode(Outcome::DegradedCoverage), 3);
    EXPECT_EQ(ExitCode(Outcome::Aborted), 130);
    EXPECT_STREQ(OutcomeName(Outcome::DegradedCoverage), "degraded");
    EXPECT_STREQ(OutcomeName(Outcome::FatalInput), "fatal_input");
}

TEST(DiagnosisPipeline, DefaultAnalyzerOrder) {
    auto analyzers = DiagnosisPipeline::DefaultAnalyzers();
    std::vector<std::string> names;
    for (const auto &a : analyzers) {
        names.push_back(a->Name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"energy", "timestep", "contact", "performance",
                                               "scaling", "instability", "failure", "warnings",
                                               "termination", "coverage"}));
}

// =============================================================================
// Complete directory
// =============================================================================

TEST(DiagnosisPipeline, HealthyRunHasFullCoverage) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);

    std::vector<std::string> phases;
    DiagnosisPipeline pipeline(AnalysisConfig::Default());
    pipeline.SetProgressCallback([&phases](const std::string &phase) { phases.push_back(phase); });
    auto result = pipeline.Run(dir.Path());

    ASSERT_TRUE(result.report.has_value()) << result.message;
    const auto &report = *result.report;
    EXPECT_EQ(result.outcome, Outcome::Success) << SkipSummary(report);
    EXPECT_TRUE(report.coverage.missing.empty());
    EXPECT_EQ(report.coverage.present.size(), kAllSources.size());
    EXPECT_EQ(report.coverage.message_logs, 1u);
    EXPECT_EQ(phases, (std::vector<std::string>{"discover", "read", "analyze", "aggregate"}));

    EXPECT_EQ(report.tool_version, Version());
    ASSERT_TRUE(report.model.has_value());
    EXPECT_EQ(report.model->header.mpp_processors, 4);
    ASSERT_TRUE(report.termination.has_value());
    EXPECT_EQ(report.termination->kind, TerminationKind::Normal);
    ASSERT_TRUE(report.summaries.energy.has_value());
    EXPECT_EQ(report.summaries.energy->source, SourceKind::Glstat);
    EXPECT_TRUE(report.summaries.timestep.has_value());
    EXPECT_TRUE(report.summaries.scaling.has_value());

    EXPECT_EQ(report.Count(FindingSeverity::Critical), 0u);
    for (const auto &f : report.findings) {
        EXPECT_FALSE(f.analyzer.empty()) << f.title;
        EXPECT_NE(f.category, "coverage") << f.title;
    }
    ASSERT_NE(FindTitle(report, "Initial penetrations found"), nullptr);
}

TEST(DiagnosisPipeline, RepeatedRunsGiveIdenticalJson) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);

    auto first = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
    auto second = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
    ASSERT_TRUE(first.report.has_value());
    ASSERT_TRUE(second.report.has_value());
    EXPECT_EQ(ReportToJSONString(*first.report), ReportToJSONString(*second.report));
}

// =============================================================================
// Missing optional inputs
// =============================================================================

TEST(DiagnosisPipeline, RemovingAFileNeverAddsFindingsAboutIt) {
    fixtures::TempRunDir full;
    WriteHealthyRun(full);
    auto baseline = DiagnosisPipeline(AnalysisConfig::Default()).Run(full.Path());
    ASSERT_TRUE(baseline.report.has_value());

    for (const auto &file : OptionalFiles()) {
        fixtures::TempRunDir dir;
        WriteHealthyRun(dir);
        dir.Remove(file.name);

        auto result = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
        ASSERT_TRUE(result.report.has_value()) << file.name;
        EXPECT_EQ(result.outcome, Outcome::DegradedCoverage) << file.name;
        EXPECT_LE(Referencing(*result.report, file.source),
                  Referencing(*baseline.report, file.source))
            << file.name;

        const auto &missing = result.report->coverage.missing;
        EXPECT_NE(std::find(missing.begin(), missing.end(), file.source), missing.end())
            << file.name;
        EXPECT_NE(FindTitle(*result.report, std::string(SourceName(file.source)) + " not found"),
                  nullptr)
            << file.name;
    }
}

TEST(DiagnosisPipeline, MessageLogsAloneAreEnough) {
    fixtures::TempRunDir dir;
    dir.Write("mes0000", fixtures::MessagLog());
    dir.Write("mes0001", fixtures::MessageWarning(50135, 1001));

    auto result = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
    ASSERT_TRUE(result.report.has_value()) << result.message;
    EXPECT_EQ(result.outcome, Outcome::DegradedCoverage);
    EXPECT_EQ(result.report->coverage.message_logs, 2u);
    EXPECT_NE(FindTitle(*result.report, "d3hsp not found"), nullptr);
}

// =============================================================================
// Error termination
// =============================================================================

TEST(DiagnosisPipeline, ErrorTerminationIsTracedToTheElement) {
    fixtures::TempRunDir dir;
    dir.Write("d3hsp", fixtures::HspErrorRun(4));

    auto result = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
    ASSERT_TRUE(result.report.has_value()) << result.message;
    const auto &report = *result.report;
    EXPECT_EQ(result.outcome, Outcome::DegradedCoverage);

    ASSERT_TRUE(report.termination.has_value());
    EXPECT_EQ(report.termination->kind, TerminationKind::ErrorTerminated);
    EXPECT_EQ(report.termination->error_code, 30010);

    const auto *termination = FindTitle(report, "Error termination");
    ASSERT_NE(termination, nullptr);
    EXPECT_EQ(termination->severity, FindingSeverity::Critical);
    EXPECT_EQ(termination->analyzer, "termination");

    const auto *failure = FindTitle(report, "Negative volume in element 101");
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->analyzer, "failure");
    EXPECT_NE(failure->message.find("part 1"), std::string::npos);
}

// =============================================================================
// Fatal input and cancellation
// =============================================================================

TEST(DiagnosisPipeline, EmptyDirectoryIsFatal) {
    fixtures::TempRunDir dir;
    dir.Write("glstat", fixtures::GlstatText(fixtures::HealthyGlstat()));

    auto result = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path());
    EXPECT_EQ(result.outcome, Outcome::FatalInput);
    EXPECT_FALSE(result.report.has_value());
    EXPECT_EQ(result.missing, (std::vector<std::string>{"d3hsp", "messag", "mes0000"}));
    EXPECT_EQ(ExitCode(result.outcome), 2);
}

TEST(DiagnosisPipeline, MissingDirectoryIsFatal) {
    fixtures::TempRunDir dir;
    auto result = DiagnosisPipeline(AnalysisConfig::Default()).Run(dir.Path() / "nope");
    EXPECT_EQ(result.outcome, Outcome::FatalInput);
    EXPECT_TRUE(result.missing.empty());
    EXPECT_NE(result.message.find("not a readable result directory"), std::string::npos);
}

TEST(DiagnosisPipeline, CancelledTokenAborts) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);

    CancellationToken token;
    token.RequestCancel();
    auto result = DiagnosisPipeline(AnalysisConfig::Default(), token).Run(dir.Path());
    EXPECT_EQ(result.outcome, Outcome::Aborted);
    EXPECT_FALSE(result.report.has_value());
    EXPECT_EQ(ExitCode(result.outcome), 130);
}

// =============================================================================
// Read phase
// =============================================================================

TEST(DiagnosisPipeline, ReadAllBuildsTheMapper) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);
    auto bundle = RunBundle::Discover(dir.Path(), 8);

    ErrorHandler errors(GetLogService());
    DiagnosisPipeline pipeline(AnalysisConfig::Default());
    auto inputs = pipeline.ReadAll(bundle, errors);

    EXPECT_EQ(inputs.mapper.OwningPart(201), PartId{2});
    EXPECT_EQ(inputs.mapper.NodeOwningPart(21), PartId{2});
    EXPECT_TRUE(inputs.data.nodal.has_value());
    EXPECT_TRUE(inputs.data.boundary.has_value());
    EXPECT_EQ(inputs.data.final_materials.size(), 2u);
    EXPECT_FALSE(inputs.data.warnings.empty());
}

// =============================================================================
// Transcript
// =============================================================================

TEST(DiagnosisPipeline, TaskLogsArriveAsOneOrderedBatch) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);

    TranscriptCapture capture;
    DiagnosisPipeline pipeline(AnalysisConfig::Default());
    pipeline.SetAnalyzerFactory([] {
        auto analyzers = DiagnosisPipeline::DefaultAnalyzers();
        analyzers.push_back(std::make_unique<EchoAnalyzer>());
        return analyzers;
    });
    auto result = pipeline.Run(dir.Path());
    ASSERT_TRUE(result.report.has_value()) << result.message;
    EXPECT_TRUE(GetLogService().IsImmediateMode());
    EXPECT_EQ(GetLogService().PendingCount(), 0u);

    const std::vector<LogEntry> *reader_batch = nullptr;
    const std::vector<LogEntry> *echo_batch = nullptr;
    for (const auto &batch : capture.batches) {
        for (const auto &entry : batch) {
            if (entry.context.stage == "reader" && reader_batch == nullptr) {
                reader_batch = &batch;
            }
            if (entry.context.FullPath() == "analysis.echo") {
                echo_batch = &batch;
            }
        }
    }

    ASSERT_NE(reader_batch, nullptr);
    EXPECT_TRUE(std::is_sorted(reader_batch->begin(), reader_batch->end(),
                               [](const LogEntry &a, const LogEntry &b) {
                                   return a.wall_time < b.wall_time;
                               }));
    std::size_t reader_entries = 0;
    for (const auto &batch : capture.batches) {
        for (const auto &entry : batch) {
            if (entry.context.stage != "reader") {
                continue;
            }
            ++reader_entries;
            EXPECT_FALSE(entry.context.source.empty()) << entry.message;
        }
    }
    // Every reader entry was held back and delivered in the single flush
    EXPECT_EQ(std::count_if(reader_batch->begin(), reader_batch->end(),
                            [](const LogEntry &e) { return e.context.stage == "reader"; }),
              static_cast<std::ptrdiff_t>(reader_entries));
    EXPECT_TRUE(std::any_of(reader_batch->begin(), reader_batch->end(), [](const LogEntry &e) {
        return e.context.FullPath() == "reader.d3hsp";
    }));

    ASSERT_NE(echo_batch, nullptr);
    EXPECT_NE(echo_batch, reader_batch);
}

// =============================================================================
// Unexpected failures
// =============================================================================

TEST(DiagnosisPipeline, AnalyzerExceptionEndsAsFatalInput) {
    fixtures::TempRunDir dir;
    WriteHealthyRun(dir);

    DiagnosisPipeline pipeline(AnalysisConfig::Default());
    pipeline.SetAnalyzerFactory([] {
        auto analyzers = DiagnosisPipeline::DefaultAnalyzers();
        analyzers.push_back(std::make_unique<ThrowingAnalyzer>());
        return analyzers;
    });

    const auto fatal_before = GetLogService().FatalCount();
    DiagnosisResult result;
    EXPECT_NO_THROW(result = pipeline.Run(dir.Path()));
    EXPECT_EQ(result.outcome, Outcome::FatalInput);
    EXPECT_FALSE(result.report.has_value());
    EXPECT_NE(result.message.find("vector index out of range"), std::string::npos);
    EXPECT_EQ(GetLogService().FatalCount(), fatal_before + 1);
    EXPECT_TRUE(GetLogService().IsImmediateMode());
}
