/**
 * @file TerminationAnalyzer.cpp
 * @brief Termination status rules
 */

#include <dynadiag/analysis/TerminationAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>

namespace dynadiag {

namespace rules::termination {

std::optional<TerminationStatus> Resolve(const RunData &data) {
    if (data.termination) {
        return data.termination;
    }
    if (!data.IsPresent(SourceKind::Messages)) {
        return std::nullopt;
    }
    TerminationStatus status{.kind = TerminationKind::Incomplete, .source = SourceKind::Messages};
    for (const auto &b : data.banners) {
        if (b.kind == TerminationKind::ErrorTerminated) {
            status.kind = TerminationKind::ErrorTerminated;
            break;
        }
        if (b.kind == TerminationKind::Normal) {
            status.kind = TerminationKind::Normal;
        }
    }
    if (status.kind == TerminationKind::ErrorTerminated) {
        for (auto it = data.warnings.rbegin(); it != data.warnings.rend(); ++it) {
            if (it->kind == EventKind::Error && it->code != 0) {
                status.error_code = it->code;
                break;
            }
        }
    }
    if (!data.progress.empty()) {
        status.cycles = data.progress.back().cycle;
        status.actual_time = data.progress.back().time;
    }
    return status;
}

Findings Assess(const TerminationStatus &status, const KnowledgeBase &knowledge) {
    auto ref = evidence::Entity(status.source, "run", 0, status.actual_time);
    ref.cycle = status.cycles;
    ref.time = status.actual_time;

    switch (status.kind) {
    case TerminationKind::ErrorTerminated: {
        std::string msg = "The solver stopped with an error termination at cycle " +
                          std::to_string(status.cycles) + " (t=" +
                          Console::FormatScientific(status.actual_time, 4) + ").";
        std::string recommendation = "Inspect the last errors in the message logs and the "
                                     "failure findings for the element or part involved.";
        if (status.error_code) {
            auto info = knowledge.Lookup(*status.error_code);
            msg += " Last error: " + std::to_string(*status.error_code) + " " + info.title + ".";
            if (!info.recommendation.empty()) {
                recommendation = info.recommendation;
            }
        }
        return {FindingBuilder(FindingSeverity::Critical, "termination", "Error termination")
                    .Message(msg)
                    .Recommendation(recommendation)
                    .Evidence(ref)
                    .Build()};
    }
    case TerminationKind::Incomplete:
        return {FindingBuilder(FindingSeverity::Critical, "termination",
                               "Run did not terminate")
                    .Message("No termination banner was written; the run was killed, ran "
                             "out of resources or is still running. Last cycle " +
                             std::to_string(status.cycles) + ".")
                    .Recommendation("Check the job scheduler log and available memory/disk; "
                                    "restart from the last d3dump if one exists.")
                    .Evidence(ref)
                    .Build()};
    case TerminationKind::Normal:
        break;
    }

    if (status.target_time > 0.0 &&
        status.actual_time < termination_limits::kCompletedFraction * status.target_time) {
        double pct = status.actual_time / status.target_time * 100.0;
        return {FindingBuilder(FindingSeverity::Warning, "termination",
                               "Normal termination before the end time")
                    .Message("The run terminated normally at t=" +
                             Console::FormatScientific(status.actual_time, 4) + ", " +
                             Console::FormatNumber(pct, 1) + "% of the termination time " +
                             Console::FormatScientific(status.target_time, 4) + ".")
                    .Recommendation("Check for a sense switch, *TERMINATION_* criteria or a "
                                    "minimum time step (TSMIN) stop.")
                    .Evidence(ref)
                    .Build()};
    }
    return {};
}

} // namespace rules::termination

AnalyzerResult TerminationAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::termination;
    AnalyzerResult result;
    if (auto status = Resolve(ctx.data)) {
        result.findings = Assess(*status, ctx.knowledge);
    }
    return result;
}

} // namespace dynadiag
