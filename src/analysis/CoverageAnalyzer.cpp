/**
 * @file CoverageAnalyzer.cpp
 * @brief Coverage notes
 */

#include <dynadiag/analysis/CoverageAnalyzer.hpp>

namespace dynadiag {

namespace rules::coverage {

const char *LostChecks(SourceKind source) {
    switch (source) {
    case SourceKind::Hsp:
        return "model summary, part and contact tables, timing and termination details";
    case SourceKind::Glstat:
        return "energy checks fall back to the d3hsp energy blocks";
    case SourceKind::Status:
        return "cycle progress and completion estimates";
    case SourceKind::Matsum:
        return "per-part hourglass energy";
    case SourceKind::Messages:
        return "per-rank warnings, initial penetrations and failure tracing";
    case SourceKind::Nodout:
        return "shooting-node and oscillation checks";
    case SourceKind::Bndout:
        return "reaction force spike and damping checks";
    case SourceKind::LoadProfile:
        return "per-rank load balance";
    case SourceKind::ContactProfile:
        return "per-rank contact timing";
    case SourceKind::InputDeck:
        return "element-to-part mapping beyond the d3hsp timestep tables";
    }
    return "";
}

Findings Missing(const std::vector<SourceKind> &missing) {
    Findings out;
    for (auto source : missing) {
        out.push_back(FindingBuilder(FindingSeverity::Info, "coverage",
                                     std::string(SourceName(source)) + " not found")
                          .Message(std::string("Unavailable: ") + LostChecks(source) + ".")
                          .Build());
    }
    return out;
}

Findings Skipped(const std::map<SourceKind, std::size_t> &skipped) {
    Findings out;
    for (const auto &[source, count] : skipped) {
        if (count == 0) {
            continue;
        }
        out.push_back(FindingBuilder(FindingSeverity::Info, "coverage",
                                     std::string(SourceName(source)) + " partly unreadable")
                          .Message(std::to_string(count) + " records could not be parsed in " +
                                   SourceName(source) + "; results from it are incomplete.")
                          .Recommendation("Run with --verbose to log each skipped line.")
                          .Evidence(evidence::Entity(source, "run", 0,
                                                     static_cast<double>(count)))
                          .Occurrences(static_cast<std::int64_t>(count))
                          .Build());
    }
    return out;
}

} // namespace rules::coverage

AnalyzerResult CoverageAnalyzer::Analyze(const AnalysisContext &ctx) const {
    AnalyzerResult result;
    Append(result.findings, rules::coverage::Missing(ctx.data.missing));
    Append(result.findings, rules::coverage::Skipped(ctx.data.skipped));
    return result;
}

} // namespace dynadiag
