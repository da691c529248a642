/**
 * @file WarningAnalyzer.cpp
 * @brief Warning code classification
 */

#include <dynadiag/analysis/WarningAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>

#include <algorithm>
#include <map>
#include <set>

namespace dynadiag {

namespace rules::warnings {

namespace {

struct CodeTally {
    int code = 0;
    bool error = false;
    std::int64_t count = 0;
    std::set<int> ranks;
    std::set<InterfaceId> interfaces;
    const WarningEvent *first = nullptr;
};

/// Tallies in order of first occurrence
std::vector<CodeTally> Collect(const std::vector<WarningEvent> &events) {
    std::map<int, std::size_t> index;
    std::vector<CodeTally> out;
    for (const auto &e : events) {
        if (e.code == 0 || e.kind == EventKind::Diagnostic) {
            continue;
        }
        auto [it, inserted] = index.try_emplace(e.code, out.size());
        if (inserted) {
            out.push_back(CodeTally{.code = e.code, .first = &e});
        }
        auto &t = out[it->second];
        t.error = t.error || e.kind == EventKind::Error;
        ++t.count;
        t.ranks.insert(e.rank);
        if (e.interface_id) {
            t.interfaces.insert(*e.interface_id);
        }
    }
    return out;
}

std::string JoinIds(const std::set<InterfaceId> &ids, std::size_t limit) {
    std::string out;
    std::size_t n = 0;
    for (auto id : ids) {
        if (n == limit) {
            out += ", ...";
            break;
        }
        out += (n++ ? ", " : "") + std::to_string(id);
    }
    return out;
}

} // namespace

std::vector<WarningCodeSummary> Tally(const std::vector<WarningEvent> &events,
                                      const KnowledgeBase &knowledge) {
    std::vector<WarningCodeSummary> out;
    for (const auto &t : Collect(events)) {
        auto info = knowledge.Lookup(t.code);
        out.push_back(WarningCodeSummary{.code = t.code,
                                         .kind = t.error ? EventKind::Error : EventKind::Warning,
                                         .title = info.title,
                                         .category = info.category,
                                         .count = t.count,
                                         .ranks = {t.ranks.begin(), t.ranks.end()}});
    }
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        bool ae = a.kind == EventKind::Error;
        bool be = b.kind == EventKind::Error;
        if (ae != be) {
            return ae;
        }
        if (ae) {
            return a.code < b.code;
        }
        if (a.count != b.count) {
            return a.count > b.count;
        }
        return a.code < b.code;
    });
    return out;
}

Findings Classify(const std::vector<WarningEvent> &events, const KnowledgeBase &knowledge) {
    Findings out;
    for (const auto &t : Collect(events)) {
        auto info = knowledge.Lookup(t.code);
        auto severity = t.error ? FindingSeverity::Critical : info.severity;
        std::string label = (t.error ? "Error " : "Warning ") + std::to_string(t.code);

        std::string msg = std::to_string(t.count) + " occurrence(s)";
        if (t.ranks.size() > 1 || *t.ranks.begin() != kPrimaryRank) {
            msg += " on " + std::to_string(t.ranks.size()) + " rank(s)";
        }
        msg += ". " + info.description;
        if (!t.interfaces.empty()) {
            msg += " Interfaces: " + JoinIds(t.interfaces, 10) + ".";
        }

        auto ref = evidence::Entity(t.first->source, "code", t.code,
                                    static_cast<double>(t.count));
        ref.cycle = t.first->cycle;
        out.push_back(FindingBuilder(severity, t.error ? "error" : "warning",
                                     label + ": " + info.title)
                          .Message(msg)
                          .Recommendation(info.recommendation)
                          .Evidence(ref)
                          .Occurrences(t.count)
                          .Build());
    }
    return out;
}

Findings Persistent(const std::vector<WarningEvent> &events, Cycle cycles) {
    if (cycles <= 0) {
        return {};
    }
    Findings out;
    for (const auto &t : Collect(events)) {
        const double share = static_cast<double>(t.count) / static_cast<double>(cycles);
        if (share <= warning_limits::kPersistentShare) {
            continue;
        }
        const bool negative_volume = t.code == warning_limits::kNegativeVolume;
        const bool tied_definition = t.code == 40538 || t.code == 40540;
        if (!negative_volume && !tied_definition) {
            continue;
        }

        std::string title = "Warning " + std::to_string(t.code) + " on " +
                            Console::FormatNumber(share * 100.0, 0) + "% of cycles";
        std::string msg = std::to_string(t.count) + " occurrences over " +
                          std::to_string(cycles) + " cycles.";
        FindingBuilder builder(negative_volume ? FindingSeverity::Critical
                                               : FindingSeverity::Warning,
                               "warning", title);
        if (negative_volume) {
            builder.Message(msg + " An element keeps inverting every cycle and cannot "
                                  "recover.")
                .Recommendation("Remesh the distorted region, add *MAT_ADD_EROSION, or set "
                                "ERODE=1 in *CONTROL_TIMESTEP.");
        } else {
            if (!t.interfaces.empty()) {
                msg += " Interfaces: " + JoinIds(t.interfaces, 5) + ".";
            }
            builder.Message(msg + " A tied interface definition is rejected repeatedly.")
                .Recommendation("Review the tied contact definitions of the listed "
                                "interfaces.");
        }
        auto ref = evidence::Entity(t.first->source, "code", t.code, share);
        ref.cycle = t.first->cycle;
        builder.Evidence(ref).Occurrences(t.count);
        out.push_back(std::move(builder).Build());
    }
    return out;
}

} // namespace rules::warnings

AnalyzerResult WarningAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::warnings;
    AnalyzerResult result;
    auto tally = Tally(ctx.data.warnings, ctx.knowledge);
    if (tally.empty()) {
        return result;
    }
    result.findings = Classify(ctx.data.warnings, ctx.knowledge);
    if (ctx.data.termination) {
        Append(result.findings, Persistent(ctx.data.warnings, ctx.data.termination->cycles));
    }
    result.summaries.warning_codes = std::move(tally);
    return result;
}

} // namespace dynadiag
