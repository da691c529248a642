/**
 * @file FailureTracer.cpp
 * @brief Element-level failure tracing
 */

#include <dynadiag/analysis/FailureTracer.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>

#include <map>
#include <utility>

namespace dynadiag {

namespace rules::failure {

namespace {

struct FailureSite {
    FailureKind kind = FailureKind::NegativeVolume;
    std::optional<ElementId> element;
    std::optional<PartId> part;
    const WarningEvent *first = nullptr;
    std::int64_t occurrences = 0;
};

std::string Describe(const FailureSite &t, const ElementPartMapper &mapper) {
    std::string what = t.kind == FailureKind::NegativeVolume ? "Negative volume"
                                                             : "NaN in the constraint matrix";
    std::string msg = what;
    if (t.element) {
        msg += " in element " + std::to_string(*t.element);
    }
    if (t.part) {
        msg += " of part " + std::to_string(*t.part);
        if (auto title = mapper.PartTitle(*t.part); title && !title->empty()) {
            msg += " (" + *title + ")";
        }
    }
    if (t.first->cycle) {
        msg += ", first reported at cycle " + std::to_string(*t.first->cycle);
    }
    if (t.first->rank != kPrimaryRank) {
        msg += " on rank " + std::to_string(t.first->rank);
    }
    msg += ".";
    if (t.occurrences > 1) {
        msg += " Reported " + std::to_string(t.occurrences) + " times.";
    }
    return msg;
}

} // namespace

std::optional<FailureKind> Classify(const WarningEvent &event) {
    switch (event.code) {
    case 40509:
    case 30010:
    case 40003:
    case 40004:
        return FailureKind::NegativeVolume;
    case 30358:
        return FailureKind::ConstraintNan;
    default:
        break;
    }
    std::string lower = text::Lower(event.message);
    if (refs::IsNegativeVolume(lower)) {
        return FailureKind::NegativeVolume;
    }
    if (refs::IsConstraintNan(lower)) {
        return FailureKind::ConstraintNan;
    }
    return std::nullopt;
}

Findings Trace(const std::vector<WarningEvent> &events, const ElementPartMapper &mapper) {
    using Key = std::pair<FailureKind, std::optional<ElementId>>;
    std::map<Key, std::size_t> index;
    std::vector<FailureSite> sites;

    for (const auto &e : events) {
        auto kind = Classify(e);
        if (!kind) {
            continue;
        }
        Key key{*kind, e.element};
        auto [it, inserted] = index.try_emplace(key, sites.size());
        if (inserted) {
            FailureSite t{.kind = *kind, .element = e.element, .part = e.part, .first = &e};
            if (!t.part && e.element) {
                t.part = mapper.OwningPart(*e.element);
            }
            sites.push_back(t);
        }
        ++sites[it->second].occurrences;
    }

    Findings out;
    for (const auto &t : sites) {
        bool nan = t.kind == FailureKind::ConstraintNan;
        std::string title = nan ? "Constraint matrix NaN" : "Negative volume";
        if (t.element) {
            title += " in element " + std::to_string(*t.element);
        }
        EvidenceRef ref = t.element
                              ? evidence::Entity(t.first->source, "element", *t.element)
                              : evidence::Entity(t.first->source, "code", t.first->code);
        ref.cycle = t.first->cycle;
        out.push_back(
            FindingBuilder(FindingSeverity::Critical, "failure", title)
                .Message(Describe(t, mapper))
                .Recommendation(nan ? "Check *CONSTRAINED_* definitions for conflicting or "
                                      "redundant constraints and look for shooting nodes "
                                      "near them."
                                    : "Improve mesh quality in the affected part, add "
                                      "*MAT_ADD_EROSION, or switch to an element "
                                      "formulation that tolerates large distortion.")
                .Evidence(ref)
                .Occurrences(t.occurrences)
                .Build());
    }
    return out;
}

} // namespace rules::failure

AnalyzerResult FailureTracer::Analyze(const AnalysisContext &ctx) const {
    AnalyzerResult result;
    result.findings = rules::failure::Trace(ctx.data.warnings, ctx.mapper);
    return result;
}

} // namespace dynadiag
