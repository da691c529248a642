#pragma once

/**
 * @file ContactAnalyzer.hpp
 * @brief Per-interface contact summary, warning load and cost ranking
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dynadiag {

namespace contact_limits {
constexpr std::int64_t kWarningCount = 100;
constexpr double kDominantShare = 0.50; ///< of total contact clock time
} // namespace contact_limits

namespace rules::contact {

/**
 * @brief One summary per interface id, ranked by clock time descending
 *
 * Ties on clock time keep ascending id order. Warning counts come from the
 * solver's per-interface summaries when present (summed over ranks),
 * otherwise from counting warning events that name the interface. Timing
 * comes from d3hsp, falling back to cont_profile.csv sums.
 */
[[nodiscard]] std::vector<ContactInterfaceSummary> Summarize(const RunData &data);

/// One Warning per interface with more than 100 warnings, in id order
[[nodiscard]] Findings WarningLoad(const std::vector<ContactInterfaceSummary> &summaries);

/// One Info per interface with initial penetrations, in id order
[[nodiscard]] Findings Penetrations(const std::vector<ContactInterfaceSummary> &summaries);

/// Where interface timing comes from: d3hsp when it has any, else cont_profile.csv
[[nodiscard]] SourceKind TimingSource(const RunData &data);

/// Info when the top-ranked interface takes more than half the contact time
[[nodiscard]] Findings DominantInterface(const std::vector<ContactInterfaceSummary> &ranked,
                                         SourceKind source);

/**
 * @brief Warning when the solver reports a contact stability dt ceiling
 *
 * Names the active surface with the smallest timestep. Silent without a
 * positive limit or without an active surface. `element_dt` is the smallest
 * element timestep, when known.
 */
[[nodiscard]] Findings StabilityLimit(const ContactStability &stability,
                                      std::optional<double> element_dt);

/// "Automatic Single Surface" for "a 13", "Type 99" when unknown
[[nodiscard]] std::string TypeName(std::string_view type_code);

} // namespace rules::contact

class ContactAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "contact"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
