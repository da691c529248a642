#pragma once

/**
 * @file TerminationAnalyzer.hpp
 * @brief How the run ended
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <string>

namespace dynadiag {

namespace termination_limits {
constexpr double kCompletedFraction = 0.99; ///< of the termination time
}

namespace rules::termination {

/**
 * @brief Termination status of the run
 *
 * d3hsp decides when it was read. Otherwise the message-log banners do: any
 * error banner wins, then any normal banner; a run with message logs but no
 * banner is Incomplete. Nothing when neither source is present.
 */
[[nodiscard]] std::optional<TerminationStatus> Resolve(const RunData &data);

[[nodiscard]] Findings Assess(const TerminationStatus &status, const KnowledgeBase &knowledge);

} // namespace rules::termination

class TerminationAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "termination"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
