#pragma once

/**
 * @file WarningAnalyzer.hpp
 * @brief Per-code warning and error tallies across all message logs
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <string>
#include <vector>

namespace dynadiag {

namespace warning_limits {
constexpr double kPersistentShare = 0.5; ///< occurrences / solver cycles
constexpr int kNegativeVolume = 40509;
} // namespace warning_limits

namespace rules::warnings {

/**
 * @brief Tally coded events
 *
 * Diagnostic events and code 0 are skipped. Errors come first in code
 * order, then warnings by descending count and ascending code.
 */
[[nodiscard]] std::vector<WarningCodeSummary> Tally(const std::vector<WarningEvent> &events,
                                                    const KnowledgeBase &knowledge);

/**
 * @brief One Finding per code, in order of first occurrence
 *
 * Errors and codes catalogued as Critical are Critical; other codes take
 * the catalogue severity.
 */
[[nodiscard]] Findings Classify(const std::vector<WarningEvent> &events,
                                const KnowledgeBase &knowledge);

/**
 * @brief Codes that recur on more than half of the solver cycles
 *
 * Negative volume (40509) is Critical. The tied-contact definition codes
 * 40538 and 40540 are Warnings and list up to five interfaces. Other codes
 * are left to Classify(). Silent when `cycles` is not positive.
 */
[[nodiscard]] Findings Persistent(const std::vector<WarningEvent> &events, Cycle cycles);

} // namespace rules::warnings

class WarningAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "warnings"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
