#pragma once

/**
 * @file FailureTracer.hpp
 * @brief Root-cause tracing for negative volumes and constraint NaNs
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <string>

namespace dynadiag {

enum class FailureKind : uint8_t { NegativeVolume, ConstraintNan };

namespace rules::failure {

/// Classify a message event, by code first and then by message text
[[nodiscard]] std::optional<FailureKind> Classify(const WarningEvent &event);

/**
 * @brief One Critical per distinct failing element, in order of first sight
 *
 * Repeats of an element raise the occurrence count of its Finding. Events
 * that name no element fold into one Finding per failure kind. The owning
 * part comes from the event itself, then from the mapper.
 */
[[nodiscard]] Findings Trace(const std::vector<WarningEvent> &events,
                             const ElementPartMapper &mapper);

} // namespace rules::failure

class FailureTracer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "failure"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
