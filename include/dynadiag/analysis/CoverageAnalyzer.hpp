#pragma once

/**
 * @file CoverageAnalyzer.hpp
 * @brief Reports which inputs were unavailable or partly unreadable
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <string>

namespace dynadiag {

namespace rules::coverage {

/// Checks that cannot run without `source`
[[nodiscard]] const char *LostChecks(SourceKind source);

/// One Info per missing source; these carry no evidence
[[nodiscard]] Findings Missing(const std::vector<SourceKind> &missing);

/// One Info per source with skipped records
[[nodiscard]] Findings Skipped(const std::map<SourceKind, std::size_t> &skipped);

} // namespace rules::coverage

class CoverageAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "coverage"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
