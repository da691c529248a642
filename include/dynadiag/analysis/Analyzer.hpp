#pragma once

/**
 * @file Analyzer.hpp
 * @brief Base class for the diagnostic analyzers
 */

#include <dynadiag/analysis/Finding.hpp>
#include <dynadiag/analysis/RunData.hpp>
#include <dynadiag/analysis/Summaries.hpp>
#include <dynadiag/io/AnalysisConfig.hpp>
#include <dynadiag/model/ElementPartMapper.hpp>
#include <dynadiag/model/KnowledgeBase.hpp>

#include <string>

namespace dynadiag {

/**
 * @brief Read-only inputs shared by every analyzer in one run
 */
struct AnalysisContext {
    const RunData &data;
    const ElementPartMapper &mapper;
    const KnowledgeBase &knowledge;
    const AnalysisConfig &config;
};

struct AnalyzerResult {
    Findings findings;
    DerivedSummaries summaries;
};

/**
 * @brief One diagnostic concern
 *
 * Analyzers hold no mutable state, so Analyze() may run concurrently with
 * every other analyzer. Findings are emitted in evidence order; severity
 * ordering is left to presentation.
 */
class Analyzer {
  public:
    virtual ~Analyzer() = default;

    /// Stable name, copied into Finding::analyzer
    [[nodiscard]] virtual std::string Name() const = 0;

    [[nodiscard]] virtual AnalyzerResult Analyze(const AnalysisContext &ctx) const = 0;
};

} // namespace dynadiag
