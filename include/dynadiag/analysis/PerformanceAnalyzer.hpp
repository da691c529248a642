#pragma once

/**
 * @file PerformanceAnalyzer.hpp
 * @brief CPU share per solver phase and MPP load balance
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <string>
#include <vector>

namespace dynadiag {

namespace performance_limits {
constexpr double kContactShare = 40.0;         ///< percent of CPU time
constexpr double kContactCritical = 50.0;
constexpr double kForceGatherWarning = 5.0;
constexpr double kForceGatherCritical = 10.0;
constexpr double kMassScaling = 5.0;
constexpr double kSharingOverhead = 25.0; ///< summed over sharing phases
constexpr double kBottleneck = 25.0;
constexpr double kLoadCv = 0.08;               ///< stddev / mean across ranks
constexpr double kDecompositionWarning = 0.30; ///< (max - min) / max
constexpr double kDecompositionCritical = 0.50;
} // namespace performance_limits

namespace rules::performance {

/**
 * @brief CPU share of each top-level solver phase
 *
 * Taken from the d3hsp timing table (indented breakdown rows excluded).
 * Without one, load_profile.csv seconds are summed over ranks.
 */
[[nodiscard]] std::vector<ComponentShare> Shares(const RunData &data);

/// Per-component coefficient of variation of seconds across ranks
[[nodiscard]] std::vector<LoadImbalance> Imbalance(const RunData &data);

/// Statistics over one per-rank series; `values[i]` belongs to rank i
[[nodiscard]] LoadImbalance Statistics(const std::string &component,
                                       const std::vector<double> &values);

/// Per contact phase: Warning above 40% of CPU time, Critical above 50%
[[nodiscard]] Findings ContactShare(const std::vector<ComponentShare> &shares, SourceKind source);

/**
 * @brief Overhead phases of an MPP run
 *
 * Force gather (rigid body force exchange) warns above 5% and is Critical
 * above 10%. Mass scaling warns above 5%.
 */
[[nodiscard]] Findings PhaseOverhead(const std::vector<ComponentShare> &shares,
                                     SourceKind source);

/// Warning when the "sharing" / "shr" phases together exceed 25%
[[nodiscard]] Findings SharingOverhead(const std::vector<ComponentShare> &shares,
                                       SourceKind source);

/// Info per phase above 25%, in table order
[[nodiscard]] Findings Bottlenecks(const std::vector<ComponentShare> &shares, SourceKind source);

/// Warning per component whose rank CV exceeds 8%
[[nodiscard]] Findings LoadBalance(const std::vector<LoadImbalance> &imbalance);

/// Warning above 30%, Critical above 50% decomposition cost spread
[[nodiscard]] Findings Decomposition(const DecompositionStats &stats);

/// (max - min) / max, or nothing when the table is absent or degenerate
[[nodiscard]] std::optional<double> DecompositionImbalance(const DecompositionStats &stats);

} // namespace rules::performance

class PerformanceAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "performance"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
