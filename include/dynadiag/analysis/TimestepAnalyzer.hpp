#pragma once

/**
 * @file TimestepAnalyzer.hpp
 * @brief Timestep stability: collapse, controlling intervals, smallest elements
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <vector>

namespace dynadiag {

namespace timestep_limits {
constexpr double kCollapseDt = 1e-11;
constexpr double kDropWarning = 0.50;  ///< min dt / initial dt
constexpr double kDropCritical = 0.10; ///< min dt / initial dt
constexpr double kDominantPartShare = 0.80;
constexpr std::size_t kTopElements = 20;
constexpr std::size_t kPartGroupEntries = 100;
} // namespace timestep_limits

namespace rules::timestep {

/**
 * @brief Controlling-element records for the run
 *
 * d3hsp records when present, otherwise derived from the energy series.
 */
[[nodiscard]] std::vector<TimestepRecord> Records(const RunData &data);

/// One Critical per contiguous run of records with 0 < dt < 1e-11
[[nodiscard]] Findings Collapse(const std::vector<TimestepRecord> &records, SourceKind source);

/**
 * @brief Compress records into intervals of constant controlling element
 *
 * Intervals are contiguous and non-overlapping: each ends one cycle before
 * the next begins and the last ends at the final record's cycle. A record
 * at a cycle not beyond the open interval's start never opens a new one.
 */
[[nodiscard]] std::vector<ControllingInterval>
Intervals(const std::vector<TimestepRecord> &records);

/// Warning below 50% of the initial dt, Critical below 10%
[[nodiscard]] Findings DtDrop(const std::vector<TimestepRecord> &records, SourceKind source);

/// The N smallest entries, ascending by dt then element id
[[nodiscard]] std::vector<ElementTimestep> SmallestElements(
    const std::vector<ElementTimestep> &entries, std::size_t n);

/// Per-part grouping of the first `n` smallest entries, ascending by min dt
[[nodiscard]] std::vector<PartTimestepGroup>
GroupByPart(const std::vector<ElementTimestep> &entries, std::size_t n,
            const ElementPartMapper &mapper);

/// Info when one part owns more than 80% of the smallest-timestep table
[[nodiscard]] Findings DominantPart(const std::vector<ElementTimestep> &entries);

/// Info when mass scaling (dt2ms) is configured
[[nodiscard]] Findings MassScaling(const ModelSummary &model);

} // namespace rules::timestep

class TimestepAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "timestep"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
