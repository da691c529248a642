#pragma once

/**
 * @file EnergyAnalyzer.hpp
 * @brief Energy balance checks over the global energy series
 *
 * Each rule is a free function over the series so it can be exercised
 * without a full run. EnergyAnalyzer::Analyze concatenates their output in
 * a fixed rule order; within a rule, Findings follow sample order.
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <map>
#include <vector>

namespace dynadiag {

namespace energy_limits {
constexpr double kHourglassWarning = 0.10;  ///< hourglass / internal
constexpr double kHourglassCritical = 0.20; ///< hourglass / internal
constexpr double kRatioLow = 0.95;
constexpr double kRatioHigh = 1.05;
constexpr double kRatioDivergence = 4.0; ///< distance outside [low, high]
constexpr double kKineticJump = 100.0;
constexpr double kKineticToInternal = 10.0;
constexpr double kSlidingShare = 0.30; ///< sliding / total
constexpr double kSlidingSpike = 50.0;
constexpr double kPartHourglassShare = 0.10;
} // namespace energy_limits

namespace rules::energy {

using Series = std::vector<EnergySample>;

/// Warning at the first sample above 10%, Critical at the first above 20%
[[nodiscard]] Findings HourglassGrowth(const Series &series, SourceKind source);

/// One Critical per sample more than 4.0 outside the [0.95, 1.05] band
[[nodiscard]] Findings RatioDivergence(const Series &series, SourceKind source);

/// One Warning at the first sample outside [0.95, 1.05]
[[nodiscard]] Findings RatioBand(const Series &series, SourceKind source);

/// One Warning per consecutive pair whose kinetic energy grows 100x or more
[[nodiscard]] Findings KineticJumps(const Series &series, SourceKind source);

/// One Warning at the first sample where kinetic exceeds 10x internal
[[nodiscard]] Findings KineticDominance(const Series &series, SourceKind source);

/// One Warning at the first sample where sliding energy exceeds 30% of total
[[nodiscard]] Findings SlidingShare(const Series &series, SourceKind source);

/// One Warning per consecutive pair whose sliding energy grows 50x or more
[[nodiscard]] Findings SlidingSpikes(const Series &series, SourceKind source);

/// One Critical at the first negative internal energy
[[nodiscard]] Findings NegativeInternal(const Series &series, SourceKind source);

/// One Warning per part whose hourglass share of internal energy exceeds 10%
[[nodiscard]] Findings PartHourglass(const std::map<PartId, MaterialSample> &materials,
                                     const ElementPartMapper &mapper);

[[nodiscard]] EnergySummary Summarize(const Series &series, SourceKind source);

/// hourglass / internal, 0 when internal is not positive
[[nodiscard]] double HourglassRatio(const EnergySample &s);

} // namespace rules::energy

class EnergyAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "energy"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
