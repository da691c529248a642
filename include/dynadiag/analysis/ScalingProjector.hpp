#pragma once

/**
 * @file ScalingProjector.hpp
 * @brief Projected parallel efficiency at larger MPP core counts
 *
 * Timing components are classified as parallel, communication or serial.
 * At a core ratio r = n / n0 the elapsed time is modelled as
 *
 *     T(r) = P / r + C * r^k + S
 *
 * with k the configured communication growth exponent. Efficiency is
 * (T(1) / T(r)) / r. The numbers are projections, not measurements.
 */

#include <dynadiag/analysis/Analyzer.hpp>

#include <array>
#include <string>
#include <string_view>

namespace dynadiag {

namespace scaling_limits {
inline constexpr std::array<int, 4> kTargetCores = {32, 64, 128, 256};
constexpr double kSevere = 0.50;
constexpr double kCautionary = 0.70;
} // namespace scaling_limits

enum class PhaseClass : uint8_t { Parallel, Communication, Serial, Unknown };

namespace rules::scaling {

/// Keyword classification of a d3hsp timing component name
[[nodiscard]] PhaseClass Classify(std::string_view component);

struct PhaseSplit {
    double parallel = 0.0;
    double communication = 0.0;
    double serial = 0.0;

    [[nodiscard]] double Total() const { return parallel + communication + serial; }
};

/// Clock seconds per class; unknown components are split evenly parallel/serial
[[nodiscard]] PhaseSplit Split(const TimingTable &timing);

/// Model elapsed time at core ratio `ratio`
[[nodiscard]] double Elapsed(const PhaseSplit &split, double ratio, double exponent);

[[nodiscard]] const char *Band(double efficiency);

/// Projections for each target above `current_cores`
[[nodiscard]] ScalingSummary Project(const PhaseSplit &split, int current_cores, double exponent);

/// One Finding per projection: Warning when severe, Info otherwise
[[nodiscard]] Findings Describe(const ScalingSummary &summary);

} // namespace rules::scaling

class ScalingProjector : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "scaling"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
