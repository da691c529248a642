#pragma once

/**
 * @file InstabilityAnalyzer.hpp
 * @brief Shooting nodes, non-physical oscillation and boundary force spikes
 *
 * nodout and bndout can be far larger than memory. The two trackers below
 * consume one sample at a time and keep per-node state bounded by a
 * trailing window, so their footprint depends only on the tracked-node cap
 * and the window sizes. Each tracker is driven by exactly one reader task.
 */

#include <dynadiag/analysis/Analyzer.hpp>
#include <dynadiag/analysis/Screening.hpp>

#include <array>
#include <deque>
#include <map>
#include <optional>
#include <string>

namespace dynadiag {

namespace instability_limits {
constexpr double kShootingSpeed = 1000.0;      ///< solver velocity units
constexpr double kOscillationHz = 10000.0;
constexpr std::size_t kMinZcrSamples = 10;
constexpr double kSpikeRatio = 100.0;          ///< peak / mean magnitude
constexpr std::size_t kMinSpikeSamples = 5;
constexpr double kMinMeanForce = 1e-9;
constexpr double kAlternatingShare = 0.9;      ///< of difference pairs
constexpr double kDecayRatio = 0.5;            ///< late / early amplitude
constexpr double kMinSwing = 0.01;             ///< early amplitude / mean magnitude
} // namespace instability_limits

/**
 * @brief Streaming screen over nodout samples
 */
class NodalInstabilityTracker {
  public:
    NodalInstabilityTracker(std::size_t zcr_window, std::size_t node_cap)
        : zcr_window_(zcr_window < 2 ? 2 : zcr_window), node_cap_(node_cap) {}

    void Observe(const NodalSample &sample);

    /// Results ordered by the sample that triggered them
    [[nodiscard]] NodalScreening Finish() const;

    /// Zero-crossing frequency of a windowed signal, crossings / (2 * duration)
    [[nodiscard]] static double ZeroCrossingFrequency(const std::deque<double> &values,
                                                      double duration);

  private:
    struct NodeState {
        std::optional<ShootingNode> shooting;
        std::optional<OscillatingNode> oscillating;
        std::deque<double> times;
        std::array<std::deque<double>, 3> velocity;
    };

    std::size_t zcr_window_;
    std::size_t node_cap_;
    std::size_t samples_ = 0;
    std::map<NodeId, NodeState> nodes_;
};

/**
 * @brief Streaming screen over bndout samples
 */
class BoundaryInstabilityTracker {
  public:
    BoundaryInstabilityTracker(std::size_t damping_window, std::size_t node_cap)
        : damping_window_(damping_window < 4 ? 4 : damping_window), node_cap_(node_cap) {}

    void Observe(const BoundaryForceSample &sample);

    [[nodiscard]] BoundaryScreening Finish() const;

    /**
     * @brief True when successive differences keep alternating sign and the
     *        late half of the window has not decayed below half the early half
     *
     * `early` and `late` receive the mean absolute difference of each half.
     */
    [[nodiscard]] static bool IsUndamped(const std::deque<double> &values, double &early,
                                         double &late);

  private:
    struct NodeState {
        std::size_t count = 0;
        double sum = 0.0;
        double peak = -1.0;
        std::size_t peak_ordinal = 0;
        Cycle peak_cycle = 0;
        double peak_time = 0.0;
        std::deque<double> window;
        std::optional<UndampedNode> undamped;
    };

    std::size_t damping_window_;
    std::size_t node_cap_;
    std::size_t samples_ = 0;
    std::map<NodeId, NodeState> nodes_;
};

namespace rules::instability {

[[nodiscard]] Findings Shooting(const NodalScreening &screen, const ElementPartMapper &mapper);

[[nodiscard]] Findings Oscillation(const NodalScreening &screen, const ElementPartMapper &mapper);

[[nodiscard]] Findings Spikes(const BoundaryScreening &screen);

[[nodiscard]] Findings Damping(const BoundaryScreening &screen);

} // namespace rules::instability

class InstabilityAnalyzer : public Analyzer {
  public:
    [[nodiscard]] std::string Name() const override { return "instability"; }
    [[nodiscard]] AnalyzerResult Analyze(const AnalysisContext &ctx) const override;
};

} // namespace dynadiag
