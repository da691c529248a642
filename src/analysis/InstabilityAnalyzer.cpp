/**
 * @file InstabilityAnalyzer.cpp
 * @brief Streaming trackers and instability rules
 */

#include <dynadiag/analysis/InstabilityAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace dynadiag {

namespace {

double Magnitude(const Vec3 &v) { return Eigen::Map<const Eigen::Vector3d>(v.data()).norm(); }

std::string NodeLabel(NodeId node, const ElementPartMapper &mapper) {
    std::string label = "Node " + std::to_string(node);
    if (auto part = mapper.NodeOwningPart(node)) {
        label += " (part " + std::to_string(*part);
        if (auto title = mapper.PartTitle(*part); title && !title->empty()) {
            label += " " + *title;
        }
        label += ")";
    }
    return label;
}

EvidenceRef At(SourceKind source, NodeId node, Cycle cycle, double time, double value) {
    auto ref = evidence::Entity(source, "node", node, value);
    ref.cycle = cycle;
    ref.time = time;
    return ref;
}

} // namespace

// =============================================================================
// NodalInstabilityTracker
// =============================================================================

double NodalInstabilityTracker::ZeroCrossingFrequency(const std::deque<double> &values,
                                                      double duration) {
    if (values.size() < 2 || duration <= 0.0) {
        return 0.0;
    }
    std::size_t crossings = 0;
    for (std::size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] * values[i] < 0.0) {
            ++crossings;
        }
    }
    return static_cast<double>(crossings) / (2.0 * duration);
}

void NodalInstabilityTracker::Observe(const NodalSample &sample) {
    auto it = nodes_.find(sample.node);
    if (it == nodes_.end()) {
        if (nodes_.size() >= node_cap_) {
            return;
        }
        it = nodes_.emplace(sample.node, NodeState{}).first;
    }
    auto &state = it->second;
    ++samples_;

    double speed = Magnitude(sample.velocity);
    if (speed > instability_limits::kShootingSpeed) {
        if (!state.shooting) {
            state.shooting = ShootingNode{.node = sample.node,
                                          .first_ordinal = sample.ordinal,
                                          .first_cycle = sample.cycle,
                                          .first_time = sample.time};
        }
        auto &s = *state.shooting;
        ++s.samples_above;
        if (speed > s.peak_speed) {
            s.peak_speed = speed;
            s.peak_cycle = sample.cycle;
            s.peak_time = sample.time;
        }
    }

    state.times.push_back(sample.time);
    for (std::size_t c = 0; c < 3; ++c) {
        state.velocity[c].push_back(sample.velocity[c]);
    }
    if (state.times.size() > zcr_window_) {
        state.times.pop_front();
        for (auto &v : state.velocity) {
            v.pop_front();
        }
    }

    if (state.oscillating ||
        state.times.size() < std::min(instability_limits::kMinZcrSamples, zcr_window_)) {
        return;
    }
    double duration = state.times.back() - state.times.front();
    for (int c = 0; c < 3; ++c) {
        double f = ZeroCrossingFrequency(state.velocity[static_cast<std::size_t>(c)], duration);
        if (f > instability_limits::kOscillationHz &&
            (!state.oscillating || f > state.oscillating->frequency_hz)) {
            state.oscillating = OscillatingNode{.node = sample.node,
                                                .ordinal = sample.ordinal,
                                                .cycle = sample.cycle,
                                                .time = sample.time,
                                                .frequency_hz = f,
                                                .component = c};
        }
    }
}

NodalScreening NodalInstabilityTracker::Finish() const {
    NodalScreening out{.nodes = nodes_.size(), .samples = samples_};
    for (const auto &[node, state] : nodes_) {
        if (state.shooting) {
            out.shooting.push_back(*state.shooting);
        }
        if (state.oscillating) {
            out.oscillating.push_back(*state.oscillating);
        }
    }
    std::stable_sort(
        out.shooting.begin(), out.shooting.end(),
        [](const auto &a, const auto &b) { return a.first_ordinal < b.first_ordinal; });
    std::stable_sort(out.oscillating.begin(), out.oscillating.end(),
                     [](const auto &a, const auto &b) { return a.ordinal < b.ordinal; });
    return out;
}

// =============================================================================
// BoundaryInstabilityTracker
// =============================================================================

bool BoundaryInstabilityTracker::IsUndamped(const std::deque<double> &values, double &early,
                                            double &late) {
    early = 0.0;
    late = 0.0;
    if (values.size() < 4) {
        return false;
    }
    std::vector<double> diffs;
    diffs.reserve(values.size() - 1);
    for (std::size_t i = 1; i < values.size(); ++i) {
        diffs.push_back(values[i] - values[i - 1]);
    }
    std::size_t alternating = 0;
    for (std::size_t i = 1; i < diffs.size(); ++i) {
        if (diffs[i - 1] * diffs[i] < 0.0) {
            ++alternating;
        }
    }
    double share = static_cast<double>(alternating) / static_cast<double>(diffs.size() - 1);

    std::size_t half = diffs.size() / 2;
    for (std::size_t i = 0; i < diffs.size(); ++i) {
        (i < half ? early : late) += std::abs(diffs[i]);
    }
    early /= static_cast<double>(half);
    late /= static_cast<double>(diffs.size() - half);

    return share >= instability_limits::kAlternatingShare && early > 0.0 &&
           late >= instability_limits::kDecayRatio * early;
}

void BoundaryInstabilityTracker::Observe(const BoundaryForceSample &sample) {
    auto it = nodes_.find(sample.node);
    if (it == nodes_.end()) {
        if (nodes_.size() >= node_cap_) {
            return;
        }
        it = nodes_.emplace(sample.node, NodeState{}).first;
    }
    auto &state = it->second;
    ++samples_;

    double magnitude = Magnitude(sample.force);
    ++state.count;
    state.sum += magnitude;
    if (magnitude > state.peak) {
        state.peak = magnitude;
        state.peak_ordinal = sample.ordinal;
        state.peak_cycle = sample.cycle;
        state.peak_time = sample.time;
    }

    state.window.push_back(magnitude);
    if (state.window.size() > damping_window_) {
        state.window.pop_front();
    }
    if (state.undamped ||
        state.window.size() < std::min(instability_limits::kMinZcrSamples, damping_window_)) {
        return;
    }
    double early = 0.0;
    double late = 0.0;
    if (!IsUndamped(state.window, early, late)) {
        return;
    }
    double mean = 0.0;
    for (double m : state.window) {
        mean += m;
    }
    mean /= static_cast<double>(state.window.size());
    if (early < instability_limits::kMinSwing * mean) {
        return;
    }
    state.undamped = UndampedNode{.node = sample.node,
                                  .ordinal = sample.ordinal,
                                  .cycle = sample.cycle,
                                  .time = sample.time,
                                  .early_amplitude = early,
                                  .late_amplitude = late};
}

BoundaryScreening BoundaryInstabilityTracker::Finish() const {
    BoundaryScreening out{.nodes = nodes_.size(), .samples = samples_};
    for (const auto &[node, state] : nodes_) {
        if (state.count >= instability_limits::kMinSpikeSamples) {
            double mean = state.sum / static_cast<double>(state.count);
            if (mean > instability_limits::kMinMeanForce &&
                state.peak / mean > instability_limits::kSpikeRatio) {
                out.spikes.push_back(ForceSpike{.node = node,
                                                .ordinal = state.peak_ordinal,
                                                .cycle = state.peak_cycle,
                                                .time = state.peak_time,
                                                .peak = state.peak,
                                                .mean = mean,
                                                .ratio = state.peak / mean,
                                                .samples = state.count});
            }
        }
        if (state.undamped) {
            out.undamped.push_back(*state.undamped);
        }
    }
    std::stable_sort(out.spikes.begin(), out.spikes.end(),
                     [](const auto &a, const auto &b) { return a.ordinal < b.ordinal; });
    std::stable_sort(out.undamped.begin(), out.undamped.end(),
                     [](const auto &a, const auto &b) { return a.ordinal < b.ordinal; });
    return out;
}

// =============================================================================
// Rules
// =============================================================================

namespace rules::instability {

Findings Shooting(const NodalScreening &screen, const ElementPartMapper &mapper) {
    Findings out;
    for (const auto &s : screen.shooting) {
        out.push_back(
            FindingBuilder(FindingSeverity::Critical, "instability",
                           "Shooting node " + std::to_string(s.node))
                .Message(NodeLabel(s.node, mapper) + " reached a speed of " +
                         Console::FormatScientific(s.peak_speed, 3) + " at t=" +
                         Console::FormatScientific(s.peak_time, 4) + "; it first exceeded " +
                         Console::FormatNumber(instability_limits::kShootingSpeed, 0) +
                         " at t=" + Console::FormatScientific(s.first_time, 4) + ".")
                .Recommendation("Check *CONSTRAINED definitions touching this node, remove "
                                "initial penetrations, and lower the contact penalty scale "
                                "(SLSFAC) if the node sits on a contact surface.")
                .Evidence(At(SourceKind::Nodout, s.node, s.peak_cycle, s.peak_time, s.peak_speed))
                .Occurrences(static_cast<std::int64_t>(s.samples_above))
                .Build());
    }
    return out;
}

Findings Oscillation(const NodalScreening &screen, const ElementPartMapper &mapper) {
    static constexpr const char *kAxis[] = {"x", "y", "z"};
    Findings out;
    for (const auto &o : screen.oscillating) {
        out.push_back(
            FindingBuilder(FindingSeverity::Warning, "instability",
                           "High-frequency oscillation at node " + std::to_string(o.node))
                .Message(NodeLabel(o.node, mapper) + " " + kAxis[o.component] +
                         "-velocity oscillates at about " +
                         Console::FormatNumber(o.frequency_hz / 1000.0, 1) +
                         " kHz around t=" + Console::FormatScientific(o.time, 4) +
                         ", above the 10 kHz structural range.")
                .Recommendation("Lower TSSFAC, strengthen hourglass control (IHQ=4 or 8) or "
                                "use fully integrated elements in this region.")
                .Evidence(At(SourceKind::Nodout, o.node, o.cycle, o.time, o.frequency_hz))
                .Build());
    }
    return out;
}

Findings Spikes(const BoundaryScreening &screen) {
    Findings out;
    for (const auto &s : screen.spikes) {
        out.push_back(
            FindingBuilder(FindingSeverity::Warning, "instability",
                           "Reaction force spike at node " + std::to_string(s.node))
                .Message("Boundary force at node " + std::to_string(s.node) + " peaks at " +
                         Console::FormatScientific(s.peak, 3) + " at t=" +
                         Console::FormatScientific(s.time, 4) + ", " +
                         Console::FormatNumber(s.ratio, 0) + "x its mean of " +
                         Console::FormatScientific(s.mean, 3) + ".")
                .Recommendation("Reduce the contact penalty scale, remove initial "
                                "penetrations, or check for conflicting boundary "
                                "conditions on this node.")
                .Evidence(At(SourceKind::Bndout, s.node, s.cycle, s.time, s.ratio))
                .Build());
    }
    return out;
}

Findings Damping(const BoundaryScreening &screen) {
    Findings out;
    for (const auto &u : screen.undamped) {
        out.push_back(
            FindingBuilder(FindingSeverity::Warning, "instability",
                           "Undamped force oscillation at node " + std::to_string(u.node))
                .Message("Boundary force at node " + std::to_string(u.node) +
                         " alternates every output state up to t=" +
                         Console::FormatScientific(u.time, 4) + " without decaying (swing " +
                         Console::FormatScientific(u.early_amplitude, 3) + " early, " +
                         Console::FormatScientific(u.late_amplitude, 3) + " late).")
                .Recommendation("Add *DAMPING_GLOBAL or contact viscous damping (VDC), or "
                                "reduce the time step scale factor.")
                .Evidence(At(SourceKind::Bndout, u.node, u.cycle, u.time, u.late_amplitude))
                .Build());
    }
    return out;
}

} // namespace rules::instability

AnalyzerResult InstabilityAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::instability;
    AnalyzerResult result;
    if (ctx.data.nodal) {
        Append(result.findings, Shooting(*ctx.data.nodal, ctx.mapper));
        Append(result.findings, Oscillation(*ctx.data.nodal, ctx.mapper));
    }
    if (ctx.data.boundary) {
        Append(result.findings, Spikes(*ctx.data.boundary));
        Append(result.findings, Damping(*ctx.data.boundary));
    }
    return result;
}

} // namespace dynadiag
