#pragma once

/**
 * @file Screening.hpp
 * @brief Results of the streaming nodal and boundary-force screens
 *
 * nodout and bndout are never materialized. Their samples are pushed
 * through the trackers in InstabilityAnalyzer.hpp while the files are read,
 * and only these bounded summaries reach RunData.
 */

#include <dynadiag/records/Records.hpp>

#include <cstddef>
#include <vector>

namespace dynadiag {

/// A node whose speed exceeded the shooting threshold at least once
struct ShootingNode {
    NodeId node = 0;
    std::size_t first_ordinal = 0; ///< sample that first exceeded the threshold
    Cycle first_cycle = 0;
    double first_time = 0.0;
    double peak_speed = 0.0;
    Cycle peak_cycle = 0;
    double peak_time = 0.0;
    std::size_t samples_above = 0;
};

/// A node whose trailing-window zero-crossing frequency exceeded the limit
struct OscillatingNode {
    NodeId node = 0;
    std::size_t ordinal = 0; ///< sample closing the first offending window
    Cycle cycle = 0;
    double time = 0.0;
    double frequency_hz = 0.0;
    int component = 0; ///< 0 = x, 1 = y, 2 = z velocity
};

struct NodalScreening {
    std::vector<ShootingNode> shooting;        ///< by first_ordinal
    std::vector<OscillatingNode> oscillating;  ///< by ordinal
    std::size_t nodes = 0;
    std::size_t samples = 0;
};

/// Peak-to-mean force magnitude spike at one boundary node
struct ForceSpike {
    NodeId node = 0;
    std::size_t ordinal = 0; ///< the peak sample
    Cycle cycle = 0;
    double time = 0.0;
    double peak = 0.0;
    double mean = 0.0;
    double ratio = 0.0;
    std::size_t samples = 0;
};

/// Sustained alternating force history without amplitude decay
struct UndampedNode {
    NodeId node = 0;
    std::size_t ordinal = 0; ///< sample closing the first offending window
    Cycle cycle = 0;
    double time = 0.0;
    double early_amplitude = 0.0;
    double late_amplitude = 0.0;
};

struct BoundaryScreening {
    std::vector<ForceSpike> spikes;     ///< by ordinal
    std::vector<UndampedNode> undamped; ///< by ordinal
    std::size_t nodes = 0;
    std::size_t samples = 0;
};

} // namespace dynadiag
