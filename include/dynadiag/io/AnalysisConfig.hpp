#pragma once

/**
 * @file AnalysisConfig.hpp
 * @brief Configuration consumed by the diagnosis pipeline
 *
 * None of these settings change Finding semantics. They bound memory
 * (tracked-node cap, window sizes), control discovery, and select outputs.
 */

#include <dynadiag/io/LogService.hpp>

#include <cstddef>
#include <string>

namespace dynadiag {

/**
 * @brief Output toggles for the presentation layer
 */
struct OutputConfig {
    bool terminal = true;
    bool json = false;
    std::string json_path = "dynadiag_report.json";
    bool html = false; ///< Accepted for compatibility; no HTML renderer ships
};

/**
 * @brief Tunables for readers and analyzers
 */
struct AnalysisConfig {
    bool verbose = false;

    /// Distinct node ids kept by the nodal and boundary-force readers
    std::size_t tracked_node_cap = 1000;

    /// Consecutive missing mesNNNN suffixes that end sibling discovery
    std::size_t message_scan_gap = 8;

    /// Trailing samples used for the zero-crossing frequency estimate
    std::size_t zcr_window = 64;

    /// Trailing samples used for the boundary damping check
    std::size_t damping_window = 64;

    /// Exponent of the communication growth term in the scaling model
    double comm_growth_exponent = 0.5;

    /// Explicit keyword deck for element mapping (empty = discover)
    std::string input_deck;

    OutputConfig outputs;
    LogConfig logging;

    [[nodiscard]] static AnalysisConfig Default() { return AnalysisConfig{}; }
};

} // namespace dynadiag
