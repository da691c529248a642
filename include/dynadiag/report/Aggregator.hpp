#pragma once

/**
 * @file Aggregator.hpp
 * @brief Joins reader outputs and analyzer results into a Report
 */

#include <dynadiag/analysis/Analyzer.hpp>
#include <dynadiag/report/Report.hpp>

#include <string>
#include <vector>

namespace dynadiag {

/// One analyzer's output, tagged with the analyzer name
struct NamedResult {
    std::string analyzer;
    AnalyzerResult result;
};

class Aggregator {
  public:
    /**
     * @brief Build the Report
     *
     * `results` must be in the fixed analyzer order; their Findings are
     * concatenated in that order and tagged with the analyzer name. Each
     * derived summary is taken from the first result that filled it.
     *
     * @throws AggregationError when no reader produced a usable record
     */
    [[nodiscard]] static Report Aggregate(const RunData &data, std::vector<NamedResult> results);

    /// True when at least one record of any kind was read
    [[nodiscard]] static bool HasUsableData(const RunData &data);
};

} // namespace dynadiag
