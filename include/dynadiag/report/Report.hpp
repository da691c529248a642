#pragma once

/**
 * @file Report.hpp
 * @brief The diagnosis of one result directory
 *
 * Built once by the Aggregator and never modified afterwards. Contains no
 * wall-clock or path content, so identical inputs give identical Reports.
 */

#include <dynadiag/analysis/Finding.hpp>
#include <dynadiag/analysis/Summaries.hpp>

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dynadiag {

/// Which inputs contributed to the Report
struct Coverage {
    std::vector<SourceKind> present;
    std::vector<SourceKind> missing;
    std::map<SourceKind, std::size_t> skipped;
    std::size_t message_logs = 0; ///< messag plus mesNNNN files read

    [[nodiscard]] bool Degraded() const {
        if (!missing.empty()) {
            return true;
        }
        for (const auto &[source, count] : skipped) {
            if (count > 0) {
                return true;
            }
        }
        return false;
    }
};

struct Report {
    std::string tool_version;

    std::optional<ModelSummary> model;
    std::optional<PartTable> parts;
    std::optional<ContactTable> contacts;
    std::optional<MassPropertyTable> mass;
    std::optional<TimingTable> timing;
    std::optional<TerminationStatus> termination;
    std::optional<StatusEstimate> estimate;

    DerivedSummaries summaries;

    /// Analyzer order, then each analyzer's evidence order
    Findings findings;

    Coverage coverage;

    /// Finding counts indexed by FindingSeverity
    [[nodiscard]] std::array<std::size_t, 3> SeverityCounts() const {
        std::array<std::size_t, 3> counts{};
        for (const auto &f : findings) {
            ++counts[static_cast<std::size_t>(f.severity)];
        }
        return counts;
    }

    [[nodiscard]] std::size_t Count(FindingSeverity severity) const {
        return SeverityCounts()[static_cast<std::size_t>(severity)];
    }
};

} // namespace dynadiag
