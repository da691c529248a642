#pragma once

/**
 * @file RunData.hpp
 * @brief Materialized reader outputs for one result directory
 *
 * Filled by the pipeline after all reader tasks have joined. Analyzers take
 * it by const reference; nothing writes to it once analysis starts.
 */

#include <dynadiag/analysis/Screening.hpp>
#include <dynadiag/records/Records.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace dynadiag {

struct RunData {
    // d3hsp once-records
    std::optional<ModelSummary> model;
    std::optional<PartTable> parts;
    std::optional<ContactTable> contacts;
    std::optional<ContactStability> contact_stability;
    std::optional<MassPropertyTable> mass;
    std::optional<TimingTable> timing;
    std::optional<TerminationStatus> termination;

    // Energy series; glstat is preferred when both exist
    std::vector<EnergySample> glstat_energy;
    std::vector<EnergySample> hsp_energy;

    std::vector<TimestepRecord> timesteps;
    std::vector<ElementTimestep> smallest_timesteps;

    // Message logs, in rank order (messag first)
    std::vector<WarningEvent> warnings;
    std::vector<InitialPenetration> penetrations;
    std::vector<InterfaceWarningCount> interface_warning_counts;
    std::vector<MemoryRequest> memory_requests;
    std::vector<TerminationBanner> banners;

    std::vector<CycleProgress> progress;
    std::optional<StatusEstimate> estimate;

    /// Last output state per part from matsum
    std::map<PartId, MaterialSample> final_materials;

    std::vector<ProcessorLoadSample> load_profile;
    std::vector<ContactProfileSample> contact_profile;

    // Streamed screens; unset when nodout / bndout are absent
    std::optional<NodalScreening> nodal;
    std::optional<BoundaryScreening> boundary;

    /// Sources found by discovery
    std::vector<SourceKind> present;
    /// Sources looked for and not found
    std::vector<SourceKind> missing;
    /// Records skipped per source
    std::map<SourceKind, std::size_t> skipped;
    /// messag plus mesNNNN files read
    std::size_t message_logs = 0;

    /// Preferred energy series and its source
    [[nodiscard]] const std::vector<EnergySample> &Energy() const {
        return glstat_energy.empty() ? hsp_energy : glstat_energy;
    }

    [[nodiscard]] SourceKind EnergySource() const {
        return glstat_energy.empty() ? SourceKind::Hsp : SourceKind::Glstat;
    }

    [[nodiscard]] bool IsPresent(SourceKind kind) const {
        for (auto k : present) {
            if (k == kind) {
                return true;
            }
        }
        return false;
    }
};

} // namespace dynadiag
