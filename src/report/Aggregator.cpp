/**
 * @file Aggregator.cpp
 * @brief Report assembly
 */

#include <dynadiag/analysis/TerminationAnalyzer.hpp>
#include <dynadiag/core/CoreTypes.hpp>
#include <dynadiag/io/LogService.hpp>
#include <dynadiag/report/Aggregator.hpp>

namespace dynadiag {

namespace {

template <typename T> void TakeFirst(std::optional<T> &dst, std::optional<T> &src) {
    if (!dst && src) {
        dst = std::move(src);
    }
}

} // namespace

bool Aggregator::HasUsableData(const RunData &data) {
    return data.model || data.parts || data.contacts || data.mass || data.timing ||
           data.termination || !data.glstat_energy.empty() || !data.hsp_energy.empty() ||
           !data.timesteps.empty() || !data.smallest_timesteps.empty() ||
           !data.warnings.empty() || !data.penetrations.empty() ||
           !data.interface_warning_counts.empty() || !data.memory_requests.empty() ||
           !data.banners.empty() || !data.progress.empty() || data.estimate ||
           !data.final_materials.empty() || !data.load_profile.empty() ||
           !data.contact_profile.empty() || (data.nodal && data.nodal->samples > 0) ||
           (data.boundary && data.boundary->samples > 0);
}

Report Aggregator::Aggregate(const RunData &data, std::vector<NamedResult> results) {
    if (!HasUsableData(data)) {
        throw AggregationError("no reader produced a usable record");
    }

    Report report;
    report.tool_version = Version();
    report.model = data.model;
    report.parts = data.parts;
    report.contacts = data.contacts;
    report.mass = data.mass;
    report.timing = data.timing;
    report.termination = rules::termination::Resolve(data);
    report.estimate = data.estimate;

    for (auto &named : results) {
        auto &s = named.result.summaries;
        TakeFirst(report.summaries.energy, s.energy);
        TakeFirst(report.summaries.timestep, s.timestep);
        TakeFirst(report.summaries.contacts, s.contacts);
        TakeFirst(report.summaries.performance, s.performance);
        TakeFirst(report.summaries.scaling, s.scaling);
        TakeFirst(report.summaries.warning_codes, s.warning_codes);

        for (auto &f : named.result.findings) {
            f.analyzer = named.analyzer;
            report.findings.push_back(std::move(f));
        }
    }

    report.coverage.present = data.present;
    report.coverage.missing = data.missing;
    report.coverage.skipped = data.skipped;
    report.coverage.message_logs = data.message_logs;

    auto counts = report.SeverityCounts();
    DYNADIAG_LOG_INFO("Aggregated " + std::to_string(report.findings.size()) + " findings (" +
                      std::to_string(counts[2]) + " critical, " + std::to_string(counts[1]) +
                      " warning, " + std::to_string(counts[0]) + " info)");
    return report;
}

} // namespace dynadiag
