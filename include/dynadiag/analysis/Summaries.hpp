#pragma once

/**
 * @file Summaries.hpp
 * @brief Derived summaries computed alongside Findings
 *
 * Each field is owned by exactly one analyzer; the Aggregator copies the
 * filled fields into the Report.
 */

#include <dynadiag/records/Records.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dynadiag {

/// A run of consecutive cycles with one controlling element, inclusive bounds
struct ControllingInterval {
    Cycle start_cycle = 0;
    Cycle end_cycle = 0;
    ElementKind kind = ElementKind::Unknown;
    ElementId element = 0;
    PartId part = 0;
    double min_dt = 0.0;

    bool operator==(const ControllingInterval &) const = default;
};

/// Parts owning the smallest-timestep elements
struct PartTimestepGroup {
    PartId part = 0;
    std::string title;
    std::size_t elements = 0;
    double min_dt = 0.0;
};

struct TimestepSummary {
    std::vector<ControllingInterval> intervals;
    std::vector<ElementTimestep> smallest_elements; ///< top 20, ascending dt
    std::vector<PartTimestepGroup> parts;           ///< from the top 100
    double initial_dt = 0.0;
    double final_dt = 0.0;
    double min_dt = 0.0;
};

struct EnergySummary {
    SourceKind source = SourceKind::Glstat;
    std::size_t samples = 0;
    double final_ratio = 1.0;
    double final_hourglass_ratio = 0.0; ///< hourglass / internal at the last sample
    double max_hourglass_ratio = 0.0;
    double final_kinetic = 0.0;
    double final_internal = 0.0;
    double final_total = 0.0;
};

struct ContactInterfaceSummary {
    InterfaceId id = 0;
    std::string type;
    std::string title;
    std::int64_t warning_count = 0;
    std::int64_t initial_penetrations = 0;
    double cpu_seconds = 0.0;
    double clock_seconds = 0.0;
};

struct ComponentShare {
    std::string name;
    double cpu_seconds = 0.0;
    double percent = 0.0;
};

struct LoadImbalance {
    std::string component;
    std::size_t ranks = 0;
    double mean = 0.0;
    double stddev = 0.0;
    double cv = 0.0; ///< stddev / mean
    int slowest_rank = 0;
};

struct PerformanceSummary {
    std::vector<ComponentShare> components;
    std::vector<LoadImbalance> imbalance;
    std::optional<double> decomposition_imbalance; ///< (max - min) / max
};

struct ScalingProjection {
    int cores = 0;
    double speedup = 0.0;
    double efficiency = 0.0;
    std::string band; ///< "severe", "cautionary" or "acceptable"
};

struct ScalingSummary {
    int current_cores = 0;
    double parallel_fraction = 0.0;
    double communication_fraction = 0.0;
    double serial_fraction = 0.0;
    std::vector<ScalingProjection> projections;
};

struct WarningCodeSummary {
    int code = 0;
    EventKind kind = EventKind::Warning;
    std::string title;
    std::string category;
    std::int64_t count = 0;
    std::vector<int> ranks;
};

struct DerivedSummaries {
    std::optional<EnergySummary> energy;
    std::optional<TimestepSummary> timestep;
    std::optional<std::vector<ContactInterfaceSummary>> contacts;
    std::optional<PerformanceSummary> performance;
    std::optional<ScalingSummary> scaling;
    std::optional<std::vector<WarningCodeSummary>> warning_codes;
};

} // namespace dynadiag
