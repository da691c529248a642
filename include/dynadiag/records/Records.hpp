#pragma once

/**
 * @file Records.hpp
 * @brief Typed records produced by the result-file readers
 *
 * Plain value types. Readers produce them, analyzers consume them by value or
 * const reference, and nothing mutates a record once its reader has emitted it.
 */

#include <dynadiag/core/CoreTypes.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dynadiag {

using Vec3 = std::array<double, 3>;

// =============================================================================
// Source files
// =============================================================================

/**
 * @brief File families found in a result directory
 */
enum class SourceKind : uint8_t {
    Hsp,            ///< d3hsp, the high-speed-printer log
    Glstat,         ///< glstat, global statistics
    Status,         ///< status.out
    Matsum,         ///< matsum, material summary
    Messages,       ///< messag and mesNNNN
    Nodout,         ///< nodout, nodal time history
    Bndout,         ///< bndout, boundary force history
    LoadProfile,    ///< load_profile.csv
    ContactProfile, ///< cont_profile.csv
    InputDeck       ///< keyword deck (*.k, dynain, *.dyn)
};

inline constexpr std::array<SourceKind, 10> kAllSources = {
    SourceKind::Hsp,         SourceKind::Glstat,         SourceKind::Status,
    SourceKind::Matsum,      SourceKind::Messages,       SourceKind::Nodout,
    SourceKind::Bndout,      SourceKind::LoadProfile,    SourceKind::ContactProfile,
    SourceKind::InputDeck};

[[nodiscard]] inline const char *SourceName(SourceKind kind) {
    switch (kind) {
    case SourceKind::Hsp:
        return "d3hsp";
    case SourceKind::Glstat:
        return "glstat";
    case SourceKind::Status:
        return "status.out";
    case SourceKind::Matsum:
        return "matsum";
    case SourceKind::Messages:
        return "messag";
    case SourceKind::Nodout:
        return "nodout";
    case SourceKind::Bndout:
        return "bndout";
    case SourceKind::LoadProfile:
        return "load_profile.csv";
    case SourceKind::ContactProfile:
        return "cont_profile.csv";
    case SourceKind::InputDeck:
        return "input_deck";
    }
    return "unknown";
}

// =============================================================================
// Elements
// =============================================================================

enum class ElementKind : uint8_t { Solid, Shell, Beam, ThickShell, Sph, Discrete, Unknown };

[[nodiscard]] inline const char *ElementKindName(ElementKind kind) {
    switch (kind) {
    case ElementKind::Solid:
        return "solid";
    case ElementKind::Shell:
        return "shell";
    case ElementKind::Beam:
        return "beam";
    case ElementKind::ThickShell:
        return "tshell";
    case ElementKind::Sph:
        return "sph";
    case ElementKind::Discrete:
        return "discrete";
    case ElementKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

[[nodiscard]] inline ElementKind ParseElementKind(std::string_view word) {
    if (word == "solid") {
        return ElementKind::Solid;
    }
    if (word == "shell") {
        return ElementKind::Shell;
    }
    if (word == "beam") {
        return ElementKind::Beam;
    }
    if (word == "tshell" || word == "thick") {
        return ElementKind::ThickShell;
    }
    if (word == "sph" || word == "particle") {
        return ElementKind::Sph;
    }
    if (word == "discrete" || word == "spring") {
        return ElementKind::Discrete;
    }
    return ElementKind::Unknown;
}

// =============================================================================
// Structural summary (d3hsp header, control and definition sections)
// =============================================================================

struct RunHeader {
    std::string version;
    std::string revision;
    std::string platform;
    std::string precision;
    std::string hostname;
    std::string input_file;
    std::string date;
    int mpp_processors = 0; ///< 0 when the run was SMP
};

struct ModelSummary {
    RunHeader header;

    std::int64_t nodes = 0;
    std::int64_t solids = 0;
    std::int64_t shells = 0;
    std::int64_t beams = 0;
    std::int64_t thick_shells = 0;
    std::int64_t sph_particles = 0;
    std::int64_t materials = 0;
    std::int64_t parts = 0;
    std::int64_t contacts = 0;
    std::int64_t spc_nodes = 0;

    /// "total # of *KEYWORD" counts, keyed by keyword
    std::map<std::string, std::int64_t> keyword_counts;

    double termination_time = 0.0;
    double dt_scale_factor = 0.0;
    double mass_scaling_dt = 0.0; ///< dt2ms; non-zero means mass scaling
    double min_dt_factor = 0.0;   ///< tsmin

    [[nodiscard]] std::int64_t TotalElements() const {
        return solids + shells + beams + thick_shells + sph_particles;
    }
};

struct PartDefinition {
    PartId id = 0;
    std::int64_t section_id = 0;
    std::int64_t material_id = 0;
    int material_type = 0;
    std::string material_name;
    int eos_type = 0;
    int hourglass_type = 0;
    double density = 0.0;
    double hourglass_coefficient = 0.0;
    double youngs_modulus = 0.0;
    double poisson_ratio = 0.0;
};

struct PartTable {
    std::vector<PartDefinition> parts;
};

struct ContactDefinition {
    InterfaceId id = 0;
    std::string type; ///< solver type code, e.g. "a 13" or "4"
    std::string title;
};

struct ContactTable {
    std::vector<ContactDefinition> interfaces;
};

/// Surface timestep the solver prints for an interface with nothing to control
constexpr double kInactiveSurfaceDt = 1.0e16;

/// One row of the d3hsp interface surface timestep table
struct SurfaceTimestep {
    InterfaceId interface_id = 0;
    std::string surface; ///< "surfa" or "surfb"
    std::string type;
    double timestep = 0.0;
    NodeId node = 0; ///< controlling node, 0 when inactive
    PartId part = 0;

    [[nodiscard]] bool Active() const { return timestep > 0.0 && timestep < kInactiveSurfaceDt; }
};

/// Penalty contact stability data: the recommended dt ceiling and per-surface timesteps
struct ContactStability {
    std::optional<double> dt_limit;
    std::vector<SurfaceTimestep> surfaces;
};

struct MassProperty {
    PartId part = 0;
    double mass = 0.0;
    Vec3 center{};
    Vec3 inertia{}; ///< principal i11, i22, i33
};

struct MassPropertyTable {
    std::vector<MassProperty> parts;

    [[nodiscard]] double TotalMass() const {
        double total = 0.0;
        for (const auto &p : parts) {
            total += p.mass;
        }
        return total;
    }
};

// =============================================================================
// Termination
// =============================================================================

enum class TerminationKind : uint8_t { Normal, ErrorTerminated, Incomplete };

[[nodiscard]] inline const char *TerminationKindName(TerminationKind kind) {
    switch (kind) {
    case TerminationKind::Normal:
        return "normal";
    case TerminationKind::ErrorTerminated:
        return "error";
    case TerminationKind::Incomplete:
        return "incomplete";
    }
    return "incomplete";
}

struct TerminationStatus {
    TerminationKind kind = TerminationKind::Incomplete;
    Cycle cycles = 0;
    double target_time = 0.0;
    double actual_time = 0.0;
    double cpu_seconds = 0.0;
    double elapsed_seconds = 0.0;
    double cpu_per_zone_ns = 0.0;
    double clock_per_zone_ns = 0.0;
    std::string start_stamp;
    std::string end_stamp;
    std::optional<int> error_code; ///< last "*** Error N" seen before termination
    SourceKind source = SourceKind::Hsp;
};

// =============================================================================
// Time series
// =============================================================================

/**
 * @brief One global-statistics block
 */
struct EnergySample {
    std::size_t ordinal = 0; ///< position in the emitting stream
    Cycle cycle = 0;
    double time = 0.0;
    double dt = 0.0;

    double kinetic = 0.0;
    double internal = 0.0;
    double hourglass = 0.0;
    double sliding = 0.0;
    double spring_damper = 0.0;
    double system_damping = 0.0;
    double external_work = 0.0;
    double eroded_kinetic = 0.0;
    double eroded_internal = 0.0;
    double eroded_hourglass = 0.0;
    double total = 0.0;
    double ratio = 1.0;
    double ratio_without_eroded = 1.0;
    Vec3 velocity{};
    double zone_cycle_ns = 0.0;

    ElementKind controlling_kind = ElementKind::Unknown;
    ElementId controlling_element = 0;
    PartId controlling_part = 0;
};

struct TimestepRecord {
    Cycle cycle = 0;
    double time = 0.0;
    double dt = 0.0;
    ElementKind element_kind = ElementKind::Unknown;
    ElementId element = 0;
    PartId part = 0;
};

/// One row of the "100 smallest timesteps" table
struct ElementTimestep {
    ElementKind kind = ElementKind::Unknown;
    ElementId element = 0;
    PartId part = 0;
    double dt = 0.0;
};

// =============================================================================
// Timing tables (d3hsp tail)
// =============================================================================

struct ComponentTiming {
    std::string name;
    double cpu_seconds = 0.0;
    double cpu_percent = 0.0;
    double clock_seconds = 0.0;
    double clock_percent = 0.0;
    bool sub_entry = false; ///< indented breakdown row
};

struct InterfaceTiming {
    InterfaceId id = 0;
    double cpu_seconds = 0.0;
    double clock_seconds = 0.0;
};

struct ProcessorTiming {
    int rank = 0;
    std::string host;
    double cpu_ratio = 0.0;
    double cpu_seconds = 0.0;
};

struct DecompositionStats {
    bool present = false;
    double min_cost = 0.0;
    double max_cost = 0.0;
    double std_deviation = 0.0;
};

struct TimingTable {
    std::vector<ComponentTiming> components;
    std::vector<InterfaceTiming> interfaces;
    std::vector<ProcessorTiming> processors;
    DecompositionStats decomposition;
};

// =============================================================================
// Messages
// =============================================================================

enum class EventKind : uint8_t {
    Warning,   ///< "*** Warning N"
    Error,     ///< "*** Error N"
    Diagnostic ///< free-standing failure line outside a coded block
};

[[nodiscard]] inline const char *EventKindName(EventKind kind) {
    switch (kind) {
    case EventKind::Warning:
        return "warning";
    case EventKind::Error:
        return "error";
    case EventKind::Diagnostic:
        return "diagnostic";
    }
    return "warning";
}

struct WarningEvent {
    int code = 0;
    EventKind kind = EventKind::Warning;
    int rank = kPrimaryRank;
    std::string message;
    std::optional<InterfaceId> interface_id;
    std::optional<PartId> part;
    std::optional<ElementId> element;
    std::optional<NodeId> node;
    std::optional<Cycle> cycle;
    SourceKind source = SourceKind::Messages;
    std::size_t line = 0;
};

struct InitialPenetration {
    InterfaceId interface_id = 0;
    std::int64_t count = 0;
    int rank = kPrimaryRank;
};

/// "Summary of warning messages for interface # = N"
struct InterfaceWarningCount {
    InterfaceId interface_id = 0;
    std::int64_t count = 0;
    int rank = kPrimaryRank;
};

struct MemoryRequest {
    std::int64_t words = 0;
    int rank = kPrimaryRank;
};

struct TerminationBanner {
    TerminationKind kind = TerminationKind::Normal;
    int rank = kPrimaryRank;
};

// =============================================================================
// Status and profiles
// =============================================================================

struct CycleProgress {
    Cycle cycle = 0;
    double time = 0.0;
    double dt = 0.0;
};

struct StatusEstimate {
    double cpu_per_zone_ns = 0.0;
    double avg_cpu_per_zone_ns = 0.0;
    double avg_clock_per_zone_ns = 0.0;
    double est_total_cpu = 0.0;
    double est_remaining_cpu = 0.0;
    double est_total_clock = 0.0;
    double est_remaining_clock = 0.0;
};

/// Per-rank seconds spent in one solver component (load_profile.csv)
struct ProcessorLoadSample {
    std::string component;
    int rank = 0;
    double seconds = 0.0;
};

/// Per-rank seconds spent in one contact interface (cont_profile.csv)
struct ContactProfileSample {
    InterfaceId interface_id = 0;
    int rank = 0;
    double seconds = 0.0;
};

// =============================================================================
// Per-part and per-node histories
// =============================================================================

struct MaterialSample {
    PartId part = 0;
    Cycle cycle = 0; ///< output-state ordinal; matsum carries no cycle counter
    double time = 0.0;
    std::string title;
    double internal = 0.0;
    double kinetic = 0.0;
    double hourglass = 0.0;
    double eroded_internal = 0.0;
    double eroded_kinetic = 0.0;
    double eroded_hourglass = 0.0;
    Vec3 momentum{};
    Vec3 rigid_velocity{};
};

struct NodalSample {
    std::size_t ordinal = 0;
    NodeId node = 0;
    Cycle cycle = 0;
    double time = 0.0;
    Vec3 displacement{};
    Vec3 velocity{};
    Vec3 acceleration{};
    Vec3 coordinate{};
};

struct BoundaryForceSample {
    std::size_t ordinal = 0;
    NodeId node = 0;
    Cycle cycle = 0; ///< output-state ordinal
    double time = 0.0;
    Vec3 force{};
    Vec3 moment{};
    double energy = 0.0;
};

/// One element line from a keyword deck
struct DeckElement {
    ElementKind kind = ElementKind::Unknown;
    ElementId element = 0;
    PartId part = 0;
    std::vector<NodeId> nodes;
};

} // namespace dynadiag
