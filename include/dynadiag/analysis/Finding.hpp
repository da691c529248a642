#pragma once

/**
 * @file Finding.hpp
 * @brief Diagnostic findings and their evidence references
 */

#include <dynadiag/records/Records.hpp>

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dynadiag {

enum class FindingSeverity : uint8_t { Info, Warning, Critical };

[[nodiscard]] inline const char *FindingSeverityName(FindingSeverity severity) {
    switch (severity) {
    case FindingSeverity::Info:
        return "info";
    case FindingSeverity::Warning:
        return "warning";
    case FindingSeverity::Critical:
        return "critical";
    }
    return "info";
}

/**
 * @brief Pointer from a Finding back into the data that triggered it
 *
 * `entity` names what `id` identifies ("sample", "element", "node",
 * "interface", "part", "component", "code", "rank", "run").
 */
struct EvidenceRef {
    SourceKind source = SourceKind::Hsp;
    std::string entity;
    std::int64_t id = 0;
    std::optional<Cycle> cycle;
    std::optional<Cycle> cycle_end;
    std::optional<double> time;
    std::optional<double> value;

    bool operator==(const EvidenceRef &) const = default;
};

/**
 * @brief One diagnosis item
 *
 * Immutable once emitted. `analyzer` is filled in by the Aggregator.
 */
struct Finding {
    FindingSeverity severity = FindingSeverity::Info;
    std::string category;
    std::string title;
    std::string message;
    std::string recommendation;
    std::vector<EvidenceRef> evidence;
    std::int64_t occurrences = 1;
    std::string analyzer;

    [[nodiscard]] bool References(SourceKind source) const {
        for (const auto &e : evidence) {
            if (e.source == source) {
                return true;
            }
        }
        return false;
    }
};

using Findings = std::vector<Finding>;

/// Move every Finding of `src` onto the end of `dst`
inline void Append(Findings &dst, Findings src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

/**
 * @brief Fluent construction for Findings
 *
 * @code
 * out.push_back(FindingBuilder(FindingSeverity::Critical, "energy", "Energy ratio diverged")
 *                   .Message("ratio 5.3 at cycle 1200")
 *                   .Evidence(Sample(SourceKind::Glstat, s))
 *                   .Build());
 * @endcode
 */
class FindingBuilder {
  public:
    FindingBuilder(FindingSeverity severity, std::string category, std::string title) {
        finding_.severity = severity;
        finding_.category = std::move(category);
        finding_.title = std::move(title);
    }

    FindingBuilder &Message(std::string message) {
        finding_.message = std::move(message);
        return *this;
    }

    FindingBuilder &Recommendation(std::string recommendation) {
        finding_.recommendation = std::move(recommendation);
        return *this;
    }

    FindingBuilder &Evidence(EvidenceRef ref) {
        finding_.evidence.push_back(std::move(ref));
        return *this;
    }

    FindingBuilder &Occurrences(std::int64_t count) {
        finding_.occurrences = count;
        return *this;
    }

    [[nodiscard]] Finding Build() && { return std::move(finding_); }
    [[nodiscard]] Finding Build() const & { return finding_; }

  private:
    Finding finding_;
};

// =============================================================================
// Evidence helpers
// =============================================================================

namespace evidence {

[[nodiscard]] inline EvidenceRef Sample(SourceKind source, const EnergySample &s,
                                        std::optional<double> value = std::nullopt) {
    return EvidenceRef{.source = source,
                       .entity = "sample",
                       .id = static_cast<std::int64_t>(s.ordinal),
                       .cycle = s.cycle,
                       .cycle_end = std::nullopt,
                       .time = s.time,
                       .value = value};
}

[[nodiscard]] inline EvidenceRef Entity(SourceKind source, std::string entity, std::int64_t id,
                                        std::optional<double> value = std::nullopt) {
    return EvidenceRef{.source = source,
                       .entity = std::move(entity),
                       .id = id,
                       .cycle = std::nullopt,
                       .cycle_end = std::nullopt,
                       .time = std::nullopt,
                       .value = value};
}

} // namespace evidence

} // namespace dynadiag
