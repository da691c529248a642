/**
 * @file EnergyAnalyzer.cpp
 * @brief Energy balance rules
 */

#include <dynadiag/analysis/EnergyAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>

#include <algorithm>
#include <cmath>

namespace dynadiag {

namespace rules::energy {

namespace {

std::string Pct(double fraction) { return Console::FormatNumber(fraction * 100.0, 1) + "%"; }

std::string Sci(double value) { return Console::FormatScientific(value, 4); }

std::string At(const EnergySample &s) {
    return "cycle " + std::to_string(s.cycle) + " (t=" + Sci(s.time) + ")";
}

double BandDistance(double ratio) {
    using namespace energy_limits;
    if (ratio < kRatioLow) {
        return kRatioLow - ratio;
    }
    if (ratio > kRatioHigh) {
        return ratio - kRatioHigh;
    }
    return 0.0;
}

} // namespace

double HourglassRatio(const EnergySample &s) {
    return s.internal > 0.0 ? s.hourglass / s.internal : 0.0;
}

Findings HourglassGrowth(const Series &series, SourceKind source) {
    Findings out;
    bool warned = false;
    for (const auto &s : series) {
        double ratio = HourglassRatio(s);
        if (!warned && ratio > energy_limits::kHourglassWarning) {
            warned = true;
            out.push_back(
                FindingBuilder(FindingSeverity::Warning, "energy",
                               "Hourglass energy exceeds 10% of internal energy")
                    .Message("Hourglass/internal ratio reached " + Pct(ratio) + " at " + At(s) +
                             ".")
                    .Recommendation("Review *CONTROL_HOURGLASS (IHQ/QH). Type 4 or 5 "
                                    "stiffness control or fully integrated elements "
                                    "suppress zero-energy modes.")
                    .Evidence(evidence::Sample(source, s, ratio))
                    .Build());
        }
        if (ratio > energy_limits::kHourglassCritical) {
            out.push_back(
                FindingBuilder(FindingSeverity::Critical, "energy",
                               "Hourglass energy exceeds 20% of internal energy")
                    .Message("Hourglass/internal ratio reached " + Pct(ratio) + " at " + At(s) +
                             "; results in the affected parts are not reliable.")
                    .Recommendation("Switch the dominant parts to fully integrated "
                                    "formulations (ELFORM=2 solids, ELFORM=16 shells) or "
                                    "raise the hourglass coefficient.")
                    .Evidence(evidence::Sample(source, s, ratio))
                    .Build());
            break;
        }
    }
    return out;
}

Findings RatioDivergence(const Series &series, SourceKind source) {
    Findings out;
    for (const auto &s : series) {
        if (BandDistance(s.ratio) > energy_limits::kRatioDivergence) {
            out.push_back(
                FindingBuilder(FindingSeverity::Critical, "energy", "Energy ratio diverged")
                    .Message("Total/initial energy ratio " + Console::FormatNumber(s.ratio, 4) +
                             " at " + At(s) + " is far outside [0.95, 1.05].")
                    .Recommendation("Divergence of this size usually precedes NaN or a "
                                    "singular constraint matrix. Reduce TSSFAC and check "
                                    "contacts and constraints active at this time.")
                    .Evidence(evidence::Sample(source, s, s.ratio))
                    .Build());
        }
    }
    return out;
}

Findings RatioBand(const Series &series, SourceKind source) {
    for (const auto &s : series) {
        if (BandDistance(s.ratio) > 0.0) {
            return {FindingBuilder(FindingSeverity::Warning, "energy",
                                   "Energy balance deviation")
                        .Message("Total/initial energy ratio left [0.95, 1.05] at " + At(s) +
                                 " (ratio " + Console::FormatNumber(s.ratio, 4) + ").")
                        .Recommendation("Compare sliding, damping and external work to find "
                                        "the energy source or sink.")
                        .Evidence(evidence::Sample(source, s, s.ratio))
                        .Build()};
        }
    }
    return {};
}

Findings KineticJumps(const Series &series, SourceKind source) {
    Findings out;
    for (std::size_t i = 1; i < series.size(); ++i) {
        const auto &prev = series[i - 1];
        const auto &cur = series[i];
        if (prev.kinetic > 0.0 && cur.kinetic >= energy_limits::kKineticJump * prev.kinetic) {
            double factor = cur.kinetic / prev.kinetic;
            out.push_back(
                FindingBuilder(FindingSeverity::Warning, "energy", "Kinetic energy jump")
                    .Message("Kinetic energy rose " + Console::FormatNumber(factor, 0) +
                             "x between cycle " + std::to_string(prev.cycle) + " and " +
                             At(cur) + ".")
                    .Recommendation("Look for shooting nodes, contact penalty spikes or a "
                                    "suddenly applied load at this time.")
                    .Evidence(evidence::Sample(source, cur, factor))
                    .Build());
        }
    }
    return out;
}

Findings KineticDominance(const Series &series, SourceKind source) {
    for (const auto &s : series) {
        if (s.internal > 0.0 && s.kinetic > energy_limits::kKineticToInternal * s.internal) {
            double ratio = s.kinetic / s.internal;
            return {FindingBuilder(FindingSeverity::Warning, "energy",
                                   "Kinetic energy dominates internal energy")
                        .Message("Kinetic/internal ratio " + Console::FormatNumber(ratio, 1) +
                                 " at " + At(s) + ".")
                        .Recommendation("Confirm rigid-body motion is expected; otherwise "
                                        "check constraints and initial velocities.")
                        .Evidence(evidence::Sample(source, s, ratio))
                        .Build()};
        }
    }
    return {};
}

Findings SlidingShare(const Series &series, SourceKind source) {
    for (const auto &s : series) {
        if (s.total == 0.0) {
            continue;
        }
        double share = std::abs(s.sliding) / std::abs(s.total);
        if (share > energy_limits::kSlidingShare) {
            return {FindingBuilder(FindingSeverity::Warning, "energy",
                                   "High sliding interface energy")
                        .Message("Sliding interface energy reached " + Pct(share) +
                                 " of total energy at " + At(s) + ".")
                        .Recommendation("Check contacts for deep penetration; raise SLSFAC or "
                                        "use SOFT=1 segment-based contact.")
                        .Evidence(evidence::Sample(source, s, share))
                        .Build()};
        }
    }
    return {};
}

Findings SlidingSpikes(const Series &series, SourceKind source) {
    Findings out;
    for (std::size_t i = 1; i < series.size(); ++i) {
        double prev = std::abs(series[i - 1].sliding);
        double cur = std::abs(series[i].sliding);
        if (prev > 0.0 && cur >= energy_limits::kSlidingSpike * prev) {
            out.push_back(
                FindingBuilder(FindingSeverity::Warning, "energy", "Sliding energy spike")
                    .Message("Sliding interface energy grew " +
                             Console::FormatNumber(cur / prev, 0) + "x at " + At(series[i]) +
                             ".")
                    .Recommendation("Identify the interface active at this time from the "
                                    "contact summary and check its penalty settings.")
                    .Evidence(evidence::Sample(source, series[i], cur / prev))
                    .Build());
        }
    }
    return out;
}

Findings NegativeInternal(const Series &series, SourceKind source) {
    for (const auto &s : series) {
        if (s.internal < 0.0) {
            return {FindingBuilder(FindingSeverity::Critical, "energy",
                                   "Negative internal energy")
                        .Message("Internal energy is " + Sci(s.internal) + " at " + At(s) +
                                 ".")
                        .Recommendation("Negative internal energy is non-physical; check "
                                        "material input and hourglass control.")
                        .Evidence(evidence::Sample(source, s, s.internal))
                        .Build()};
        }
    }
    return {};
}

Findings PartHourglass(const std::map<PartId, MaterialSample> &materials,
                       const ElementPartMapper &mapper) {
    Findings out;
    for (const auto &[part, m] : materials) {
        if (m.internal <= 0.0) {
            continue;
        }
        double share = m.hourglass / m.internal;
        if (share <= energy_limits::kPartHourglassShare) {
            continue;
        }
        std::string name = !m.title.empty() ? m.title : mapper.PartTitle(part).value_or("");
        std::string label = "part " + std::to_string(part);
        if (!name.empty()) {
            label += " (" + name + ")";
        }
        EvidenceRef ref = evidence::Entity(SourceKind::Matsum, "part", part, share);
        ref.cycle = m.cycle;
        ref.time = m.time;
        out.push_back(FindingBuilder(FindingSeverity::Warning, "energy",
                                     "Part hourglass energy above 10%")
                          .Message("Hourglass energy is " + Pct(share) +
                                   " of internal energy in " + label + " at the last state.")
                          .Recommendation("Refine the mesh or change the element formulation "
                                          "of this part.")
                          .Evidence(std::move(ref))
                          .Build());
    }
    return out;
}

EnergySummary Summarize(const Series &series, SourceKind source) {
    EnergySummary summary;
    summary.source = source;
    summary.samples = series.size();
    if (series.empty()) {
        return summary;
    }
    const auto &last = series.back();
    summary.final_ratio = last.ratio;
    summary.final_hourglass_ratio = HourglassRatio(last);
    summary.final_kinetic = last.kinetic;
    summary.final_internal = last.internal;
    summary.final_total = last.total;
    for (const auto &s : series) {
        summary.max_hourglass_ratio = std::max(summary.max_hourglass_ratio, HourglassRatio(s));
    }
    return summary;
}

} // namespace rules::energy

AnalyzerResult EnergyAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::energy;
    AnalyzerResult result;
    const auto &series = ctx.data.Energy();
    const SourceKind source = ctx.data.EnergySource();

    if (!series.empty()) {
        Append(result.findings, HourglassGrowth(series, source));
        Append(result.findings, RatioDivergence(series, source));
        Append(result.findings, RatioBand(series, source));
        Append(result.findings, KineticJumps(series, source));
        Append(result.findings, KineticDominance(series, source));
        Append(result.findings, SlidingShare(series, source));
        Append(result.findings, SlidingSpikes(series, source));
        Append(result.findings, NegativeInternal(series, source));
        result.summaries.energy = Summarize(series, source);
    }
    Append(result.findings, PartHourglass(ctx.data.final_materials, ctx.mapper));
    return result;
}

} // namespace dynadiag
