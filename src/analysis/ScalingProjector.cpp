/**
 * @file ScalingProjector.cpp
 * @brief Communication-growth scaling model
 */

#include <dynadiag/analysis/ScalingProjector.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>

#include <cmath>
#include <initializer_list>

namespace dynadiag {

namespace rules::scaling {

namespace {

bool AnyOf(const std::string &name, std::initializer_list<const char *> keys) {
    for (const char *k : keys) {
        if (text::Contains(name, k)) {
            return true;
        }
    }
    return false;
}

} // namespace

PhaseClass Classify(std::string_view component) {
    std::string name = text::Lower(component);
    // Communication first: "elmnt_shr" and "contact sharing" are not compute
    if (AnyOf(name, {"sharing", "shr", "share"})) {
        return PhaseClass::Communication;
    }
    if (AnyOf(name, {"element", "solid", "shell", "beam", "contact", "rigid"})) {
        return PhaseClass::Parallel;
    }
    if (AnyOf(name, {"keyword", "init", "decomposition", "binary database", "ascii database",
                     "sense switch", "group force", "time step size"})) {
        return PhaseClass::Serial;
    }
    return PhaseClass::Unknown;
}

PhaseSplit Split(const TimingTable &timing) {
    PhaseSplit split;
    for (const auto &c : timing.components) {
        if (c.sub_entry) {
            continue;
        }
        switch (Classify(c.name)) {
        case PhaseClass::Parallel:
            split.parallel += c.clock_seconds;
            break;
        case PhaseClass::Communication:
            split.communication += c.clock_seconds;
            break;
        case PhaseClass::Serial:
            split.serial += c.clock_seconds;
            break;
        case PhaseClass::Unknown:
            split.parallel += 0.5 * c.clock_seconds;
            split.serial += 0.5 * c.clock_seconds;
            break;
        }
    }
    return split;
}

double Elapsed(const PhaseSplit &split, double ratio, double exponent) {
    return split.parallel / ratio + split.communication * std::pow(ratio, exponent) +
           split.serial;
}

const char *Band(double efficiency) {
    if (efficiency < scaling_limits::kSevere) {
        return "severe";
    }
    if (efficiency <= scaling_limits::kCautionary) {
        return "cautionary";
    }
    return "acceptable";
}

ScalingSummary Project(const PhaseSplit &split, int current_cores, double exponent) {
    ScalingSummary summary;
    summary.current_cores = current_cores;
    double total = split.Total();
    if (total <= 0.0 || current_cores < 1) {
        return summary;
    }
    summary.parallel_fraction = split.parallel / total;
    summary.communication_fraction = split.communication / total;
    summary.serial_fraction = split.serial / total;

    double base = Elapsed(split, 1.0, exponent);
    for (int cores : scaling_limits::kTargetCores) {
        if (cores <= current_cores) {
            continue;
        }
        double ratio = static_cast<double>(cores) / current_cores;
        double elapsed = Elapsed(split, ratio, exponent);
        double speedup = elapsed > 0.0 ? base / elapsed : 0.0;
        double efficiency = speedup / ratio;
        summary.projections.push_back(ScalingProjection{.cores = cores,
                                                        .speedup = speedup,
                                                        .efficiency = efficiency,
                                                        .band = Band(efficiency)});
    }
    return summary;
}

Findings Describe(const ScalingSummary &summary) {
    Findings out;
    for (const auto &p : summary.projections) {
        auto severity = p.band == "severe" ? FindingSeverity::Warning : FindingSeverity::Info;
        std::string eff = Console::FormatNumber(p.efficiency * 100.0, 0) + "%";
        FindingBuilder builder(severity, "scaling",
                               "Projected efficiency at " + std::to_string(p.cores) +
                                   " cores: " + eff + " (" + p.band + ")");
        builder.Message("Projection, not a measurement: moving from " +
                        std::to_string(summary.current_cores) + " to " +
                        std::to_string(p.cores) + " cores is estimated to give a " +
                        Console::FormatNumber(p.speedup, 2) + "x speedup at " + eff +
                        " parallel efficiency. Communication is " +
                        Console::FormatNumber(summary.communication_fraction * 100.0, 1) +
                        "% of the measured run.");
        if (p.band == "severe") {
            builder.Recommendation("Communication overhead would dominate; stay near the "
                                   "current core count or coarsen the decomposition.");
        } else if (p.band == "cautionary") {
            builder.Recommendation("Expect diminishing returns; benchmark a short run at this "
                                   "core count before committing.");
        }
        builder.Evidence(evidence::Entity(SourceKind::Hsp, "cores", p.cores, p.efficiency));
        out.push_back(std::move(builder).Build());
    }
    return out;
}

} // namespace rules::scaling

AnalyzerResult ScalingProjector::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::scaling;
    AnalyzerResult result;
    const auto &data = ctx.data;
    if (!data.timing || !data.model || data.model->header.mpp_processors < 1) {
        return result;
    }
    auto summary = Project(Split(*data.timing), data.model->header.mpp_processors,
                           ctx.config.comm_growth_exponent);
    if (summary.parallel_fraction + summary.communication_fraction + summary.serial_fraction <=
        0.0) {
        return result;
    }
    result.findings = Describe(summary);
    result.summaries.scaling = std::move(summary);
    return result;
}

} // namespace dynadiag
