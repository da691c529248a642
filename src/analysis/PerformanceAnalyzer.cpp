/**
 * @file PerformanceAnalyzer.cpp
 * @brief Phase shares, rank statistics and decomposition balance
 */

#include <dynadiag/analysis/PerformanceAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>

#include <Eigen/Core>

#include <cmath>
#include <map>
#include <optional>
#include <string_view>

namespace dynadiag {

namespace rules::performance {

namespace {

/// Component name used for the d3hsp per-processor CPU table
constexpr const char *kMppCpu = "mpp_cpu";

std::string Pct(double fraction) { return Console::FormatNumber(fraction * 100.0, 1) + "%"; }

std::string Percent(double percent) { return Console::FormatNumber(percent, 1) + "%"; }

bool NameHas(const ComponentShare &share, std::string_view needle) {
    return text::Contains(text::Lower(share.name), needle);
}

EvidenceRef ShareRef(SourceKind source, std::size_t index, const ComponentShare &share) {
    return evidence::Entity(source, "component", static_cast<std::int64_t>(index), share.percent);
}

} // namespace

std::vector<ComponentShare> Shares(const RunData &data) {
    std::vector<ComponentShare> out;
    if (data.timing && !data.timing->components.empty()) {
        double total = 0.0;
        for (const auto &c : data.timing->components) {
            if (!c.sub_entry) {
                total += c.cpu_seconds;
            }
        }
        for (const auto &c : data.timing->components) {
            if (c.sub_entry) {
                continue;
            }
            double percent = c.cpu_percent;
            if (percent <= 0.0 && total > 0.0) {
                percent = c.cpu_seconds / total * 100.0;
            }
            out.push_back({.name = c.name, .cpu_seconds = c.cpu_seconds, .percent = percent});
        }
        return out;
    }

    // load_profile.csv fallback, in column order
    std::vector<std::string> order;
    std::map<std::string, double> seconds;
    for (const auto &s : data.load_profile) {
        auto [it, inserted] = seconds.try_emplace(s.component, 0.0);
        if (inserted) {
            order.push_back(s.component);
        }
        it->second += s.seconds;
    }
    double total = 0.0;
    for (const auto &[name, sec] : seconds) {
        total += sec;
    }
    for (const auto &name : order) {
        double sec = seconds[name];
        out.push_back({.name = name,
                       .cpu_seconds = sec,
                       .percent = total > 0.0 ? sec / total * 100.0 : 0.0});
    }
    return out;
}

LoadImbalance Statistics(const std::string &component, const std::vector<double> &values) {
    LoadImbalance result{.component = component, .ranks = values.size()};
    if (values.empty()) {
        return result;
    }
    Eigen::Map<const Eigen::VectorXd> v(values.data(), static_cast<Eigen::Index>(values.size()));
    result.mean = v.mean();
    result.stddev = std::sqrt((v.array() - result.mean).square().mean());
    result.cv = result.mean > 0.0 ? result.stddev / result.mean : 0.0;
    Eigen::Index slowest = 0;
    v.maxCoeff(&slowest);
    result.slowest_rank = static_cast<int>(slowest);
    return result;
}

std::vector<LoadImbalance> Imbalance(const RunData &data) {
    std::vector<std::string> order;
    std::map<std::string, std::map<int, double>> by_component;
    for (const auto &s : data.load_profile) {
        auto [it, inserted] = by_component.try_emplace(s.component);
        if (inserted) {
            order.push_back(s.component);
        }
        it->second[s.rank] += s.seconds;
    }

    std::vector<LoadImbalance> out;
    auto add = [&out](const std::string &name, const std::map<int, double> &ranks) {
        if (ranks.size() < 2) {
            return;
        }
        std::vector<double> values;
        std::vector<int> ids;
        for (const auto &[rank, sec] : ranks) {
            ids.push_back(rank);
            values.push_back(sec);
        }
        auto stats = Statistics(name, values);
        stats.slowest_rank = ids[static_cast<std::size_t>(stats.slowest_rank)];
        out.push_back(stats);
    };

    for (const auto &name : order) {
        add(name, by_component[name]);
    }
    if (data.timing) {
        std::map<int, double> ranks;
        for (const auto &p : data.timing->processors) {
            ranks[p.rank] += p.cpu_seconds;
        }
        add(kMppCpu, ranks);
    }
    return out;
}

Findings ContactShare(const std::vector<ComponentShare> &shares, SourceKind source) {
    Findings out;
    for (std::size_t i = 0; i < shares.size(); ++i) {
        const auto &s = shares[i];
        if (!NameHas(s, "contact") || s.percent <= performance_limits::kContactShare) {
            continue;
        }
        auto severity = s.percent > performance_limits::kContactCritical
                            ? FindingSeverity::Critical
                            : FindingSeverity::Warning;
        out.push_back(FindingBuilder(severity, "performance", "Contact dominates CPU time")
                          .Message(s.name + " takes " + Percent(s.percent) + " of CPU time (" +
                                   Console::FormatNumber(s.cpu_seconds, 1) + " s).")
                          .Recommendation("Reduce contact search cost: merge or split "
                                          "interfaces, raise BSORT, or limit automatic single "
                                          "surface contact to the parts that need it.")
                          .Evidence(ShareRef(source, i, s))
                          .Build());
    }
    return out;
}

Findings PhaseOverhead(const std::vector<ComponentShare> &shares, SourceKind source) {
    using namespace performance_limits;
    Findings out;
    for (std::size_t i = 0; i < shares.size(); ++i) {
        const auto &s = shares[i];
        if (NameHas(s, "force gather") && s.percent > kForceGatherWarning) {
            auto severity = s.percent > kForceGatherCritical ? FindingSeverity::Critical
                                                             : FindingSeverity::Warning;
            out.push_back(
                FindingBuilder(severity, "performance", "Force gather overhead")
                    .Message("Force gather takes " + Percent(s.percent) + " of CPU time (" +
                             Console::FormatNumber(s.cpu_seconds, 2) +
                             " s). Rigid body forces are collected and redistributed across "
                             "all ranks every cycle.")
                    .Recommendation("Make rigid bodies that do not need to be rigid "
                                    "deformable, merge small ones with "
                                    "*CONSTRAINED_RIGID_BODIES, or run on fewer ranks.")
                    .Evidence(ShareRef(source, i, s))
                    .Build());
        } else if (NameHas(s, "mass scaling") && s.percent > kMassScaling) {
            out.push_back(
                FindingBuilder(FindingSeverity::Warning, "performance", "Mass scaling overhead")
                    .Message("Mass scaling takes " + Percent(s.percent) +
                             " of CPU time; many elements sit below the DT2MS target "
                             "timestep.")
                    .Recommendation("Review DT2MS, remove or merge the smallest elements, and "
                                    "check in glstat that the added mass stays within 5%.")
                    .Evidence(ShareRef(source, i, s))
                    .Build());
        }
    }
    return out;
}

Findings SharingOverhead(const std::vector<ComponentShare> &shares, SourceKind source) {
    double total = 0.0;
    std::optional<std::size_t> largest;
    for (std::size_t i = 0; i < shares.size(); ++i) {
        if (!NameHas(shares[i], "sharing") && !NameHas(shares[i], "shr")) {
            continue;
        }
        total += shares[i].percent;
        if (!largest || shares[i].percent > shares[*largest].percent) {
            largest = i;
        }
    }
    if (!largest || total <= performance_limits::kSharingOverhead) {
        return {};
    }
    auto ref = ShareRef(source, *largest, shares[*largest]);
    ref.value = total;
    return {FindingBuilder(FindingSeverity::Warning, "performance", "High MPI sharing overhead")
                .Message("Sharing phases take " + Percent(total) +
                         " of CPU time; ranks spend much of each cycle exchanging boundary "
                         "data.")
                .Recommendation("Run on fewer ranks or improve the decomposition; sharing "
                                "cost grows when the model is split too finely.")
                .Evidence(ref)
                .Build()};
}

Findings Bottlenecks(const std::vector<ComponentShare> &shares, SourceKind source) {
    Findings out;
    for (std::size_t i = 0; i < shares.size(); ++i) {
        const auto &s = shares[i];
        if (s.percent <= performance_limits::kBottleneck) {
            continue;
        }
        out.push_back(FindingBuilder(FindingSeverity::Info, "performance",
                                     s.name + " is the primary cost")
                          .Message(s.name + ": " + Console::FormatNumber(s.cpu_seconds, 1) +
                                   " s, " + Percent(s.percent) + " of CPU time.")
                          .Evidence(ShareRef(source, i, s))
                          .Build());
    }
    return out;
}

Findings LoadBalance(const std::vector<LoadImbalance> &imbalance) {
    Findings out;
    for (const auto &li : imbalance) {
        if (li.cv <= performance_limits::kLoadCv) {
            continue;
        }
        SourceKind source = li.component == kMppCpu ? SourceKind::Hsp : SourceKind::LoadProfile;
        out.push_back(FindingBuilder(FindingSeverity::Warning, "performance",
                                     "Load imbalance in " + li.component)
                          .Message("Per-rank time for " + li.component + " varies by " +
                                   Pct(li.cv) + " (mean " + Console::FormatNumber(li.mean, 2) +
                                   " s, stddev " + Console::FormatNumber(li.stddev, 2) +
                                   " s over " + std::to_string(li.ranks) +
                                   " ranks); rank " + std::to_string(li.slowest_rank) +
                                   " is slowest.")
                          .Recommendation("Review *CONTROL_MPP_DECOMPOSITION; weighting "
                                          "contact regions or using RCB along the dominant "
                                          "direction evens out the work.")
                          .Evidence(evidence::Entity(source, "rank", li.slowest_rank, li.cv))
                          .Build());
    }
    return out;
}

std::optional<double> DecompositionImbalance(const DecompositionStats &stats) {
    if (!stats.present || stats.max_cost <= 0.0) {
        return std::nullopt;
    }
    return (stats.max_cost - stats.min_cost) / stats.max_cost;
}

Findings Decomposition(const DecompositionStats &stats) {
    auto imbalance = DecompositionImbalance(stats);
    if (!imbalance || *imbalance <= performance_limits::kDecompositionWarning) {
        return {};
    }
    auto severity = *imbalance > performance_limits::kDecompositionCritical
                        ? FindingSeverity::Critical
                        : FindingSeverity::Warning;
    return {FindingBuilder(severity, "performance", "Unbalanced domain decomposition")
                .Message("Decomposition cost ranges from " +
                         Console::FormatNumber(stats.min_cost, 1) + " to " +
                         Console::FormatNumber(stats.max_cost, 1) + ", a spread of " +
                         Pct(*imbalance) + " of the largest domain.")
                .Recommendation("Use *CONTROL_MPP_DECOMPOSITION_METHOD or a transformation "
                                "that aligns domains with the model's long axis.")
                .Evidence(evidence::Entity(SourceKind::Hsp, "run", 0, *imbalance))
                .Build()};
}

} // namespace rules::performance

AnalyzerResult PerformanceAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::performance;
    AnalyzerResult result;
    const auto &data = ctx.data;

    PerformanceSummary summary;
    summary.components = Shares(data);
    summary.imbalance = Imbalance(data);
    if (data.timing) {
        summary.decomposition_imbalance = DecompositionImbalance(data.timing->decomposition);
    }

    SourceKind share_source = data.timing && !data.timing->components.empty()
                                  ? SourceKind::Hsp
                                  : SourceKind::LoadProfile;
    Append(result.findings, Bottlenecks(summary.components, share_source));
    Append(result.findings, ContactShare(summary.components, share_source));
    Append(result.findings, PhaseOverhead(summary.components, share_source));
    Append(result.findings, SharingOverhead(summary.components, share_source));
    Append(result.findings, LoadBalance(summary.imbalance));
    if (data.timing) {
        Append(result.findings, Decomposition(data.timing->decomposition));
    }

    if (!summary.components.empty() || !summary.imbalance.empty() ||
        summary.decomposition_imbalance) {
        result.summaries.performance = std::move(summary);
    }
    return result;
}

} // namespace dynadiag
