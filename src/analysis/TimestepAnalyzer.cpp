/**
 * @file TimestepAnalyzer.cpp
 * @brief Timestep rules and interval compression
 */

#include <dynadiag/analysis/TimestepAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>

#include <algorithm>
#include <map>
#include <queue>

namespace dynadiag {

namespace rules::timestep {

namespace {

std::string Sci(double v) { return Console::FormatScientific(v, 4); }

bool Smaller(const ElementTimestep &a, const ElementTimestep &b) {
    if (a.dt != b.dt) {
        return a.dt < b.dt;
    }
    return a.element < b.element;
}

std::string ElementLabel(ElementKind kind, ElementId element, PartId part) {
    return std::string(ElementKindName(kind)) + " " + std::to_string(element) + " of part " +
           std::to_string(part);
}

} // namespace

std::vector<TimestepRecord> Records(const RunData &data) {
    if (!data.timesteps.empty()) {
        return data.timesteps;
    }
    std::vector<TimestepRecord> out;
    for (const auto &s : data.Energy()) {
        if (s.controlling_element == 0 && s.dt == 0.0) {
            continue;
        }
        out.push_back(TimestepRecord{.cycle = s.cycle,
                                     .time = s.time,
                                     .dt = s.dt,
                                     .element_kind = s.controlling_kind,
                                     .element = s.controlling_element,
                                     .part = s.controlling_part});
    }
    return out;
}

Findings Collapse(const std::vector<TimestepRecord> &records, SourceKind source) {
    Findings out;
    std::size_t i = 0;
    while (i < records.size()) {
        const auto &r = records[i];
        if (!(r.dt > 0.0 && r.dt < timestep_limits::kCollapseDt)) {
            ++i;
            continue;
        }
        std::size_t j = i;
        double min_dt = r.dt;
        while (j + 1 < records.size() && records[j + 1].dt > 0.0 &&
               records[j + 1].dt < timestep_limits::kCollapseDt) {
            ++j;
            min_dt = std::min(min_dt, records[j].dt);
        }
        EvidenceRef ref = evidence::Entity(source, "element", r.element, min_dt);
        ref.cycle = r.cycle;
        ref.cycle_end = records[j].cycle;
        ref.time = r.time;
        out.push_back(
            FindingBuilder(FindingSeverity::Critical, "timestep", "Timestep collapse")
                .Message("dt fell to " + Sci(r.dt) + " at cycle " + std::to_string(r.cycle) +
                         ", controlled by " + ElementLabel(r.element_kind, r.element, r.part) +
                         (j > i ? "; stayed below 1e-11 through cycle " +
                                      std::to_string(records[j].cycle)
                                : std::string()) +
                         ".")
                .Recommendation("The controlling element is collapsing. Add erosion "
                                "(*MAT_ADD_EROSION or ERODE=1 with TSMIN) or fix the mesh "
                                "around it.")
                .Evidence(std::move(ref))
                .Occurrences(static_cast<std::int64_t>(j - i + 1))
                .Build());
        i = j + 1;
    }
    return out;
}

std::vector<ControllingInterval> Intervals(const std::vector<TimestepRecord> &records) {
    std::vector<ControllingInterval> out;
    for (const auto &r : records) {
        if (!out.empty()) {
            auto &open = out.back();
            bool same = open.kind == r.element_kind && open.element == r.element;
            if (same || r.cycle <= open.start_cycle) {
                if (same && r.dt > 0.0) {
                    open.min_dt = open.min_dt > 0.0 ? std::min(open.min_dt, r.dt) : r.dt;
                }
                open.end_cycle = std::max(open.end_cycle, r.cycle);
                continue;
            }
            open.end_cycle = r.cycle - 1;
        }
        out.push_back(ControllingInterval{.start_cycle = r.cycle,
                                          .end_cycle = r.cycle,
                                          .kind = r.element_kind,
                                          .element = r.element,
                                          .part = r.part,
                                          .min_dt = r.dt});
    }
    return out;
}

Findings DtDrop(const std::vector<TimestepRecord> &records, SourceKind source) {
    const TimestepRecord *first = nullptr;
    const TimestepRecord *lowest = nullptr;
    for (const auto &r : records) {
        if (r.dt <= 0.0) {
            continue;
        }
        if (first == nullptr) {
            first = &r;
        }
        if (lowest == nullptr || r.dt < lowest->dt) {
            lowest = &r;
        }
    }
    if (first == nullptr) {
        return {};
    }
    double ratio = lowest->dt / first->dt;
    if (ratio >= timestep_limits::kDropWarning) {
        return {};
    }
    bool critical = ratio < timestep_limits::kDropCritical;
    EvidenceRef ref = evidence::Entity(source, "element", lowest->element, lowest->dt);
    ref.cycle = lowest->cycle;
    ref.time = lowest->time;
    return {FindingBuilder(critical ? FindingSeverity::Critical : FindingSeverity::Warning,
                           "timestep",
                           critical ? "Severe timestep drop" : "Significant timestep drop")
                .Message("dt dropped to " + Console::FormatNumber(ratio * 100.0, 1) +
                         "% of its initial value (" + Sci(first->dt) + " to " + Sci(lowest->dt) +
                         " at cycle " + std::to_string(lowest->cycle) + ").")
                .Recommendation("Check the controlling elements near this cycle for excessive "
                                "distortion; erosion or local remeshing may be needed.")
                .Evidence(std::move(ref))
                .Build()};
}

std::vector<ElementTimestep> SmallestElements(const std::vector<ElementTimestep> &entries,
                                              std::size_t n) {
    // max-heap on "largest kept", bounded to n
    auto cmp = [](const ElementTimestep &a, const ElementTimestep &b) { return Smaller(a, b); };
    std::priority_queue<ElementTimestep, std::vector<ElementTimestep>, decltype(cmp)> heap(cmp);
    for (const auto &e : entries) {
        if (heap.size() < n) {
            heap.push(e);
        } else if (n > 0 && Smaller(e, heap.top())) {
            heap.pop();
            heap.push(e);
        }
    }
    std::vector<ElementTimestep> out;
    out.reserve(heap.size());
    while (!heap.empty()) {
        out.push_back(heap.top());
        heap.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<PartTimestepGroup> GroupByPart(const std::vector<ElementTimestep> &entries,
                                           std::size_t n, const ElementPartMapper &mapper) {
    std::map<PartId, PartTimestepGroup> groups;
    for (const auto &e : SmallestElements(entries, n)) {
        PartId part = e.part != 0 ? e.part : mapper.OwningPart(e.element).value_or(0);
        auto [it, inserted] = groups.try_emplace(part);
        auto &g = it->second;
        if (inserted) {
            g.part = part;
            g.title = mapper.PartTitle(part).value_or("");
            g.min_dt = e.dt;
        }
        ++g.elements;
        g.min_dt = std::min(g.min_dt, e.dt);
    }
    std::vector<PartTimestepGroup> out;
    for (auto &[part, g] : groups) {
        out.push_back(std::move(g));
    }
    std::stable_sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        return a.min_dt < b.min_dt;
    });
    return out;
}

Findings DominantPart(const std::vector<ElementTimestep> &entries) {
    if (entries.empty()) {
        return {};
    }
    std::map<PartId, std::size_t> counts;
    for (const auto &e : entries) {
        ++counts[e.part];
    }
    auto best = std::max_element(counts.begin(), counts.end(), [](const auto &a, const auto &b) {
        return a.second < b.second;
    });
    double share = static_cast<double>(best->second) / static_cast<double>(entries.size());
    if (share <= timestep_limits::kDominantPartShare) {
        return {};
    }
    return {FindingBuilder(FindingSeverity::Info, "timestep",
                           "Part " + std::to_string(best->first) + " dominates timestep control")
                .Message("Part " + std::to_string(best->first) + " owns " +
                         std::to_string(best->second) + " of " + std::to_string(entries.size()) +
                         " smallest-timestep elements.")
                .Recommendation("Coarsen the smallest elements of this part or apply selective "
                                "mass scaling (DT2MS) to it.")
                .Evidence(evidence::Entity(SourceKind::Hsp, "part", best->first, share))
                .Build()};
}

Findings MassScaling(const ModelSummary &model) {
    if (model.mass_scaling_dt == 0.0) {
        return {};
    }
    return {FindingBuilder(FindingSeverity::Info, "timestep", "Mass scaling is active")
                .Message("DT2MS = " + Sci(model.mass_scaling_dt) +
                         "; mass is added to hold the target timestep.")
                .Recommendation("Confirm the added mass stays small (under about 5% of total "
                                "mass) in glstat.")
                .Evidence(evidence::Entity(SourceKind::Hsp, "run", 0, model.mass_scaling_dt))
                .Build()};
}

} // namespace rules::timestep

AnalyzerResult TimestepAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::timestep;
    AnalyzerResult result;
    const auto &data = ctx.data;
    const SourceKind source = data.timesteps.empty() ? data.EnergySource() : SourceKind::Hsp;
    auto records = Records(data);

    Append(result.findings, Collapse(records, source));
    Append(result.findings, DtDrop(records, source));
    Append(result.findings, DominantPart(data.smallest_timesteps));
    if (data.model) {
        Append(result.findings, MassScaling(*data.model));
    }

    if (!records.empty() || !data.smallest_timesteps.empty()) {
        TimestepSummary summary;
        summary.intervals = Intervals(records);
        summary.smallest_elements =
            SmallestElements(data.smallest_timesteps, timestep_limits::kTopElements);
        summary.parts =
            GroupByPart(data.smallest_timesteps, timestep_limits::kPartGroupEntries, ctx.mapper);
        for (const auto &r : records) {
            if (r.dt <= 0.0) {
                continue;
            }
            if (summary.initial_dt == 0.0) {
                summary.initial_dt = r.dt;
            }
            summary.final_dt = r.dt;
            summary.min_dt = summary.min_dt == 0.0 ? r.dt : std::min(summary.min_dt, r.dt);
        }
        result.summaries.timestep = std::move(summary);
    }
    return result;
}

} // namespace dynadiag
