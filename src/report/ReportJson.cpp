/**
 * @file ReportJson.cpp
 * @brief Report to nlohmann::json
 */

#include <dynadiag/core/Error.hpp>
#include <dynadiag/report/ReportJson.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>

namespace dynadiag {

namespace {

using nlohmann::json;

template <typename T, typename F> json Optional(const std::optional<T> &value, F &&convert) {
    return value ? convert(*value) : json(nullptr);
}

template <typename T, typename F> json Array(const std::vector<T> &values, F &&convert) {
    json arr = json::array();
    for (const auto &v : values) {
        arr.push_back(convert(v));
    }
    return arr;
}

json Vec(const Vec3 &v) { return json::array({v[0], v[1], v[2]}); }

json ToJson(const ModelSummary &m) {
    json j;
    j["header"]["version"] = m.header.version;
    j["header"]["revision"] = m.header.revision;
    j["header"]["platform"] = m.header.platform;
    j["header"]["precision"] = m.header.precision;
    j["header"]["hostname"] = m.header.hostname;
    j["header"]["input_file"] = m.header.input_file;
    j["header"]["date"] = m.header.date;
    j["header"]["mpp_processors"] = m.header.mpp_processors;
    j["nodes"] = m.nodes;
    j["solids"] = m.solids;
    j["shells"] = m.shells;
    j["beams"] = m.beams;
    j["thick_shells"] = m.thick_shells;
    j["sph_particles"] = m.sph_particles;
    j["materials"] = m.materials;
    j["parts"] = m.parts;
    j["contacts"] = m.contacts;
    j["spc_nodes"] = m.spc_nodes;
    j["total_elements"] = m.TotalElements();
    j["keyword_counts"] = m.keyword_counts;
    j["termination_time"] = m.termination_time;
    j["dt_scale_factor"] = m.dt_scale_factor;
    j["mass_scaling_dt"] = m.mass_scaling_dt;
    j["min_dt_factor"] = m.min_dt_factor;
    return j;
}

json ToJson(const PartDefinition &p) {
    return {{"id", p.id},
            {"section_id", p.section_id},
            {"material_id", p.material_id},
            {"material_type", p.material_type},
            {"material_name", p.material_name},
            {"eos_type", p.eos_type},
            {"hourglass_type", p.hourglass_type},
            {"density", p.density},
            {"hourglass_coefficient", p.hourglass_coefficient},
            {"youngs_modulus", p.youngs_modulus},
            {"poisson_ratio", p.poisson_ratio}};
}

json ToJson(const ContactDefinition &c) {
    return {{"id", c.id}, {"type", c.type}, {"title", c.title}};
}

json ToJson(const MassProperty &m) {
    return {{"part", m.part},
            {"mass", m.mass},
            {"center", Vec(m.center)},
            {"inertia", Vec(m.inertia)}};
}

json ToJson(const TimingTable &t) {
    json j;
    j["components"] = Array(t.components, [](const ComponentTiming &c) {
        return json{{"name", c.name},
                    {"cpu_seconds", c.cpu_seconds},
                    {"cpu_percent", c.cpu_percent},
                    {"clock_seconds", c.clock_seconds},
                    {"clock_percent", c.clock_percent},
                    {"sub_entry", c.sub_entry}};
    });
    j["interfaces"] = Array(t.interfaces, [](const InterfaceTiming &i) {
        return json{
            {"id", i.id}, {"cpu_seconds", i.cpu_seconds}, {"clock_seconds", i.clock_seconds}};
    });
    j["processors"] = Array(t.processors, [](const ProcessorTiming &p) {
        return json{{"rank", p.rank},
                    {"host", p.host},
                    {"cpu_ratio", p.cpu_ratio},
                    {"cpu_seconds", p.cpu_seconds}};
    });
    if (t.decomposition.present) {
        j["decomposition"] = {{"min_cost", t.decomposition.min_cost},
                              {"max_cost", t.decomposition.max_cost},
                              {"std_deviation", t.decomposition.std_deviation}};
    } else {
        j["decomposition"] = nullptr;
    }
    return j;
}

json ToJson(const TerminationStatus &t) {
    return {{"kind", TerminationKindName(t.kind)},
            {"cycles", t.cycles},
            {"target_time", t.target_time},
            {"actual_time", t.actual_time},
            {"cpu_seconds", t.cpu_seconds},
            {"elapsed_seconds", t.elapsed_seconds},
            {"cpu_per_zone_ns", t.cpu_per_zone_ns},
            {"clock_per_zone_ns", t.clock_per_zone_ns},
            {"start_stamp", t.start_stamp},
            {"end_stamp", t.end_stamp},
            {"error_code", t.error_code ? json(*t.error_code) : json(nullptr)},
            {"source", SourceName(t.source)}};
}

json ToJson(const StatusEstimate &e) {
    return {{"cpu_per_zone_ns", e.cpu_per_zone_ns},
            {"avg_cpu_per_zone_ns", e.avg_cpu_per_zone_ns},
            {"avg_clock_per_zone_ns", e.avg_clock_per_zone_ns},
            {"est_total_cpu", e.est_total_cpu},
            {"est_remaining_cpu", e.est_remaining_cpu},
            {"est_total_clock", e.est_total_clock},
            {"est_remaining_clock", e.est_remaining_clock}};
}

json ToJson(const ElementTimestep &e) {
    return {{"kind", ElementKindName(e.kind)},
            {"element", e.element},
            {"part", e.part},
            {"dt", e.dt}};
}

json ToJson(const DerivedSummaries &s) {
    json j;
    j["energy"] = Optional(s.energy, [](const EnergySummary &e) {
        return json{{"source", SourceName(e.source)},
                    {"samples", e.samples},
                    {"final_ratio", e.final_ratio},
                    {"final_hourglass_ratio", e.final_hourglass_ratio},
                    {"max_hourglass_ratio", e.max_hourglass_ratio},
                    {"final_kinetic", e.final_kinetic},
                    {"final_internal", e.final_internal},
                    {"final_total", e.final_total}};
    });
    j["timestep"] = Optional(s.timestep, [](const TimestepSummary &t) {
        json jt;
        jt["intervals"] = Array(t.intervals, [](const ControllingInterval &i) {
            return json{{"start_cycle", i.start_cycle},
                        {"end_cycle", i.end_cycle},
                        {"kind", ElementKindName(i.kind)},
                        {"element", i.element},
                        {"part", i.part},
                        {"min_dt", i.min_dt}};
        });
        jt["smallest_elements"] =
            Array(t.smallest_elements, [](const ElementTimestep &e) { return ToJson(e); });
        jt["parts"] = Array(t.parts, [](const PartTimestepGroup &g) {
            return json{{"part", g.part},
                        {"title", g.title},
                        {"elements", g.elements},
                        {"min_dt", g.min_dt}};
        });
        jt["initial_dt"] = t.initial_dt;
        jt["final_dt"] = t.final_dt;
        jt["min_dt"] = t.min_dt;
        return jt;
    });
    j["contacts"] = Optional(s.contacts, [](const std::vector<ContactInterfaceSummary> &list) {
        return Array(list, [](const ContactInterfaceSummary &c) {
            return json{{"id", c.id},
                        {"type", c.type},
                        {"title", c.title},
                        {"warning_count", c.warning_count},
                        {"initial_penetrations", c.initial_penetrations},
                        {"cpu_seconds", c.cpu_seconds},
                        {"clock_seconds", c.clock_seconds}};
        });
    });
    j["performance"] = Optional(s.performance, [](const PerformanceSummary &p) {
        json jp;
        jp["components"] = Array(p.components, [](const ComponentShare &c) {
            return json{
                {"name", c.name}, {"cpu_seconds", c.cpu_seconds}, {"percent", c.percent}};
        });
        jp["imbalance"] = Array(p.imbalance, [](const LoadImbalance &l) {
            return json{{"component", l.component},
                        {"ranks", l.ranks},
                        {"mean", l.mean},
                        {"stddev", l.stddev},
                        {"cv", l.cv},
                        {"slowest_rank", l.slowest_rank}};
        });
        jp["decomposition_imbalance"] = Optional(p.decomposition_imbalance,
                                                 [](double v) { return json(v); });
        return jp;
    });
    j["scaling"] = Optional(s.scaling, [](const ScalingSummary &sc) {
        json js;
        js["projection"] = true;
        js["current_cores"] = sc.current_cores;
        js["parallel_fraction"] = sc.parallel_fraction;
        js["communication_fraction"] = sc.communication_fraction;
        js["serial_fraction"] = sc.serial_fraction;
        js["projections"] = Array(sc.projections, [](const ScalingProjection &p) {
            return json{{"cores", p.cores},
                        {"speedup", p.speedup},
                        {"efficiency", p.efficiency},
                        {"band", p.band}};
        });
        return js;
    });
    j["warning_codes"] =
        Optional(s.warning_codes, [](const std::vector<WarningCodeSummary> &list) {
            return Array(list, [](const WarningCodeSummary &w) {
                return json{{"code", w.code},
                            {"kind", EventKindName(w.kind)},
                            {"title", w.title},
                            {"category", w.category},
                            {"count", w.count},
                            {"ranks", w.ranks}};
            });
        });
    return j;
}

json ToJson(const EvidenceRef &e) {
    json j;
    j["source"] = SourceName(e.source);
    j["entity"] = e.entity;
    j["id"] = e.id;
    j["cycle"] = e.cycle ? json(*e.cycle) : json(nullptr);
    j["cycle_end"] = e.cycle_end ? json(*e.cycle_end) : json(nullptr);
    j["time"] = e.time ? json(*e.time) : json(nullptr);
    j["value"] = e.value ? json(*e.value) : json(nullptr);
    return j;
}

json SourceList(const std::vector<SourceKind> &sources) {
    json arr = json::array();
    for (auto s : sources) {
        arr.push_back(SourceName(s));
    }
    return arr;
}

} // namespace

json FindingToJSON(const Finding &f) {
    json j;
    j["severity"] = FindingSeverityName(f.severity);
    j["category"] = f.category;
    j["title"] = f.title;
    j["message"] = f.message;
    j["recommendation"] = f.recommendation;
    j["evidence"] = Array(f.evidence, [](const EvidenceRef &e) { return ToJson(e); });
    j["occurrences"] = f.occurrences;
    j["analyzer"] = f.analyzer;
    return j;
}

json ReportToJSON(const Report &report) {
    json j;
    j["tool_version"] = report.tool_version;
    j["model"] = Optional(report.model, [](const ModelSummary &m) { return ToJson(m); });
    j["parts"] = Optional(report.parts, [](const PartTable &t) {
        return Array(t.parts, [](const PartDefinition &p) { return ToJson(p); });
    });
    j["contacts"] = Optional(report.contacts, [](const ContactTable &t) {
        return Array(t.interfaces, [](const ContactDefinition &c) { return ToJson(c); });
    });
    j["mass"] = Optional(report.mass, [](const MassPropertyTable &t) {
        json jm;
        jm["total"] = t.TotalMass();
        jm["parts"] = Array(t.parts, [](const MassProperty &m) { return ToJson(m); });
        return jm;
    });
    j["timing"] = Optional(report.timing, [](const TimingTable &t) { return ToJson(t); });
    j["termination"] =
        Optional(report.termination, [](const TerminationStatus &t) { return ToJson(t); });
    j["estimate"] = Optional(report.estimate, [](const StatusEstimate &e) { return ToJson(e); });
    j["summaries"] = ToJson(report.summaries);
    j["findings"] = Array(report.findings, [](const Finding &f) { return FindingToJSON(f); });

    auto counts = report.SeverityCounts();
    j["counts"] = {{"info", counts[0]}, {"warning", counts[1]}, {"critical", counts[2]}};

    json skipped = json::object();
    for (const auto &[source, count] : report.coverage.skipped) {
        skipped[SourceName(source)] = count;
    }
    j["coverage"] = {{"present", SourceList(report.coverage.present)},
                     {"missing", SourceList(report.coverage.missing)},
                     {"skipped", skipped},
                     {"message_logs", report.coverage.message_logs},
                     {"degraded", report.coverage.Degraded()}};
    return j;
}

std::string ReportToJSONString(const Report &report) { return ReportToJSON(report).dump(2); }

void WriteReportJSON(const Report &report, const std::string &path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IOError("Failed to open file for writing: '" + path + "': " + std::strerror(errno));
    }
    file << ReportToJSONString(report) << "\n";
    if (file.fail()) {
        throw IOError("Failed to write to file: '" + path + "': " + std::strerror(errno));
    }
}

} // namespace dynadiag
