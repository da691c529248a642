#pragma once

/**
 * @file DiagnosisDebrief.hpp
 * @brief Terminal transcript of a Report
 */

#include <dynadiag/io/Console.hpp>
#include <dynadiag/io/report/AsciiTable.hpp>
#include <dynadiag/io/report/Banner.hpp>
#include <dynadiag/report/Report.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace dynadiag {

/**
 * @brief Renders a Report for a human reader
 *
 * Findings are grouped by severity here, most severe first; within a group
 * they keep Report order. Colors are applied only when the console allows.
 */
class DiagnosisDebrief {
  public:
    explicit DiagnosisDebrief(const Console &console) : console_(console) {}

    /// Findings listed per severity group before "... and N more"
    void SetFindingLimit(std::size_t limit) { finding_limit_ = limit; }

    [[nodiscard]] std::string Generate(const Report &report) const {
        std::ostringstream oss;
        oss << Banner::GetTitle(report.tool_version) << "\n\n";
        ModelSection(oss, report);
        TerminationSection(oss, report);
        TimestepSection(oss, report);
        ContactSection(oss, report);
        PerformanceSection(oss, report);
        FindingSection(oss, report);
        CoverageSection(oss, report);
        oss << Banner::GetRule() << "\n";
        return oss.str();
    }

    void Print(const Report &report) const { std::cout << Generate(report); }

  private:
    const Console &console_;
    std::size_t finding_limit_ = 50;

    [[nodiscard]] std::string Paint(const std::string &text, const char *color) const {
        return console_.Colorize(text, color);
    }

    [[nodiscard]] static const char *SeverityColor(FindingSeverity severity) {
        switch (severity) {
        case FindingSeverity::Critical:
            return AnsiColor::Red;
        case FindingSeverity::Warning:
            return AnsiColor::Yellow;
        case FindingSeverity::Info:
            return AnsiColor::Cyan;
        }
        return AnsiColor::White;
    }

    static void Field(std::ostringstream &oss, const std::string &label, const std::string &value) {
        oss << "  " << Console::PadRight(label + ":", 22) << value << "\n";
    }

    void ModelSection(std::ostringstream &oss, const Report &report) const {
        if (!report.model) {
            return;
        }
        const auto &m = *report.model;
        oss << Banner::GetSectionHeader("MODEL") << "\n";
        if (!m.header.version.empty()) {
            Field(oss, "Solver", m.header.version + " " + m.header.revision + " " +
                                     m.header.precision);
        }
        if (!m.header.input_file.empty()) {
            Field(oss, "Input", m.header.input_file);
        }
        Field(oss, "Processors",
              m.header.mpp_processors > 0 ? std::to_string(m.header.mpp_processors) + " (MPP)"
                                          : "SMP");
        Field(oss, "Nodes / elements",
              std::to_string(m.nodes) + " / " + std::to_string(m.TotalElements()));
        Field(oss, "Parts / contacts",
              std::to_string(m.parts) + " / " + std::to_string(m.contacts));
        if (m.termination_time > 0.0) {
            Field(oss, "Termination time", Console::FormatScientific(m.termination_time, 4));
        }
        if (m.mass_scaling_dt != 0.0) {
            Field(oss, "Mass scaling dt", Console::FormatScientific(m.mass_scaling_dt, 4));
        }
        oss << "\n";
    }

    void TerminationSection(std::ostringstream &oss, const Report &report) const {
        if (!report.termination) {
            return;
        }
        const auto &t = *report.termination;
        oss << Banner::GetSectionHeader("TERMINATION") << "\n";
        std::string kind = TerminationKindName(t.kind);
        std::transform(kind.begin(), kind.end(), kind.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        Field(oss, "Status",
              Paint(kind, t.kind == TerminationKind::Normal ? AnsiColor::Green : AnsiColor::Red));
        Field(oss, "Reached", "t=" + Console::FormatScientific(t.actual_time, 4) + " at cycle " +
                                  std::to_string(t.cycles));
        if (t.elapsed_seconds > 0.0) {
            Field(oss, "Elapsed", Console::FormatNumber(t.elapsed_seconds, 0) + " s");
        }
        if (report.estimate && report.estimate->est_remaining_clock > 0.0) {
            Field(oss, "Estimated remaining",
                  Console::FormatNumber(report.estimate->est_remaining_clock, 0) + " s");
        }
        oss << "\n";
    }

    void TimestepSection(std::ostringstream &oss, const Report &report) const {
        if (!report.summaries.timestep || report.summaries.timestep->parts.empty()) {
            return;
        }
        oss << Banner::GetSectionHeader("TIME STEP CONTROL") << "\n";
        AsciiTable table;
        table.AddColumn("PART", AsciiTable::Align::Right)
            .AddColumn("TITLE", AsciiTable::Align::Left, 32)
            .AddColumn("ELEMENTS", AsciiTable::Align::Right)
            .AddColumn("MIN DT", AsciiTable::Align::Right);
        for (const auto &g : report.summaries.timestep->parts) {
            table.AddRow({std::to_string(g.part), g.title, std::to_string(g.elements),
                          Console::FormatScientific(g.min_dt, 3)});
        }
        oss << table.Render(2) << "\n";
    }

    void ContactSection(std::ostringstream &oss, const Report &report) const {
        if (!report.summaries.contacts || report.summaries.contacts->empty()) {
            return;
        }
        oss << Banner::GetSectionHeader("CONTACT") << "\n";
        AsciiTable table;
        table.AddColumn("ID", AsciiTable::Align::Right)
            .AddColumn("TITLE", AsciiTable::Align::Left, 28)
            .AddColumn("CLOCK (s)", AsciiTable::Align::Right)
            .AddColumn("WARNINGS", AsciiTable::Align::Right)
            .AddColumn("PENETRATIONS", AsciiTable::Align::Right);
        std::size_t shown = 0;
        for (const auto &c : *report.summaries.contacts) {
            if (shown++ == 10) {
                break;
            }
            table.AddRow({std::to_string(c.id), c.title, Console::FormatNumber(c.clock_seconds, 2),
                          std::to_string(c.warning_count), std::to_string(c.initial_penetrations)});
        }
        oss << table.Render(2) << "\n";
    }

    void PerformanceSection(std::ostringstream &oss, const Report &report) const {
        const auto &perf = report.summaries.performance;
        const auto &scaling = report.summaries.scaling;
        if ((!perf || perf->components.empty()) && (!scaling || scaling->projections.empty())) {
            return;
        }
        oss << Banner::GetSectionHeader("PERFORMANCE") << "\n";
        if (perf && !perf->components.empty()) {
            auto components = perf->components;
            std::stable_sort(components.begin(), components.end(),
                             [](const auto &a, const auto &b) { return a.percent > b.percent; });
            AsciiTable table;
            table.AddColumn("COMPONENT", AsciiTable::Align::Left, 30)
                .AddColumn("CPU (s)", AsciiTable::Align::Right)
                .AddColumn("% CPU", AsciiTable::Align::Right);
            for (const auto &c : components) {
                table.AddRow({c.name, Console::FormatNumber(c.cpu_seconds, 1),
                              Console::FormatNumber(c.percent, 1) + "%"});
            }
            oss << table.Render(2);
        }
        if (scaling && !scaling->projections.empty()) {
            oss << "  Scaling projection from " << scaling->current_cores
                << " cores (model estimate, not measured):\n";
            AsciiTable table;
            table.AddColumn("CORES", AsciiTable::Align::Right)
                .AddColumn("SPEEDUP", AsciiTable::Align::Right)
                .AddColumn("EFFICIENCY", AsciiTable::Align::Right)
                .AddColumn("BAND");
            for (const auto &p : scaling->projections) {
                table.AddRow({std::to_string(p.cores), Console::FormatNumber(p.speedup, 2) + "x",
                              Console::FormatNumber(p.efficiency * 100.0, 0) + "%", p.band});
            }
            oss << table.Render(2);
        }
        oss << "\n";
    }

    void FindingSection(std::ostringstream &oss, const Report &report) const {
        auto counts = report.SeverityCounts();
        oss << Banner::GetSectionHeader("FINDINGS") << "\n";
        oss << "  " << Paint(std::to_string(counts[2]) + " critical", AnsiColor::Red) << ", "
            << Paint(std::to_string(counts[1]) + " warning", AnsiColor::Yellow) << ", "
            << Paint(std::to_string(counts[0]) + " info", AnsiColor::Cyan) << "\n\n";

        for (auto severity :
             {FindingSeverity::Critical, FindingSeverity::Warning, FindingSeverity::Info}) {
            std::size_t shown = 0;
            std::size_t total = counts[static_cast<std::size_t>(severity)];
            for (const auto &f : report.findings) {
                if (f.severity != severity) {
                    continue;
                }
                if (shown == finding_limit_) {
                    oss << "  ... and " << (total - shown) << " more\n";
                    break;
                }
                ++shown;
                std::string tag = "[" + std::string(FindingSeverityName(severity)) + "]";
                std::transform(tag.begin(), tag.end(), tag.begin(),
                               [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
                oss << "  " << Paint(tag, SeverityColor(severity)) << " " << f.title;
                if (f.occurrences > 1) {
                    oss << " (x" << f.occurrences << ")";
                }
                oss << "\n";
                if (!f.message.empty()) {
                    oss << "      " << f.message << "\n";
                }
                if (!f.recommendation.empty()) {
                    oss << "      " << Paint("-> " + f.recommendation, AnsiColor::Dim) << "\n";
                }
            }
            if (shown > 0) {
                oss << "\n";
            }
        }
    }

    void CoverageSection(std::ostringstream &oss, const Report &report) const {
        const auto &cov = report.coverage;
        if (!cov.Degraded()) {
            return;
        }
        oss << Banner::GetSectionHeader("COVERAGE") << "\n";
        if (!cov.missing.empty()) {
            std::string names;
            for (auto s : cov.missing) {
                names += (names.empty() ? "" : ", ") + std::string(SourceName(s));
            }
            Field(oss, "Not found", names);
        }
        for (const auto &[source, count] : cov.skipped) {
            if (count > 0) {
                Field(oss, std::string("Skipped in ") + SourceName(source),
                      std::to_string(count) + " records");
            }
        }
        oss << "\n";
    }
};

} // namespace dynadiag
