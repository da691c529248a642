/**
 * @file ContactAnalyzer.cpp
 * @brief Contact interface merging and rules
 */

#include <dynadiag/analysis/ContactAnalyzer.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>

#include <algorithm>
#include <map>

namespace dynadiag {

namespace rules::contact {

namespace {

std::string Label(const ContactInterfaceSummary &s) {
    std::string label = "Interface " + std::to_string(s.id);
    if (!s.title.empty()) {
        label += " (" + s.title + ")";
    }
    return label;
}

} // namespace

std::string TypeName(std::string_view type_code) {
    static const std::map<int, const char *> names = {
        {1, "Sliding Only"},
        {2, "Tied"},
        {3, "Surface to Surface"},
        {4, "Single Surface"},
        {5, "Nodes to Surface"},
        {6, "Nodes Tied to Surface"},
        {7, "Shell Edge Tied to Shell"},
        {8, "Spotweld Nodes to Surface"},
        {9, "Tie-Break"},
        {10, "One-Way Surface to Surface"},
        {13, "Automatic Single Surface"},
        {14, "Eroding Surface to Surface"},
        {15, "Eroding Single Surface"},
        {25, "Automatic Surface to Surface (Offset)"},
        {26, "Automatic Single Surface (Offset)"},
    };
    auto tokens = text::SplitWhitespace(type_code);
    if (tokens.empty()) {
        return "";
    }
    auto code = text::ParseInt32(tokens.back());
    if (!code) {
        return std::string(type_code);
    }
    auto it = names.find(*code);
    return it != names.end() ? it->second : "Type " + std::to_string(*code);
}

SourceKind TimingSource(const RunData &data) {
    return data.timing && !data.timing->interfaces.empty() ? SourceKind::Hsp
                                                           : SourceKind::ContactProfile;
}

std::vector<ContactInterfaceSummary> Summarize(const RunData &data) {
    std::map<InterfaceId, ContactInterfaceSummary> merged;
    auto entry = [&merged](InterfaceId id) -> ContactInterfaceSummary & {
        auto [it, inserted] = merged.try_emplace(id);
        it->second.id = id;
        return it->second;
    };

    if (data.contacts) {
        for (const auto &c : data.contacts->interfaces) {
            auto &s = entry(c.id);
            s.type = c.type;
            s.title = c.title;
        }
    }

    if (TimingSource(data) == SourceKind::Hsp) {
        for (const auto &t : data.timing->interfaces) {
            auto &s = entry(t.id);
            s.cpu_seconds += t.cpu_seconds;
            s.clock_seconds += t.clock_seconds;
        }
    } else {
        for (const auto &p : data.contact_profile) {
            auto &s = entry(p.interface_id);
            s.cpu_seconds += p.seconds;
            s.clock_seconds += p.seconds;
        }
    }

    if (!data.interface_warning_counts.empty()) {
        for (const auto &w : data.interface_warning_counts) {
            entry(w.interface_id).warning_count += w.count;
        }
    } else {
        for (const auto &w : data.warnings) {
            if (w.interface_id) {
                ++entry(*w.interface_id).warning_count;
            }
        }
    }

    for (const auto &p : data.penetrations) {
        entry(p.interface_id).initial_penetrations += p.count;
    }

    std::vector<ContactInterfaceSummary> out;
    out.reserve(merged.size());
    for (auto &[id, s] : merged) {
        out.push_back(std::move(s));
    }
    // merged is id-ordered; stable sort keeps ascending id on equal clock time
    std::stable_sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        return a.clock_seconds > b.clock_seconds;
    });
    return out;
}

Findings WarningLoad(const std::vector<ContactInterfaceSummary> &summaries) {
    std::vector<const ContactInterfaceSummary *> flagged;
    for (const auto &s : summaries) {
        if (s.warning_count > contact_limits::kWarningCount) {
            flagged.push_back(&s);
        }
    }
    std::sort(flagged.begin(), flagged.end(), [](auto *a, auto *b) { return a->id < b->id; });

    Findings out;
    for (const auto *s : flagged) {
        out.push_back(FindingBuilder(FindingSeverity::Warning, "contact",
                                     "Excessive contact warnings")
                          .Message(Label(*s) + " reported " + std::to_string(s->warning_count) +
                                   " warnings.")
                          .Recommendation("Check segment orientation, initial gaps and "
                                          "penetrations on this interface; tied contacts may "
                                          "need a larger search distance.")
                          .Evidence(evidence::Entity(SourceKind::Messages, "interface", s->id,
                                                     static_cast<double>(s->warning_count)))
                          .Occurrences(s->warning_count)
                          .Build());
    }
    return out;
}

Findings Penetrations(const std::vector<ContactInterfaceSummary> &summaries) {
    std::vector<const ContactInterfaceSummary *> hits;
    for (const auto &s : summaries) {
        if (s.initial_penetrations > 0) {
            hits.push_back(&s);
        }
    }
    std::sort(hits.begin(), hits.end(), [](auto *a, auto *b) { return a->id < b->id; });

    Findings out;
    for (const auto *s : hits) {
        out.push_back(FindingBuilder(FindingSeverity::Info, "contact",
                                     "Initial penetrations found")
                          .Message(Label(*s) + " started with " +
                                   std::to_string(s->initial_penetrations) +
                                   " initial penetrations.")
                          .Recommendation("Remove the overlaps in the mesh or control their "
                                          "treatment with IGNORE in *CONTROL_CONTACT.")
                          .Evidence(evidence::Entity(SourceKind::Messages, "interface", s->id,
                                                     static_cast<double>(s->initial_penetrations)))
                          .Build());
    }
    return out;
}

Findings DominantInterface(const std::vector<ContactInterfaceSummary> &ranked,
                           SourceKind source) {
    double total = 0.0;
    for (const auto &s : ranked) {
        total += s.clock_seconds;
    }
    if (ranked.empty() || total <= 0.0) {
        return {};
    }
    const auto &top = ranked.front();
    double share = top.clock_seconds / total;
    if (share <= contact_limits::kDominantShare) {
        return {};
    }
    std::string type = TypeName(top.type);
    return {FindingBuilder(FindingSeverity::Info, "contact",
                           "Interface " + std::to_string(top.id) + " dominates contact cost")
                .Message(Label(top) + (type.empty() ? "" : ", " + type + ",") + " takes " +
                         Console::FormatNumber(share * 100.0, 0) + "% of contact time (" +
                         Console::FormatNumber(top.clock_seconds, 2) + " s of " +
                         Console::FormatNumber(total, 2) + " s).")
                .Recommendation("Review bucket sort frequency and segment count of this "
                                "interface.")
                .Evidence(evidence::Entity(source, "interface", top.id, share))
                .Build()};
}

Findings StabilityLimit(const ContactStability &stability, std::optional<double> element_dt) {
    if (!stability.dt_limit || *stability.dt_limit <= 0.0) {
        return {};
    }
    const SurfaceTimestep *controlling = nullptr;
    std::size_t active = 0;
    for (const auto &s : stability.surfaces) {
        if (!s.Active()) {
            continue;
        }
        ++active;
        if (controlling == nullptr || s.timestep < controlling->timestep) {
            controlling = &s;
        }
    }
    if (controlling == nullptr) {
        return {};
    }

    const double limit = *stability.dt_limit;
    std::string msg = "The solver recommends dt <= " + Console::FormatScientific(limit) +
                      " for contact stability. The smallest active surface timestep is " +
                      Console::FormatScientific(controlling->timestep) + " on interface " +
                      std::to_string(controlling->interface_id) + " " + controlling->surface +
                      " (part " + std::to_string(controlling->part) + "), one of " +
                      std::to_string(active) + " active surface(s).";
    if (element_dt && limit < *element_dt) {
        msg += " The limit is below the smallest element timestep (" +
               Console::FormatScientific(*element_dt) + "), so contact stiffness sets the step.";
    }
    return {FindingBuilder(FindingSeverity::Warning, "contact",
                           "Contact stability limits the timestep")
                .Message(msg)
                .Recommendation("Lower the penalty scale factor (SLSFAC) or switch to soft "
                                "constraint contact (SOFT=1 or 2). Check the contact thickness "
                                "(SHLTHK) and the surface mesh size on this interface.")
                .Evidence(evidence::Entity(SourceKind::Hsp, "interface",
                                           controlling->interface_id, controlling->timestep))
                .Build()};
}

} // namespace rules::contact

AnalyzerResult ContactAnalyzer::Analyze(const AnalysisContext &ctx) const {
    using namespace rules::contact;
    AnalyzerResult result;
    if (ctx.data.contact_stability) {
        std::optional<double> element_dt;
        for (const auto &e : ctx.data.smallest_timesteps) {
            if (e.dt > 0.0 && (!element_dt || e.dt < *element_dt)) {
                element_dt = e.dt;
            }
        }
        Append(result.findings, StabilityLimit(*ctx.data.contact_stability, element_dt));
    }
    auto summaries = Summarize(ctx.data);
    if (summaries.empty()) {
        return result;
    }
    Append(result.findings, WarningLoad(summaries));
    Append(result.findings, Penetrations(summaries));
    Append(result.findings, DominantInterface(summaries, TimingSource(ctx.data)));
    result.summaries.contacts = std::move(summaries);
    return result;
}

} // namespace dynadiag
