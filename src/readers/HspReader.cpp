/**
 * @file HspReader.cpp
 * @brief d3hsp section state machine
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/HspReader.hpp>

#include <map>
#include <regex>
#include <string_view>

namespace dynadiag {

namespace {

using text::Contains;

// Header
const std::regex kVersion(R"(^\s*\|\s+Version\s*:\s*(.+?)\s*\|)");
const std::regex kRevision(R"(^\s*\|\s+Revision\s*:\s*(.+?)\s*\|)");
const std::regex kPlatform(R"(^\s*\|\s+Platform\s*:\s*(.+?)\s*\|)");
const std::regex kPrecision(R"(^\s*\|\s+Precision\s*:\s*(.+?)\s*\|)");
const std::regex kHostname(R"(^\s*\|\s+Hostname\s*:\s*(.+?)\s*\|)");
const std::regex kInputFile(R"(Input file:\s*(\S+))");
const std::regex kRunDate(R"(^\s+Date:\s+(\S+)\s+Time:\s+(\S+))");
const std::regex kMppProcs(R"((?:MPP|Parallel)\s+execution with\s+(\d+)\s+(?:MPP\s+)?procs?)");

// Keyword counts and model size
const std::regex kKeywordCount(R"(total # of \*([A-Za-z_0-9/,.+\-()\s]+?)\.{2,}\s+(\d+))");
const std::regex kMaterials(R"(number of materials or property sets\.+\s+(\d+))");
const std::regex kNodes(R"(number of nodal\+scalar points\.+\s+(\d+))");
const std::regex kSolids(R"(number of solid elements\.+\s+(\d+))");
const std::regex kShells(R"(number of shell elements\.+\s+(\d+))");
const std::regex kBeams(R"(number of beam elements\.+\s+(\d+))");
const std::regex kThickShells(R"(number of thick shell elements\.+\s+(\d+))");
const std::regex kSph(R"(number of SPH particles\.+\s+(\d+))");
const std::regex kContacts(R"(number of number of contact definitions\.+\s+(\d+))");
const std::regex kSpc(R"(number of spc nodes\.+\s+(\d+))");

// Computation options
const std::regex kTermTime(R"(termination time\.+\s+(\S+))");
const std::regex kTssfac(R"(time step scale factor\.+\s+(\S+))");
const std::regex kDt2ms(R"(time step size for mass scaled solution.*?\.+\s+(\S+))");
const std::regex kTsmin(R"(reduction factor for minimum time step.*?\.+\s+(\S+))");

// Part definitions
const std::regex kPartSeparator(R"(^\s*\*{60,})");
const std::regex kPartId(R"(part\s+id\s*\.+\s*(\d+))");
const std::regex kSectionId(R"(section\s+id\s*\.+\s*(\d+))");
const std::regex kMaterialId(R"(material\s+id\s*\.+\s*(\d+))");
const std::regex kMaterialType(R"(material type\s*\.+\s*(\d+))");
const std::regex kEosType(R"(equation-of-state type\s*\.+\s*(\d+))");
const std::regex kHgType(R"(hourglass type\s*\.+\s*(\d+))");
const std::regex kDensity(R"(density\s*\.+\s*=\s*(\S+))");
const std::regex kHgCoeff(R"(hourglass coefficient\s*\.+\s*=\s*(\S+))");
const std::regex kYoungs(R"(^\s+e\s+\.+\s*=\s*(\S+))");
const std::regex kPoisson(R"(vnu\s*\.+\s*=\s*(\S+))");

// Contacts
const std::regex kContactHeader(R"(Contact Interface\s+(\d+))");
const std::regex kContactType(R"(contact type\.+\s+(\d+))");
const std::regex kContactSummaryRow(R"(^\s+(\d+)\s+(\d+)\s+([oa]?\s*\d+)\s+(.*?)\s*$)");
const std::regex kSurfaceRow(
    R"(^\s*(\d+)\s+(surf[ab])\s+(.+?)\s+(\S+)\s+(\d+)\s+(\d+)\s*$)", std::regex::icase);
const std::regex kContactDtLimit(R"(contact stability.*?([-+]?\d+\.\d*[eE][-+]?\d+))",
                                 std::regex::icase);

// Solution body
const std::regex kSmallestRow(R"((solid|shell|beam|tshell)\s+(\d+)\s+(\d+)\s+(\S+))");
const std::regex kDecompMin(R"(Minumum:\s+(\S+))");
const std::regex kDecompMax(R"(Maximum:\s+(\S+))");
const std::regex kDecompStd(R"(Standard Deviation:\s+(\S+))");

// Mass properties
const std::regex kMassPart(R"(m a s s\s+p r o p e r t i e s\s+o f\s+p a r t\s*#\s*(\d+))");
const std::regex kMassTotal(R"(total mass of part\s*=\s*(\S+))");
const std::regex kMassCx(R"(x-coordinate of mass center\s*=\s*(\S+))");
const std::regex kMassCy(R"(y-coordinate of mass center\s*=\s*(\S+))");
const std::regex kMassCz(R"(z-coordinate of mass center\s*=\s*(\S+))");
const std::regex kI11(R"(i11\s*=\s*(\S+))");
const std::regex kI22(R"(i22\s*=\s*(\S+))");
const std::regex kI33(R"(i33\s*=\s*(\S+))");

// Tail
const std::regex kTimingRow(R"(^(\s*)(\S.*?)\s*\.{2,}\s*(\S+)\s+(\S+)\s+(\S+)\s+(\S+)\s*$)");
const std::regex kInterfaceRow(R"(^\s+Interf\.\s+ID\s+(\d+)\s+(\S+)\s+(\S+)\s+(\S+)\s+(\S+))");
const std::regex kCpuRow(R"(#\s+(\d+)\s+(\S+)\s+([\d.]+)\s+(\S+))");
const std::regex kProblemTime(R"(Problem time\s+=\s+(\S+))");
const std::regex kProblemCycle(R"(Problem cycle\s+=\s+(\d+))");
const std::regex kTotalCpu(R"(Total CPU time\s+=\s+(\d+)\s+seconds)");
const std::regex kCpuPerZone(R"(CPU time per zone cycle\s*=\s+([\d.]+)\s+nanoseconds)");
const std::regex kClockPerZone(R"(Clock time per zone cycle\s*=\s+([\d.]+)\s+nanoseconds)");
const std::regex kElapsed(R"(Elapsed time\s+(\d+)\s+seconds)");
const std::regex kStartTime(R"(Start time\s+(\d{2}/\d{2}/\d{4}\s+\d{2}:\d{2}:\d{2}))");
const std::regex kEndTime(R"(End time\s+(\d{2}/\d{2}/\d{4}\s+\d{2}:\d{2}:\d{2}))");
const std::regex kNormalTermination(R"(N o r m a l\s+t e r m i n a t i o n)");
const std::regex kErrorTermination(R"(E r r o r\s+t e r m i n a t i o n)");

const std::map<int, const char *> &MaterialNames() {
    static const std::map<int, const char *> names = {
        {1, "Elastic"},
        {2, "Orthotropic"},
        {3, "Elastic-Plastic (von Mises)"},
        {5, "Soil/Crushable Foam"},
        {6, "Viscoelastic"},
        {7, "Blatz-Ko Rubber"},
        {9, "Null"},
        {20, "Rigid"},
        {24, "Piecewise Linear Plasticity"},
        {57, "Low Density Urethane Foam"},
        {76, "Linear Viscoelastic"},
        {77, "General Hyperelastic/Ogden"},
        {98, "Simplified Johnson Cook"},
    };
    return names;
}

template <typename T> void SetInt(const std::string &line, const std::regex &re, T &target) {
    if (auto v = text::SearchInt(line, re)) {
        target = static_cast<T>(*v);
    }
}

void SetDouble(const std::string &line, const std::regex &re, double &target) {
    if (auto v = text::SearchDouble(line, re)) {
        target = *v;
    }
}

std::string Capture(const std::string &line, const std::regex &re) {
    std::smatch m;
    if (std::regex_search(line, m, re)) {
        return m.str(1);
    }
    return {};
}

bool IsSpacedMassBanner(const std::string &line) {
    return Contains(line, "m a s s") && Contains(line, "p r o p e r t i e s");
}

} // namespace

const char *HspSectionName(HspSection section) {
    switch (section) {
    case HspSection::Header:
        return "header";
    case HspSection::ModelStats:
        return "model_stats";
    case HspSection::TimestepControl:
        return "timestep_control";
    case HspSection::PartTable:
        return "part_table";
    case HspSection::ContactTable:
        return "contact_table";
    case HspSection::Warnings:
        return "warnings";
    case HspSection::MassProperties:
        return "mass_properties";
    case HspSection::Termination:
        return "termination";
    }
    return "unknown";
}

HspReader::HspReader(LineSource source) : source_(std::move(source)) {
    termination_.source = SourceKind::Hsp;
}

std::optional<HspRecord> HspReader::Next() {
    std::string line;
    while (pending_.empty() && !finished_) {
        if (source_.NextLine(line)) {
            ProcessLine(line);
        } else {
            Finish();
        }
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    HspRecord record = std::move(pending_.front());
    pending_.pop_front();
    return record;
}

// =============================================================================
// Dispatch
// =============================================================================

void HspReader::ProcessLine(const std::string &line) {
    auto banner = DetectBanner(line);

    if (warning_.Open()) {
        bool structural = banner.has_value() || Contains(line, "dt of cycle") ||
                          Contains(line, "***");
        if (!structural && warning_.AddContext(line)) {
            return;
        }
        FlushWarning();
    }

    if (Contains(line, "termination time reached") && Contains(line, "***")) {
        termination_.kind = TerminationKind::Normal;
        return;
    }

    if (HandleContactStability(line)) {
        return;
    }

    if (banner && *banner != section_) {
        EnterSection(*banner);
    }

    if (warning_.TryBegin(line, SourceKind::Hsp, kPrimaryRank, source_.LineNumber())) {
        if (section_ == HspSection::ContactTable) {
            EnterSection(HspSection::Warnings);
        }
        return;
    }

    switch (section_) {
    case HspSection::Header:
        HandleHeader(line);
        break;
    case HspSection::ModelStats:
        HandleModelStats(line);
        break;
    case HspSection::TimestepControl:
        HandleTimestepControl(line);
        break;
    case HspSection::PartTable:
        HandlePartTable(line);
        break;
    case HspSection::ContactTable:
        HandleContactTable(line);
        break;
    case HspSection::Warnings:
        HandleSolution(line);
        break;
    case HspSection::MassProperties:
        HandleMassProperties(line);
        break;
    case HspSection::Termination:
        HandleTermination(line);
        break;
    }
}

std::optional<HspSection> HspReader::DetectBanner(const std::string &line) const {
    if (Contains(line, "L I S T   O F   K E Y W O R D") ||
        Contains(line, "c o n t r o l   i n f o r m a t i o n")) {
        return HspSection::ModelStats;
    }
    if (Contains(line, "c o m p u t a t i o n   o p t i o n s") ||
        Contains(line, "t i m e   s t e p   c o n t r o l")) {
        return HspSection::TimestepControl;
    }
    if (Contains(line, "p a r t   d e f i n i t i o n s")) {
        return HspSection::PartTable;
    }
    if (Contains(line, "c o n t a c t   i n t e r f a c e s")) {
        return HspSection::ContactTable;
    }
    if (IsSpacedMassBanner(line)) {
        return HspSection::MassProperties;
    }
    if (Contains(line, "T i m i n g   i n f o r m a t i o n") ||
        Contains(line, "C P U   T i m i n g") || Contains(line, "t e r m i n a t i o n")) {
        if (Contains(line, "t e r m i n a t i o n") &&
            !std::regex_search(line, kNormalTermination) &&
            !std::regex_search(line, kErrorTermination)) {
            return std::nullopt;
        }
        return HspSection::Termination;
    }
    if (section_ != HspSection::Warnings && section_ != HspSection::Termination &&
        (Contains(line, "dt of cycle") || Contains(line, "100 smallest timesteps"))) {
        return HspSection::Warnings;
    }
    return std::nullopt;
}

void HspReader::EnterSection(HspSection next) {
    FinishEnergyBlock();
    in_smallest_ = false;
    tail_table_ = TailTable::None;

    if (section_ == HspSection::PartTable) {
        FinishPart();
        EmitParts();
    }
    if (section_ == HspSection::ContactTable) {
        in_contact_summary_ = false;
        EmitContacts();
    }
    if (static_cast<uint8_t>(next) >= static_cast<uint8_t>(HspSection::PartTable)) {
        EmitModel();
    }

    DYNADIAG_LOG_TRACE(std::string("d3hsp section ") + HspSectionName(section_) + " -> " +
                       HspSectionName(next) + " at line " +
                       std::to_string(source_.LineNumber()));
    section_ = next;
}

// =============================================================================
// Structural sections
// =============================================================================

void HspReader::HandleHeader(const std::string &line) {
    auto &h = model_.header;
    if (line.find('|') != std::string::npos) {
        if (auto v = Capture(line, kVersion); !v.empty()) {
            h.version = v;
        } else if (auto r = Capture(line, kRevision); !r.empty()) {
            h.revision = r;
        } else if (auto p = Capture(line, kPlatform); !p.empty()) {
            h.platform = p;
        } else if (auto pr = Capture(line, kPrecision); !pr.empty()) {
            h.precision = pr;
        } else if (auto host = Capture(line, kHostname); !host.empty()) {
            h.hostname = host;
        }
        return;
    }
    if (Contains(line, "Input file:")) {
        h.input_file = Capture(line, kInputFile);
        return;
    }
    std::smatch m;
    if (Contains(line, "Date:") && std::regex_search(line, m, kRunDate)) {
        h.date = m.str(1) + " " + m.str(2);
        return;
    }
    if (Contains(line, "execution with")) {
        SetInt(line, kMppProcs, h.mpp_processors);
    }
}

void HspReader::HandleModelStats(const std::string &line) {
    std::smatch m;
    if (Contains(line, "total # of") && std::regex_search(line, m, kKeywordCount)) {
        std::string keyword(text::Trim(m.str(1)));
        auto count = text::ParseInt(m.str(2)).value_or(0);
        if (count > 0) {
            model_.keyword_counts[keyword] = count;
        }
        if (Contains(keyword, "PART_option card")) {
            model_.parts = count;
        }
        return;
    }
    if (Contains(line, "execution with")) {
        SetInt(line, kMppProcs, model_.header.mpp_processors);
        return;
    }
    if (Contains(line, "number of")) {
        SetInt(line, kMaterials, model_.materials);
        SetInt(line, kNodes, model_.nodes);
        SetInt(line, kSolids, model_.solids);
        SetInt(line, kShells, model_.shells);
        SetInt(line, kBeams, model_.beams);
        SetInt(line, kThickShells, model_.thick_shells);
        SetInt(line, kSph, model_.sph_particles);
        SetInt(line, kContacts, model_.contacts);
        SetInt(line, kSpc, model_.spc_nodes);
        return;
    }
    HandleTimestepControl(line);
}

void HspReader::HandleTimestepControl(const std::string &line) {
    if (Contains(line, "termination time")) {
        SetDouble(line, kTermTime, model_.termination_time);
    } else if (Contains(line, "time step scale factor")) {
        SetDouble(line, kTssfac, model_.dt_scale_factor);
    } else if (Contains(line, "mass scaled solution")) {
        SetDouble(line, kDt2ms, model_.mass_scaling_dt);
    } else if (Contains(line, "reduction factor for minimum time step")) {
        SetDouble(line, kTsmin, model_.min_dt_factor);
    }
}

void HspReader::HandlePartTable(const std::string &line) {
    if (std::regex_search(line, kPartSeparator)) {
        FinishPart();
        return;
    }
    std::smatch m;
    if (Contains(line, "part id") && std::regex_search(line, m, kPartId)) {
        FinishPart();
        part_ = PartDefinition{};
        part_->id = text::ParseInt(m.str(1)).value_or(0);
        return;
    }
    if (!part_) {
        return;
    }
    auto &p = *part_;
    if (Contains(line, "section id")) {
        SetInt(line, kSectionId, p.section_id);
    } else if (Contains(line, "material id")) {
        SetInt(line, kMaterialId, p.material_id);
    } else if (Contains(line, "material type")) {
        SetInt(line, kMaterialType, p.material_type);
        auto it = MaterialNames().find(p.material_type);
        p.material_name = it != MaterialNames().end()
                              ? it->second
                              : "Type " + std::to_string(p.material_type);
    } else if (Contains(line, "equation-of-state")) {
        SetInt(line, kEosType, p.eos_type);
    } else if (Contains(line, "hourglass type")) {
        SetInt(line, kHgType, p.hourglass_type);
    } else if (Contains(line, "hourglass coefficient")) {
        SetDouble(line, kHgCoeff, p.hourglass_coefficient);
    } else if (Contains(line, "density")) {
        SetDouble(line, kDensity, p.density);
    } else if (Contains(line, "vnu")) {
        SetDouble(line, kPoisson, p.poisson_ratio);
    } else {
        SetDouble(line, kYoungs, p.youngs_modulus);
    }
}

void HspReader::HandleContactTable(const std::string &line) {
    if (Contains(line, "Contact summary")) {
        in_contact_summary_ = true;
        return;
    }
    std::smatch m;
    if (in_contact_summary_) {
        if (Contains(line, "Order #")) {
            return;
        }
        if (std::regex_search(line, kPartSeparator)) {
            in_contact_summary_ = false;
            return;
        }
        if (std::regex_search(line, m, kContactSummaryRow)) {
            InterfaceId id = text::ParseInt(m.str(2)).value_or(0);
            std::string type(text::Trim(m.str(3)));
            std::string title(text::Trim(m.str(4)));
            for (auto &c : contacts_.interfaces) {
                if (c.id == id) {
                    c.type = type;
                    c.title = title;
                    return;
                }
            }
            contacts_.interfaces.push_back(
                ContactDefinition{.id = id, .type = type, .title = title});
        }
        return;
    }
    if (std::regex_search(line, m, kContactHeader)) {
        InterfaceId id = text::ParseInt(m.str(1)).value_or(0);
        for (const auto &c : contacts_.interfaces) {
            if (c.id == id) {
                return;
            }
        }
        contacts_.interfaces.push_back(ContactDefinition{.id = id, .type = "", .title = ""});
        return;
    }
    if (!contacts_.interfaces.empty() && std::regex_search(line, m, kContactType)) {
        auto &last = contacts_.interfaces.back();
        if (last.type.empty()) {
            last.type = m.str(1);
        }
    }
}

/**
 * The surface timestep table may follow the contact definitions or open the
 * solution phase, so it is matched ahead of section dispatch:
 *
 *    i n t e r f a c e   s u r f a c e   t i m e s t e p s
 *    interface  surface    type    timestep      node    part
 *            1    surfa    a 13   2.5000E-07     1001       1
 *            1    surfb    a 13   1.0000E+16        0       0
 *
 * The table ends at the first blank or unrecognised line after a row.
 */
bool HspReader::HandleContactStability(const std::string &line) {
    if (Contains(line, "s u r f a c e   t i m e s t e p s")) {
        in_surface_table_ = true;
        return true;
    }
    if (in_surface_table_) {
        if (text::IsBlank(line)) {
            in_surface_table_ = stability_.surfaces.empty();
            return true;
        }
        if (Contains(line, "interface") && Contains(line, "surface")) {
            return true;
        }
        std::smatch m;
        if (std::regex_search(line, m, kSurfaceRow)) {
            auto dt = text::ParseDouble(m.str(4));
            if (!dt) {
                ++skipped_;
                DYNADIAG_LOG_DEBUG("d3hsp:" + std::to_string(source_.LineNumber()) +
                                   " unparsable surface timestep");
                return true;
            }
            stability_.surfaces.push_back(
                SurfaceTimestep{.interface_id = text::ParseInt(m.str(1)).value_or(0),
                                .surface = text::Lower(m.str(2)),
                                .type = std::string(text::Trim(m.str(3))),
                                .timestep = *dt,
                                .node = text::ParseInt(m.str(5)).value_or(0),
                                .part = text::ParseInt(m.str(6)).value_or(0)});
            return true;
        }
        in_surface_table_ = false;
        return false;
    }
    if (Contains(line, "ontact stability")) {
        if (auto limit = text::SearchDouble(line, kContactDtLimit)) {
            stability_.dt_limit = *limit;
            return true;
        }
    }
    return false;
}

// =============================================================================
// Solution phase
// =============================================================================

void HspReader::HandleSolution(const std::string &line) {
    if (Contains(line, "dt of cycle")) {
        FinishEnergyBlock();
        StartEnergyBlock(line);
        return;
    }

    if (in_energy_ && Contains(line, "100 smallest timesteps")) {
        FinishEnergyBlock();
    }

    if (in_energy_) {
        if (text::IsBlank(line)) {
            FinishEnergyBlock();
            return;
        }
        std::smatch m;
        if (std::regex_search(line, m, energy_fields::FieldPattern())) {
            std::string label = text::Lower(text::Trim(m.str(1)));
            auto value = text::ParseDouble(m.str(2));
            if (!value) {
                if (energy_fields::Apply(label, 0.0, energy_)) {
                    energy_bad_ = true;
                }
                return;
            }
            if (auto bit = energy_fields::Apply(label, *value, energy_)) {
                energy_seen_ |= *bit;
            }
        }
        return;
    }

    if (in_smallest_) {
        std::smatch m;
        if (std::regex_search(line, m, kSmallestRow)) {
            auto dt = text::ParseDouble(m.str(4));
            if (!dt) {
                ++skipped_;
                DYNADIAG_LOG_DEBUG("d3hsp:" + std::to_string(source_.LineNumber()) +
                                   " unparsable smallest-timestep row");
                return;
            }
            ++smallest_rows_;
            pending_.push_back(ElementTimestep{.kind = ParseElementKind(m.str(1)),
                                               .element = text::ParseInt(m.str(2)).value_or(0),
                                               .part = text::ParseInt(m.str(3)).value_or(0),
                                               .dt = *dt});
        } else if (text::IsBlank(line) && smallest_rows_ > 0) {
            in_smallest_ = false;
        }
        return;
    }

    if (Contains(line, "100 smallest timesteps")) {
        in_smallest_ = true;
        smallest_rows_ = 0;
        return;
    }

    HandleDecomposition(line);
}

bool HspReader::HandleDecomposition(const std::string &line) {
    auto &d = timing_.decomposition;
    if (Contains(line, "Minumum:")) {
        SetDouble(line, kDecompMin, d.min_cost);
        d.present = true;
        return true;
    }
    if (Contains(line, "Maximum:")) {
        SetDouble(line, kDecompMax, d.max_cost);
        d.present = true;
        return true;
    }
    if (Contains(line, "Standard Deviation:")) {
        SetDouble(line, kDecompStd, d.std_deviation);
        d.present = true;
        return true;
    }
    return false;
}

void HspReader::StartEnergyBlock(const std::string &line) {
    std::smatch m;
    if (!std::regex_search(line, m, energy_fields::ControllingPattern())) {
        return;
    }
    in_energy_ = true;
    energy_ = EnergySample{};
    energy_.cycle = text::ParseInt(m.str(1)).value_or(0);
    energy_.controlling_kind = ParseElementKind(text::Lower(m.str(2)));
    energy_.controlling_element = text::ParseInt(m.str(3)).value_or(0);
    energy_.controlling_part = text::ParseInt(m.str(4)).value_or(0);
    energy_seen_ = 0;
    energy_bad_ = false;
    energy_line_ = source_.LineNumber();
}

void HspReader::FinishEnergyBlock() {
    if (!in_energy_) {
        return;
    }
    in_energy_ = false;
    if (energy_seen_ == 0 && !energy_bad_) {
        return; // controlling-element line without a printed energy block
    }
    const bool complete =
        (energy_seen_ & energy_fields::kAllRequired) == energy_fields::kAllRequired;
    if (energy_bad_ || !complete) {
        ++skipped_;
        DYNADIAG_LOG_DEBUG("d3hsp:" + std::to_string(energy_line_) +
                           " malformed energy block skipped");
        return;
    }
    energy_.ordinal = energy_ordinal_++;
    pending_.push_back(TimestepRecord{.cycle = energy_.cycle,
                                      .time = energy_.time,
                                      .dt = energy_.dt,
                                      .element_kind = energy_.controlling_kind,
                                      .element = energy_.controlling_element,
                                      .part = energy_.controlling_part});
    pending_.push_back(energy_);
}

// =============================================================================
// Mass properties and tail
// =============================================================================

void HspReader::HandleMassProperties(const std::string &line) {
    std::smatch m;
    if (IsSpacedMassBanner(line)) {
        if (std::regex_search(line, m, kMassPart)) {
            mass_.parts.push_back(MassProperty{.part = text::ParseInt(m.str(1)).value_or(0),
                                               .mass = 0.0,
                                               .center = {},
                                               .inertia = {}});
        }
        return;
    }
    if (HandleTerminationMarkers(line) || mass_.parts.empty()) {
        return;
    }
    auto &mp = mass_.parts.back();
    if (Contains(line, "mass center")) {
        if (Contains(line, "x-coordinate")) {
            SetDouble(line, kMassCx, mp.center[0]);
        } else if (Contains(line, "y-coordinate")) {
            SetDouble(line, kMassCy, mp.center[1]);
        } else if (Contains(line, "z-coordinate")) {
            SetDouble(line, kMassCz, mp.center[2]);
        }
    } else if (Contains(line, "total mass")) {
        SetDouble(line, kMassTotal, mp.mass);
    } else if (Contains(line, "i11")) {
        SetDouble(line, kI11, mp.inertia[0]);
    } else if (Contains(line, "i22")) {
        SetDouble(line, kI22, mp.inertia[1]);
    } else if (Contains(line, "i33")) {
        SetDouble(line, kI33, mp.inertia[2]);
    }
}

bool HspReader::HandleTerminationMarkers(const std::string &line) {
    if (Contains(line, "t e r m i n a t i o n")) {
        if (std::regex_search(line, kNormalTermination)) {
            termination_.kind = TerminationKind::Normal;
            return true;
        }
        if (std::regex_search(line, kErrorTermination)) {
            termination_.kind = TerminationKind::ErrorTerminated;
            return true;
        }
    }
    auto &t = termination_;
    if (Contains(line, "Problem time")) {
        SetDouble(line, kProblemTime, t.actual_time);
    } else if (Contains(line, "Problem cycle")) {
        SetInt(line, kProblemCycle, t.cycles);
    } else if (Contains(line, "Total CPU time")) {
        SetDouble(line, kTotalCpu, t.cpu_seconds);
    } else if (Contains(line, "CPU time per zone cycle")) {
        SetDouble(line, kCpuPerZone, t.cpu_per_zone_ns);
    } else if (Contains(line, "Clock time per zone cycle")) {
        SetDouble(line, kClockPerZone, t.clock_per_zone_ns);
    } else if (Contains(line, "Elapsed time")) {
        SetDouble(line, kElapsed, t.elapsed_seconds);
    } else if (Contains(line, "Start time")) {
        t.start_stamp = Capture(line, kStartTime);
    } else if (Contains(line, "End time")) {
        t.end_stamp = Capture(line, kEndTime);
    } else {
        return false;
    }
    return true;
}

void HspReader::HandleTermination(const std::string &line) {
    if (tail_table_ == TailTable::Timing) {
        if (Contains(line, "T o t a l s") && !Contains(line, "C P U")) {
            tail_table_ = TailTable::None;
            return;
        }
        std::smatch m;
        if (Contains(line, "Interf.") && std::regex_search(line, m, kInterfaceRow)) {
            auto cpu = text::ParseDouble(m.str(2));
            auto clock = text::ParseDouble(m.str(4));
            if (!cpu || !clock) {
                ++skipped_;
                return;
            }
            timing_.interfaces.push_back(InterfaceTiming{
                .id = text::ParseInt(m.str(1)).value_or(0), .cpu_seconds = *cpu,
                .clock_seconds = *clock});
            return;
        }
        if (std::regex_search(line, m, kTimingRow)) {
            auto cpu = text::ParseDouble(m.str(3));
            auto cpu_pct = text::ParseDouble(m.str(4));
            auto clock = text::ParseDouble(m.str(5));
            auto clock_pct = text::ParseDouble(m.str(6));
            if (!cpu || !cpu_pct || !clock || !clock_pct) {
                ++skipped_;
                DYNADIAG_LOG_DEBUG("d3hsp:" + std::to_string(source_.LineNumber()) +
                                   " unparsable timing row");
                return;
            }
            timing_.components.push_back(ComponentTiming{.name = std::string(text::Trim(m.str(2))),
                                                         .cpu_seconds = *cpu,
                                                         .cpu_percent = *cpu_pct,
                                                         .clock_seconds = *clock,
                                                         .clock_percent = *clock_pct,
                                                         .sub_entry = m.length(1) > 2});
        }
        return;
    }

    if (tail_table_ == TailTable::Cpu) {
        if (Contains(line, "T o t a l s")) {
            tail_table_ = TailTable::None;
            return;
        }
        std::smatch m;
        std::string trimmed(text::Trim(line));
        if (std::regex_search(trimmed, m, kCpuRow)) {
            auto rank = text::ParseInt32(m.str(1));
            auto ratio = text::ParseDouble(m.str(3));
            auto seconds = text::ParseDouble(m.str(4));
            if (!rank || !ratio || !seconds) {
                ++skipped_;
                return;
            }
            timing_.processors.push_back(
                ProcessorTiming{.rank = *rank,
                                .host = m.str(2),
                                .cpu_ratio = *ratio,
                                .cpu_seconds = *seconds});
        }
        return;
    }

    if (Contains(line, "C P U   T i m i n g")) {
        tail_table_ = TailTable::Cpu;
        return;
    }
    if (Contains(line, "T i m i n g   i n f o r m a t i o n")) {
        tail_table_ = TailTable::Timing;
        return;
    }
    if (HandleTerminationMarkers(line)) {
        return;
    }
    HandleDecomposition(line);
}

// =============================================================================
// Emission
// =============================================================================

void HspReader::FinishPart() {
    if (part_) {
        parts_.parts.push_back(std::move(*part_));
        part_.reset();
    }
}

void HspReader::FlushWarning() {
    if (auto event = warning_.Take()) {
        if (event->kind == EventKind::Error) {
            last_error_code_ = event->code;
        }
        pending_.push_back(std::move(*event));
    }
}

void HspReader::EmitModel() {
    if (!model_emitted_) {
        model_emitted_ = true;
        pending_.push_back(model_);
    }
}

void HspReader::EmitParts() {
    if (!parts_emitted_) {
        parts_emitted_ = true;
        pending_.push_back(parts_);
    }
}

void HspReader::EmitContacts() {
    if (!contacts_emitted_) {
        contacts_emitted_ = true;
        pending_.push_back(contacts_);
    }
}

void HspReader::Finish() {
    finished_ = true;
    FlushWarning();
    FinishEnergyBlock();
    FinishPart();
    EmitModel();
    EmitParts();
    EmitContacts();
    pending_.push_back(mass_);
    pending_.push_back(timing_);
    if (stability_.dt_limit || !stability_.surfaces.empty()) {
        pending_.push_back(stability_);
    }

    termination_.target_time = model_.termination_time;
    if (termination_.kind == TerminationKind::ErrorTerminated) {
        termination_.error_code = last_error_code_;
    }
    pending_.push_back(termination_);
}

} // namespace dynadiag
