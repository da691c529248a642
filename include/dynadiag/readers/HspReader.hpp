#pragma once

/**
 * @file HspReader.hpp
 * @brief Streaming reader for the d3hsp high-speed-printer log
 *
 * An explicit state machine over the file's sections. Section banners drive
 * the transitions; lines a section does not recognize are ignored without
 * changing state.
 *
 * Emission contract:
 * - ModelSummary, PartTable, ContactTable, MassPropertyTable, TimingTable and
 *   TerminationStatus exactly once each (at section exit or end of input).
 * - ContactStability once at end of input, and only when the file carries a
 *   surface timestep table or a contact stability limit.
 * - EnergySample, TimestepRecord, ElementTimestep and WarningEvent repeat.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>

namespace dynadiag {

using HspRecord = std::variant<ModelSummary, PartTable, ContactTable, EnergySample, TimestepRecord,
                               ElementTimestep, WarningEvent, MassPropertyTable, TimingTable,
                               TerminationStatus, ContactStability>;

enum class HspSection : uint8_t {
    Header,
    ModelStats,
    TimestepControl,
    PartTable,
    ContactTable,
    Warnings, ///< solution phase: energy blocks, warnings, smallest-timestep table
    MassProperties,
    Termination
};

[[nodiscard]] const char *HspSectionName(HspSection section);

class HspReader {
  public:
    explicit HspReader(LineSource source);

    /// Next record, or nullopt once the file is exhausted
    std::optional<HspRecord> Next();

    [[nodiscard]] HspSection Section() const { return section_; }
    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_ + warning_.Skipped(); }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    enum class TailTable : uint8_t { None, Timing, Cpu };

    void ProcessLine(const std::string &line);
    [[nodiscard]] std::optional<HspSection> DetectBanner(const std::string &line) const;
    void EnterSection(HspSection next);

    void HandleHeader(const std::string &line);
    void HandleModelStats(const std::string &line);
    void HandleTimestepControl(const std::string &line);
    void HandlePartTable(const std::string &line);
    void HandleContactTable(const std::string &line);
    void HandleSolution(const std::string &line);
    void HandleMassProperties(const std::string &line);
    void HandleTermination(const std::string &line);
    bool HandleDecomposition(const std::string &line);
    bool HandleTerminationMarkers(const std::string &line);
    bool HandleContactStability(const std::string &line);

    void StartEnergyBlock(const std::string &line);
    void FinishEnergyBlock();
    void FinishPart();
    void FlushWarning();
    void EmitModel();
    void EmitParts();
    void EmitContacts();
    void Finish();

    LineSource source_;
    HspSection section_ = HspSection::Header;
    std::deque<HspRecord> pending_;
    bool finished_ = false;
    std::size_t skipped_ = 0;

    ModelSummary model_;
    bool model_emitted_ = false;

    PartTable parts_;
    std::optional<PartDefinition> part_;
    bool parts_emitted_ = false;

    ContactTable contacts_;
    bool contacts_emitted_ = false;
    bool in_contact_summary_ = false;

    ContactStability stability_;
    bool in_surface_table_ = false;

    MassPropertyTable mass_;
    TimingTable timing_;
    TailTable tail_table_ = TailTable::None;
    TerminationStatus termination_;
    std::optional<int> last_error_code_;

    WarningBlock warning_;

    bool in_energy_ = false;
    EnergySample energy_;
    unsigned energy_seen_ = 0;
    bool energy_bad_ = false;
    std::size_t energy_line_ = 0;
    std::size_t energy_ordinal_ = 0;

    bool in_smallest_ = false;
    std::size_t smallest_rows_ = 0;
};

} // namespace dynadiag
