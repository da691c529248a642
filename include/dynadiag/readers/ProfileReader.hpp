#pragma once

/**
 * @file ProfileReader.hpp
 * @brief Readers for the MPP timing profiles (load_profile.csv, cont_profile.csv)
 *
 * Both files carry an absolute "Clock (seconds)" table followed by a
 * percentage table. Only the absolute table is read; the row index within it
 * is the rank.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <array>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace dynadiag {

/// Column order of load_profile.csv
inline constexpr std::array<const char *, 15> kLoadProfileComponents = {
    "solids",    "shells",    "tshells",   "beams",     "sph",
    "e_other",   "force_shr", "tstep_shr", "swtch_shr", "matrl_shr",
    "elmnt_shr", "time_step", "contact",   "rigid_bdy", "others"};

class LoadProfileReader {
  public:
    explicit LoadProfileReader(LineSource source) : source_(std::move(source)) {}

    std::optional<ProcessorLoadSample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    LineSource source_;
    std::size_t skipped_ = 0;
    std::deque<ProcessorLoadSample> pending_;
    bool in_absolute_ = false;
    bool absolute_done_ = false;
    int rank_ = 0;
};

class ContactProfileReader {
  public:
    explicit ContactProfileReader(LineSource source) : source_(std::move(source)) {}

    std::optional<ContactProfileSample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    LineSource source_;
    std::size_t skipped_ = 0;
    std::deque<ContactProfileSample> pending_;
    std::vector<InterfaceId> interfaces_;
    bool in_absolute_ = false;
    bool absolute_done_ = false;
    int rank_ = 0;
};

} // namespace dynadiag
