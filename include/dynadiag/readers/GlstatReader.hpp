#pragma once

/**
 * @file GlstatReader.hpp
 * @brief Streaming reader for glstat (global statistics)
 *
 * A block opens at a "dt of cycle" line, or implicitly when the "time" field
 * repeats inside an open block. Blocks missing a required field (time,
 * kinetic, internal, total) or carrying an unparsable value are skipped and
 * counted.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <optional>
#include <string>

namespace dynadiag {

class GlstatReader {
  public:
    explicit GlstatReader(LineSource source) : source_(std::move(source)) {}

    std::optional<EnergySample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    void Open(std::size_t line_no);
    /// Close the open block; returns a sample if it was complete
    std::optional<EnergySample> Close();

    LineSource source_;
    std::size_t skipped_ = 0;
    std::size_t ordinal_ = 0;

    bool open_ = false;
    EnergySample block_;
    unsigned seen_ = 0;
    bool bad_ = false;
    std::size_t block_line_ = 0;
    bool done_ = false;
};

} // namespace dynadiag
