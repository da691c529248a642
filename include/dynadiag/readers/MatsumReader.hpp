#pragma once

/**
 * @file MatsumReader.hpp
 * @brief Streaming reader for matsum (per-material energy summary)
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <map>
#include <optional>
#include <string>

namespace dynadiag {

/**
 * @brief Emits one MaterialSample per material block
 *
 * Each "time =" header starts a new output state; its ordinal is the sample
 * cycle. A block is the "mat.#=" line plus up to three continuation lines
 * (momentum, rigid-body velocity, hourglass energy).
 */
class MatsumReader {
  public:
    explicit MatsumReader(LineSource source) : source_(std::move(source)) {}

    std::optional<MaterialSample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

    /// Part titles read from the legend so far
    [[nodiscard]] const std::map<PartId, std::string> &Legend() const { return legend_; }

  private:
    std::optional<MaterialSample> TakeBlock();
    bool ApplyFields(const std::string &line);

    LineSource source_;
    std::size_t skipped_ = 0;
    std::map<PartId, std::string> legend_;
    bool in_legend_ = false;

    Cycle state_ = 0;
    double time_ = 0.0;
    bool seen_state_ = false;

    std::optional<MaterialSample> block_;
    int continuation_ = 0;
    bool bad_ = false;
    bool done_ = false;
};

} // namespace dynadiag
