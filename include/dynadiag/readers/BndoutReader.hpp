#pragma once

/**
 * @file BndoutReader.hpp
 * @brief Streaming reader for bndout (boundary nodal forces)
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <optional>

namespace dynadiag {

class BndoutReader {
  public:
    explicit BndoutReader(LineSource source) : source_(std::move(source)) {}

    std::optional<BoundaryForceSample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    LineSource source_;
    std::size_t skipped_ = 0;
    std::size_t ordinal_ = 0;
    Cycle state_ = -1;
    double time_ = 0.0;
};

} // namespace dynadiag
