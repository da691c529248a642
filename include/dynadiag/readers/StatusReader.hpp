#pragma once

/**
 * @file StatusReader.hpp
 * @brief Streaming reader for status.out
 *
 * Emits one CycleProgress per progress line and a single StatusEstimate at
 * end of input when any timing or estimate line was present.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <optional>
#include <variant>

namespace dynadiag {

using StatusRecord = std::variant<CycleProgress, StatusEstimate>;

class StatusReader {
  public:
    explicit StatusReader(LineSource source) : source_(std::move(source)) {}

    std::optional<StatusRecord> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    bool ApplyEstimate(const std::string &lower);

    LineSource source_;
    std::size_t skipped_ = 0;
    StatusEstimate estimate_;
    bool have_estimate_ = false;
    bool done_ = false;
};

} // namespace dynadiag
