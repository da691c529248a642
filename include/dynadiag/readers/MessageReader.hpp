#pragma once

/**
 * @file MessageReader.hpp
 * @brief Streaming reader for the messag / mesNNNN logs
 *
 * One reader per file. The rank is fixed at construction: kPrimaryRank for
 * messag, the numeric suffix for mesNNNN.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <deque>
#include <optional>
#include <string>
#include <variant>

namespace dynadiag {

using MessageRecord = std::variant<WarningEvent, InitialPenetration, InterfaceWarningCount,
                                   MemoryRequest, TerminationBanner>;

class MessageReader {
  public:
    MessageReader(LineSource source, int rank) : source_(std::move(source)), rank_(rank) {}

    std::optional<MessageRecord> Next();

    [[nodiscard]] int Rank() const { return rank_; }
    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_ + block_.Skipped(); }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

  private:
    void ProcessLine(const std::string &line);
    void Flush();

    LineSource source_;
    int rank_;
    std::size_t skipped_ = 0;
    std::deque<MessageRecord> pending_;
    WarningBlock block_;
    std::optional<InterfaceId> pending_summary_;
    bool done_ = false;
};

} // namespace dynadiag
