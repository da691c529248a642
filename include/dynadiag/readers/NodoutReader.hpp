#pragma once

/**
 * @file NodoutReader.hpp
 * @brief Streaming reader for nodout (nodal time history)
 *
 * Only the first `node_cap` distinct node ids are tracked; rows for other
 * nodes are read past without being counted as skipped.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <optional>
#include <unordered_set>

namespace dynadiag {

class NodoutReader {
  public:
    NodoutReader(LineSource source, std::size_t node_cap)
        : source_(std::move(source)), node_cap_(node_cap) {}

    std::optional<NodalSample> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }
    [[nodiscard]] std::size_t TrackedNodes() const { return tracked_.size(); }

  private:
    LineSource source_;
    std::size_t node_cap_;
    std::size_t skipped_ = 0;
    std::size_t ordinal_ = 0;
    std::unordered_set<NodeId> tracked_;
    bool in_legend_ = false;
    Cycle state_ = 0;
    double time_ = 0.0;
};

} // namespace dynadiag
