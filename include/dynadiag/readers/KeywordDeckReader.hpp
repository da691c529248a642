#pragma once

/**
 * @file KeywordDeckReader.hpp
 * @brief Element-to-part extraction from an LS-DYNA keyword deck
 *
 * Reads *ELEMENT_SOLID, *ELEMENT_SHELL, *ELEMENT_BEAM and *ELEMENT_TSHELL
 * blocks (with any option suffix). Element cards may be free format
 * (comma or whitespace separated) or fixed 8-column format.
 */

#include <dynadiag/readers/LineSource.hpp>
#include <dynadiag/readers/ReaderSupport.hpp>
#include <dynadiag/records/Records.hpp>

#include <optional>

namespace dynadiag {

class KeywordDeckReader {
  public:
    explicit KeywordDeckReader(LineSource source) : source_(std::move(source)) {}

    std::optional<DeckElement> Next();

    [[nodiscard]] std::size_t SkippedRecords() const { return skipped_; }
    [[nodiscard]] std::size_t LinesRead() const { return source_.LineNumber(); }

    /// Parse one element card; nullopt if the card is not an element line
    [[nodiscard]] static std::optional<DeckElement> ParseCard(std::string_view card,
                                                              ElementKind kind);

  private:
    LineSource source_;
    std::size_t skipped_ = 0;
    ElementKind block_ = ElementKind::Unknown;
    bool block_has_options_ = false;
};

} // namespace dynadiag
