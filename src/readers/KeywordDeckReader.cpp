/**
 * @file KeywordDeckReader.cpp
 * @brief *ELEMENT_* card parsing
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/KeywordDeckReader.hpp>

#include <cctype>
#include <string>
#include <vector>

namespace dynadiag {

namespace {

constexpr std::size_t kFieldWidth = 8;

struct BlockKeyword {
    std::string_view prefix;
    ElementKind kind;
};

// TSHELL before SHELL so the longer keyword wins
constexpr BlockKeyword kBlocks[] = {
    {"*ELEMENT_TSHELL", ElementKind::ThickShell},
    {"*ELEMENT_SOLID", ElementKind::Solid},
    {"*ELEMENT_SHELL", ElementKind::Shell},
    {"*ELEMENT_BEAM", ElementKind::Beam},
};

std::optional<std::vector<std::int64_t>> ParseFixed(std::string_view card) {
    std::vector<std::int64_t> fields;
    for (std::size_t pos = 0; pos < card.size(); pos += kFieldWidth) {
        std::string_view field = text::Trim(card.substr(pos, kFieldWidth));
        if (field.empty()) {
            continue;
        }
        auto v = text::ParseInt(field);
        if (!v) {
            return std::nullopt;
        }
        fields.push_back(*v);
    }
    return fields;
}

std::optional<std::vector<std::int64_t>> ParseFree(std::string_view card) {
    std::vector<std::int64_t> fields;
    if (text::Contains(card, ",")) {
        for (const auto &cell : text::SplitCsv(card)) {
            if (cell.empty()) {
                continue;
            }
            auto v = text::ParseInt(cell);
            if (!v) {
                return std::nullopt;
            }
            fields.push_back(*v);
        }
        return fields;
    }
    for (auto token : text::SplitWhitespace(card)) {
        auto v = text::ParseInt(token);
        if (!v) {
            return std::nullopt;
        }
        fields.push_back(*v);
    }
    return fields;
}

} // namespace

std::optional<DeckElement> KeywordDeckReader::ParseCard(std::string_view card, ElementKind kind) {
    std::optional<std::vector<std::int64_t>> fields;
    if (!text::Contains(card, ",")) {
        fields = ParseFixed(card);
    }
    if (!fields || fields->size() < 2) {
        fields = ParseFree(card);
    }
    if (!fields || fields->size() < 2) {
        return std::nullopt;
    }
    DeckElement element;
    element.kind = kind;
    element.element = (*fields)[0];
    element.part = (*fields)[1];
    for (std::size_t i = 2; i < fields->size(); ++i) {
        if ((*fields)[i] != 0) {
            element.nodes.push_back((*fields)[i]);
        }
    }
    return element;
}

std::optional<DeckElement> KeywordDeckReader::Next() {
    std::string line;
    while (source_.NextLine(line)) {
        if (line.empty() || line.front() == '$') {
            continue;
        }
        if (line.front() == '*') {
            std::string upper = line;
            for (auto &c : upper) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            std::string_view keyword = text::Trim(upper);
            block_ = ElementKind::Unknown;
            for (const auto &b : kBlocks) {
                if (keyword.starts_with(b.prefix)) {
                    block_ = b.kind;
                    block_has_options_ = keyword.size() > b.prefix.size();
                    break;
                }
            }
            continue;
        }
        if (block_ == ElementKind::Unknown || text::IsBlank(line)) {
            continue;
        }
        if (auto element = ParseCard(line, block_)) {
            return element;
        }
        // option cards (thickness, orientation) carry reals and are not element lines
        if (!block_has_options_) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " unparsable element card");
        }
    }
    return std::nullopt;
}

} // namespace dynadiag
