#pragma once

/**
 * @file AsciiTable.hpp
 * @brief Box-drawn tables for the terminal transcript
 */

#include <dynadiag/io/Console.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

namespace dynadiag {

/**
 * @brief Column-aligned table with box-drawing borders
 *
 * ┌──────┬──────────────┬──────────┐
 * │ PART │ TITLE        │   MIN DT │
 * ├──────┼──────────────┼──────────┤
 * │ 12   │ B-pillar     │ 1.02e-07 │
 * └──────┴──────────────┴──────────┘
 *
 * Cells wider than a column's limit are cut and end in "~".
 */
class AsciiTable {
  public:
    enum class Align { Left, Right };

    struct Column {
        std::string header;
        std::size_t max_width = 0; ///< 0 = unlimited
        Align align = Align::Left;
    };

    AsciiTable &AddColumn(std::string header, Align align = Align::Left,
                          std::size_t max_width = 0) {
        columns_.push_back(
            Column{.header = std::move(header), .max_width = max_width, .align = align});
        return *this;
    }

    void AddRow(std::vector<std::string> cells) {
        cells.resize(columns_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] std::size_t RowCount() const { return rows_.size(); }

    /// Render with every line prefixed by `indent` spaces
    [[nodiscard]] std::string Render(std::size_t indent = 0) const {
        if (columns_.empty()) {
            return "";
        }
        auto widths = Widths();
        std::string pad(indent, ' ');
        std::ostringstream oss;
        oss << pad << Rule(widths, BoxChars::TopLeft, BoxChars::TeeDown, BoxChars::TopRight)
            << "\n";
        std::vector<std::string> headers;
        for (const auto &c : columns_) {
            headers.push_back(c.header);
        }
        oss << pad << Line(headers, widths, true) << "\n";
        oss << pad << Rule(widths, BoxChars::TeeRight, BoxChars::Cross, BoxChars::TeeLeft)
            << "\n";
        for (const auto &row : rows_) {
            oss << pad << Line(row, widths, false) << "\n";
        }
        oss << pad << Rule(widths, BoxChars::BottomLeft, BoxChars::TeeUp, BoxChars::BottomRight)
            << "\n";
        return oss.str();
    }

    /// Codepoints, not bytes
    [[nodiscard]] static std::size_t DisplayWidth(const std::string &text) {
        return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
            return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        }));
    }

  private:
    std::vector<Column> columns_;
    std::vector<std::vector<std::string>> rows_;

    [[nodiscard]] std::vector<std::size_t> Widths() const {
        std::vector<std::size_t> widths;
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            std::size_t w = DisplayWidth(columns_[i].header);
            for (const auto &row : rows_) {
                w = std::max(w, DisplayWidth(row[i]));
            }
            if (columns_[i].max_width > 0) {
                w = std::min(w, std::max(columns_[i].max_width, DisplayWidth(columns_[i].header)));
            }
            widths.push_back(w);
        }
        return widths;
    }

    [[nodiscard]] static std::string Rule(const std::vector<std::size_t> &widths, const char *left,
                                          const char *join, const char *right) {
        std::string out = left;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            for (std::size_t j = 0; j < widths[i] + 2; ++j) {
                out += BoxChars::Horizontal;
            }
            out += i + 1 < widths.size() ? join : right;
        }
        return out;
    }

    [[nodiscard]] std::string Line(const std::vector<std::string> &cells,
                                   const std::vector<std::size_t> &widths, bool header) const {
        std::string out = BoxChars::Vertical;
        for (std::size_t i = 0; i < widths.size(); ++i) {
            Align align = header ? Align::Left : columns_[i].align;
            out += " " + Fit(cells[i], widths[i], align) + " " + BoxChars::Vertical;
        }
        return out;
    }

    [[nodiscard]] static std::string Fit(const std::string &text, std::size_t width, Align align) {
        std::size_t shown = DisplayWidth(text);
        if (shown > width) {
            // Cut on a codepoint boundary
            std::string out;
            std::size_t n = 0;
            for (char c : text) {
                bool lead = (static_cast<unsigned char>(c) & 0xC0) != 0x80;
                if (lead && ++n > width - 1) {
                    break;
                }
                out += c;
            }
            return out + "~";
        }
        std::string fill(width - shown, ' ');
        return align == Align::Left ? text + fill : fill + text;
    }
};

} // namespace dynadiag
