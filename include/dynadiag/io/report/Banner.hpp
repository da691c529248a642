#pragma once

/**
 * @file Banner.hpp
 * @brief Headers and rules for the terminal transcript
 */

#include <dynadiag/io/Console.hpp>

#include <string>

namespace dynadiag {

class Banner {
  public:
    static constexpr int kWidth = 80;

    [[nodiscard]] static std::string GetTitle(const std::string &version) {
        std::string line = "  DYNADIAG " + version + " | LS-DYNA RUN DIAGNOSIS";
        return GetRule() + "\n" + line + "\n" + GetRule();
    }

    /// "─── [ TITLE ] ──────..." padded to the transcript width
    [[nodiscard]] static std::string GetSectionHeader(const std::string &title) {
        std::string header = "─── [ " + title + " ] ";
        std::size_t used = 9 + title.size();
        for (std::size_t i = used; i < static_cast<std::size_t>(kWidth); ++i) {
            header += BoxChars::Horizontal;
        }
        return header;
    }

    [[nodiscard]] static std::string GetRule(int width = kWidth, char c = '=') {
        return std::string(static_cast<std::size_t>(width), c);
    }
};

} // namespace dynadiag
