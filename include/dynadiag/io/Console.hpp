#pragma once

/**
 * @file Console.hpp
 * @brief Terminal capabilities, log levels and text formatting
 *
 * Everything that writes to a terminal goes through here: the log sinks for
 * level tags and colors, the debrief and tables for box characters and
 * padding, and the analyzers for number formatting in Finding messages.
 */

#include <array>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define STDOUT_FILENO 1
#else
#include <unistd.h>
#endif

namespace dynadiag {

// =============================================================================
// LogLevel
// =============================================================================

enum class LogLevel {
    Trace,   ///< Per-line parser detail
    Debug,   ///< Skipped records, reader statistics
    Info,    ///< Normal operation
    Event,   ///< Pipeline phase changes
    Warning, ///< Degraded coverage
    Error,   ///< A source could not be read
    Fatal    ///< The run cannot be diagnosed
};

namespace detail {

struct LevelStyle {
    LogLevel level;
    std::string_view name;
    const char *tag;
    const char *color;
};

inline constexpr std::array<LevelStyle, 7> kLevelStyles{{
    {LogLevel::Trace, "trace", "[TRC]", "\033[90m"},
    {LogLevel::Debug, "debug", "[DBG]", "\033[36m"},
    {LogLevel::Info, "info", "[INF]", "\033[37m"},
    {LogLevel::Event, "event", "[EVT]", "\033[32m"},
    {LogLevel::Warning, "warning", "[WRN]", "\033[33m"},
    {LogLevel::Error, "error", "[ERR]", "\033[31m"},
    {LogLevel::Fatal, "fatal", "[FTL]", "\033[41m"},
}};

inline const LevelStyle &StyleOf(LogLevel level) {
    return kLevelStyles[static_cast<std::size_t>(level)];
}

} // namespace detail

/// Parse a level name as written in configuration files ("info", "warning", ...)
[[nodiscard]] inline std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "warn") {
        return LogLevel::Warning;
    }
    for (const auto &style : detail::kLevelStyles) {
        if (style.name == name) {
            return style.level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Terminal glyphs
// =============================================================================

struct AnsiColor {
    static constexpr const char *Reset = "\033[0m";
    static constexpr const char *Dim = "\033[2m";
    static constexpr const char *Red = "\033[31m";
    static constexpr const char *Green = "\033[32m";
    static constexpr const char *Yellow = "\033[33m";
    static constexpr const char *Cyan = "\033[36m";
    static constexpr const char *White = "\033[37m";
};

/// Light box-drawing set used by AsciiTable and the section rules
struct BoxChars {
    static constexpr const char *TopLeft = "┌";
    static constexpr const char *TopRight = "┐";
    static constexpr const char *BottomLeft = "└";
    static constexpr const char *BottomRight = "┘";
    static constexpr const char *Horizontal = "─";
    static constexpr const char *Vertical = "│";
    static constexpr const char *TeeRight = "├";
    static constexpr const char *TeeLeft = "┤";
    static constexpr const char *TeeDown = "┬";
    static constexpr const char *TeeUp = "┴";
    static constexpr const char *Cross = "┼";
};

// =============================================================================
// Console
// =============================================================================

/**
 * @brief Color policy for one output stream plus static text helpers
 *
 * Colors default on only when stdout is a terminal. The CLI turns them off
 * for `--no-terminal` runs that still print errors.
 */
class Console {
  public:
    Console() : is_tty_(isatty(STDOUT_FILENO) != 0), color_enabled_(is_tty_) {}

    [[nodiscard]] bool IsTerminal() const { return is_tty_; }

    void SetColorEnabled(bool enabled) { color_enabled_ = enabled; }
    [[nodiscard]] bool IsColorEnabled() const { return color_enabled_; }

    /// Report a run-level failure on stderr, outside the log pipeline
    void Error(std::string_view msg) const {
        std::cerr << Colorize(LevelTag(LogLevel::Error), LevelColor(LogLevel::Error)) << " "
                  << msg << "\n";
    }

    [[nodiscard]] std::string Colorize(std::string_view text, const char *color) const {
        std::string out;
        if (color_enabled_) {
            out += color;
        }
        out += text;
        if (color_enabled_) {
            out += AnsiColor::Reset;
        }
        return out;
    }

    [[nodiscard]] static const char *LevelTag(LogLevel level) {
        return detail::StyleOf(level).tag;
    }
    [[nodiscard]] static const char *LevelColor(LogLevel level) {
        return detail::StyleOf(level).color;
    }

    // === Text helpers ===

    [[nodiscard]] static std::string BoxHorizontalRule(int width = 80) {
        std::string rule;
        for (int i = 0; i < width; ++i) {
            rule += BoxChars::Horizontal;
        }
        return rule;
    }

    [[nodiscard]] static std::string PadRight(std::string_view text, std::size_t width) {
        return Pad(text, width, 0);
    }
    [[nodiscard]] static std::string PadLeft(std::string_view text, std::size_t width) {
        return Pad(text, width, width > text.size() ? width - text.size() : 0);
    }
    [[nodiscard]] static std::string PadCenter(std::string_view text, std::size_t width) {
        return Pad(text, width, width > text.size() ? (width - text.size()) / 2 : 0);
    }

    /// Fixed-point, e.g. CPU seconds and percentages
    [[nodiscard]] static std::string FormatNumber(double value, int precision = 2) {
        return Format(value, precision, std::ios::fixed);
    }

    /// Scientific, e.g. energies, times and timesteps
    [[nodiscard]] static std::string FormatScientific(double value, int precision = 3) {
        return Format(value, precision, std::ios::scientific);
    }

  private:
    bool is_tty_ = false;
    bool color_enabled_ = false;

    static std::string Pad(std::string_view text, std::size_t width, std::size_t left) {
        if (text.size() >= width) {
            return std::string(text);
        }
        std::string out(left, ' ');
        out += text;
        out.append(width - text.size() - left, ' ');
        return out;
    }

    static std::string Format(double value, int precision, std::ios::fmtflags notation) {
        std::ostringstream oss;
        oss.setf(notation, std::ios::floatfield);
        oss << std::setprecision(precision) << value;
        return oss.str();
    }
};

} // namespace dynadiag
