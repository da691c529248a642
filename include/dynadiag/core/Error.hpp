#pragma once

/**
 * @file Error.hpp
 * @brief Exception hierarchy for dynadiag
 *
 * Data-quality problems inside a result file never leave a reader; they are
 * counted as skipped records. Only configuration, I/O, a missing required
 * input set, cancellation and an empty aggregation surface as exceptions.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dynadiag {

enum class Severity : uint8_t {
    INFO,    ///< logged only
    WARNING, ///< analysis continues with reduced coverage
    ERROR,   ///< the current source or operation fails
    FATAL    ///< the run cannot continue
};

inline constexpr std::size_t kSeverityCount = 4;

/// Error as handed to ErrorHandler, detached from the exception object
struct DiagnosticError {
    Severity severity;
    std::string message;
    std::string source;
};

/**
 * @brief Root of all dynadiag exceptions
 *
 * `what()` is prefixed with "[dynadiag] ". The category names the subsystem
 * and doubles as the log source when no file is known.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[dynadiag] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

    [[nodiscard]] DiagnosticError ToDiagnostic(const std::string &source = "") const {
        return {severity_, what(), source.empty() ? category_ : source};
    }

  private:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Invalid or unreadable configuration
 *
 * `origin` is the YAML file path, or "<string>" for in-memory documents.
 * `line` is 1-based and only known for YAML syntax and type errors.
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &msg, std::string origin,
                std::optional<int> line = std::nullopt, std::string hint = "")
        : Error(Describe(msg, origin, line, hint), Severity::ERROR, "config"),
          origin_(std::move(origin)), line_(line), hint_(std::move(hint)) {}

    [[nodiscard]] const std::string &origin() const { return origin_; }
    [[nodiscard]] std::optional<int> line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string Describe(const std::string &msg, const std::string &origin,
                                std::optional<int> line, const std::string &hint) {
        std::string text = "Config: " + msg;
        if (!origin.empty()) {
            text += "\n  at: " + origin + (line ? ":" + std::to_string(*line) : "");
        }
        if (!hint.empty()) {
            text += "\n  hint: " + hint;
        }
        return text;
    }

    std::string origin_;
    std::optional<int> line_;
    std::string hint_;
};

// =============================================================================
// Files
// =============================================================================

/// A file could not be opened, read or written
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, std::string path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(std::move(path)) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

/**
 * @brief The result directory lacks d3hsp and every message log
 *
 * An empty `missing` list means the path itself is not a readable directory.
 */
class InputError : public Error {
  public:
    InputError(std::string directory, std::vector<std::string> missing)
        : Error(Describe(directory, missing), Severity::FATAL, "input"),
          directory_(std::move(directory)), missing_(std::move(missing)) {}

    static InputError NotADirectory(const std::string &directory) { return {directory, {}}; }

    [[nodiscard]] const std::string &directory() const { return directory_; }
    [[nodiscard]] const std::vector<std::string> &missing() const { return missing_; }

  private:
    static std::string Describe(const std::string &directory,
                                const std::vector<std::string> &missing) {
        if (missing.empty()) {
            return "Input: '" + directory + "' is not a readable result directory";
        }
        std::string names;
        for (const auto &name : missing) {
            names += (names.empty() ? "" : ", ") + name;
        }
        return "Input: no required solver output in '" + directory + "' (missing: " + names +
               ")";
    }

    std::string directory_;
    std::vector<std::string> missing_;
};

// =============================================================================
// Run control
// =============================================================================

/// Cancellation was observed between records or between phases
class AbortedError : public Error {
  public:
    explicit AbortedError(const std::string &where)
        : Error("Aborted: cancellation requested during " + where, Severity::FATAL, "abort") {}
};

/// No reader produced a usable summary
class AggregationError : public Error {
  public:
    explicit AggregationError(const std::string &msg)
        : Error("Aggregate: " + msg, Severity::FATAL, "aggregate") {}
};

} // namespace dynadiag
