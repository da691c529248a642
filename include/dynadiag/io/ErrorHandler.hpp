#pragma once

/**
 * @file ErrorHandler.hpp
 * @brief Per-severity policy for errors raised while reading one source
 *
 * The pipeline reports every reader exception here and applies the returned
 * policy: an unreadable optional file degrades coverage, a fatal error stops
 * the run.
 */

#include <dynadiag/core/Error.hpp>
#include <dynadiag/io/LogService.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>

namespace dynadiag {

enum class ErrorPolicy {
    Continue, ///< log only
    Degrade,  ///< log and record the source as unavailable
    Abort     ///< stop the run
};

using ErrorCallback = std::function<ErrorPolicy(const DiagnosticError &)>;

class ErrorHandler {
  public:
    explicit ErrorHandler(LogService &log_service) : log_service_(log_service) {}

    void SetPolicy(Severity severity, ErrorPolicy policy) { policies_[Index(severity)] = policy; }

    /// When set, the callback's answer replaces the table policy
    void SetCallback(ErrorCallback callback) { callback_ = std::move(callback); }

    /// Log the error, count it, remember the first fatal one, return the policy
    ErrorPolicy Report(const DiagnosticError &error) {
        log_service_.Log(SeverityToLogLevel(error.severity),
                         "[" + error.source + "] " + error.message);
        ++counts_[Index(error.severity)];
        if (error.severity == Severity::FATAL && !first_fatal_) {
            first_fatal_ = error;
        }
        return callback_ ? callback_(error) : policies_[Index(error.severity)];
    }

    ErrorPolicy Report(const Error &exception, const std::string &source = "") {
        return Report(exception.ToDiagnostic(source));
    }

    [[nodiscard]] std::size_t GetErrorCount(Severity severity) const {
        return counts_[Index(severity)];
    }

    [[nodiscard]] std::optional<DiagnosticError> GetFatalError() const { return first_fatal_; }

    void Reset() {
        counts_.fill(0);
        first_fatal_.reset();
    }

    [[nodiscard]] static LogLevel SeverityToLogLevel(Severity severity) {
        static constexpr std::array<LogLevel, kSeverityCount> kLevels{
            LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Fatal};
        return kLevels[Index(severity)];
    }

  private:
    static constexpr std::size_t Index(Severity severity) {
        return static_cast<std::size_t>(severity);
    }

    LogService &log_service_;
    ErrorCallback callback_;
    std::array<ErrorPolicy, kSeverityCount> policies_{
        ErrorPolicy::Continue, ErrorPolicy::Continue, ErrorPolicy::Degrade, ErrorPolicy::Abort};
    std::array<std::size_t, kSeverityCount> counts_{};
    std::optional<DiagnosticError> first_fatal_;
};

} // namespace dynadiag
