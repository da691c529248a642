#pragma once

/**
 * @file LogService.hpp
 * @brief Process-wide logging for the diagnosis pipeline
 *
 * Readers and analyzers run as parallel tasks. Each task installs a
 * ThreadLogContext::Scope naming its stage and source, so every entry it
 * logs is tagged without passing a logger around. While tasks run the
 * pipeline holds a BufferedScope; the buffer is drained in wall-clock order
 * after the join so the transcript does not interleave half-lines.
 */

#include <dynadiag/io/Console.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynadiag {

// =============================================================================
// LogConfig
// =============================================================================

/// Sink levels and destinations, filled from the `logging` config section
struct LogConfig {
    LogLevel console_level = LogLevel::Info;
    LogLevel file_level = LogLevel::Debug; ///< applies to both file sinks

    std::string file_path;  ///< plain text; empty disables
    std::string jsonl_path; ///< one JSON object per line; empty disables

    bool quiet_mode = false; ///< console shows errors only

    [[nodiscard]] static LogConfig Default() { return LogConfig{}; }

    [[nodiscard]] static LogConfig Quiet() {
        LogConfig config;
        config.quiet_mode = true;
        config.console_level = LogLevel::Error;
        return config;
    }

    [[nodiscard]] static LogConfig Verbose() {
        LogConfig config;
        config.console_level = LogLevel::Debug;
        return config;
    }
};

// =============================================================================
// LogContext / LogEntry
// =============================================================================

/**
 * @brief Where an entry came from
 *
 * `stage` is "reader", "analysis" or "pipeline"; `source` is the file family
 * or analyzer name ("glstat", "energy").
 */
struct LogContext {
    std::string stage;
    std::string source;

    /// "stage.source", or whichever half is set
    [[nodiscard]] std::string FullPath() const {
        if (stage.empty() || source.empty()) {
            return stage + source;
        }
        return stage + "." + source;
    }

    [[nodiscard]] bool IsSet() const { return !stage.empty() || !source.empty(); }
};

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string message;
    LogContext context;
    std::chrono::steady_clock::time_point wall_time;

    static LogEntry Create(LogLevel level, std::string_view message, const LogContext &ctx) {
        return LogEntry{level, std::string(message), ctx, std::chrono::steady_clock::now()};
    }

    /// "[WRN] [reader.nodout] skipped 3 records"
    [[nodiscard]] std::string Format(bool include_context = true) const {
        std::string line = Console::LevelTag(level);
        line += ' ';
        if (include_context && context.IsSet()) {
            line += "[" + context.FullPath() + "] ";
        }
        return line + message;
    }

    /// Same layout as Format(), colored per level when the console allows it
    [[nodiscard]] std::string FormatColored(const Console &console) const {
        std::string line = console.Colorize(Console::LevelTag(level), Console::LevelColor(level));
        line += ' ';
        if (context.IsSet()) {
            line += console.Colorize("[" + context.FullPath() + "]", AnsiColor::Cyan) + " ";
        }
        return line + message;
    }
};

// =============================================================================
// ThreadLogContext
// =============================================================================

/// The LogContext attached to entries logged from the current thread
class ThreadLogContext {
  public:
    [[nodiscard]] static const LogContext &Current() { return current_; }
    static void Reset() { current_ = LogContext{}; }

    /// Installs a context until destruction, then restores the outer one
    class Scope {
      public:
        Scope(std::string stage, std::string source) : saved_(std::move(current_)) {
            current_ = LogContext{std::move(stage), std::move(source)};
        }
        ~Scope() { current_ = std::move(saved_); }

        Scope(const Scope &) = delete;
        Scope &operator=(const Scope &) = delete;
        Scope(Scope &&) = delete;
        Scope &operator=(Scope &&) = delete;

      private:
        LogContext saved_;
    };

  private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    static inline thread_local LogContext current_;
};

// =============================================================================
// LogService
// =============================================================================

/**
 * @brief Thread-safe fan-out of log entries to sinks
 *
 * Immediate mode (the default) hands each entry to the sinks at once.
 * Buffered mode keeps entries until Flush(), which sorts them by wall time,
 * delivers them and empties the buffer.
 */
class LogService {
  public:
    using Sink = std::function<void(const std::vector<LogEntry> &)>;

    /// Buffers for its lifetime, then flushes and restores the previous mode
    class BufferedScope {
      public:
        explicit BufferedScope(LogService &service)
            : service_(service), was_immediate_(service.IsImmediateMode()) {
            service_.SetImmediateMode(false);
        }
        ~BufferedScope() {
            service_.Flush();
            service_.SetImmediateMode(was_immediate_);
        }

        BufferedScope(const BufferedScope &) = delete;
        BufferedScope &operator=(const BufferedScope &) = delete;
        BufferedScope(BufferedScope &&) = delete;
        BufferedScope &operator=(BufferedScope &&) = delete;

      private:
        LogService &service_;
        bool was_immediate_;
    };

    void SetImmediateMode(bool immediate) {
        std::lock_guard<std::mutex> lock(mutex_);
        immediate_ = immediate;
    }
    [[nodiscard]] bool IsImmediateMode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return immediate_;
    }

    /// Entries below this level are dropped before reaching any sink
    void SetMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }
    [[nodiscard]] LogLevel GetMinLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void AddSink(Sink sink, LogLevel min_level = LogLevel::Trace) {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.push_back(SinkSlot{std::move(sink), min_level});
    }

    void ClearSinks() {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_.clear();
    }

    // === Logging ===

    void Log(LogLevel level, std::string_view message) {
        Log(level, message, ThreadLogContext::Current());
    }

    void Log(LogLevel level, std::string_view message, const LogContext &ctx) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }
        error_count_ += level == LogLevel::Error ? 1 : 0;
        fatal_count_ += level == LogLevel::Fatal ? 1 : 0;

        auto entry = LogEntry::Create(level, message, ctx);
        if (immediate_) {
            Deliver({std::move(entry)});
        } else {
            pending_.push_back(std::move(entry));
        }
    }

    void Trace(std::string_view msg) { Log(LogLevel::Trace, msg); }
    void Debug(std::string_view msg) { Log(LogLevel::Debug, msg); }
    void Info(std::string_view msg) { Log(LogLevel::Info, msg); }
    void Event(std::string_view msg) { Log(LogLevel::Event, msg); }
    void Warning(std::string_view msg) { Log(LogLevel::Warning, msg); }
    void Error(std::string_view msg) { Log(LogLevel::Error, msg); }
    void Fatal(std::string_view msg) { Log(LogLevel::Fatal, msg); }

    /// Deliver buffered entries in wall-clock order and empty the buffer
    void Flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<LogEntry> batch;
        batch.swap(pending_);
        std::stable_sort(batch.begin(), batch.end(), [](const LogEntry &a, const LogEntry &b) {
            return a.wall_time < b.wall_time;
        });
        Deliver(batch);
    }

    // === Queries ===

    [[nodiscard]] std::size_t PendingCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    [[nodiscard]] std::size_t ErrorCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_count_;
    }
    [[nodiscard]] std::size_t FatalCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fatal_count_;
    }
    void ResetErrorCounts() {
        std::lock_guard<std::mutex> lock(mutex_);
        error_count_ = fatal_count_ = 0;
    }

  private:
    struct SinkSlot {
        Sink sink;
        LogLevel min_level;
    };

    std::vector<SinkSlot> sinks_;
    std::vector<LogEntry> pending_;
    LogLevel min_level_ = LogLevel::Info;
    bool immediate_ = true;
    std::size_t error_count_ = 0;
    std::size_t fatal_count_ = 0;
    mutable std::mutex mutex_;

    // Caller holds mutex_
    void Deliver(const std::vector<LogEntry> &batch) const {
        for (const auto &slot : sinks_) {
            std::vector<LogEntry> accepted;
            for (const auto &entry : batch) {
                if (entry.level >= slot.min_level) {
                    accepted.push_back(entry);
                }
            }
            if (!accepted.empty()) {
                slot.sink(accepted);
            }
        }
    }
};

/// Process-wide service used by the DYNADIAG_LOG_* macros
inline LogService &GetLogService() {
    static LogService instance;
    return instance;
}

} // namespace dynadiag

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define DYNADIAG_LOG_TRACE(msg) ::dynadiag::GetLogService().Trace(msg)
#define DYNADIAG_LOG_DEBUG(msg) ::dynadiag::GetLogService().Debug(msg)
#define DYNADIAG_LOG_INFO(msg) ::dynadiag::GetLogService().Info(msg)
#define DYNADIAG_LOG_EVENT(msg) ::dynadiag::GetLogService().Event(msg)
#define DYNADIAG_LOG_WARN(msg) ::dynadiag::GetLogService().Warning(msg)
#define DYNADIAG_LOG_ERROR(msg) ::dynadiag::GetLogService().Error(msg)
// NOLINTEND(cppcoreguidelines-macro-usage)
