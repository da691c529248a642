#pragma once

/**
 * @file LogSink.hpp
 * @brief Log destinations: terminal, text file, JSON Lines, callbacks
 */

#include <dynadiag/core/Error.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/io/LogService.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

namespace dynadiag {

class LogSinks {
  public:
    /// Terminal sink on stderr, so stdout stays free for the debrief
    static LogService::Sink Console(const class Console &console) {
        return [&console](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                std::cerr << (console.IsColorEnabled() ? entry.FormatColored(console)
                                                       : entry.Format())
                          << "\n";
            }
        };
    }

    /// Plain-text lines appended to `path`
    static LogService::Sink File(const std::string &path) {
        auto out = OpenForAppend(path);
        return [out](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                *out << entry.Format() << "\n";
            }
            out->flush();
        };
    }

    /// One object per entry: {"level", "stage", "source", "message"}
    static LogService::Sink JsonLines(const std::string &path) {
        auto out = OpenForAppend(path);
        return [out](const std::vector<LogEntry> &entries) {
            for (const auto &entry : entries) {
                nlohmann::ordered_json line;
                line["level"] = std::string(detail::StyleOf(entry.level).name);
                line["stage"] = entry.context.stage;
                line["source"] = entry.context.source;
                line["message"] = entry.message;
                *out << line.dump() << "\n";
            }
            out->flush();
        };
    }

    static LogService::Sink Null() {
        return [](const std::vector<LogEntry> & /*entries*/) {};
    }

    static LogService::Sink Callback(std::function<void(const LogEntry &)> handler) {
        return [handler = std::move(handler)](const std::vector<LogEntry> &entries) {
            std::for_each(entries.begin(), entries.end(), handler);
        };
    }

    /**
     * @brief Replace the service's sinks with those described by `config`
     *
     * The service minimum becomes the lowest sink level so a Debug file sink
     * still sees entries the Info console filters out. Throws IOError when a
     * log file cannot be opened.
     */
    static void Configure(LogService &service, const class Console &console,
                          const LogConfig &config) {
        const LogLevel console_level = config.quiet_mode ? LogLevel::Error : config.console_level;
        LogLevel lowest = console_level;

        service.ClearSinks();
        service.AddSink(Console(console), console_level);
        for (const std::string *path : {&config.file_path, &config.jsonl_path}) {
            if (path->empty()) {
                continue;
            }
            service.AddSink(path == &config.file_path ? File(*path) : JsonLines(*path),
                            config.file_level);
            lowest = std::min(lowest, config.file_level);
        }
        service.SetMinLevel(lowest);
    }

  private:
    static std::shared_ptr<std::ofstream> OpenForAppend(const std::string &path) {
        auto out = std::make_shared<std::ofstream>(path, std::ios::app);
        if (!out->is_open()) {
            throw IOError("open log file", path, "cannot open for append");
        }
        return out;
    }
};

} // namespace dynadiag
