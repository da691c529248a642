#pragma once

/**
 * @file ConfigLoader.hpp
 * @brief Loads AnalysisConfig from YAML files
 *
 * Every key is optional. Unknown keys are ignored; keys with the wrong type or
 * an out-of-range value raise ConfigError naming the key.
 *
 * Example:
 * @code
 * analysis:
 *   tracked_node_cap: 500
 *   zcr_window: 128
 * outputs:
 *   json: true
 *   json_path: report.json
 * logging:
 *   console_level: debug
 * @endcode
 */

#include <dynadiag/core/Error.hpp>
#include <dynadiag/io/AnalysisConfig.hpp>

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>

namespace dynadiag {
namespace io {

class ConfigLoader {
  public:
    /// Load from a YAML file
    static AnalysisConfig LoadFile(const std::string &yaml_path);

    /// Parse from a YAML string
    static AnalysisConfig Parse(const std::string &yaml_content);

    /// Apply a parsed root node on top of defaults
    static AnalysisConfig FromNode(const YAML::Node &root, const std::string &origin);

  private:
    template <typename T>
    static void Read(const YAML::Node &section, const char *key, T &target,
                     const std::string &origin, const std::string &path) {
        if (!section[key]) {
            return;
        }
        try {
            target = section[key].as<T>();
        } catch (const YAML::Exception &e) {
            throw ConfigError("invalid value for '" + path + "." + key + "'", origin,
                              e.mark.is_null() ? std::nullopt
                                               : std::optional<int>(e.mark.line + 1),
                              "check the value type");
        }
    }

    static void ReadCount(const YAML::Node &section, const char *key, std::size_t &target,
                          const std::string &origin, const std::string &path) {
        long long value = static_cast<long long>(target);
        Read(section, key, value, origin, path);
        if (value <= 0) {
            throw ConfigError("'" + path + "." + key + "' must be a positive integer", origin);
        }
        target = static_cast<std::size_t>(value);
    }

    static LogLevel ReadLevel(const YAML::Node &section, const char *key, LogLevel fallback,
                              const std::string &origin) {
        std::string name;
        Read(section, key, name, origin, "logging");
        if (name.empty()) {
            return fallback;
        }
        auto level = ParseLogLevel(name);
        if (!level) {
            throw ConfigError("unknown log level '" + name + "'", origin, std::nullopt,
                              "use trace, debug, info, event, warning, error or fatal");
        }
        return *level;
    }
};

// =============================================================================
// Implementation
// =============================================================================

inline AnalysisConfig ConfigLoader::LoadFile(const std::string &yaml_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::BadFile &) {
        throw ConfigError("cannot open configuration file", yaml_path);
    } catch (const YAML::ParserException &e) {
        throw ConfigError(e.msg, yaml_path, e.mark.line + 1);
    }
    return FromNode(root, yaml_path);
}

inline AnalysisConfig ConfigLoader::Parse(const std::string &yaml_content) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::ParserException &e) {
        throw ConfigError(e.msg, "<string>", e.mark.line + 1);
    }
    return FromNode(root, "<string>");
}

inline AnalysisConfig ConfigLoader::FromNode(const YAML::Node &root, const std::string &origin) {
    AnalysisConfig cfg = AnalysisConfig::Default();
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        throw ConfigError("top level must be a mapping", origin);
    }

    if (const auto analysis = root["analysis"]) {
        Read(analysis, "verbose", cfg.verbose, origin, "analysis");
        ReadCount(analysis, "tracked_node_cap", cfg.tracked_node_cap, origin, "analysis");
        ReadCount(analysis, "message_scan_gap", cfg.message_scan_gap, origin, "analysis");
        ReadCount(analysis, "zcr_window", cfg.zcr_window, origin, "analysis");
        ReadCount(analysis, "damping_window", cfg.damping_window, origin, "analysis");
        Read(analysis, "comm_growth_exponent", cfg.comm_growth_exponent, origin, "analysis");
        Read(analysis, "input_deck", cfg.input_deck, origin, "analysis");
        if (cfg.comm_growth_exponent < 0.0 || cfg.comm_growth_exponent > 2.0) {
            throw ConfigError("'analysis.comm_growth_exponent' out of range", origin, std::nullopt,
                              "expected a value in [0, 2]");
        }
        if (cfg.zcr_window < 4 || cfg.damping_window < 4) {
            throw ConfigError("window sizes must be at least 4 samples", origin);
        }
    }

    if (const auto outputs = root["outputs"]) {
        Read(outputs, "terminal", cfg.outputs.terminal, origin, "outputs");
        Read(outputs, "json", cfg.outputs.json, origin, "outputs");
        Read(outputs, "json_path", cfg.outputs.json_path, origin, "outputs");
        Read(outputs, "html", cfg.outputs.html, origin, "outputs");
    }

    if (const auto logging = root["logging"]) {
        cfg.logging.console_level =
            ReadLevel(logging, "console_level", cfg.logging.console_level, origin);
        cfg.logging.file_level = ReadLevel(logging, "file_level", cfg.logging.file_level, origin);
        Read(logging, "file", cfg.logging.file_path, origin, "logging");
        Read(logging, "jsonl", cfg.logging.jsonl_path, origin, "logging");
        Read(logging, "quiet", cfg.logging.quiet_mode, origin, "logging");
    }

    if (cfg.verbose && cfg.logging.console_level > LogLevel::Debug) {
        cfg.logging.console_level = LogLevel::Debug;
    }
    return cfg;
}

} // namespace io
} // namespace dynadiag
