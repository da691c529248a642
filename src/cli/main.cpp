/**
 * @file main.cpp
 * @brief dynadiag command-line entry point
 *
 * Usage: dynadiag <result_dir> [--config file.yaml] [--json [path]]
 *                 [--verbose | --quiet] [--no-terminal]
 *
 * Exit codes: 0 success, 3 degraded coverage, 2 fatal input, 130 aborted,
 * 1 usage or configuration error.
 */

#include <dynadiag/dynadiag.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>

using namespace dynadiag;
namespace fs = std::filesystem;

namespace {

CancellationToken g_token;

extern "C" void OnInterrupt(int /*signal*/) { g_token.RequestCancel(); }

void PrintUsage(const char *argv0) {
    std::cerr << "Usage: " << argv0
              << " <result_dir> [--config file.yaml] [--json [path]] [--verbose | --quiet]"
                 " [--no-terminal]\n";
}

struct CliOptions {
    std::string directory;
    std::string config_path;
    bool json = false;
    std::string json_path;
    bool verbose = false;
    bool quiet = false;
    bool no_terminal = false;
};

bool ParseArgs(int argc, char *argv[], CliOptions &opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--json") {
            opts.json = true;
            if (i + 1 < argc && fs::path(argv[i + 1]).extension() == ".json") {
                opts.json_path = argv[++i];
            }
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (arg == "--no-terminal") {
            opts.no_terminal = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else if (opts.directory.empty()) {
            opts.directory = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return !opts.directory.empty();
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc > 1 && (std::string(argv[1]) == "--version")) {
        std::cout << "dynadiag " << Version() << "\n";
        return 0;
    }

    CliOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage(argv[0]);
        return 1;
    }

    AnalysisConfig config;
    try {
        if (!opts.config_path.empty()) {
            config = io::ConfigLoader::LoadFile(opts.config_path);
        }
    } catch (const ConfigError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (opts.verbose) {
        config.verbose = true;
    }
    if (config.verbose) {
        config.logging.console_level = LogLevel::Debug;
    }
    if (opts.quiet) {
        config.logging.quiet_mode = true;
    }
    if (opts.json) {
        config.outputs.json = true;
        if (!opts.json_path.empty()) {
            config.outputs.json_path = opts.json_path;
        }
    }
    if (opts.no_terminal) {
        config.outputs.terminal = false;
    }

    Console console;
    try {
        LogSinks::Configure(GetLogService(), console, config.logging);
    } catch (const IOError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, OnInterrupt);

    DiagnosisPipeline pipeline(config, g_token);
    pipeline.SetProgressCallback([](const std::string &phase) {
        DYNADIAG_LOG_INFO("Phase: " + phase);
    });
    auto result = pipeline.Run(fs::path(opts.directory));

    if (!result.report) {
        console.Error(result.message);
        return ExitCode(result.outcome);
    }

    if (config.outputs.terminal) {
        DiagnosisDebrief(console).Print(*result.report);
    }
    if (config.outputs.json) {
        try {
            WriteReportJSON(*result.report, config.outputs.json_path);
            DYNADIAG_LOG_INFO("Report written to " + config.outputs.json_path);
        } catch (const IOError &e) {
            console.Error(e.what());
            return 1;
        }
    }
    if (config.outputs.html) {
        DYNADIAG_LOG_WARN("outputs.html is set but no HTML renderer is built; ignored");
    }

    GetLogService().Flush();
    return ExitCode(result.outcome);
}
