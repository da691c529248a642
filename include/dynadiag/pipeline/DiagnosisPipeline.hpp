#pragma once

/**
 * @file DiagnosisPipeline.hpp
 * @brief Discover, read, analyze and aggregate one result directory
 *
 * Four phases, each joined before the next starts:
 *
 *   1. Discover   RunBundle::Discover
 *   2. Read       one std::async task per file; nodout and bndout stream
 *                 straight into the instability trackers
 *   3. Analyze    one std::async task per analyzer over the joined RunData
 *   4. Aggregate  Aggregator::Aggregate
 *
 * Usage:
 *   DiagnosisPipeline pipeline(config, token);
 *   auto result = pipeline.Run("/data/crash_run");
 *   if (result.report) { ... }
 */

#include <dynadiag/analysis/Analyzer.hpp>
#include <dynadiag/core/CoreTypes.hpp>
#include <dynadiag/io/AnalysisConfig.hpp>
#include <dynadiag/io/ErrorHandler.hpp>
#include <dynadiag/io/RunBundle.hpp>
#include <dynadiag/report/Aggregator.hpp>
#include <dynadiag/report/Report.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dynadiag {

enum class Outcome : uint8_t {
    Success,          ///< Report with full coverage
    DegradedCoverage, ///< Report, but a source was missing or partly unreadable
    FatalInput,       ///< No Report: required inputs absent or nothing usable
    Aborted           ///< No Report: cancelled
};

[[nodiscard]] const char *OutcomeName(Outcome outcome);

/// Process exit code for an outcome
[[nodiscard]] int ExitCode(Outcome outcome);

/// Joined reader output and the mapper built from it
struct RunInputs {
    RunData data;
    ElementPartMapper mapper;
};

struct DiagnosisResult {
    Outcome outcome = Outcome::FatalInput;
    std::optional<Report> report; ///< set only for Success and DegradedCoverage
    std::vector<std::string> missing;
    std::string message;
};

class DiagnosisPipeline {
  public:
    using ProgressCallback = std::function<void(const std::string &phase)>;
    using AnalyzerFactory = std::function<std::vector<std::unique_ptr<Analyzer>>()>;

    explicit DiagnosisPipeline(AnalysisConfig config, CancellationToken token = {});

    /// Called on the calling thread as each phase starts
    DiagnosisPipeline &SetProgressCallback(ProgressCallback callback) {
        progress_ = std::move(callback);
        return *this;
    }

    /// Replaces DefaultAnalyzers() for the analyze phase
    DiagnosisPipeline &SetAnalyzerFactory(AnalyzerFactory factory) {
        analyzers_ = std::move(factory);
        return *this;
    }

    /**
     * @brief Run all four phases
     *
     * Never throws. An exception escaping a reader or analyzer task is
     * reported through ErrorHandler and ends the run as FatalInput.
     */
    [[nodiscard]] DiagnosisResult Run(const fs::path &directory);

    // =========================================================================
    // Phases (public for tests)
    // =========================================================================

    /**
     * @brief Read every discovered file
     *
     * An IOError on one file is reported to `errors`; under the Degrade or
     * Continue policy that source moves to the missing list.
     *
     * @throws AbortedError on cancellation
     */
    [[nodiscard]] RunInputs ReadAll(const RunBundle &bundle, ErrorHandler &errors) const;

    /// The fixed analyzer order used for Findings in the Report
    [[nodiscard]] static std::vector<std::unique_ptr<Analyzer>> DefaultAnalyzers();

    /// Run analyzers in parallel; results keep the analyzer order.
    /// Entries logged by the tasks are buffered and flushed after the join.
    [[nodiscard]] static std::vector<NamedResult>
    RunAnalyzers(const std::vector<std::unique_ptr<Analyzer>> &analyzers,
                 const AnalysisContext &ctx);

    [[nodiscard]] const AnalysisConfig &Config() const { return config_; }

  private:
    void Progress(const std::string &phase) const;

    AnalysisConfig config_;
    CancellationToken token_;
    ProgressCallback progress_;
    AnalyzerFactory analyzers_;
};

} // namespace dynadiag
