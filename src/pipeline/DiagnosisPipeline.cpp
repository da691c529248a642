/**
 * @file DiagnosisPipeline.cpp
 * @brief Reader tasks, analyzer tasks and outcome mapping
 */

#include <dynadiag/analysis/ContactAnalyzer.hpp>
#include <dynadiag/analysis/CoverageAnalyzer.hpp>
#include <dynadiag/analysis/EnergyAnalyzer.hpp>
#include <dynadiag/analysis/FailureTracer.hpp>
#include <dynadiag/analysis/InstabilityAnalyzer.hpp>
#include <dynadiag/analysis/PerformanceAnalyzer.hpp>
#include <dynadiag/analysis/ScalingProjector.hpp>
#include <dynadiag/analysis/TerminationAnalyzer.hpp>
#include <dynadiag/analysis/TimestepAnalyzer.hpp>
#include <dynadiag/analysis/WarningAnalyzer.hpp>
#include <dynadiag/io/LogService.hpp>
#include <dynadiag/pipeline/DiagnosisPipeline.hpp>
#include <dynadiag/readers/BndoutReader.hpp>
#include <dynadiag/readers/GlstatReader.hpp>
#include <dynadiag/readers/HspReader.hpp>
#include <dynadiag/readers/KeywordDeckReader.hpp>
#include <dynadiag/readers/MatsumReader.hpp>
#include <dynadiag/readers/MessageReader.hpp>
#include <dynadiag/readers/NodoutReader.hpp>
#include <dynadiag/readers/ProfileReader.hpp>
#include <dynadiag/readers/StatusReader.hpp>

#include <algorithm>
#include <future>
#include <iterator>
#include <map>
#include <variant>

namespace dynadiag {

const char *OutcomeName(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return "success";
    case Outcome::DegradedCoverage:
        return "degraded";
    case Outcome::FatalInput:
        return "fatal_input";
    case Outcome::Aborted:
        return "aborted";
    }
    return "fatal_input";
}

int ExitCode(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return 0;
    case Outcome::DegradedCoverage:
        return 3;
    case Outcome::FatalInput:
        return 2;
    case Outcome::Aborted:
        return 130;
    }
    return 2;
}

namespace {

template <typename... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/// What one reader task hands back to the joining thread
struct ReaderOutput {
    RunData data;
    std::vector<WarningEvent> hsp_warnings;
    std::vector<DeckElement> deck;
    std::map<PartId, std::string> titles;
    std::size_t skipped = 0;
};

template <typename T> void AppendAll(std::vector<T> &dst, std::vector<T> &src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

template <typename T> void TakeIfSet(std::optional<T> &dst, std::optional<T> &src) {
    if (src) {
        dst = std::move(src);
    }
}

void LogDone(const std::string &label, std::size_t lines, std::size_t skipped) {
    DYNADIAG_LOG_DEBUG(label + ": " + std::to_string(lines) + " lines, " +
                       std::to_string(skipped) + " skipped");
}

// =============================================================================
// Reader tasks
// =============================================================================

ReaderOutput ReadHsp(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "d3hsp");
    ReaderOutput out;
    auto &d = out.data;
    HspReader reader(LineSource(path, token));
    while (auto record = reader.Next()) {
        std::visit(Overloaded{
                       [&](ModelSummary &r) { d.model = std::move(r); },
                       [&](PartTable &r) { d.parts = std::move(r); },
                       [&](ContactTable &r) { d.contacts = std::move(r); },
                       [&](EnergySample &r) { d.hsp_energy.push_back(r); },
                       [&](TimestepRecord &r) { d.timesteps.push_back(r); },
                       [&](ElementTimestep &r) { d.smallest_timesteps.push_back(r); },
                       [&](WarningEvent &r) { out.hsp_warnings.push_back(std::move(r)); },
                       [&](MassPropertyTable &r) { d.mass = std::move(r); },
                       [&](TimingTable &r) { d.timing = std::move(r); },
                       [&](TerminationStatus &r) { d.termination = std::move(r); },
                       [&](ContactStability &r) { d.contact_stability = std::move(r); },
                   },
                   *record);
    }
    out.skipped = reader.SkippedRecords();
    LogDone("d3hsp", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadGlstat(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "glstat");
    ReaderOutput out;
    GlstatReader reader(LineSource(path, token));
    while (auto sample = reader.Next()) {
        out.data.glstat_energy.push_back(*sample);
    }
    out.skipped = reader.SkippedRecords();
    LogDone("glstat", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadStatus(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "status.out");
    ReaderOutput out;
    StatusReader reader(LineSource(path, token));
    while (auto record = reader.Next()) {
        if (auto *p = std::get_if<CycleProgress>(&*record)) {
            out.data.progress.push_back(*p);
        } else {
            out.data.estimate = std::get<StatusEstimate>(*record);
        }
    }
    out.skipped = reader.SkippedRecords();
    LogDone("status.out", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadMatsum(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "matsum");
    ReaderOutput out;
    MatsumReader reader(LineSource(path, token));
    while (auto sample = reader.Next()) {
        if (!sample->title.empty()) {
            out.titles.try_emplace(sample->part, sample->title);
        }
        out.data.final_materials[sample->part] = std::move(*sample);
    }
    for (const auto &[part, title] : reader.Legend()) {
        out.titles.try_emplace(part, title);
    }
    out.skipped = reader.SkippedRecords();
    LogDone("matsum", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadMessages(const MessageLog &log, const CancellationToken &token) {
    std::string label = log.path.filename().string();
    ThreadLogContext::Scope scope("reader", label);
    ReaderOutput out;
    auto &d = out.data;
    MessageReader reader(LineSource(log.path, token), log.rank);
    while (auto record = reader.Next()) {
        std::visit(Overloaded{
                       [&](WarningEvent &r) { d.warnings.push_back(std::move(r)); },
                       [&](InitialPenetration &r) { d.penetrations.push_back(r); },
                       [&](InterfaceWarningCount &r) { d.interface_warning_counts.push_back(r); },
                       [&](MemoryRequest &r) { d.memory_requests.push_back(r); },
                       [&](TerminationBanner &r) { d.banners.push_back(r); },
                   },
                   *record);
    }
    d.message_logs = 1;
    out.skipped = reader.SkippedRecords();
    LogDone(label, reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadNodout(const fs::path &path, const CancellationToken &token,
                        const AnalysisConfig &config) {
    ThreadLogContext::Scope scope("reader", "nodout");
    ReaderOutput out;
    NodoutReader reader(LineSource(path, token), config.tracked_node_cap);
    NodalInstabilityTracker tracker(config.zcr_window, config.tracked_node_cap);
    while (auto sample = reader.Next()) {
        tracker.Observe(*sample);
    }
    out.data.nodal = tracker.Finish();
    out.skipped = reader.SkippedRecords();
    LogDone("nodout", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadBndout(const fs::path &path, const CancellationToken &token,
                        const AnalysisConfig &config) {
    ThreadLogContext::Scope scope("reader", "bndout");
    ReaderOutput out;
    BndoutReader reader(LineSource(path, token));
    BoundaryInstabilityTracker tracker(config.damping_window, config.tracked_node_cap);
    while (auto sample = reader.Next()) {
        tracker.Observe(*sample);
    }
    out.data.boundary = tracker.Finish();
    out.skipped = reader.SkippedRecords();
    LogDone("bndout", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadLoadProfile(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "load_profile.csv");
    ReaderOutput out;
    LoadProfileReader reader(LineSource(path, token));
    while (auto sample = reader.Next()) {
        out.data.load_profile.push_back(std::move(*sample));
    }
    out.skipped = reader.SkippedRecords();
    LogDone("load_profile.csv", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadContactProfile(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "cont_profile.csv");
    ReaderOutput out;
    ContactProfileReader reader(LineSource(path, token));
    while (auto sample = reader.Next()) {
        out.data.contact_profile.push_back(*sample);
    }
    out.skipped = reader.SkippedRecords();
    LogDone("cont_profile.csv", reader.LinesRead(), out.skipped);
    return out;
}

ReaderOutput ReadDeck(const fs::path &path, const CancellationToken &token) {
    ThreadLogContext::Scope scope("reader", "input_deck");
    ReaderOutput out;
    KeywordDeckReader reader(LineSource(path, token));
    while (auto element = reader.Next()) {
        out.deck.push_back(std::move(*element));
    }
    out.skipped = reader.SkippedRecords();
    LogDone(path.filename().string(), reader.LinesRead(), out.skipped);
    return out;
}

// =============================================================================
// Join
// =============================================================================

struct Task {
    SourceKind source;
    std::string label;
    std::future<ReaderOutput> future;
};

/// Everything a joined task contributes; fields are disjoint between sources
void Merge(RunData &dst, ReaderOutput &src) {
    auto &s = src.data;
    TakeIfSet(dst.model, s.model);
    TakeIfSet(dst.parts, s.parts);
    TakeIfSet(dst.contacts, s.contacts);
    TakeIfSet(dst.contact_stability, s.contact_stability);
    TakeIfSet(dst.mass, s.mass);
    TakeIfSet(dst.timing, s.timing);
    TakeIfSet(dst.termination, s.termination);
    TakeIfSet(dst.estimate, s.estimate);
    TakeIfSet(dst.nodal, s.nodal);
    TakeIfSet(dst.boundary, s.boundary);
    AppendAll(dst.glstat_energy, s.glstat_energy);
    AppendAll(dst.hsp_energy, s.hsp_energy);
    AppendAll(dst.timesteps, s.timesteps);
    AppendAll(dst.smallest_timesteps, s.smallest_timesteps);
    AppendAll(dst.warnings, s.warnings);
    AppendAll(dst.penetrations, s.penetrations);
    AppendAll(dst.interface_warning_counts, s.interface_warning_counts);
    AppendAll(dst.memory_requests, s.memory_requests);
    AppendAll(dst.banners, s.banners);
    AppendAll(dst.progress, s.progress);
    AppendAll(dst.load_profile, s.load_profile);
    AppendAll(dst.contact_profile, s.contact_profile);
    dst.final_materials.merge(s.final_materials);
    dst.message_logs += s.message_logs;
}

void MarkMissing(RunData &data, SourceKind source) {
    data.present.erase(std::remove(data.present.begin(), data.present.end(), source),
                       data.present.end());
    if (std::find(data.missing.begin(), data.missing.end(), source) == data.missing.end()) {
        data.missing.push_back(source);
    }
}

} // namespace

// =============================================================================
// DiagnosisPipeline
// =============================================================================

DiagnosisPipeline::DiagnosisPipeline(AnalysisConfig config, CancellationToken token)
    : config_(std::move(config)), token_(std::move(token)) {}

void DiagnosisPipeline::Progress(const std::string &phase) const {
    DYNADIAG_LOG_DEBUG("phase: " + phase);
    if (progress_) {
        progress_(phase);
    }
}

RunInputs DiagnosisPipeline::ReadAll(const RunBundle &bundle, ErrorHandler &errors) const {
    RunInputs inputs;
    auto &data = inputs.data;
    for (auto kind : kAllSources) {
        if (bundle.Has(kind)) {
            data.present.push_back(kind);
        }
    }
    data.missing = bundle.Missing();

    const auto &token = token_;
    const auto &config = config_;
    // Declared before the tasks so a throwing join drains them before the flush
    LogService::BufferedScope buffered(GetLogService());
    std::vector<Task> tasks;
    auto launch = [&tasks](SourceKind source, std::string label, auto &&fn) {
        tasks.push_back(Task{.source = source,
                             .label = std::move(label),
                             .future = std::async(std::launch::async, std::move(fn))});
    };

    if (auto p = bundle.PathOf(SourceKind::Hsp)) {
        launch(SourceKind::Hsp, "d3hsp", [p = *p, &token] { return ReadHsp(p, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::Glstat)) {
        launch(SourceKind::Glstat, "glstat", [p = *p, &token] { return ReadGlstat(p, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::Status)) {
        launch(SourceKind::Status, "status.out",
               [p = *p, &token] { return ReadStatus(p, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::Matsum)) {
        launch(SourceKind::Matsum, "matsum", [p = *p, &token] { return ReadMatsum(p, token); });
    }
    for (const auto &log : bundle.MessageLogs()) {
        launch(SourceKind::Messages, log.path.filename().string(),
               [log, &token] { return ReadMessages(log, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::Nodout)) {
        launch(SourceKind::Nodout, "nodout",
               [p = *p, &token, &config] { return ReadNodout(p, token, config); });
    }
    if (auto p = bundle.PathOf(SourceKind::Bndout)) {
        launch(SourceKind::Bndout, "bndout",
               [p = *p, &token, &config] { return ReadBndout(p, token, config); });
    }
    if (auto p = bundle.PathOf(SourceKind::LoadProfile)) {
        launch(SourceKind::LoadProfile, "load_profile.csv",
               [p = *p, &token] { return ReadLoadProfile(p, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::ContactProfile)) {
        launch(SourceKind::ContactProfile, "cont_profile.csv",
               [p = *p, &token] { return ReadContactProfile(p, token); });
    }
    if (auto p = bundle.PathOf(SourceKind::InputDeck)) {
        launch(SourceKind::InputDeck, p->filename().string(),
               [p = *p, &token] { return ReadDeck(p, token); });
    }

    // Join in launch order so the merged series are deterministic
    std::vector<WarningEvent> hsp_warnings;
    std::vector<DeckElement> deck;
    std::map<PartId, std::string> titles;
    std::size_t failed_logs = 0;
    for (auto &task : tasks) {
        ReaderOutput out;
        try {
            out = task.future.get();
        } catch (const IOError &e) {
            if (errors.Report(e, task.label) == ErrorPolicy::Abort) {
                throw;
            }
            if (task.source != SourceKind::Messages ||
                ++failed_logs == bundle.MessageLogs().size()) {
                MarkMissing(data, task.source);
            }
            continue;
        }
        Merge(data, out);
        AppendAll(hsp_warnings, out.hsp_warnings);
        AppendAll(deck, out.deck);
        titles.merge(out.titles);
        if (out.skipped > 0) {
            data.skipped[task.source] += out.skipped;
        }
    }

    // The message logs repeat every d3hsp warning; d3hsp counts only without them
    if (data.message_logs == 0) {
        data.warnings = std::move(hsp_warnings);
    }

    ElementPartMapper::Builder builder;
    for (const auto &r : data.timesteps) {
        builder.Add(r);
    }
    for (const auto &e : data.smallest_timesteps) {
        builder.Add(e);
    }
    for (const auto &e : deck) {
        builder.Add(e);
    }
    for (auto &[part, title] : titles) {
        builder.AddPartTitle(part, title);
    }
    inputs.mapper = std::move(builder).Build();
    DYNADIAG_LOG_DEBUG("mapper: " + std::to_string(inputs.mapper.ElementCount()) +
                       " elements, " + std::to_string(inputs.mapper.NodeCount()) + " nodes");
    return inputs;
}

std::vector<std::unique_ptr<Analyzer>> DiagnosisPipeline::DefaultAnalyzers() {
    std::vector<std::unique_ptr<Analyzer>> analyzers;
    analyzers.push_back(std::make_unique<EnergyAnalyzer>());
    analyzers.push_back(std::make_unique<TimestepAnalyzer>());
    analyzers.push_back(std::make_unique<ContactAnalyzer>());
    analyzers.push_back(std::make_unique<PerformanceAnalyzer>());
    analyzers.push_back(std::make_unique<ScalingProjector>());
    analyzers.push_back(std::make_unique<InstabilityAnalyzer>());
    analyzers.push_back(std::make_unique<FailureTracer>());
    analyzers.push_back(std::make_unique<WarningAnalyzer>());
    analyzers.push_back(std::make_unique<TerminationAnalyzer>());
    analyzers.push_back(std::make_unique<CoverageAnalyzer>());
    return analyzers;
}

std::vector<NamedResult>
DiagnosisPipeline::RunAnalyzers(const std::vector<std::unique_ptr<Analyzer>> &analyzers,
                                const AnalysisContext &ctx) {
    LogService::BufferedScope buffered(GetLogService());
    std::vector<std::future<AnalyzerResult>> futures;
    futures.reserve(analyzers.size());
    for (const auto &analyzer : analyzers) {
        const Analyzer *a = analyzer.get();
        futures.push_back(std::async(std::launch::async, [a, &ctx] {
            ThreadLogContext::Scope scope("analysis", a->Name());
            return a->Analyze(ctx);
        }));
    }
    std::vector<NamedResult> results;
    results.reserve(analyzers.size());
    for (std::size_t i = 0; i < analyzers.size(); ++i) {
        results.push_back(
            NamedResult{.analyzer = analyzers[i]->Name(), .result = futures[i].get()});
    }
    return results;
}

DiagnosisResult DiagnosisPipeline::Run(const fs::path &directory) {
    DiagnosisResult result;
    ErrorHandler errors(GetLogService());
    try {
        Progress("discover");
        auto bundle =
            RunBundle::Discover(directory, config_.message_scan_gap, config_.input_deck);
        token_.ThrowIfCancelled("discovery");

        Progress("read");
        auto inputs = ReadAll(bundle, errors);
        token_.ThrowIfCancelled("reading");

        Progress("analyze");
        AnalysisContext ctx{.data = inputs.data,
                            .mapper = inputs.mapper,
                            .knowledge = KnowledgeBase::Instance(),
                            .config = config_};
        auto results = RunAnalyzers(analyzers_ ? analyzers_() : DefaultAnalyzers(), ctx);
        token_.ThrowIfCancelled("analysis");

        Progress("aggregate");
        auto report = Aggregator::Aggregate(inputs.data, std::move(results));
        result.outcome = report.coverage.Degraded() ? Outcome::DegradedCoverage : Outcome::Success;
        result.report = std::move(report);
    } catch (const InputError &e) {
        DYNADIAG_LOG_ERROR(e.what());
        result.outcome = Outcome::FatalInput;
        result.missing = e.missing();
        result.message = e.what();
    } catch (const AggregationError &e) {
        DYNADIAG_LOG_ERROR(e.what());
        result.outcome = Outcome::FatalInput;
        result.message = e.what();
    } catch (const AbortedError &e) {
        DYNADIAG_LOG_WARN(e.what());
        result.outcome = Outcome::Aborted;
        result.message = e.what();
    } catch (const IOError &e) {
        DYNADIAG_LOG_ERROR(e.what());
        result.outcome = Outcome::FatalInput;
        result.message = e.what();
    } catch (const Error &e) {
        errors.Report(e, "pipeline");
        result.outcome = Outcome::FatalInput;
        result.message = e.what();
    } catch (const std::exception &e) {
        errors.Report(DiagnosticError{Severity::FATAL, e.what(), "pipeline"});
        result.outcome = Outcome::FatalInput;
        result.message = e.what();
    }
    return result;
}

} // namespace dynadiag
