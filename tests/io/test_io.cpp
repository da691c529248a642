/**
 * @file test_io.cpp
 * @brief Tests for console formatting, logging, error policy, configuration and discovery
 */

#include <dynadiag/io/ConfigLoader.hpp>
#include <dynadiag/io/Console.hpp>
#include <dynadiag/io/ErrorHandler.hpp>
#include <dynadiag/io/LogService.hpp>
#include <dynadiag/io/LogSink.hpp>
#include <dynadiag/io/RunBundle.hpp>
#include <dynadiag/io/report/AsciiTable.hpp>
#include <dynadiag/io/report/Banner.hpp>
#include <dynadiag/io/report/DiagnosisDebrief.hpp>

#include <Fixtures.hpp>
#include <TempRunDir.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace dynadiag;

namespace {

std::string ReadText(const std::filesystem::path &path) {
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

/// A LogService with one capturing sink, logging everything from Trace up
struct CapturingService {
    LogService service;
    std::vector<LogEntry> seen;

    CapturingService() {
        service.SetMinLevel(LogLevel::Trace);
        service.AddSink(LogSinks::Callback([this](const LogEntry &e) { seen.push_back(e); }));
    }
};

} // namespace

// =============================================================================
// Console
// =============================================================================

TEST(Console, ColorFollowsToggle) {
    Console console;
    EXPECT_EQ(console.IsColorEnabled(), console.IsTerminal());

    console.SetColorEnabled(false);
    EXPECT_EQ(console.Colorize("glstat", AnsiColor::Red), "glstat");

    console.SetColorEnabled(true);
    auto painted = console.Colorize("glstat", AnsiColor::Red);
    EXPECT_EQ(painted, std::string("\033[31m") + "glstat" + "\033[0m");
}

TEST(Console, Padding) {
    EXPECT_EQ(Console::PadRight("dt", 5), "dt   ");
    EXPECT_EQ(Console::PadRight("energy", 3), "energy");
    EXPECT_EQ(Console::PadLeft("42", 5), "   42");
    EXPECT_EQ(Console::PadCenter("ab", 7), "  ab   ");
}

TEST(Console, NumberFormatting) {
    EXPECT_EQ(Console::FormatNumber(3.14159), "3.14");
    EXPECT_EQ(Console::FormatNumber(12.4, 0), "12");
    EXPECT_EQ(Console::FormatScientific(1.5e-6), "1.500e-06");
    EXPECT_EQ(Console::FormatScientific(250.0, 1), "2.5e+02");
}

TEST(Console, BoxRuleCountsCodepoints) {
    auto rule = Console::BoxHorizontalRule(4);
    EXPECT_EQ(AsciiTable::DisplayWidth(rule), 4u);
    EXPECT_EQ(rule.size(), 12u);
}

TEST(Console, ParseLogLevel) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(ParseLogLevel("fatal"), LogLevel::Fatal);
    EXPECT_FALSE(ParseLogLevel("DEBUG").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

// =============================================================================
// LogEntry / LogContext
// =============================================================================

TEST(LogContext, FullPath) {
    EXPECT_EQ((LogContext{"reader", "glstat"}).FullPath(), "reader.glstat");
    EXPECT_EQ((LogContext{"pipeline", ""}).FullPath(), "pipeline");
    EXPECT_EQ((LogContext{"", "energy"}).FullPath(), "energy");
    EXPECT_FALSE(LogContext{}.IsSet());
}

TEST(LogEntry, FormatWithAndWithoutContext) {
    auto entry = LogEntry::Create(LogLevel::Warning, "skipped 3 records", {"reader", "nodout"});
    EXPECT_EQ(entry.Format(), "[WRN] [reader.nodout] skipped 3 records");
    EXPECT_EQ(entry.Format(false), "[WRN] skipped 3 records");

    auto bare = LogEntry::Create(LogLevel::Info, "done", LogContext{});
    EXPECT_EQ(bare.Format(), "[INF] done");
}

TEST(ThreadLogContext, ScopesNestAndRestore) {
    ThreadLogContext::Reset();
    {
        ThreadLogContext::Scope outer("reader", "glstat");
        EXPECT_EQ(ThreadLogContext::Current().FullPath(), "reader.glstat");
        {
            ThreadLogContext::Scope inner("analysis", "energy");
            EXPECT_EQ(ThreadLogContext::Current().FullPath(), "analysis.energy");
        }
        EXPECT_EQ(ThreadLogContext::Current().FullPath(), "reader.glstat");
    }
    EXPECT_FALSE(ThreadLogContext::Current().IsSet());
}

// =============================================================================
// LogService
// =============================================================================

TEST(LogService, ImmediateModeDeliversAtOnce) {
    CapturingService cap;
    EXPECT_TRUE(cap.service.IsImmediateMode());
    cap.service.Info("opened d3hsp");
    ASSERT_EQ(cap.seen.size(), 1u);
    EXPECT_EQ(cap.seen[0].message, "opened d3hsp");
    EXPECT_EQ(cap.service.PendingCount(), 0u);
}

TEST(LogService, BufferedScopeHoldsUntilExit) {
    CapturingService cap;
    {
        LogService::BufferedScope scope(cap.service);
        EXPECT_FALSE(cap.service.IsImmediateMode());
        cap.service.Debug("first");
        cap.service.Warning("second");
        EXPECT_TRUE(cap.seen.empty());
        EXPECT_EQ(cap.service.PendingCount(), 2u);
    }
    EXPECT_TRUE(cap.service.IsImmediateMode());
    EXPECT_EQ(cap.service.PendingCount(), 0u);
    ASSERT_EQ(cap.seen.size(), 2u);
    EXPECT_EQ(cap.seen[0].message, "first");
    EXPECT_EQ(cap.seen[1].message, "second");
}

TEST(LogService, MinLevelDropsEntries) {
    CapturingService cap;
    cap.service.SetMinLevel(LogLevel::Warning);
    cap.service.Info("dropped");
    cap.service.Error("kept");
    ASSERT_EQ(cap.seen.size(), 1u);
    EXPECT_EQ(cap.seen[0].level, LogLevel::Error);
}

TEST(LogService, SinkLevelFiltersPerSink) {
    LogService service;
    service.SetMinLevel(LogLevel::Trace);
    std::size_t all = 0;
    std::size_t errors = 0;
    service.AddSink(LogSinks::Callback([&all](const LogEntry &) { ++all; }));
    service.AddSink(LogSinks::Callback([&errors](const LogEntry &) { ++errors; }), LogLevel::Error);

    service.Debug("a");
    service.Warning("b");
    service.Error("c");
    EXPECT_EQ(all, 3u);
    EXPECT_EQ(errors, 1u);
}

TEST(LogService, CountsErrorsAndFatals) {
    LogService service;
    service.Error("one");
    service.Error("two");
    service.Fatal("three");
    service.Warning("not counted");
    EXPECT_EQ(service.ErrorCount(), 2u);
    EXPECT_EQ(service.FatalCount(), 1u);
    service.ResetErrorCounts();
    EXPECT_EQ(service.ErrorCount(), 0u);
}

TEST(LogService, UsesThreadContext) {
    CapturingService cap;
    {
        ThreadLogContext::Scope ctx("analysis", "contact");
        cap.service.Info("tagged");
    }
    ASSERT_EQ(cap.seen.size(), 1u);
    EXPECT_EQ(cap.seen[0].context.source, "contact");
}

// =============================================================================
// LogSinks
// =============================================================================

TEST(LogSinks, FileSinkAppendsFormattedLines) {
    fixtures::TempRunDir dir;
    auto path = dir.Path() / "run.log";

    LogService service;
    service.AddSink(LogSinks::File(path.string()));
    service.Log(LogLevel::Warning, "glstat truncated", {"reader", "glstat"});

    EXPECT_EQ(ReadText(path), "[WRN] [reader.glstat] glstat truncated\n");
}

TEST(LogSinks, JsonLinesEscapesText) {
    fixtures::TempRunDir dir;
    auto path = dir.Path() / "run.jsonl";

    LogService service;
    service.AddSink(LogSinks::JsonLines(path.string()));
    service.Log(LogLevel::Error, "bad \"value\"", {"reader", "nodout"});

    EXPECT_EQ(ReadText(path), "{\"level\":\"error\",\"stage\":\"reader\",\"source\":\"nodout\","
                              "\"message\":\"bad \\\"value\\\"\"}\n");
}

TEST(LogSinks, UnwritablePathThrows) {
    fixtures::TempRunDir dir;
    auto path = (dir.Path() / "no_such_dir" / "run.log").string();
    EXPECT_THROW((void)LogSinks::File(path), IOError);
    EXPECT_THROW((void)LogSinks::JsonLines(path), IOError);
}

TEST(LogSinks, ConfigureTakesLowestSinkLevel) {
    fixtures::TempRunDir dir;
    Console console;
    LogService service;

    auto config = LogConfig::Default();
    config.file_path = (dir.Path() / "run.log").string();
    config.file_level = LogLevel::Trace;
    LogSinks::Configure(service, console, config);
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Trace);

    LogSinks::Configure(service, console, LogConfig::Quiet());
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Error);

    LogSinks::Configure(service, console, LogConfig::Verbose());
    EXPECT_EQ(service.GetMinLevel(), LogLevel::Debug);
}

// =============================================================================
// ErrorHandler
// =============================================================================

TEST(ErrorHandler, DefaultPolicies) {
    LogService service;
    service.AddSink(LogSinks::Null());
    ErrorHandler handler(service);

    EXPECT_EQ(handler.Report(DiagnosticError{Severity::WARNING, "short file", "glstat"}),
              ErrorPolicy::Continue);
    EXPECT_EQ(handler.Report(IOError("read", "/run/matsum", "permission denied"), "matsum"),
              ErrorPolicy::Degrade);
    EXPECT_EQ(handler.Report(AbortedError("read")), ErrorPolicy::Abort);

    EXPECT_EQ(handler.GetErrorCount(Severity::ERROR), 1u);
    EXPECT_EQ(handler.GetErrorCount(Severity::INFO), 0u);
    EXPECT_EQ(service.ErrorCount(), 1u);
    EXPECT_EQ(service.FatalCount(), 1u);

    ASSERT_TRUE(handler.GetFatalError().has_value());
    EXPECT_EQ(handler.GetFatalError()->source, "abort");
}

TEST(ErrorHandler, CallbackOverridesPolicy) {
    LogService service;
    ErrorHandler handler(service);
    handler.SetPolicy(Severity::WARNING, ErrorPolicy::Degrade);
    EXPECT_EQ(handler.Report(DiagnosticError{Severity::WARNING, "x", "y"}), ErrorPolicy::Degrade);

    handler.SetCallback([](const DiagnosticError &) { return ErrorPolicy::Continue; });
    EXPECT_EQ(handler.Report(DiagnosticError{Severity::FATAL, "x", "y"}), ErrorPolicy::Continue);

    handler.Reset();
    EXPECT_FALSE(handler.GetFatalError().has_value());
    EXPECT_EQ(handler.GetErrorCount(Severity::WARNING), 0u);
}

TEST(ErrorHandler, SeverityToLogLevel) {
    EXPECT_EQ(ErrorHandler::SeverityToLogLevel(Severity::INFO), LogLevel::Info);
    EXPECT_EQ(ErrorHandler::SeverityToLogLevel(Severity::WARNING), LogLevel::Warning);
    EXPECT_EQ(ErrorHandler::SeverityToLogLevel(Severity::FATAL), LogLevel::Fatal);
}

// =============================================================================
// ConfigLoader
// =============================================================================

TEST(ConfigLoader, EmptyDocumentGivesDefaults) {
    auto cfg = io::ConfigLoader::Parse("");
    EXPECT_EQ(cfg.tracked_node_cap, 1000u);
    EXPECT_EQ(cfg.message_scan_gap, 8u);
    EXPECT_DOUBLE_EQ(cfg.comm_growth_exponent, 0.5);
    EXPECT_TRUE(cfg.outputs.terminal);
    EXPECT_FALSE(cfg.outputs.json);
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Info);
}

TEST(ConfigLoader, ReadsEverySection) {
    auto cfg = io::ConfigLoader::Parse(R"(
analysis:
  tracked_node_cap: 250
  message_scan_gap: 3
  zcr_window: 32
  damping_window: 16
  comm_growth_exponent: 1.0
  input_deck: main.k
outputs:
  terminal: false
  json: true
  json_path: out/report.json
logging:
  console_level: warn
  file_level: trace
  file: dynadiag.log
  quiet: true
)");
    EXPECT_EQ(cfg.tracked_node_cap, 250u);
    EXPECT_EQ(cfg.message_scan_gap, 3u);
    EXPECT_EQ(cfg.zcr_window, 32u);
    EXPECT_EQ(cfg.damping_window, 16u);
    EXPECT_DOUBLE_EQ(cfg.comm_growth_exponent, 1.0);
    EXPECT_EQ(cfg.input_deck, "main.k");
    EXPECT_FALSE(cfg.outputs.terminal);
    EXPECT_TRUE(cfg.outputs.json);
    EXPECT_EQ(cfg.outputs.json_path, "out/report.json");
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Warning);
    EXPECT_EQ(cfg.logging.file_level, LogLevel::Trace);
    EXPECT_EQ(cfg.logging.file_path, "dynadiag.log");
    EXPECT_TRUE(cfg.logging.quiet_mode);
}

TEST(ConfigLoader, VerboseForcesDebugConsole) {
    auto cfg = io::ConfigLoader::Parse(
        "analysis:\n  verbose: true\nlogging:\n  console_level: error\n");
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.logging.console_level, LogLevel::Debug);

    auto trace = io::ConfigLoader::Parse(
        "analysis:\n  verbose: true\nlogging:\n  console_level: trace\n");
    EXPECT_EQ(trace.logging.console_level, LogLevel::Trace);
}

TEST(ConfigLoader, WrongTypeNamesTheKey) {
    try {
        (void)io::ConfigLoader::Parse("analysis:\n  tracked_node_cap: lots\n");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("invalid value for 'analysis.tracked_node_cap'"),
                  std::string::npos);
        EXPECT_EQ(e.origin(), "<string>");
    }
}

TEST(ConfigLoader, RejectsOutOfRangeValues) {
    EXPECT_THROW((void)io::ConfigLoader::Parse("analysis:\n  tracked_node_cap: 0\n"), ConfigError);
    EXPECT_THROW((void)io::ConfigLoader::Parse("analysis:\n  zcr_window: 3\n"), ConfigError);
    EXPECT_THROW((void)io::ConfigLoader::Parse("analysis:\n  comm_growth_exponent: 2.5\n"),
                 ConfigError);
    EXPECT_THROW((void)io::ConfigLoader::Parse("logging:\n  console_level: loud\n"), ConfigError);
    EXPECT_THROW((void)io::ConfigLoader::Parse("- a\n- b\n"), ConfigError);
}

TEST(ConfigLoader, LoadFile) {
    fixtures::TempRunDir dir;
    auto path = dir.Write("dynadiag.yaml", "analysis:\n  zcr_window: 128\n");
    EXPECT_EQ(io::ConfigLoader::LoadFile(path.string()).zcr_window, 128u);

    try {
        (void)io::ConfigLoader::LoadFile((dir.Path() / "absent.yaml").string());
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string(e.what()).find("cannot open configuration file"), std::string::npos);
    }
}

// =============================================================================
// AsciiTable / Banner
// =============================================================================

TEST(AsciiTable, AlignsAndCutsCells) {
    AsciiTable table;
    table.AddColumn("ID", AsciiTable::Align::Right).AddColumn("TITLE", AsciiTable::Align::Left, 6);
    table.AddRow({"7", "bumper beam"});
    table.AddRow({"12", "door"});
    EXPECT_EQ(table.RowCount(), 2u);

    auto text = table.Render(2);
    EXPECT_NE(text.find("│  7 │ bumpe~ │"), std::string::npos) << text;
    EXPECT_NE(text.find("│ 12 │ door   │"), std::string::npos) << text;
    EXPECT_NE(text.find("│ ID │ TITLE  │"), std::string::npos) << text;
    EXPECT_EQ(text.rfind("  ┌", 0), 0u);
}

TEST(AsciiTable, EmptyWithoutColumns) { EXPECT_EQ(AsciiTable().Render(), ""); }

TEST(Banner, TitleAndSections) {
    auto title = Banner::GetTitle("0.3.0");
    EXPECT_NE(title.find("DYNADIAG 0.3.0 | LS-DYNA RUN DIAGNOSIS"), std::string::npos);
    EXPECT_EQ(Banner::GetRule(5, '-'), "-----");

    auto header = Banner::GetSectionHeader("CONTACT");
    EXPECT_EQ(header.rfind("─── [ CONTACT ] ", 0), 0u);
    EXPECT_EQ(AsciiTable::DisplayWidth(header), static_cast<std::size_t>(Banner::kWidth));
}

// =============================================================================
// DiagnosisDebrief
// =============================================================================

TEST(DiagnosisDebrief, GroupsFindingsBySeverity) {
    Report report;
    report.tool_version = "0.3.0";
    report.findings.push_back(
        FindingBuilder(FindingSeverity::Warning, "timestep", "Time step drop").Build());
    report.findings.push_back(FindingBuilder(FindingSeverity::Critical, "failure",
                                             "Negative volume in element 101")
                                  .Message("element 101 of part 1")
                                  .Recommendation("refine the mesh")
                                  .Occurrences(3)
                                  .Build());
    report.findings.push_back(
        FindingBuilder(FindingSeverity::Warning, "contact", "Contact warnings").Build());
    report.coverage.missing = {SourceKind::Glstat};

    Console console;
    console.SetColorEnabled(false);
    DiagnosisDebrief debrief(console);
    debrief.SetFindingLimit(1);
    auto text = debrief.Generate(report);

    EXPECT_NE(text.find("1 critical, 2 warning, 0 info"), std::string::npos) << text;
    auto critical = text.find("[CRITICAL] Negative volume in element 101 (x3)");
    auto warning = text.find("[WARNING] Time step drop");
    ASSERT_NE(critical, std::string::npos) << text;
    ASSERT_NE(warning, std::string::npos) << text;
    EXPECT_LT(critical, warning);
    EXPECT_NE(text.find("-> refine the mesh"), std::string::npos);
    EXPECT_NE(text.find("... and 1 more"), std::string::npos);
    EXPECT_EQ(text.find("Contact warnings"), std::string::npos);
    EXPECT_NE(text.find("COVERAGE"), std::string::npos);
    EXPECT_NE(text.find("glstat"), std::string::npos);
    EXPECT_EQ(text.find("\033["), std::string::npos);
}

TEST(DiagnosisDebrief, CompleteCoverageHasNoCoverageSection) {
    Report report;
    report.tool_version = "0.3.0";
    Console console;
    console.SetColorEnabled(false);
    auto text = DiagnosisDebrief(console).Generate(report);
    EXPECT_EQ(text.find("COVERAGE"), std::string::npos);
    EXPECT_EQ(text.find("MODEL"), std::string::npos);
}

// =============================================================================
// RunBundle
// =============================================================================

TEST(RunBundle, ScansMessageLogsUntilGap) {
    fixtures::TempRunDir dir;
    dir.Write("messag", "");
    dir.Write("mes0000", "");
    dir.Write("mes0002", "");
    dir.Write("mes0009", "");

    auto bundle = RunBundle::Discover(dir.Path(), 3);
    const auto &logs = bundle.MessageLogs();
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs[0].rank, kPrimaryRank);
    EXPECT_EQ(logs[1].rank, 0);
    EXPECT_EQ(logs[2].rank, 2);
    EXPECT_TRUE(bundle.Has(SourceKind::Messages));
    EXPECT_FALSE(bundle.Has(SourceKind::Hsp));

    auto wide = RunBundle::Discover(dir.Path(), 8);
    EXPECT_EQ(wide.MessageLogs().size(), 4u);
}

TEST(RunBundle, DeckSkipsIncludeFiles) {
    fixtures::TempRunDir dir;
    dir.Write("d3hsp", fixtures::HspNormalRun(4));
    dir.Write("include_mat.k", "*KEYWORD\n");
    dir.Write("car.k", fixtures::DeckText());
    dir.Write("dynain", "*KEYWORD\n");

    auto bundle = RunBundle::Discover(dir.Path(), 8);
    ASSERT_TRUE(bundle.PathOf(SourceKind::InputDeck).has_value());
    EXPECT_EQ(bundle.PathOf(SourceKind::InputDeck)->filename(), "car.k");

    dir.Remove("car.k");
    EXPECT_EQ(FindInputDeck(dir.Path())->filename(), "dynain");
    dir.Remove("dynain");
    EXPECT_FALSE(FindInputDeck(dir.Path()).has_value());
}

TEST(RunBundle, ExplicitDeckRelativeToDirectory) {
    fixtures::TempRunDir dir;
    dir.Write("d3hsp", fixtures::HspNormalRun(4));
    dir.Write("a.k", "*KEYWORD\n");
    dir.Write("main.dyn", fixtures::DeckText());

    auto bundle = RunBundle::Discover(dir.Path(), 8, "main.dyn");
    EXPECT_EQ(bundle.PathOf(SourceKind::InputDeck)->filename(), "main.dyn");

    auto absent = RunBundle::Discover(dir.Path(), 8, "other.k");
    EXPECT_FALSE(absent.Has(SourceKind::InputDeck));
}

TEST(RunBundle, MissingListsEveryAbsentSource) {
    fixtures::TempRunDir dir;
    dir.Write("d3hsp", fixtures::HspNormalRun(4));
    dir.Write("glstat", "");

    auto missing = RunBundle::Discover(dir.Path(), 8).Missing();
    EXPECT_EQ(std::find(missing.begin(), missing.end(), SourceKind::Glstat), missing.end());
    EXPECT_EQ(std::find(missing.begin(), missing.end(), SourceKind::Hsp), missing.end());
    EXPECT_NE(std::find(missing.begin(), missing.end(), SourceKind::Messages), missing.end());
    EXPECT_NE(std::find(missing.begin(), missing.end(), SourceKind::InputDeck), missing.end());
}

TEST(RunBundle, RequiredInputsMissing) {
    fixtures::TempRunDir dir;
    dir.Write("glstat", "");
    try {
        (void)RunBundle::Discover(dir.Path(), 8);
        FAIL() << "expected InputError";
    } catch (const InputError &e) {
        EXPECT_EQ(e.missing(), (std::vector<std::string>{"d3hsp", "messag", "mes0000"}));
        EXPECT_EQ(e.severity(), Severity::FATAL);
    }
    EXPECT_THROW((void)RunBundle::Discover(dir.Path() / "glstat", 8), InputError);
}
