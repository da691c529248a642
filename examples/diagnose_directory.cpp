#include <dynadiag/dynadiag.hpp>

#include <iostream>

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <result_dir>" << std::endl;
        return 1;
    }

    std::cout << "=== dynadiag library walkthrough ===" << std::endl;
    std::cout << "Version: " << dynadiag::Version() << std::endl;
    std::cout << std::endl;

    // Defaults: terminal output only, info-level logging
    auto config = dynadiag::AnalysisConfig::Default();
    dynadiag::DiagnosisPipeline pipeline(config);
    pipeline.SetProgressCallback(
        [](const std::string &phase) { std::cout << "  phase: " << phase << std::endl; });

    auto result = pipeline.Run(argv[1]);
    std::cout << "Outcome: " << dynadiag::OutcomeName(result.outcome) << std::endl;
    if (!result.report) {
        std::cout << "  " << result.message << std::endl;
        return dynadiag::ExitCode(result.outcome);
    }

    const auto &report = *result.report;
    std::cout << "Findings: " << report.findings.size() << std::endl;
    std::cout << "  critical: " << report.Count(dynadiag::FindingSeverity::Critical) << std::endl;
    std::cout << "  warning:  " << report.Count(dynadiag::FindingSeverity::Warning) << std::endl;
    std::cout << "  info:     " << report.Count(dynadiag::FindingSeverity::Info) << std::endl;
    std::cout << std::endl;

    // Most severe first
    using dynadiag::FindingSeverity;
    for (auto severity : {FindingSeverity::Critical, FindingSeverity::Warning}) {
        for (const auto &f : report.findings) {
            if (f.severity == severity) {
                std::cout << "[" << dynadiag::FindingSeverityName(f.severity) << "] " << f.title
                          << " (" << f.analyzer << ")" << std::endl;
            }
        }
    }

    if (report.coverage.Degraded()) {
        std::cout << std::endl << "Missing inputs:";
        for (auto source : report.coverage.missing) {
            std::cout << " " << dynadiag::SourceName(source);
        }
        std::cout << std::endl;
    }
    return dynadiag::ExitCode(result.outcome);
}
