/**
 * @file StatusReader.cpp
 * @brief status.out progress and estimate lines
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/StatusReader.hpp>

#include <regex>

namespace dynadiag {

namespace {

const std::regex kProgress(R"(^\s*(\d+)\s+t\s+(\S+)\s+dt\s+(\S+))");
const std::regex kCpuZone(R"(cpu time per zone cycle\.+\s+(\d+)\s+nanoseconds)");
const std::regex kAvgCpuZone(R"(average cpu time per zone cycle\.+\s+(\d+)\s+nanoseconds)");
const std::regex kAvgClockZone(R"(average clock time per zone cycle\.+\s+(\d+)\s+nanoseconds)");
const std::regex kEstTotalCpu(R"(estimated total cpu time\s+=\s+(\d+)\s+sec)");
const std::regex kEstCpuRemain(R"(estimated cpu time to complete\s+=\s+(\d+)\s+sec)");
const std::regex kEstTotalClock(R"(estimated total clock time\s+=\s+(\d+)\s+sec)");
const std::regex kEstClockRemain(R"(estimated clock time to complete\s+=\s+(\d+)\s+sec)");

bool Assign(const std::string &lower, const std::regex &re, double &target) {
    if (auto v = text::SearchDouble(lower, re)) {
        target = *v;
        return true;
    }
    return false;
}

} // namespace

bool StatusReader::ApplyEstimate(const std::string &lower) {
    if (text::Contains(lower, "per zone cycle")) {
        // "average" lines also contain the plain pattern; check them first
        if (text::Contains(lower, "average cpu")) {
            return Assign(lower, kAvgCpuZone, estimate_.avg_cpu_per_zone_ns);
        }
        if (text::Contains(lower, "average clock")) {
            return Assign(lower, kAvgClockZone, estimate_.avg_clock_per_zone_ns);
        }
        return Assign(lower, kCpuZone, estimate_.cpu_per_zone_ns);
    }
    if (!text::Contains(lower, "estimated")) {
        return false;
    }
    return Assign(lower, kEstTotalCpu, estimate_.est_total_cpu) ||
           Assign(lower, kEstCpuRemain, estimate_.est_remaining_cpu) ||
           Assign(lower, kEstTotalClock, estimate_.est_total_clock) ||
           Assign(lower, kEstClockRemain, estimate_.est_remaining_clock);
}

std::optional<StatusRecord> StatusReader::Next() {
    if (done_) {
        return std::nullopt;
    }
    std::string line;
    while (source_.NextLine(line)) {
        std::smatch m;
        if (std::regex_search(line, m, kProgress)) {
            auto cycle = text::ParseInt(m.str(1));
            auto time = text::ParseDouble(m.str(2));
            auto dt = text::ParseDouble(m.str(3));
            if (!cycle || !time || !dt) {
                ++skipped_;
                DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                                   " unparsable progress line");
                continue;
            }
            return CycleProgress{.cycle = *cycle, .time = *time, .dt = *dt};
        }
        if (ApplyEstimate(text::Lower(line))) {
            have_estimate_ = true;
        }
    }
    done_ = true;
    if (have_estimate_) {
        return estimate_;
    }
    return std::nullopt;
}

} // namespace dynadiag
