/**
 * @file MessageReader.cpp
 * @brief Message log event extraction
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/MessageReader.hpp>

#include <regex>

namespace dynadiag {

namespace {

const std::regex kPenetration(
    R"((\d+)\s+initial penetrations? (?:were|was) found for interface\s+(\d+))");
const std::regex kSummary(R"(Summary of warning messages for interface # =\s+(\d+))");
const std::regex kSummaryCount(R"(number of warning messages\s+=\s+(\d+))");
const std::regex kMemory(R"((?:expanding|allocating|contracting)\s+memory to\s+(\d+)\s+d\s+(\d+))");
const std::regex kNormal(R"(N o r m a l\s+t e r m i n a t i o n)");
const std::regex kError(R"(E r r o r\s+t e r m i n a t i o n)");

} // namespace

void MessageReader::Flush() {
    if (auto event = block_.Take()) {
        pending_.push_back(std::move(*event));
    }
}

void MessageReader::ProcessLine(const std::string &line) {
    const std::size_t line_no = source_.LineNumber();

    if (block_.Open()) {
        if (line.find("***") == std::string::npos && block_.AddContext(line)) {
            return;
        }
        Flush();
    }

    if (block_.TryBegin(line, SourceKind::Messages, rank_, line_no)) {
        return;
    }

    std::smatch m;
    if (pending_summary_) {
        if (std::regex_search(line, m, kSummaryCount)) {
            auto count = text::ParseInt(m.str(1));
            if (count) {
                pending_.push_back(InterfaceWarningCount{
                    .interface_id = *pending_summary_, .count = *count, .rank = rank_});
            } else {
                ++skipped_;
            }
            pending_summary_.reset();
            return;
        }
        if (!text::IsBlank(line)) {
            pending_summary_.reset();
        }
    }

    if (text::Contains(line, "Summary of warning")) {
        if (auto id = text::SearchInt(line, kSummary)) {
            pending_summary_ = *id;
        }
        return;
    }

    if (text::Contains(line, "initial penetration") && std::regex_search(line, m, kPenetration)) {
        auto count = text::ParseInt(m.str(1));
        auto id = text::ParseInt(m.str(2));
        if (count && id) {
            pending_.push_back(
                InitialPenetration{.interface_id = *id, .count = *count, .rank = rank_});
        } else {
            ++skipped_;
        }
        return;
    }

    if (text::Contains(line, "memory to") && std::regex_search(line, m, kMemory)) {
        if (auto words = text::ParseInt(m.str(2))) {
            pending_.push_back(MemoryRequest{.words = *words, .rank = rank_});
        }
        return;
    }

    if (text::Contains(line, "t e r m i n a t i o n")) {
        if (std::regex_search(line, kNormal)) {
            pending_.push_back(TerminationBanner{.kind = TerminationKind::Normal, .rank = rank_});
            return;
        }
        if (std::regex_search(line, kError)) {
            pending_.push_back(
                TerminationBanner{.kind = TerminationKind::ErrorTerminated, .rank = rank_});
            return;
        }
    }

    std::string lower = text::Lower(line);
    if (refs::IsNegativeVolume(lower) || refs::IsConstraintNan(lower)) {
        WarningEvent event;
        event.code = 0;
        event.kind = EventKind::Diagnostic;
        event.rank = rank_;
        event.message = std::string(text::Trim(line));
        event.source = SourceKind::Messages;
        event.line = line_no;
        refs::Extract(line, event);
        pending_.push_back(std::move(event));
    }
}

std::optional<MessageRecord> MessageReader::Next() {
    std::string line;
    while (pending_.empty() && !done_) {
        if (source_.NextLine(line)) {
            ProcessLine(line);
        } else {
            Flush();
            done_ = true;
        }
    }
    if (pending_.empty()) {
        return std::nullopt;
    }
    MessageRecord record = std::move(pending_.front());
    pending_.pop_front();
    return record;
}

} // namespace dynadiag
