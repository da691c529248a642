/**
 * @file ProfileReader.cpp
 * @brief CSV timing profile parsing
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/ProfileReader.hpp>

namespace dynadiag {

namespace {

bool IsAbsoluteHeader(std::string_view line) {
    return text::Contains(line, "\"Clock (seconds)\"");
}

} // namespace

// =============================================================================
// load_profile.csv
// =============================================================================

std::optional<ProcessorLoadSample> LoadProfileReader::Next() {
    std::string line;
    while (pending_.empty() && !absolute_done_ && source_.NextLine(line)) {
        std::string_view trimmed = text::Trim(line);
        if (trimmed.empty()) {
            if (in_absolute_ && rank_ > 0) {
                in_absolute_ = false;
                absolute_done_ = true;
            }
            continue;
        }
        if (IsAbsoluteHeader(trimmed)) {
            in_absolute_ = true;
            rank_ = 0;
            continue;
        }
        if (!in_absolute_ || trimmed.front() == '"' || trimmed.starts_with("Solids")) {
            continue;
        }

        auto cells = text::SplitCsv(trimmed);
        if (cells.size() < kLoadProfileComponents.size()) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " short profile row");
            continue;
        }
        std::vector<ProcessorLoadSample> row;
        row.reserve(kLoadProfileComponents.size());
        for (std::size_t i = 0; i < kLoadProfileComponents.size(); ++i) {
            auto v = text::ParseDouble(cells[i]);
            if (!v) {
                row.clear();
                break;
            }
            row.push_back(ProcessorLoadSample{
                .component = kLoadProfileComponents[i], .rank = rank_, .seconds = *v});
        }
        if (row.empty()) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " unparsable profile row");
        } else {
            pending_.insert(pending_.end(), row.begin(), row.end());
        }
        ++rank_;
    }
    if (pending_.empty()) {
        source_.Close();
        return std::nullopt;
    }
    auto sample = std::move(pending_.front());
    pending_.pop_front();
    return sample;
}

// =============================================================================
// cont_profile.csv
// =============================================================================

std::optional<ContactProfileSample> ContactProfileReader::Next() {
    std::string line;
    while (pending_.empty() && !absolute_done_ && source_.NextLine(line)) {
        std::string_view trimmed = text::Trim(line);
        if (trimmed.empty()) {
            if (in_absolute_ && rank_ > 0) {
                in_absolute_ = false;
                absolute_done_ = true;
            }
            continue;
        }
        if (IsAbsoluteHeader(trimmed)) {
            in_absolute_ = true;
            rank_ = 0;
            interfaces_.clear();
            continue;
        }
        if (!in_absolute_ || trimmed.front() == '"') {
            continue;
        }

        auto cells = text::SplitCsv(trimmed);
        if (interfaces_.empty()) {
            for (const auto &cell : cells) {
                if (auto id = text::ParseInt(cell)) {
                    interfaces_.push_back(*id);
                }
            }
            continue;
        }
        bool ok = cells.size() >= interfaces_.size();
        std::vector<ContactProfileSample> row;
        for (std::size_t i = 0; ok && i < interfaces_.size(); ++i) {
            auto v = text::ParseDouble(cells[i]);
            if (!v) {
                ok = false;
                break;
            }
            row.push_back(
                ContactProfileSample{.interface_id = interfaces_[i], .rank = rank_, .seconds = *v});
        }
        if (!ok) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " unparsable contact profile row");
        } else {
            pending_.insert(pending_.end(), row.begin(), row.end());
        }
        ++rank_;
    }
    if (pending_.empty()) {
        source_.Close();
        return std::nullopt;
    }
    auto sample = std::move(pending_.front());
    pending_.pop_front();
    return sample;
}

} // namespace dynadiag
