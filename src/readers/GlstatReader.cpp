/**
 * @file GlstatReader.cpp
 * @brief glstat block assembly
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/GlstatReader.hpp>

#include <regex>

namespace dynadiag {

void GlstatReader::Open(std::size_t line_no) {
    open_ = true;
    block_ = EnergySample{};
    seen_ = 0;
    bad_ = false;
    block_line_ = line_no;
}

std::optional<EnergySample> GlstatReader::Close() {
    if (!open_) {
        return std::nullopt;
    }
    open_ = false;
    if (seen_ == 0 && !bad_) {
        return std::nullopt;
    }
    if (bad_ || (seen_ & energy_fields::kAllRequired) != energy_fields::kAllRequired) {
        ++skipped_;
        DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(block_line_) +
                           " incomplete energy block skipped");
        return std::nullopt;
    }
    block_.ordinal = ordinal_++;
    return block_;
}

std::optional<EnergySample> GlstatReader::Next() {
    if (done_) {
        return std::nullopt;
    }
    std::string line;
    while (source_.NextLine(line)) {
        if (text::Contains(line, "dt of cycle")) {
            std::smatch m;
            auto finished = Close();
            Open(source_.LineNumber());
            if (std::regex_search(line, m, energy_fields::ControllingPattern())) {
                block_.cycle = text::ParseInt(m.str(1)).value_or(0);
                block_.controlling_kind = ParseElementKind(text::Lower(m.str(2)));
                block_.controlling_element = text::ParseInt(m.str(3)).value_or(0);
                block_.controlling_part = text::ParseInt(m.str(4)).value_or(0);
            }
            if (finished) {
                return finished;
            }
            continue;
        }

        std::smatch m;
        if (!std::regex_search(line, m, energy_fields::FieldPattern())) {
            continue;
        }
        std::string label = text::Lower(text::Trim(m.str(1)));
        std::optional<EnergySample> finished;
        if (label == "time" && (!open_ || (seen_ & energy_fields::kTime) != 0U)) {
            finished = Close();
            Open(source_.LineNumber());
        }
        if (!open_) {
            continue;
        }

        auto value = text::ParseDouble(m.str(2));
        EnergySample scratch;
        if (!value) {
            if (energy_fields::Apply(label, 0.0, scratch)) {
                bad_ = true;
            }
        } else if (auto bit = energy_fields::Apply(label, *value, block_)) {
            seen_ |= *bit;
        }
        if (finished) {
            return finished;
        }
    }
    done_ = true;
    return Close();
}

} // namespace dynadiag
