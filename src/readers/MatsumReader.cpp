/**
 * @file MatsumReader.cpp
 * @brief matsum legend, state and material block parsing
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/MatsumReader.hpp>

#include <regex>

namespace dynadiag {

namespace {

const std::regex kLegendRow(R"(^\s*(\d+)\s+(.+?)\s*$)");
const std::regex kTime(R"(time\s*=\s*(\S+))");
const std::regex kMaterial(R"(mat\.#\s*=\s*(\d+))");

} // namespace

std::optional<MaterialSample> MatsumReader::TakeBlock() {
    if (!block_) {
        return std::nullopt;
    }
    auto out = std::move(block_);
    block_.reset();
    continuation_ = 0;
    if (bad_) {
        ++skipped_;
        DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                           " malformed material block skipped");
        bad_ = false;
        return std::nullopt;
    }
    return out;
}

bool MatsumReader::ApplyFields(const std::string &line) {
    auto pairs = text::ParseKeyValues(line);
    bool any = false;
    for (const auto &[key, raw] : pairs) {
        double *target = nullptr;
        auto &s = *block_;
        if (key == "inten") {
            target = &s.internal;
        } else if (key == "kinen") {
            target = &s.kinetic;
        } else if (key == "eroded_ie") {
            target = &s.eroded_internal;
        } else if (key == "eroded_ke") {
            target = &s.eroded_kinetic;
        } else if (key == "x-mom") {
            target = &s.momentum[0];
        } else if (key == "y-mom") {
            target = &s.momentum[1];
        } else if (key == "z-mom") {
            target = &s.momentum[2];
        } else if (key == "x-rbv") {
            target = &s.rigid_velocity[0];
        } else if (key == "y-rbv") {
            target = &s.rigid_velocity[1];
        } else if (key == "z-rbv") {
            target = &s.rigid_velocity[2];
        } else if (key == "hgeng") {
            target = &s.hourglass;
        } else if (key == "eroded_he") {
            target = &s.eroded_hourglass;
        }
        if (target == nullptr) {
            continue;
        }
        any = true;
        if (auto v = text::ParseDouble(raw)) {
            *target = *v;
        } else {
            bad_ = true;
        }
    }
    return any;
}

std::optional<MaterialSample> MatsumReader::Next() {
    if (done_) {
        return std::nullopt;
    }
    std::string line;
    while (source_.NextLine(line)) {
        if (text::Contains(line, "{BEGIN LEGEND}")) {
            in_legend_ = true;
            continue;
        }
        if (text::Contains(line, "{END LEGEND}")) {
            in_legend_ = false;
            continue;
        }
        if (in_legend_) {
            std::smatch m;
            if (std::regex_search(line, m, kLegendRow)) {
                if (auto id = text::ParseInt(m.str(1))) {
                    legend_[*id] = m.str(2);
                }
            }
            continue;
        }

        std::string_view trimmed = text::Trim(line);
        if (trimmed.starts_with("time")) {
            auto finished = TakeBlock();
            if (auto t = text::SearchDouble(line, kTime)) {
                state_ = seen_state_ ? state_ + 1 : 0;
                seen_state_ = true;
                time_ = *t;
            }
            if (finished) {
                return finished;
            }
            continue;
        }

        if (trimmed.starts_with("mat.#")) {
            auto finished = TakeBlock();
            std::smatch m;
            block_ = MaterialSample{};
            block_->cycle = state_;
            block_->time = time_;
            if (std::regex_search(line, m, kMaterial)) {
                block_->part = text::ParseInt(m.str(1)).value_or(0);
                auto it = legend_.find(block_->part);
                if (it != legend_.end()) {
                    block_->title = it->second;
                }
            } else {
                bad_ = true;
            }
            ApplyFields(line);
            if (finished) {
                return finished;
            }
            continue;
        }

        if (block_ && continuation_ < 3 && ApplyFields(line)) {
            ++continuation_;
            if (text::Contains(line, "hgeng")) {
                if (auto finished = TakeBlock()) {
                    return finished;
                }
            }
        }
    }
    done_ = true;
    return TakeBlock();
}

} // namespace dynadiag
