/**
 * @file BndoutReader.cpp
 * @brief bndout state headers and "nd#" force rows
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/BndoutReader.hpp>

#include <regex>

namespace dynadiag {

namespace {

const std::regex kStateTime(R"(\bt\s*=\s*(\S+))");
const std::regex kNode(R"(nd#\s+(\d+))");

} // namespace

std::optional<BoundaryForceSample> BndoutReader::Next() {
    std::string line;
    while (source_.NextLine(line)) {
        if (text::Contains(line, "n o d a l   f o r c e")) {
            if (auto t = text::SearchDouble(line, kStateTime)) {
                time_ = *t;
            }
            ++state_;
            continue;
        }
        if (!text::Trim(line).starts_with("nd#")) {
            continue;
        }

        auto node = text::SearchInt(line, kNode);
        if (!node) {
            ++skipped_;
            continue;
        }
        BoundaryForceSample sample;
        sample.node = *node;
        sample.cycle = state_ < 0 ? 0 : state_;
        sample.time = time_;

        bool ok = true;
        for (const auto &[key, raw] : text::ParseKeyValues(line)) {
            double *target = nullptr;
            if (key == "xforce") {
                target = &sample.force[0];
            } else if (key == "yforce") {
                target = &sample.force[1];
            } else if (key == "zforce") {
                target = &sample.force[2];
            } else if (key == "energy") {
                target = &sample.energy;
            } else if (key == "xmoment") {
                target = &sample.moment[0];
            } else if (key == "ymoment") {
                target = &sample.moment[1];
            } else if (key == "zmoment") {
                target = &sample.moment[2];
            }
            if (target == nullptr) {
                continue;
            }
            auto v = text::ParseDouble(raw);
            if (!v) {
                ok = false;
                break;
            }
            *target = *v;
        }
        if (!ok) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " unparsable force row");
            continue;
        }
        sample.ordinal = ordinal_++;
        return sample;
    }
    return std::nullopt;
}

} // namespace dynadiag
