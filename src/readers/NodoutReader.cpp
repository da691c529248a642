/**
 * @file NodoutReader.cpp
 * @brief nodout state headers and nodal rows
 */

#include <dynadiag/io/LogService.hpp>
#include <dynadiag/readers/NodoutReader.hpp>

#include <regex>

namespace dynadiag {

namespace {

const std::regex kStateStep(R"(t i m e\s+s t e p\s+(\d+))");
const std::regex kStateTime(R"(\(\s*at time\s+(\S+)\s*\))");
constexpr std::size_t kColumns = 13;

} // namespace

std::optional<NodalSample> NodoutReader::Next() {
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
            continue;
        }
        if (text::Contains(line, "n o d a l   p r i n t   o u t")) {
            if (auto step = text::SearchInt(line, kStateStep)) {
                state_ = *step;
            }
            if (auto t = text::SearchDouble(line, kStateTime)) {
                time_ = *t;
            }
            continue;
        }

        auto cols = text::SplitWhitespace(line);
        if (cols.size() < kColumns) {
            continue;
        }
        auto node = text::ParseInt(cols[0]);
        if (!node) {
            continue; // column header row
        }
        if (!tracked_.contains(*node) && tracked_.size() >= node_cap_) {
            continue;
        }

        NodalSample sample;
        sample.node = *node;
        sample.cycle = state_;
        sample.time = time_;
        Vec3 *groups[] = {&sample.displacement, &sample.velocity, &sample.acceleration,
                          &sample.coordinate};
        bool ok = true;
        for (std::size_t g = 0; g < 4 && ok; ++g) {
            for (std::size_t c = 0; c < 3; ++c) {
                auto v = text::ParseDouble(cols[1 + g * 3 + c]);
                if (!v) {
                    ok = false;
                    break;
                }
                (*groups[g])[c] = *v;
            }
        }
        if (!ok) {
            ++skipped_;
            DYNADIAG_LOG_DEBUG(source_.Label() + ":" + std::to_string(source_.LineNumber()) +
                               " unparsable nodal row");
            continue;
        }
        tracked_.insert(*node);
        sample.ordinal = ordinal_++;
        return sample;
    }
    return std::nullopt;
}

} // namespace dynadiag
