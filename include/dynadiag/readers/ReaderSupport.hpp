#pragma once

/**
 * @file ReaderSupport.hpp
 * @brief Text helpers shared by the result-file readers
 */

#include <dynadiag/records/Records.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <concepts>
#include <cstdlib>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dynadiag {

// =============================================================================
// Reader concept
// =============================================================================

/**
 * @brief A lazy, forward-only, single-consumption record sequence
 */
template <typename R>
concept RecordReader = requires(R reader) {
    { reader.Next() };
    { reader.SkippedRecords() } -> std::convertible_to<std::size_t>;
    { reader.LinesRead() } -> std::convertible_to<std::size_t>;
};

/// Drain a reader into a callable, one record at a time
template <RecordReader R, typename F> void ForEachRecord(R &reader, F &&fn) {
    while (auto record = reader.Next()) {
        fn(std::move(*record));
    }
}

namespace text {

// =============================================================================
// Strings
// =============================================================================

[[nodiscard]] inline std::string_view Trim(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

[[nodiscard]] inline std::string Lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] inline bool Contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

[[nodiscard]] inline bool IsBlank(std::string_view s) { return Trim(s).empty(); }

[[nodiscard]] inline std::vector<std::string_view> SplitWhitespace(std::string_view s) {
    std::vector<std::string_view> tokens;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) {
            ++i;
        }
        std::size_t start = i;
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) == 0) {
            ++i;
        }
        if (i > start) {
            tokens.push_back(s.substr(start, i - start));
        }
    }
    return tokens;
}

[[nodiscard]] inline std::vector<std::string> SplitCsv(std::string_view s) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (char c : s) {
        if (c == '"') {
            quoted = !quoted;
        } else if (c == ',' && !quoted) {
            cells.emplace_back(Trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    cells.emplace_back(Trim(cell));
    return cells;
}

// =============================================================================
// Numbers
// =============================================================================

/**
 * @brief Parse a solver-printed real number
 *
 * Accepts Fortran exponents without the letter ("1.234-105").
 */
[[nodiscard]] inline std::optional<double> ParseDouble(std::string_view raw) {
    std::string_view s = Trim(raw);
    if (s.empty()) {
        return std::nullopt;
    }
    std::string buf(s);
    char *end = nullptr;
    errno = 0;
    double value = std::strtod(buf.c_str(), &end);
    if (end == buf.c_str()) {
        return std::nullopt;
    }
    if (*end == '+' || *end == '-') {
        auto pos = static_cast<std::size_t>(end - buf.c_str());
        buf.insert(pos, "E");
        errno = 0;
        value = std::strtod(buf.c_str(), &end);
    }
    if (*end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] inline std::optional<std::int64_t> ParseInt(std::string_view raw) {
    std::string_view s = Trim(raw);
    if (s.empty()) {
        return std::nullopt;
    }
    if (s.front() == '+') {
        s.remove_prefix(1);
    }
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

/// ParseInt narrowed to int; nullopt when the value does not fit
[[nodiscard]] inline std::optional<int> ParseInt32(std::string_view raw) {
    auto value = ParseInt(raw);
    if (!value || *value < std::numeric_limits<int>::min() ||
        *value > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

/// First capture of a regex search parsed as a real number
[[nodiscard]] inline std::optional<double> SearchDouble(const std::string &line,
                                                        const std::regex &re) {
    std::smatch m;
    if (std::regex_search(line, m, re)) {
        return ParseDouble(m.str(1));
    }
    return std::nullopt;
}

/// First capture of a regex search parsed as an integer
[[nodiscard]] inline std::optional<std::int64_t> SearchInt(const std::string &line,
                                                           const std::regex &re) {
    std::smatch m;
    if (std::regex_search(line, m, re)) {
        return ParseInt(m.str(1));
    }
    return std::nullopt;
}

/**
 * @brief Split "key= value key2= value2" into pairs
 *
 * Keys are the whitespace-delimited token immediately before each '='.
 * Values are the first token after it.
 */
[[nodiscard]] inline std::vector<std::pair<std::string, std::string>>
ParseKeyValues(std::string_view line) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t pos = 0;
    while ((pos = line.find('=', pos)) != std::string_view::npos) {
        std::size_t key_end = pos;
        while (key_end > 0 && line[key_end - 1] == ' ') {
            --key_end;
        }
        std::size_t key_begin = key_end;
        while (key_begin > 0 && line[key_begin - 1] != ' ' && line[key_begin - 1] != '=') {
            --key_begin;
        }
        std::size_t val_begin = pos + 1;
        while (val_begin < line.size() && line[val_begin] == ' ') {
            ++val_begin;
        }
        std::size_t val_end = val_begin;
        while (val_end < line.size() && line[val_end] != ' ') {
            ++val_end;
        }
        out.emplace_back(std::string(line.substr(key_begin, key_end - key_begin)),
                         std::string(line.substr(val_begin, val_end - val_begin)));
        pos = val_end > pos ? val_end : pos + 1;
    }
    return out;
}

/// Rank from a zero-padded "mesNNNN" file name, or nullopt
[[nodiscard]] inline std::optional<int> RankFromMessageName(std::string_view name) {
    if (name.size() != 7 || name.substr(0, 3) != "mes") {
        return std::nullopt;
    }
    auto rank = ParseInt32(name.substr(3));
    if (!rank || *rank < 0) {
        return std::nullopt;
    }
    return rank;
}

} // namespace text

// =============================================================================
// Energy fields (shared by the global-statistics and high-speed-printer readers)
// =============================================================================

namespace energy_fields {

/// Bits for the fields every energy block must carry
enum Required : unsigned {
    kTime = 1U << 0,
    kKinetic = 1U << 1,
    kInternal = 1U << 2,
    kTotal = 1U << 3,
    kAllRequired = kTime | kKinetic | kInternal | kTotal
};

/// "label.......   value"
inline const std::regex &FieldPattern() {
    static const std::regex re(R"(^\s*([A-Za-z][\w\s/().#-]*?)\s*\.{2,}\s*(\S+)\s*$)");
    return re;
}

/// "dt of cycle N is controlled by solid E of part P"
inline const std::regex &ControllingPattern() {
    static const std::regex re(
        R"(dt of cycle\s+(\d+)\s+is controlled by\s+(\w+)\s+(\d+)\s+of part\s+(\d+))");
    return re;
}

/**
 * @brief Route one labelled value into a sample
 *
 * Labels are matched in a fixed precedence order (first match wins) so that
 * "eroded kinetic energy" never lands in "kinetic" and "time step" never in
 * "time". Returns the Required bit satisfied, 0 for optional fields, or
 * nullopt if the label is not an energy field.
 */
inline std::optional<unsigned> Apply(const std::string &label, double value,
                                     EnergySample &sample) {
    using text::Contains;
    if (Contains(label, "total energy / initial energy") ||
        Contains(label, "total energy/initial")) {
        sample.ratio = value;
        return 0U;
    }
    if (Contains(label, "energy ratio w/o eroded")) {
        sample.ratio_without_eroded = value;
        return 0U;
    }
    if (Contains(label, "eroded kinetic")) {
        sample.eroded_kinetic = value;
        return 0U;
    }
    if (Contains(label, "eroded internal")) {
        sample.eroded_internal = value;
        return 0U;
    }
    if (Contains(label, "eroded hourglass")) {
        sample.eroded_hourglass = value;
        return 0U;
    }
    if (Contains(label, "spring and damper")) {
        sample.spring_damper = value;
        return 0U;
    }
    if (Contains(label, "sliding interface")) {
        sample.sliding = value;
        return 0U;
    }
    if (Contains(label, "system damping")) {
        sample.system_damping = value;
        return 0U;
    }
    if (Contains(label, "time per zone cycle")) {
        sample.zone_cycle_ns = value;
        return 0U;
    }
    if (Contains(label, "kinetic energy")) {
        sample.kinetic = value;
        return static_cast<unsigned>(kKinetic);
    }
    if (Contains(label, "internal energy")) {
        sample.internal = value;
        return static_cast<unsigned>(kInternal);
    }
    if (Contains(label, "hourglass energy")) {
        sample.hourglass = value;
        return 0U;
    }
    if (Contains(label, "total energy")) {
        sample.total = value;
        return static_cast<unsigned>(kTotal);
    }
    if (Contains(label, "external work")) {
        sample.external_work = value;
        return 0U;
    }
    if (Contains(label, "global x velocity")) {
        sample.velocity[0] = value;
        return 0U;
    }
    if (Contains(label, "global y velocity")) {
        sample.velocity[1] = value;
        return 0U;
    }
    if (Contains(label, "global z velocity")) {
        sample.velocity[2] = value;
        return 0U;
    }
    if (Contains(label, "time step")) {
        sample.dt = value;
        return 0U;
    }
    if (label == "time") {
        sample.time = value;
        return static_cast<unsigned>(kTime);
    }
    return std::nullopt;
}

} // namespace energy_fields

// =============================================================================
// Warning context references
// =============================================================================

namespace refs {

/**
 * @brief Mine a warning/error message line for entity references
 *
 * Fills only fields that are still empty, so the first mention wins.
 */
inline void Extract(const std::string &line, WarningEvent &event) {
    std::string lower = text::Lower(line);
    if (!event.interface_id && text::Contains(lower, "interface")) {
        static const std::regex re(R"(interface\s*(?:#|id|number|no\.?)?\s*=?\s*(\d+))");
        if (auto v = text::SearchInt(lower, re)) {
            event.interface_id = *v;
        }
    }
    if (!event.element && text::Contains(lower, "element")) {
        static const std::regex re(R"(element\s*(?:#|id|number|no\.?)?\s*=?\s*(\d+))");
        if (auto v = text::SearchInt(lower, re)) {
            event.element = *v;
        }
    }
    if (!event.node && text::Contains(lower, "node")) {
        static const std::regex re(R"(node\s*(?:#|id|number|no\.?)?\s*=?\s*(\d+))");
        if (auto v = text::SearchInt(lower, re)) {
            event.node = *v;
        }
    }
    if (!event.part && text::Contains(lower, "part")) {
        static const std::regex re(R"(\bpart\s*(?:#|id|number|no\.?)?\s*=?\s*(\d+))");
        if (auto v = text::SearchInt(lower, re)) {
            event.part = *v;
        }
    }
    if (!event.cycle && text::Contains(lower, "cycle")) {
        static const std::regex re(R"(cycle\s*(?:#|number)?\s*=?\s*(\d+))");
        if (auto v = text::SearchInt(lower, re)) {
            event.cycle = *v;
        }
    }
}

/// True if the message text describes a negative-volume condition
[[nodiscard]] inline bool IsNegativeVolume(std::string_view lower_text) {
    return text::Contains(lower_text, "negative volume");
}

/// True if the message text describes a NaN in the constraint matrix
[[nodiscard]] inline bool IsConstraintNan(std::string_view lower_text) {
    return text::Contains(lower_text, "constraint matrix") && text::Contains(lower_text, "nan");
}

} // namespace refs

// =============================================================================
// Warning block capture (shared by the d3hsp and message readers)
// =============================================================================

/**
 * @brief Collects one "*** Warning/Error N" block with up to five context lines
 */
class WarningBlock {
  public:
    static constexpr std::size_t kContextLines = 5;

    /**
     * @brief Start a block if the line is a coded warning/error header
     *
     * A header whose code does not fit an int is consumed and counted in
     * Skipped() without opening a block.
     */
    bool TryBegin(const std::string &line, SourceKind source, int rank, std::size_t line_no) {
        if (line.find("***") == std::string::npos) {
            return false;
        }
        static const std::regex re(R"(^\s*\*\*\*\s+(Warning|Error)\s+(\d+)\s*(.*)$)",
                                   std::regex::icase);
        std::smatch m;
        if (!std::regex_search(line, m, re)) {
            return false;
        }
        auto code = text::ParseInt32(m.str(2));
        if (!code) {
            ++skipped_;
            return true;
        }
        WarningEvent event;
        event.kind = text::Lower(m.str(1)) == "error" ? EventKind::Error : EventKind::Warning;
        event.code = *code;
        event.message = std::string(text::Trim(m.str(3)));
        event.rank = rank;
        event.source = source;
        event.line = line_no;
        refs::Extract(event.message, event);
        current_ = std::move(event);
        context_ = 0;
        return true;
    }

    /**
     * @brief Feed a line following the header
     * @return true if the line was consumed as context
     */
    bool AddContext(const std::string &line) {
        if (!current_) {
            return false;
        }
        if (text::IsBlank(line) || context_ >= kContextLines) {
            return false;
        }
        ++context_;
        std::string_view trimmed = text::Trim(line);
        if (!current_->message.empty()) {
            current_->message += ' ';
        }
        current_->message.append(trimmed);
        refs::Extract(line, *current_);
        return true;
    }

    [[nodiscard]] bool Open() const { return current_.has_value(); }

    [[nodiscard]] std::size_t Skipped() const { return skipped_; }

    /// Close the block and hand out the event
    std::optional<WarningEvent> Take() {
        auto out = std::move(current_);
        current_.reset();
        context_ = 0;
        return out;
    }

  private:
    std::optional<WarningEvent> current_;
    std::size_t context_ = 0;
    std::size_t skipped_ = 0;
};

} // namespace dynadiag
