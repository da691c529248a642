/**
 * @file RunBundle.cpp
 * @brief Result directory probing
 */

#include <dynadiag/core/Error.hpp>
#include <dynadiag/io/LogService.hpp>
#include <dynadiag/io/RunBundle.hpp>

#include <algorithm>
#include <cstdio>
#include <system_error>

namespace dynadiag {

namespace {

struct FixedName {
    SourceKind kind;
    const char *name;
};

constexpr FixedName kFixedNames[] = {
    {SourceKind::Hsp, "d3hsp"},
    {SourceKind::Glstat, "glstat"},
    {SourceKind::Status, "status.out"},
    {SourceKind::Matsum, "matsum"},
    {SourceKind::Nodout, "nodout"},
    {SourceKind::Bndout, "bndout"},
    {SourceKind::LoadProfile, "load_profile.csv"},
    {SourceKind::ContactProfile, "cont_profile.csv"},
};

bool IsRegularFile(const fs::path &p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

std::string MessageName(int rank) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "mes%04d", rank);
    return buf;
}

std::vector<fs::path> SortedWithExtension(const fs::path &directory, const std::string &ext) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        const auto &p = it->path();
        if (p.extension() == ext && IsRegularFile(p)) {
            out.push_back(p);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

std::optional<fs::path> FindInputDeck(const fs::path &directory) {
    for (const auto &p : SortedWithExtension(directory, ".k")) {
        if (!p.filename().string().starts_with("include")) {
            return p;
        }
    }
    if (IsRegularFile(directory / "dynain")) {
        return directory / "dynain";
    }
    auto dyn = SortedWithExtension(directory, ".dyn");
    if (!dyn.empty()) {
        return dyn.front();
    }
    return std::nullopt;
}

RunBundle RunBundle::Discover(const fs::path &directory, std::size_t scan_gap,
                              const std::string &input_deck) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw InputError::NotADirectory(directory.string());
    }

    RunBundle bundle;
    bundle.directory_ = directory;

    for (const auto &f : kFixedNames) {
        auto p = directory / f.name;
        if (IsRegularFile(p)) {
            bundle.files_[f.kind] = p;
        }
    }

    if (IsRegularFile(directory / "messag")) {
        bundle.messages_.push_back(MessageLog{.path = directory / "messag", .rank = kPrimaryRank});
    }
    std::size_t misses = 0;
    for (int rank = 0; rank <= 9999 && misses < scan_gap; ++rank) {
        auto p = directory / MessageName(rank);
        if (IsRegularFile(p)) {
            bundle.messages_.push_back(MessageLog{.path = p, .rank = rank});
            misses = 0;
        } else {
            ++misses;
        }
    }

    if (!input_deck.empty()) {
        fs::path deck(input_deck);
        if (deck.is_relative() && !IsRegularFile(deck)) {
            deck = directory / deck;
        }
        if (IsRegularFile(deck)) {
            bundle.files_[SourceKind::InputDeck] = deck;
        } else {
            DYNADIAG_LOG_WARN("configured input deck '" + input_deck + "' not found");
        }
    } else if (auto deck = FindInputDeck(directory)) {
        bundle.files_[SourceKind::InputDeck] = *deck;
    }

    if (!bundle.Has(SourceKind::Hsp) && bundle.messages_.empty()) {
        throw InputError(directory.string(), {"d3hsp", "messag", "mes0000"});
    }

    DYNADIAG_LOG_DEBUG("discovered " + std::to_string(bundle.files_.size()) + " files and " +
                       std::to_string(bundle.messages_.size()) + " message logs in " +
                       directory.string());
    return bundle;
}

bool RunBundle::Has(SourceKind kind) const {
    if (kind == SourceKind::Messages) {
        return !messages_.empty();
    }
    return files_.contains(kind);
}

std::optional<fs::path> RunBundle::PathOf(SourceKind kind) const {
    auto it = files_.find(kind);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<SourceKind> RunBundle::Missing() const {
    std::vector<SourceKind> out;
    for (auto kind : kAllSources) {
        if (!Has(kind)) {
            out.push_back(kind);
        }
    }
    return out;
}

} // namespace dynadiag
