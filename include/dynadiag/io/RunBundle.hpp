#pragma once

/**
 * @file RunBundle.hpp
 * @brief Discovery of solver output files in a result directory
 */

#include <dynadiag/records/Records.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dynadiag {

namespace fs = std::filesystem;

/// One message log and the rank it belongs to
struct MessageLog {
    fs::path path;
    int rank = kPrimaryRank;
};

/**
 * @brief The set of result files found in one directory
 *
 * Discovery only checks existence. Files are opened later by the readers.
 */
class RunBundle {
  public:
    /**
     * @brief Scan a result directory
     *
     * @param directory     Result directory
     * @param scan_gap     Consecutive missing mesNNNN suffixes that end the scan
     * @param input_deck    Explicit deck path; empty to discover
     * @throws InputError   if the directory is unreadable, or neither d3hsp nor
     *                      any message log exists
     */
    static RunBundle Discover(const fs::path &directory, std::size_t scan_gap,
                              const std::string &input_deck = "");

    [[nodiscard]] const fs::path &Directory() const { return directory_; }

    [[nodiscard]] bool Has(SourceKind kind) const;

    /// Path for a single-file source; nullopt if missing
    [[nodiscard]] std::optional<fs::path> PathOf(SourceKind kind) const;

    /// messag first (if present), then mesNNNN in rank order
    [[nodiscard]] const std::vector<MessageLog> &MessageLogs() const { return messages_; }

    /// Sources that were looked for and not found
    [[nodiscard]] std::vector<SourceKind> Missing() const;

  private:
    fs::path directory_;
    std::map<SourceKind, fs::path> files_;
    std::vector<MessageLog> messages_;
};

/**
 * @brief Pick the input deck used for element-to-part mapping
 *
 * First *.k not starting with "include" (sorted), then dynain, then *.dyn.
 */
[[nodiscard]] std::optional<fs::path> FindInputDeck(const fs::path &directory);

} // namespace dynadiag
