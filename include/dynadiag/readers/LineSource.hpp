#pragma once

/**
 * @file LineSource.hpp
 * @brief Forward-only line stream over one result file
 *
 * Holds one line of buffer. Polls the cancellation token before every line
 * and releases the file handle as soon as the end is reached or Close() is
 * called.
 */

#include <dynadiag/core/CoreTypes.hpp>
#include <dynadiag/core/Error.hpp>

#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <sstream>
#include <string>

namespace dynadiag {

class LineSource {
  public:
    /// Open a file. Throws IOError if it cannot be opened.
    LineSource(const std::filesystem::path &path, CancellationToken token = {})
        : label_(path.filename().string()), token_(std::move(token)) {
        auto file = std::make_unique<std::ifstream>(path, std::ios::in | std::ios::binary);
        if (!file->is_open()) {
            throw IOError("open", path.string(), "cannot open for reading");
        }
        stream_ = std::move(file);
    }

    /// Wrap an existing stream (in-memory content in tests)
    LineSource(std::unique_ptr<std::istream> stream, std::string label,
               CancellationToken token = {})
        : stream_(std::move(stream)), label_(std::move(label)), token_(std::move(token)) {}

    /// Convenience for in-memory text
    static LineSource FromString(const std::string &text, std::string label,
                                 CancellationToken token = {}) {
        return LineSource(std::make_unique<std::istringstream>(text), std::move(label),
                          std::move(token));
    }

    LineSource(LineSource &&) noexcept = default;
    LineSource &operator=(LineSource &&) noexcept = default;
    LineSource(const LineSource &) = delete;
    LineSource &operator=(const LineSource &) = delete;

    /**
     * @brief Read the next line, without its terminator
     * @return false at end of input
     * @throws AbortedError if cancellation was requested
     */
    bool NextLine(std::string &line) {
        if (token_.IsCancelled()) {
            Close();
            throw AbortedError("reading " + label_);
        }
        if (!stream_) {
            return false;
        }
        if (!std::getline(*stream_, line)) {
            Close();
            return false;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ++line_number_;
        return true;
    }

    /// 1-based number of the line last returned
    [[nodiscard]] std::size_t LineNumber() const { return line_number_; }

    [[nodiscard]] const std::string &Label() const { return label_; }

    void Close() { stream_.reset(); }

  private:
    std::unique_ptr<std::istream> stream_;
    std::string label_;
    CancellationToken token_;
    std::size_t line_number_ = 0;
};

} // namespace dynadiag
