#pragma once

/**
 * @file TempRunDir.hpp
 * @brief Scratch result directory for reader and pipeline tests
 */

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace dynadiag::fixtures {

/**
 * @brief A unique directory under the system temp path, removed on destruction
 *
 * Files written with Write() land directly inside it, so the directory can be
 * handed to RunBundle::Discover or DiagnosisPipeline::Run as-is.
 */
class TempRunDir {
  public:
    TempRunDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("dynadiag_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempRunDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempRunDir(const TempRunDir &) = delete;
    TempRunDir &operator=(const TempRunDir &) = delete;

    /// Write (or overwrite) one file in the directory
    std::filesystem::path Write(const std::string &name, const std::string &content) const {
        auto p = path_ / name;
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

    void Remove(const std::string &name) const {
        std::error_code ec;
        std::filesystem::remove(path_ / name, ec);
    }

    [[nodiscard]] const std::filesystem::path &Path() const { return path_; }

  private:
    std::filesystem::path path_;
};

} // namespace dynadiag::fixtures
