#pragma once

/**
 * @file CoreTypes.hpp
 * @brief Core type definitions, version info and cancellation for dynadiag
 */

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <dynadiag/core/Error.hpp>

namespace dynadiag {

// =============================================================================
// Version
// =============================================================================

#ifndef DYNADIAG_VERSION_MAJOR
#define DYNADIAG_VERSION_MAJOR 0
#endif
#ifndef DYNADIAG_VERSION_MINOR
#define DYNADIAG_VERSION_MINOR 3
#endif
#ifndef DYNADIAG_VERSION_PATCH
#define DYNADIAG_VERSION_PATCH 0
#endif

[[nodiscard]] inline std::string Version() {
    return std::to_string(DYNADIAG_VERSION_MAJOR) + "." + std::to_string(DYNADIAG_VERSION_MINOR) +
           "." + std::to_string(DYNADIAG_VERSION_PATCH);
}

// =============================================================================
// Identifiers
// =============================================================================

using ElementId = std::int64_t;
using PartId = std::int64_t;
using NodeId = std::int64_t;
using InterfaceId = std::int64_t;
using Cycle = std::int64_t;

/// Rank tag of the primary message log (messag), which is not per-process
constexpr int kPrimaryRank = -1;

// =============================================================================
// Cancellation
// =============================================================================

/**
 * @brief Cooperative cancellation flag shared between the caller and the pipeline
 *
 * Copies share one flag. Readers poll it between records; RequestCancel() is
 * safe to call from a signal handler.
 */
class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void RequestCancel() const { flag_->store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool IsCancelled() const { return flag_->load(std::memory_order_relaxed); }

    /// Throw AbortedError if cancellation was requested
    void ThrowIfCancelled(const std::string &where) const {
        if (IsCancelled()) {
            throw AbortedError(where);
        }
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace dynadiag
