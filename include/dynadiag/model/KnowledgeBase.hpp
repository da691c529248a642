#pragma once

/**
 * @file KnowledgeBase.hpp
 * @brief Catalogue of solver warning and error codes
 *
 * Process-wide and immutable. Unknown codes resolve to a generic
 * "uncatalogued" entry whose severity follows the code range.
 */

#include <dynadiag/analysis/Finding.hpp>

#include <string>
#include <unordered_map>

namespace dynadiag {

struct CodeInfo {
    int code = 0;
    std::string category;
    FindingSeverity severity = FindingSeverity::Warning;
    std::string title;
    std::string description;
    std::string recommendation;
    bool catalogued = false;
};

class KnowledgeBase {
  public:
    /// The shared instance, built on first use
    static const KnowledgeBase &Instance();

    /// Never fails; unknown codes get a range-based fallback
    [[nodiscard]] CodeInfo Lookup(int code) const;

    [[nodiscard]] bool Contains(int code) const { return entries_.contains(code); }
    [[nodiscard]] std::size_t Size() const { return entries_.size(); }

    KnowledgeBase(const KnowledgeBase &) = delete;
    KnowledgeBase &operator=(const KnowledgeBase &) = delete;

  private:
    KnowledgeBase();

    std::unordered_map<int, CodeInfo> entries_;
};

} // namespace dynadiag
