#pragma once

/**
 * @file ReportJson.hpp
 * @brief JSON rendering of a Report
 *
 * Field names follow the Report structure. Absent optional sections are
 * null. Object keys are sorted, so the text depends only on the Report.
 */

#include <dynadiag/report/Report.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace dynadiag {

[[nodiscard]] nlohmann::json ReportToJSON(const Report &report);

[[nodiscard]] nlohmann::json FindingToJSON(const Finding &finding);

/// Serialize with two-space indentation
[[nodiscard]] std::string ReportToJSONString(const Report &report);

/**
 * @brief Write the Report to a file
 * @throws IOError when the file cannot be opened or written
 */
void WriteReportJSON(const Report &report, const std::string &path);

} // namespace dynadiag
