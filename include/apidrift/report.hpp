#pragma once

/**
 * @file report.hpp
 * @brief Result assembly and rendering of match results
 */

#include "apidrift/common.hpp"
#include "apidrift/matcher.hpp"
#include "apidrift/report/overview.hpp"
#include "apidrift/rules.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace apidrift::report {

struct SeverityGroup
{
    rules::Severity severity;
    std::vector<matcher::MatchResult> results;  ///< Name order
};

struct Summary
{
    std::size_t total_schemas = 0;
    std::size_t changed_schemas = 0;  ///< Schemas with at least one violation
    std::size_t breaking = 0;         ///< Violation counts per severity
    std::size_t warnings = 0;
    std::size_t changes = 0;
};

/// Order results by schema name (stable).
[[nodiscard]] std::vector<matcher::MatchResult> assemble(std::vector<matcher::MatchResult> results);

/**
 * Keep results whose overall severity is at least @p min_severity. Results
 * without violations are kept only when @p include_unchanged is set.
 */
[[nodiscard]] std::vector<matcher::MatchResult>
filter_results(std::span<const matcher::MatchResult> results,
               rules::Severity min_severity,
               bool include_unchanged);

/// Breaking group first, then Warning, then Change; empty groups are omitted.
[[nodiscard]] std::vector<SeverityGroup>
group_by_severity(std::span<const matcher::MatchResult> results);

[[nodiscard]] Summary summarize(std::span<const matcher::MatchResult> results);

/// Highest overall severity among results, nullopt when none has violations.
[[nodiscard]] std::optional<rules::Severity>
highest_severity(std::span<const matcher::MatchResult> results);

[[nodiscard]] nlohmann::json violation_to_json(const rules::Violation& violation);
[[nodiscard]] nlohmann::json match_result_to_json(const matcher::MatchResult& result);

/**
 * Build the diff_report.v1 document.
 * @param overview Schema overview entries; omitted from the report when empty
 */
[[nodiscard]] nlohmann::json build_report_json(std::span<const matcher::MatchResult> results,
                                               std::span<const SchemaOverview> overview = {});

/// Summary line, then severity groups (Breaking first) with one header line per schema
/// and one indented line per violation.
[[nodiscard]] std::vector<std::string>
render_text(std::span<const matcher::MatchResult> results);

[[nodiscard]] VoidResult write_json_file(const std::filesystem::path& path,
                                         const nlohmann::json& payload);
[[nodiscard]] VoidResult write_text_file(const std::filesystem::path& path,
                                         std::span<const std::string> lines);

}  // namespace apidrift::report
