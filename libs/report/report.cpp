/**
 * @file report.cpp
 * @brief Result assembly and rendering of match results
 */

#include "apidrift/report.hpp"

#include "apidrift/version.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace apidrift::report {

namespace {

constexpr std::array<rules::Severity, 3> kSeverityDisplayOrder = {
    rules::Severity::kBreaking,
    rules::Severity::kWarning,
    rules::Severity::kChange,
};

[[nodiscard]] nlohmann::json make_tool_json()
{
    return nlohmann::json{
        {    "name", "apidrift"},
        { "version",   kVersion},
        {"build_id",   kBuildId}
    };
}

[[nodiscard]] nlohmann::json summary_to_json(const Summary& summary)
{
    return nlohmann::json{
        {  "total_schemas",   summary.total_schemas},
        {"changed_schemas", summary.changed_schemas},
        {       "breaking",        summary.breaking},
        {       "warnings",        summary.warnings},
        {        "changes",         summary.changes}
    };
}

[[nodiscard]] std::string format_summary(const Summary& summary)
{
    return std::format("Schemas: {} total, {} changed ({} breaking, {} warnings, {} changes)",
                       summary.total_schemas,
                       summary.changed_schemas,
                       summary.breaking,
                       summary.warnings,
                       summary.changes);
}

}  // namespace

std::vector<matcher::MatchResult> assemble(std::vector<matcher::MatchResult> results)
{
    std::ranges::stable_sort(results,
                             [](const matcher::MatchResult& lhs, const matcher::MatchResult& rhs) {
                                 return lhs.name < rhs.name;
                             });
    return results;
}

std::vector<matcher::MatchResult> filter_results(std::span<const matcher::MatchResult> results,
                                                 rules::Severity min_severity,
                                                 bool include_unchanged)
{
    std::vector<matcher::MatchResult> filtered;
    for (const auto& result : results) {
        if (result.violations.empty()) {
            if (include_unchanged && min_severity == rules::Severity::kChange) {
                filtered.push_back(result);
            }
            continue;
        }
        if (result.severity >= min_severity) {
            filtered.push_back(result);
        }
    }
    return filtered;
}

std::vector<SeverityGroup> group_by_severity(std::span<const matcher::MatchResult> results)
{
    std::vector<SeverityGroup> groups;
    for (const auto severity : kSeverityDisplayOrder) {
        SeverityGroup group{.severity = severity, .results = {}};
        for (const auto& result : results) {
            if (result.severity == severity) {
                group.results.push_back(result);
            }
        }
        if (group.results.empty()) {
            continue;
        }
        group.results = assemble(std::move(group.results));
        groups.push_back(std::move(group));
    }
    return groups;
}

Summary summarize(std::span<const matcher::MatchResult> results)
{
    Summary summary;
    summary.total_schemas = results.size();
    for (const auto& result : results) {
        if (!result.violations.empty()) {
            ++summary.changed_schemas;
        }
        for (const auto& violation : result.violations) {
            switch (violation.severity()) {
                case rules::Severity::kBreaking:
                    ++summary.breaking;
                    break;
                case rules::Severity::kWarning:
                    ++summary.warnings;
                    break;
                case rules::Severity::kChange:
                    ++summary.changes;
                    break;
            }
        }
    }
    return summary;
}

std::optional<rules::Severity> highest_severity(std::span<const matcher::MatchResult> results)
{
    std::optional<rules::Severity> highest;
    for (const auto& result : results) {
        if (result.violations.empty()) {
            continue;
        }
        if (!highest || result.severity > *highest) {
            highest = result.severity;
        }
    }
    return highest;
}

nlohmann::json violation_to_json(const rules::Violation& violation)
{
    return nlohmann::json{
        {       "name",                         std::string(violation.name())},
        {"description",                               violation.description()},
        {   "severity", std::string(rules::to_string(violation.severity()))},
        {   "category", std::string(rules::to_string(violation.category()))},
        {    "context",                      violation.context()},
        {     "anchor",                       violation.anchor()}
    };
}

nlohmann::json match_result_to_json(const matcher::MatchResult& result)
{
    nlohmann::json violations = nlohmann::json::array();
    for (const auto& violation : result.violations) {
        violations.push_back(violation_to_json(violation));
    }
    return nlohmann::json{
        {      "name",                          result.name},
        {  "severity", std::string(rules::to_string(result.severity))},
        {"violations",                           violations}
    };
}

nlohmann::json build_report_json(std::span<const matcher::MatchResult> results,
                                 std::span<const SchemaOverview> overview)
{
    nlohmann::json result_list = nlohmann::json::array();
    for (const auto& result : results) {
        result_list.push_back(match_result_to_json(result));
    }

    nlohmann::json payload = {
        {"schema_version", kReportSchemaVersion},
        {          "tool",     make_tool_json()},
        {       "summary", summary_to_json(summarize(results))},
        {       "results",          result_list}
    };
    if (const auto highest = highest_severity(results)) {
        payload["highest_severity"] = std::string(rules::to_string(*highest));
    }
    if (!overview.empty()) {
        nlohmann::json overview_list = nlohmann::json::array();
        for (const auto& entry : overview) {
            overview_list.push_back(overview_to_json(entry));
        }
        payload["overview"] = std::move(overview_list);
    }
    return payload;
}

std::vector<std::string> render_text(std::span<const matcher::MatchResult> results)
{
    std::vector<std::string> lines;
    lines.push_back(format_summary(summarize(results)));
    for (const auto& group : group_by_severity(results)) {
        lines.push_back(std::format("== {} ==", rules::to_string(group.severity)));
        for (const auto& result : group.results) {
            lines.push_back(
                std::format("Schema {} [{}]", result.name, rules::to_string(result.severity)));
            if (result.violations.empty()) {
                lines.emplace_back("  (no differences)");
                continue;
            }
            for (const auto& violation : result.violations) {
                lines.push_back(std::format("  - [{}] {}: {} ({})",
                                            rules::to_string(violation.severity()),
                                            violation.name(),
                                            violation.description(),
                                            violation.context()));
            }
        }
    }
    return lines;
}

VoidResult write_json_file(const std::filesystem::path& path, const nlohmann::json& payload)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << payload.dump(2) << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

VoidResult write_text_file(const std::filesystem::path& path, std::span<const std::string> lines)
{
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace apidrift::report
