#pragma once

/**
 * @file overview.hpp
 * @brief Property-level view of changed schemas in the current version
 */

#include "apidrift/matcher.hpp"
#include "apidrift/rules.hpp"
#include "apidrift/schema.hpp"

#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace apidrift::report {

struct PropertyOverview
{
    std::string name;
    std::set<std::string> types;
    std::optional<std::string> reference;  ///< Target schema name for $ref properties
    std::optional<std::string> format;
    std::optional<std::string> description;
    bool required = false;
    bool nullable = false;
    std::vector<nlohmann::json> enum_values;
    std::vector<rules::Violation> violations;  ///< Anchored at or below this property
};

struct SchemaOverview
{
    std::string name;
    std::optional<std::string> description;
    rules::Severity severity;
    std::vector<PropertyOverview> properties;  ///< Required first, then by name
    std::vector<rules::Violation> schema_violations;
};

/**
 * Describe every result with violations whose schema still exists in @p current.
 *
 * Violations are attached to the top-level property named by the first segment
 * of their anchor; the rest (schema level, removed properties) stay on the schema.
 */
[[nodiscard]] std::vector<SchemaOverview>
build_schema_overview(const schema::SchemaTable& current,
                      std::span<const matcher::MatchResult> results);

[[nodiscard]] nlohmann::json overview_to_json(const SchemaOverview& overview);

}  // namespace apidrift::report
