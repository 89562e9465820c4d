/**
 * @file overview.cpp
 * @brief Property-level view of changed schemas in the current version
 */

#include "apidrift/report/overview.hpp"

#include "apidrift/report.hpp"
#include "apidrift/resolver.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

namespace apidrift::report {

namespace {

/// "address" for "address.city", "tags" for "tags[]", "" for "".
[[nodiscard]] std::string_view top_level_property(std::string_view anchor)
{
    return anchor.substr(0, anchor.find_first_of(".["));
}

[[nodiscard]] const schema::SchemaNode* resolve_root(const schema::SchemaTable& table,
                                                     const std::string& name)
{
    const auto entry = table.find(name);
    if (entry == table.end()) {
        return nullptr;
    }
    if (!entry->second.is_reference()) {
        return entry->second.node();
    }
    resolver::VisitedNames visited{name};
    auto resolved = resolver::resolve(entry->second.pointer(), table, visited);
    return resolved ? resolved->node : nullptr;
}

[[nodiscard]] PropertyOverview describe_property(const schema::SchemaTable& table,
                                                 const std::string& name,
                                                 const schema::SchemaOrRef& entry,
                                                 const schema::SchemaNode& parent)
{
    PropertyOverview property;
    property.name = name;
    property.required = parent.required.contains(name);

    const schema::SchemaNode* node = entry.node();
    if (entry.is_reference()) {
        property.reference = resolver::schema_name_from_pointer(entry.pointer());
        resolver::VisitedNames visited;
        auto resolved = resolver::resolve(entry.pointer(), table, visited);
        node = resolved ? resolved->node : nullptr;
    }
    if (node == nullptr) {
        return property;
    }
    property.types = node->types;
    property.format = node->format;
    property.description = node->description;
    property.nullable = node->nullable;
    property.enum_values = node->enum_values;
    return property;
}

[[nodiscard]] nlohmann::json violations_to_json(const std::vector<rules::Violation>& violations)
{
    nlohmann::json list = nlohmann::json::array();
    for (const auto& violation : violations) {
        list.push_back(violation_to_json(violation));
    }
    return list;
}

[[nodiscard]] nlohmann::json property_to_json(const PropertyOverview& property)
{
    nlohmann::json types = nlohmann::json::array();
    for (const auto& type : property.types) {
        types.push_back(type);
    }
    nlohmann::json payload = {
        {      "name",                        property.name},
        {     "types",                                types},
        {  "required",                    property.required},
        {  "nullable",                    property.nullable},
        {      "enum",                 property.enum_values},
        {"violations", violations_to_json(property.violations)}
    };
    if (property.reference) {
        payload["reference"] = *property.reference;
    }
    if (property.format) {
        payload["format"] = *property.format;
    }
    if (property.description) {
        payload["description"] = *property.description;
    }
    return payload;
}

}  // namespace

std::vector<SchemaOverview> build_schema_overview(const schema::SchemaTable& current,
                                                  std::span<const matcher::MatchResult> results)
{
    std::vector<SchemaOverview> overview;
    for (const auto& result : results) {
        if (result.violations.empty()) {
            continue;
        }
        const schema::SchemaNode* node = resolve_root(current, result.name);
        if (node == nullptr) {
            continue;
        }

        SchemaOverview entry{.name = result.name,
                             .description = node->description,
                             .severity = result.severity,
                             .properties = {},
                             .schema_violations = {}};
        for (const auto& [name, property] : node->properties) {
            entry.properties.push_back(describe_property(current, name, property, *node));
        }

        for (const auto& violation : result.violations) {
            const auto anchor = violation.anchor();
            const auto property_name = top_level_property(anchor);
            auto target = std::ranges::find_if(entry.properties, [&](const PropertyOverview& p) {
                return !property_name.empty() && p.name == property_name;
            });
            if (target == entry.properties.end()) {
                entry.schema_violations.push_back(violation);
                continue;
            }
            target->violations.push_back(violation);
        }

        std::ranges::stable_sort(entry.properties,
                                 [](const PropertyOverview& lhs, const PropertyOverview& rhs) {
                                     if (lhs.required != rhs.required) {
                                         return lhs.required;
                                     }
                                     return lhs.name < rhs.name;
                                 });
        overview.push_back(std::move(entry));
    }
    return overview;
}

nlohmann::json overview_to_json(const SchemaOverview& overview)
{
    nlohmann::json properties = nlohmann::json::array();
    for (const auto& property : overview.properties) {
        properties.push_back(property_to_json(property));
    }
    nlohmann::json payload = {
        {             "name",                                overview.name},
        {         "severity",  std::string(rules::to_string(overview.severity))},
        {       "properties",                                   properties},
        {"schema_violations", violations_to_json(overview.schema_violations)}
    };
    if (overview.description) {
        payload["description"] = *overview.description;
    }
    return payload;
}

}  // namespace apidrift::report
