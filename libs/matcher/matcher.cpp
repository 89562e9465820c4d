/**
 * @file matcher.cpp
 * @brief Recursive schema comparison
 *
 * Per node the checks run in a fixed order (type, properties, items, enum,
 * format, nullable, description) and nested properties are visited depth-first
 * in property name order, so identical inputs always produce identical output.
 */

#include "apidrift/matcher.hpp"

#include "apidrift/resolver.hpp"
#include "apidrift/rules/schema_rules.hpp"

#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace apidrift::matcher {

namespace {

using rules::Violation;
using schema::SchemaNode;
using schema::SchemaOrRef;
using schema::SchemaTable;

constexpr std::string_view kArrayType = "array";

/// Position of one comparison step; copied into each recursive call.
struct ComparisonPath
{
    resolver::VisitedNames base_visited;
    resolver::VisitedNames current_visited;
    std::size_t depth = 0;
    std::string property_path;
};

[[nodiscard]] std::vector<nlohmann::json> values_missing_from(const std::vector<nlohmann::json>& from,
                                                              const std::vector<nlohmann::json>& in)
{
    std::vector<nlohmann::json> missing;
    for (const auto& value : from) {
        if (std::ranges::find(in, value) != in.end()) {
            continue;
        }
        if (std::ranges::find(missing, value) != missing.end()) {
            continue;
        }
        missing.push_back(value);
    }
    return missing;
}

[[nodiscard]] bool is_array(const SchemaNode& node)
{
    return node.types.contains(std::string(kArrayType));
}

class NodeComparator
{
public:
    NodeComparator(std::string_view schema_name,
                   const SchemaTable& base,
                   const SchemaTable& current,
                   std::vector<Violation>& out)
        : m_schema_name(schema_name)
        , m_base(base)
        , m_current(current)
        , m_out(out)
    {}

    void compare_entries(const SchemaOrRef& base, const SchemaOrRef& current, ComparisonPath path)
    {
        if (path.depth >= resolver::kMaxComparisonDepth) {
            return;
        }
        const SchemaNode* base_node = resolve_side(base, m_base, path.base_visited, path);
        if (base_node == nullptr) {
            return;
        }
        const SchemaNode* current_node =
            resolve_side(current, m_current, path.current_visited, path);
        if (current_node == nullptr) {
            return;
        }
        compare_nodes(*base_node, *current_node, path);
    }

private:
    /// nullptr when the branch must stop; unresolved references are reported here.
    [[nodiscard]] const SchemaNode* resolve_side(const SchemaOrRef& entry,
                                                 const SchemaTable& table,
                                                 resolver::VisitedNames& visited,
                                                 const ComparisonPath& path)
    {
        if (!entry.is_reference()) {
            return entry.node();
        }
        auto resolved = resolver::resolve(entry.pointer(), table, visited);
        if (resolved) {
            return resolved->node;
        }
        if (resolved.error().code != resolver::kCircularReference) {
            emit<rules::SchemaUnresolvedRule>(path.property_path, std::string(entry.pointer()));
        }
        return nullptr;
    }

    void compare_nodes(const SchemaNode& base, const SchemaNode& current, const ComparisonPath& path)
    {
        const auto& at = path.property_path;
        const bool same_types = base.types == current.types;
        if (!same_types) {
            emit<rules::TypeChangedRule>(at, base.types, current.types);
        }

        compare_properties(base, current, path);

        // Items stay comparable when one side only widens or narrows a union around "array".
        if (same_types || (is_array(base) && is_array(current))) {
            compare_items(base, current, path);
        }

        const auto removed_values = values_missing_from(base.enum_values, current.enum_values);
        if (!removed_values.empty()) {
            emit<rules::EnumValuesRemovedRule>(at, removed_values);
        }
        const auto added_values = values_missing_from(current.enum_values, base.enum_values);
        if (!added_values.empty()) {
            emit<rules::EnumValuesAddedRule>(at, added_values);
        }

        if (base.format != current.format) {
            emit<rules::FormatChangedRule>(at, base.format, current.format);
        }
        if (base.nullable != current.nullable) {
            emit<rules::NullableChangedRule>(at, base.nullable, current.nullable);
        }
        if (base.description != current.description) {
            emit<rules::DescriptionChangedRule>(at, base.description, current.description);
        }
    }

    void compare_properties(const SchemaNode& base,
                            const SchemaNode& current,
                            const ComparisonPath& path)
    {
        std::set<std::string> names = base.required;
        names.insert(current.required.begin(), current.required.end());
        for (const auto& [name, _] : base.properties) {
            names.insert(name);
        }
        for (const auto& [name, _] : current.properties) {
            names.insert(name);
        }

        const auto& at = path.property_path;
        for (const auto& name : names) {
            const auto base_prop = base.properties.find(name);
            const auto current_prop = current.properties.find(name);
            const bool in_base = base_prop != base.properties.end();
            const bool in_current = current_prop != current.properties.end();
            const bool required_before = base.required.contains(name);
            const bool required_now = current.required.contains(name);

            if (in_base && !in_current) {
                m_out.push_back(Violation::make<rules::PropertyRemovedRule>(
                    std::string(m_schema_name), at, name, required_before));
                continue;
            }
            if (!in_base && in_current) {
                if (required_now) {
                    m_out.push_back(Violation::make<rules::RequiredPropertyAddedRule>(
                        std::string(m_schema_name), at, name, true));
                } else {
                    m_out.push_back(Violation::make<rules::PropertyAddedRule>(
                        std::string(m_schema_name), at, name));
                }
                continue;
            }

            if (required_before && !required_now) {
                m_out.push_back(Violation::make<rules::RequiredPropertyRemovedRule>(
                    std::string(m_schema_name), at, name));
            } else if (!required_before && required_now) {
                m_out.push_back(Violation::make<rules::RequiredPropertyAddedRule>(
                    std::string(m_schema_name), at, name, false));
            }

            if (in_base && in_current) {
                auto child = path;
                child.depth += 1;
                child.property_path = rules::join_property_path(at, name);
                compare_entries(base_prop->second, current_prop->second, std::move(child));
            }
        }
    }

    void compare_items(const SchemaNode& base, const SchemaNode& current, const ComparisonPath& path)
    {
        if (base.items && current.items) {
            auto child = path;
            child.depth += 1;
            child.property_path = rules::items_path(path.property_path);
            compare_entries(*base.items, *current.items, std::move(child));
            return;
        }
        if (base.items.has_value() != current.items.has_value()) {
            emit<rules::ArrayItemsChangedRule>(path.property_path,
                                               base.items.has_value(),
                                               current.items.has_value());
        }
    }

    template <typename R, typename... Args>
    void emit(const std::string& property_path, Args&&... args)
    {
        m_out.push_back(Violation::make<R>(std::string(m_schema_name),
                                           property_path,
                                           std::forward<Args>(args)...));
    }

    std::string_view m_schema_name;
    const SchemaTable& m_base;
    const SchemaTable& m_current;
    std::vector<Violation>& m_out;
};

}  // namespace

MatchResult make_match_result(std::string name, std::vector<rules::Violation> violations)
{
    const auto severity = rules::aggregate_severity(violations);
    return MatchResult{.name = std::move(name),
                       .violations = std::move(violations),
                       .severity = severity};
}

SchemaMatcher::SchemaMatcher(const SchemaTable& base, const SchemaTable& current)
    : m_base(base)
    , m_current(current)
{}

std::vector<MatchResult> SchemaMatcher::match() const
{
    std::set<std::string> names;
    for (const auto& [name, _] : m_base) {
        names.insert(name);
    }
    for (const auto& [name, _] : m_current) {
        names.insert(name);
    }

    std::vector<MatchResult> results;
    results.reserve(names.size());
    for (const auto& name : names) {
        results.push_back(match_schema(name));
    }
    return results;
}

MatchResult SchemaMatcher::match_schema(std::string_view name) const
{
    const auto base_entry = m_base.find(std::string(name));
    const auto current_entry = m_current.find(std::string(name));
    const bool in_base = base_entry != m_base.end();
    const bool in_current = current_entry != m_current.end();

    std::vector<Violation> violations;
    if (in_base && !in_current) {
        violations.push_back(Violation::make<rules::SchemaRemovedRule>(std::string(name)));
    } else if (!in_base && in_current) {
        violations.push_back(Violation::make<rules::SchemaAddedRule>(std::string(name)));
    } else if (in_base && in_current) {
        ComparisonPath root;
        root.base_visited.insert(std::string(name));
        root.current_visited.insert(std::string(name));
        NodeComparator comparator(name, m_base, m_current, violations);
        comparator.compare_entries(base_entry->second, current_entry->second, std::move(root));
    }
    return make_match_result(std::string(name), std::move(violations));
}

}  // namespace apidrift::matcher
