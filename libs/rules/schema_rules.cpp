/**
 * @file schema_rules.cpp
 * @brief Rendering of schema difference kinds
 */

#include "apidrift/rules/schema_rules.hpp"

#include "apidrift/schema.hpp"

#include <format>
#include <ranges>
#include <utility>

namespace apidrift::rules {

namespace {

[[nodiscard]] std::string_view or_none(const std::optional<std::string>& value)
{
    if (!value) {
        return "(none)";
    }
    return *value;
}

[[nodiscard]] std::string join_values(const std::vector<nlohmann::json>& values)
{
    std::string result;
    for (auto [i, value] : std::views::enumerate(values)) {
        if (i != 0) {
            result += ", ";
        }
        result += value.dump();
    }
    return result;
}

}  // namespace

std::string join_property_path(std::string_view parent, std::string_view child)
{
    if (parent.empty()) {
        return std::string(child);
    }
    return std::format("{}.{}", parent, child);
}

std::string items_path(std::string_view parent)
{
    return std::format("{}[]", parent);
}

SchemaRule::SchemaRule(std::string schema_name, std::string property_path)
    : m_schema_name(std::move(schema_name))
    , m_property_path(std::move(property_path))
{}

std::string SchemaRule::context() const
{
    if (m_property_path.empty()) {
        return std::format("schema: {}", m_schema_name);
    }
    return std::format("schema: {}, property: {}", m_schema_name, m_property_path);
}

PropertyRule::PropertyRule(std::string schema_name,
                           std::string_view parent_path,
                           std::string property_name)
    : SchemaRule(std::move(schema_name), join_property_path(parent_path, property_name))
    , m_property_name(std::move(property_name))
{}

SchemaAddedRule::SchemaAddedRule(std::string schema_name)
    : SchemaRule(std::move(schema_name), std::string{})
{}

std::string SchemaAddedRule::description() const
{
    return std::format("Schema '{}' was added", schema_name());
}

SchemaRemovedRule::SchemaRemovedRule(std::string schema_name)
    : SchemaRule(std::move(schema_name), std::string{})
{}

std::string SchemaRemovedRule::description() const
{
    return std::format("Schema '{}' was removed", schema_name());
}

SchemaUnresolvedRule::SchemaUnresolvedRule(std::string schema_name,
                                           std::string property_path,
                                           std::string pointer)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_pointer(std::move(pointer))
{}

std::string SchemaUnresolvedRule::description() const
{
    return std::format("Reference '{}' could not be resolved; comparison skipped", m_pointer);
}

TypeChangedRule::TypeChangedRule(std::string schema_name,
                                 std::string property_path,
                                 std::set<std::string> old_types,
                                 std::set<std::string> new_types)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_old_types(std::move(old_types))
    , m_new_types(std::move(new_types))
{}

std::string TypeChangedRule::description() const
{
    return std::format("Type changed from '{}' to '{}'",
                       schema::type_set_to_string(m_old_types),
                       schema::type_set_to_string(m_new_types));
}

std::string PropertyAddedRule::description() const
{
    return std::format("Property '{}' was added", property_name());
}

PropertyRemovedRule::PropertyRemovedRule(std::string schema_name,
                                         std::string_view parent_path,
                                         std::string property_name,
                                         bool was_required)
    : PropertyRule(std::move(schema_name), parent_path, std::move(property_name))
    , m_was_required(was_required)
{}

std::string PropertyRemovedRule::description() const
{
    if (m_was_required) {
        return std::format("Required property '{}' was removed", property_name());
    }
    return std::format("Property '{}' was removed", property_name());
}

RequiredPropertyAddedRule::RequiredPropertyAddedRule(std::string schema_name,
                                                     std::string_view parent_path,
                                                     std::string property_name,
                                                     bool property_is_new)
    : PropertyRule(std::move(schema_name), parent_path, std::move(property_name))
    , m_property_is_new(property_is_new)
{}

std::string RequiredPropertyAddedRule::description() const
{
    if (m_property_is_new) {
        return std::format("Required property '{}' was added", property_name());
    }
    return std::format("Property '{}' became required", property_name());
}

std::string RequiredPropertyRemovedRule::description() const
{
    return std::format("Property '{}' is no longer required", property_name());
}

EnumValuesAddedRule::EnumValuesAddedRule(std::string schema_name,
                                         std::string property_path,
                                         std::vector<nlohmann::json> values)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_values(std::move(values))
{}

std::string EnumValuesAddedRule::description() const
{
    return std::format("Enum values added: [{}]", join_values(m_values));
}

EnumValuesRemovedRule::EnumValuesRemovedRule(std::string schema_name,
                                             std::string property_path,
                                             std::vector<nlohmann::json> values)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_values(std::move(values))
{}

std::string EnumValuesRemovedRule::description() const
{
    return std::format("Enum values removed: [{}]", join_values(m_values));
}

FormatChangedRule::FormatChangedRule(std::string schema_name,
                                     std::string property_path,
                                     std::optional<std::string> old_format,
                                     std::optional<std::string> new_format)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_old_format(std::move(old_format))
    , m_new_format(std::move(new_format))
{}

std::string FormatChangedRule::description() const
{
    return std::format("Format changed from '{}' to '{}'",
                       or_none(m_old_format),
                       or_none(m_new_format));
}

NullableChangedRule::NullableChangedRule(std::string schema_name,
                                         std::string property_path,
                                         bool old_nullable,
                                         bool new_nullable)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_old_nullable(old_nullable)
    , m_new_nullable(new_nullable)
{}

std::string NullableChangedRule::description() const
{
    return std::format("Nullable changed from {} to {}", m_old_nullable, m_new_nullable);
}

Severity NullableChangedRule::severity() const
{
    if (m_old_nullable && !m_new_nullable) {
        return Severity::kBreaking;
    }
    if (!m_old_nullable && m_new_nullable) {
        return Severity::kWarning;
    }
    return Severity::kChange;
}

DescriptionChangedRule::DescriptionChangedRule(std::string schema_name,
                                               std::string property_path,
                                               std::optional<std::string> old_description,
                                               std::optional<std::string> new_description)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_old_description(std::move(old_description))
    , m_new_description(std::move(new_description))
{}

std::string DescriptionChangedRule::description() const
{
    return std::format("Description changed from '{}' to '{}'",
                       or_none(m_old_description),
                       or_none(m_new_description));
}

ArrayItemsChangedRule::ArrayItemsChangedRule(std::string schema_name,
                                             std::string property_path,
                                             bool had_items,
                                             bool has_items)
    : SchemaRule(std::move(schema_name), std::move(property_path))
    , m_had_items(had_items)
    , m_has_items(has_items)
{}

std::string ArrayItemsChangedRule::description() const
{
    if (m_had_items && !m_has_items) {
        return "Array items definition was removed";
    }
    if (!m_had_items && m_has_items) {
        return "Array items definition was added";
    }
    return "Array items definition changed";
}

}  // namespace apidrift::rules
