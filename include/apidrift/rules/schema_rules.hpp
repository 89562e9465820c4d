#pragma once

/**
 * @file schema_rules.hpp
 * @brief Difference kinds detected between two versions of a schema
 */

#include "apidrift/rules.hpp"

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace apidrift::rules {

/// "parent.child", or "child" when @p parent is empty.
[[nodiscard]] std::string join_property_path(std::string_view parent, std::string_view child);

/// Path of the items node below @p parent: "parent[]".
[[nodiscard]] std::string items_path(std::string_view parent);

/**
 * @brief Base for rules anchored at a schema name plus property path
 *
 * Context renders as "schema: <name>" at the root and
 * "schema: <name>, property: <path>" below it.
 */
class SchemaRule : public Rule
{
public:
    SchemaRule(std::string schema_name, std::string property_path);

    [[nodiscard]] const std::string& schema_name() const noexcept { return m_schema_name; }
    [[nodiscard]] const std::string& property_path() const noexcept { return m_property_path; }

    [[nodiscard]] std::string context() const override;
    [[nodiscard]] std::string anchor() const override { return m_property_path; }

private:
    std::string m_schema_name;
    std::string m_property_path;
};

/**
 * @brief Base for rules about one named property of an object node
 */
class PropertyRule : public SchemaRule
{
public:
    PropertyRule(std::string schema_name, std::string_view parent_path, std::string property_name);

    [[nodiscard]] const std::string& property_name() const noexcept { return m_property_name; }

private:
    std::string m_property_name;
};

class SchemaAddedRule final : public SchemaRule
{
public:
    explicit SchemaAddedRule(std::string schema_name);

    [[nodiscard]] std::string_view name() const override { return "SchemaAdded"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }
};

class SchemaRemovedRule final : public SchemaRule
{
public:
    explicit SchemaRemovedRule(std::string schema_name);

    [[nodiscard]] std::string_view name() const override { return "SchemaRemoved"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kBreaking; }
};

/// A reference that could not be followed; comparison below it is skipped.
class SchemaUnresolvedRule final : public SchemaRule
{
public:
    SchemaUnresolvedRule(std::string schema_name, std::string property_path, std::string pointer);

    [[nodiscard]] std::string_view name() const override { return "SchemaUnresolved"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }

    [[nodiscard]] const std::string& pointer() const noexcept { return m_pointer; }

private:
    std::string m_pointer;
};

class TypeChangedRule final : public SchemaRule
{
public:
    TypeChangedRule(std::string schema_name,
                    std::string property_path,
                    std::set<std::string> old_types,
                    std::set<std::string> new_types);

    [[nodiscard]] std::string_view name() const override { return "TypeChanged"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kBreaking; }

private:
    std::set<std::string> m_old_types;
    std::set<std::string> m_new_types;
};

class PropertyAddedRule final : public PropertyRule
{
public:
    using PropertyRule::PropertyRule;

    [[nodiscard]] std::string_view name() const override { return "PropertyAdded"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }
};

/// Reported once per removed property, whether or not it was required.
class PropertyRemovedRule final : public PropertyRule
{
public:
    PropertyRemovedRule(std::string schema_name,
                        std::string_view parent_path,
                        std::string property_name,
                        bool was_required);

    [[nodiscard]] std::string_view name() const override { return "PropertyRemoved"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kBreaking; }

    [[nodiscard]] bool was_required() const noexcept { return m_was_required; }

private:
    bool m_was_required;
};

/// A new mandatory property, or an existing property that became required.
class RequiredPropertyAddedRule final : public PropertyRule
{
public:
    RequiredPropertyAddedRule(std::string schema_name,
                              std::string_view parent_path,
                              std::string property_name,
                              bool property_is_new);

    [[nodiscard]] std::string_view name() const override { return "RequiredPropertyAdded"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kBreaking; }

    [[nodiscard]] bool property_is_new() const noexcept { return m_property_is_new; }

private:
    bool m_property_is_new;
};

/// A property that still exists but is no longer required.
class RequiredPropertyRemovedRule final : public PropertyRule
{
public:
    using PropertyRule::PropertyRule;

    [[nodiscard]] std::string_view name() const override { return "RequiredPropertyRemoved"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }
};

class EnumValuesAddedRule final : public SchemaRule
{
public:
    EnumValuesAddedRule(std::string schema_name,
                        std::string property_path,
                        std::vector<nlohmann::json> values);

    [[nodiscard]] std::string_view name() const override { return "EnumValuesAdded"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }

    [[nodiscard]] const std::vector<nlohmann::json>& values() const noexcept { return m_values; }

private:
    std::vector<nlohmann::json> m_values;
};

class EnumValuesRemovedRule final : public SchemaRule
{
public:
    EnumValuesRemovedRule(std::string schema_name,
                          std::string property_path,
                          std::vector<nlohmann::json> values);

    [[nodiscard]] std::string_view name() const override { return "EnumValuesRemoved"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kBreaking; }

    [[nodiscard]] const std::vector<nlohmann::json>& values() const noexcept { return m_values; }

private:
    std::vector<nlohmann::json> m_values;
};

class FormatChangedRule final : public SchemaRule
{
public:
    FormatChangedRule(std::string schema_name,
                      std::string property_path,
                      std::optional<std::string> old_format,
                      std::optional<std::string> new_format);

    [[nodiscard]] std::string_view name() const override { return "FormatChanged"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kWarning; }

private:
    std::optional<std::string> m_old_format;
    std::optional<std::string> m_new_format;
};

/**
 * Nullability flip. Severity depends on direction:
 * nullable -> non-nullable is kBreaking (consumers sending null are rejected),
 * non-nullable -> nullable is kWarning (consumers may now receive null).
 */
class NullableChangedRule final : public SchemaRule
{
public:
    NullableChangedRule(std::string schema_name,
                        std::string property_path,
                        bool old_nullable,
                        bool new_nullable);

    [[nodiscard]] std::string_view name() const override { return "NullableChanged"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override;

private:
    bool m_old_nullable;
    bool m_new_nullable;
};

class DescriptionChangedRule final : public SchemaRule
{
public:
    DescriptionChangedRule(std::string schema_name,
                           std::string property_path,
                           std::optional<std::string> old_description,
                           std::optional<std::string> new_description);

    [[nodiscard]] std::string_view name() const override { return "DescriptionChanged"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kChange; }

private:
    std::optional<std::string> m_old_description;
    std::optional<std::string> m_new_description;
};

/// One side declares array items and the other does not.
class ArrayItemsChangedRule final : public SchemaRule
{
public:
    ArrayItemsChangedRule(std::string schema_name,
                          std::string property_path,
                          bool had_items,
                          bool has_items);

    [[nodiscard]] std::string_view name() const override { return "ArrayItemsChanged"; }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] Severity severity() const override { return Severity::kWarning; }

private:
    bool m_had_items;
    bool m_has_items;
};

}  // namespace apidrift::rules
