#pragma once

/**
 * @file schema.hpp
 * @brief In-memory schema graph compared by the matcher
 *
 * A SchemaTable maps schema names to their root node. Nodes are immutable once
 * built and shared between copies of a table; references are plain pointer
 * strings resolved on demand against the owning table.
 */

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace apidrift::schema {

struct SchemaNode;

/**
 * @brief Either an owned schema node or a reference to a named schema
 */
class SchemaOrRef
{
public:
    [[nodiscard]] static SchemaOrRef object(SchemaNode node);
    [[nodiscard]] static SchemaOrRef reference(std::string pointer);

    [[nodiscard]] bool is_reference() const noexcept;

    /// Pointer string; empty for object entries.
    [[nodiscard]] std::string_view pointer() const noexcept;

    /// Owned node; nullptr for reference entries.
    [[nodiscard]] const SchemaNode* node() const noexcept;

private:
    explicit SchemaOrRef(std::variant<std::shared_ptr<const SchemaNode>, std::string> value);

    std::variant<std::shared_ptr<const SchemaNode>, std::string> m_value;
};

struct SchemaNode
{
    std::set<std::string> types;  ///< JSON Schema type names, "null" excluded
    std::map<std::string, SchemaOrRef> properties;
    std::set<std::string> required;
    std::vector<nlohmann::json> enum_values;  ///< Empty when no enumeration is declared
    std::optional<std::string> format;
    std::optional<std::string> description;
    bool nullable = false;
    std::optional<SchemaOrRef> items;
};

/// Schema name -> root node, one per document version.
using SchemaTable = std::map<std::string, SchemaOrRef>;

/**
 * Render a type set for messages, e.g. "string" or "integer|string".
 * An empty set renders as "(none)".
 */
[[nodiscard]] std::string type_set_to_string(const std::set<std::string>& types);

}  // namespace apidrift::schema
