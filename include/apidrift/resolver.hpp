#pragma once

/**
 * @file resolver.hpp
 * @brief Internal reference resolution over a schema table
 */

#include "apidrift/common.hpp"
#include "apidrift/schema.hpp"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace apidrift::resolver {

/// Comparison recursion stops silently below this many nested levels.
constexpr std::size_t kMaxComparisonDepth = 10;

/// Error codes carried by resolve() failures.
constexpr std::string_view kUnresolvedReference = "UnresolvedReference";
constexpr std::string_view kCircularReference = "CircularReference";

/// Names of the schemas already entered on the current comparison path.
using VisitedNames = std::set<std::string>;

struct ResolvedSchema
{
    std::string name;                ///< Table name of the final target
    const schema::SchemaNode* node;  ///< Never null on success
};

/**
 * Extract the schema name designated by an internal pointer.
 *
 * Accepts "#/components/schemas/Name", "#/definitions/Name" and "#/$defs/Name",
 * decoding the JSON pointer escapes "~1" and "~0".
 *
 * @return Schema name, or nullopt for external or unsupported pointers
 */
[[nodiscard]] std::optional<std::string> schema_name_from_pointer(std::string_view pointer);

/**
 * Resolve a pointer to its concrete node.
 *
 * Reference chains (a table entry that is itself a reference) are followed. Every
 * name entered is added to @p visited; meeting a name already present fails with
 * kCircularReference, a missing or external target with kUnresolvedReference.
 */
[[nodiscard]] Result<ResolvedSchema>
resolve(std::string_view pointer, const schema::SchemaTable& table, VisitedNames& visited);

}  // namespace apidrift::resolver
