/**
 * @file resolver.cpp
 * @brief Internal reference resolution over a schema table
 */

#include "apidrift/resolver.hpp"

#include <array>
#include <format>

namespace apidrift::resolver {

namespace {

constexpr std::array<std::string_view, 3> kSchemaPointerPrefixes = {
    "#/components/schemas/",
    "#/definitions/",
    "#/$defs/",
};

[[nodiscard]] std::string unescape_pointer_token(std::string_view token)
{
    std::string result;
    result.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '~' && i + 1 < token.size()) {
            if (token[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            }
            if (token[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += token[i];
    }
    return result;
}

[[nodiscard]] Error unresolved(std::string_view pointer, std::string_view reason)
{
    return Error::make(std::string(kUnresolvedReference),
                       std::format("Cannot resolve reference '{}': {}", pointer, reason));
}

}  // namespace

std::optional<std::string> schema_name_from_pointer(std::string_view pointer)
{
    for (const auto prefix : kSchemaPointerPrefixes) {
        if (!pointer.starts_with(prefix)) {
            continue;
        }
        const auto token = pointer.substr(prefix.size());
        // Deeper pointers (".../Name/properties/x") are not schema roots.
        if (token.empty() || token.find('/') != std::string_view::npos) {
            return std::nullopt;
        }
        return unescape_pointer_token(token);
    }
    return std::nullopt;
}

Result<ResolvedSchema>
resolve(std::string_view pointer, const schema::SchemaTable& table, VisitedNames& visited)
{
    std::string current_pointer(pointer);
    // Each hop inserts a new name, so the chain ends within table.size() + 1 steps.
    while (true) {
        auto name = schema_name_from_pointer(current_pointer);
        if (!name) {
            return std::unexpected(unresolved(current_pointer, "not an internal schema pointer"));
        }
        if (visited.contains(*name)) {
            return std::unexpected(
                Error::make(std::string(kCircularReference),
                            std::format("Reference '{}' re-enters schema '{}'",
                                        current_pointer,
                                        *name)));
        }
        const auto entry = table.find(*name);
        if (entry == table.end()) {
            return std::unexpected(
                unresolved(current_pointer, std::format("schema '{}' is not defined", *name)));
        }
        visited.insert(*name);
        if (!entry->second.is_reference()) {
            return ResolvedSchema{.name = *name, .node = entry->second.node()};
        }
        current_pointer = std::string(entry->second.pointer());
    }
}

}  // namespace apidrift::resolver
