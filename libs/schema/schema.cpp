/**
 * @file schema.cpp
 * @brief Schema graph value types
 */

#include "apidrift/schema.hpp"

#include <utility>

namespace apidrift::schema {

SchemaOrRef::SchemaOrRef(std::variant<std::shared_ptr<const SchemaNode>, std::string> value)
    : m_value(std::move(value))
{}

SchemaOrRef SchemaOrRef::object(SchemaNode node)
{
    return SchemaOrRef(std::make_shared<const SchemaNode>(std::move(node)));
}

SchemaOrRef SchemaOrRef::reference(std::string pointer)
{
    return SchemaOrRef(std::move(pointer));
}

bool SchemaOrRef::is_reference() const noexcept
{
    return std::holds_alternative<std::string>(m_value);
}

std::string_view SchemaOrRef::pointer() const noexcept
{
    if (const auto* pointer = std::get_if<std::string>(&m_value)) {
        return *pointer;
    }
    return {};
}

const SchemaNode* SchemaOrRef::node() const noexcept
{
    if (const auto* node = std::get_if<std::shared_ptr<const SchemaNode>>(&m_value)) {
        return node->get();
    }
    return nullptr;
}

std::string type_set_to_string(const std::set<std::string>& types)
{
    if (types.empty()) {
        return "(none)";
    }
    std::string result;
    for (const auto& type : types) {
        if (!result.empty()) {
            result += '|';
        }
        result += type;
    }
    return result;
}

}  // namespace apidrift::schema
