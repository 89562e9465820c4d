/**
 * @file openapi_loader.cpp
 * @brief OpenAPI document -> schema table
 *
 * Only the keywords the matcher compares are read. OpenAPI 3.1 type arrays
 * containing "null" and the OpenAPI 3.0 "nullable" flag both set
 * SchemaNode::nullable; "null" never appears in SchemaNode::types.
 */

#include "apidrift/openapi.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace apidrift::openapi {

namespace {

constexpr std::string_view kNullType = "null";

[[nodiscard]] std::string lowercase(std::string text)
{
    std::ranges::transform(text, text.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& node,
                                                         const char* key)
{
    const auto it = node.find(key);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void read_types(const nlohmann::json& node, schema::SchemaNode& out)
{
    const auto it = node.find("type");
    if (it == node.end()) {
        return;
    }
    const auto add_type = [&out](const nlohmann::json& value) {
        if (!value.is_string()) {
            return;
        }
        const auto& name = value.get_ref<const std::string&>();
        if (name == kNullType) {
            out.nullable = true;
            return;
        }
        out.types.insert(name);
    };
    if (it->is_array()) {
        for (const auto& value : *it) {
            add_type(value);
        }
        return;
    }
    add_type(*it);
}

void read_properties(const nlohmann::json& node, schema::SchemaNode& out)
{
    const auto it = node.find("properties");
    if (it == node.end() || !it->is_object()) {
        return;
    }
    for (const auto& [name, property] : it->items()) {
        out.properties.emplace(name, parse_schema(property));
    }
}

void read_required(const nlohmann::json& node, schema::SchemaNode& out)
{
    const auto it = node.find("required");
    if (it == node.end() || !it->is_array()) {
        return;
    }
    for (const auto& name : *it) {
        if (name.is_string()) {
            out.required.insert(name.get<std::string>());
        }
    }
}

[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open OpenAPI document: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError",
                        "Failed to parse JSON document: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open OpenAPI document: " + path.string()));
    }
    std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return std::unexpected(
            Error::make("IOError", "Failed to read OpenAPI document: " + path.string()));
    }
    return text;
}

[[nodiscard]] std::optional<std::int64_t> parse_integer(std::string_view digits, int base)
{
    if (digits.empty() || (base != 10 && digits.front() == '-')) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const char* end = digits.data() + digits.size();
    if (auto [ptr, ec] = std::from_chars(digits.data(), end, value, base);
        ec == std::errc{} && ptr == end) {
        return value;
    }
    return std::nullopt;
}

/// Decimal floats only; from_chars would also accept "inf" and "nan", which YAML keeps as strings.
[[nodiscard]] std::optional<double> parse_decimal_float(std::string_view text)
{
    const bool decimal_chars = std::ranges::all_of(text, [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' || c == 'e' ||
               c == 'E' || c == '-' || c == '+';
    });
    if (!decimal_chars) {
        return std::nullopt;
    }
    double value = 0.0;
    const char* end = text.data() + text.size();
    if (auto [ptr, ec] = std::from_chars(text.data(), end, value);
        ec == std::errc{} && ptr == end) {
        return value;
    }
    return std::nullopt;
}

/**
 * Plain (unquoted) YAML scalars carry YAML 1.2 core-schema types; quoted ones are strings.
 *
 * Integers accept an optional sign, "0x" (hex) and "0o" (octal) forms. ".inf" and ".nan" become
 * doubles; JSON has no literal for them, so they render as null in JSON output.
 */
[[nodiscard]] nlohmann::json yaml_scalar_to_json(const YAML::Node& node)
{
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }

    const auto lowered = lowercase(text);
    if (lowered == "null" || lowered == "~" || lowered.empty()) {
        return nullptr;
    }
    if (lowered == "true") {
        return true;
    }
    if (lowered == "false") {
        return false;
    }
    if (lowered == ".nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (lowered == ".inf" || lowered == "+.inf") {
        return std::numeric_limits<double>::infinity();
    }
    if (lowered == "-.inf") {
        return -std::numeric_limits<double>::infinity();
    }

    std::string_view unsigned_text = lowered;
    if (lowered.starts_with("0x")) {
        if (auto hex = parse_integer(unsigned_text.substr(2), 16)) {
            return *hex;
        }
        return text;
    }
    if (lowered.starts_with("0o")) {
        if (auto octal = parse_integer(unsigned_text.substr(2), 8)) {
            return *octal;
        }
        return text;
    }

    const bool negative = lowered.starts_with('-');
    if (negative || lowered.starts_with('+')) {
        unsigned_text.remove_prefix(1);
    }
    if (unsigned_text.empty() || unsigned_text.front() == '+' || unsigned_text.front() == '-') {
        return text;
    }
    // Decimal integers keep the sign inside from_chars so that INT64_MIN still parses.
    const std::string signed_text = negative ? "-" + std::string(unsigned_text)
                                             : std::string(unsigned_text);
    if (auto integer = parse_integer(signed_text, 10)) {
        return *integer;
    }
    if (auto floating = parse_decimal_float(signed_text)) {
        return *floating;
    }
    return text;
}

[[nodiscard]] nlohmann::json yaml_to_json(const YAML::Node& node)
{
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.Scalar()] = yaml_to_json(entry.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& element : node) {
                array.push_back(yaml_to_json(element));
            }
            return array;
        }
        case YAML::NodeType::Scalar:
            return yaml_scalar_to_json(node);
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
    }
    return nullptr;
}

}  // namespace

Result<DocumentFormat> detect_format(const std::filesystem::path& path)
{
    const auto extension = lowercase(path.extension().string());
    if (extension == ".json") {
        return DocumentFormat::kJson;
    }
    if (extension == ".yaml" || extension == ".yml") {
        return DocumentFormat::kYaml;
    }
    return std::unexpected(Error::make("UnsupportedFormat",
                                       "Unsupported document format '" + extension
                                           + "' for " + path.string()
                                           + ". Supported formats: json, yaml, yml"));
}

schema::SchemaOrRef parse_schema(const nlohmann::json& node)
{
    if (node.is_object()) {
        if (auto ref = optional_string(node, "$ref")) {
            return schema::SchemaOrRef::reference(std::move(*ref));
        }
    }

    schema::SchemaNode out;
    if (!node.is_object()) {
        // Boolean schemas and other shapes compare as an empty node.
        return schema::SchemaOrRef::object(std::move(out));
    }

    read_types(node, out);
    read_properties(node, out);
    read_required(node, out);
    if (const auto it = node.find("enum"); it != node.end() && it->is_array()) {
        out.enum_values.assign(it->begin(), it->end());
    }
    out.format = optional_string(node, "format");
    out.description = optional_string(node, "description");
    if (const auto it = node.find("nullable"); it != node.end() && it->is_boolean()) {
        out.nullable = out.nullable || it->get<bool>();
    }
    if (const auto it = node.find("items"); it != node.end() && it->is_object()) {
        out.items = parse_schema(*it);
    }
    return schema::SchemaOrRef::object(std::move(out));
}

Result<schema::SchemaTable> parse_schema_table(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return std::unexpected(
            Error::make("InvalidDocument", "OpenAPI document must be a JSON object"));
    }
    schema::SchemaTable table;
    const auto components = document.find("components");
    if (components == document.end() || components->is_null()) {
        return table;
    }
    if (!components->is_object()) {
        return std::unexpected(Error::make("InvalidDocument", "components must be an object"));
    }
    const auto schemas = components->find("schemas");
    if (schemas == components->end() || schemas->is_null()) {
        return table;
    }
    if (!schemas->is_object()) {
        return std::unexpected(
            Error::make("InvalidDocument", "components.schemas must be an object"));
    }
    for (const auto& [name, node] : schemas->items()) {
        table.emplace(name, parse_schema(node));
    }
    return table;
}

Result<nlohmann::json> parse_yaml(std::string_view text)
{
    try {
        const YAML::Node root = YAML::Load(std::string(text));
        return yaml_to_json(root);
    } catch (const YAML::Exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::string("Failed to parse YAML: ") + ex.what()));
    }
}

namespace {

[[nodiscard]] Result<nlohmann::json> read_document(const std::filesystem::path& path,
                                                   DocumentFormat format)
{
    if (format == DocumentFormat::kJson) {
        return read_json_file(path);
    }
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    auto document = parse_yaml(*text);
    if (!document) {
        return std::unexpected(
            Error::make("ParseError", path.string() + ": " + document.error().message));
    }
    return document;
}

}  // namespace

Result<schema::SchemaTable> load_schema_table(const std::filesystem::path& path)
{
    auto format = detect_format(path);
    if (!format) {
        return std::unexpected(format.error());
    }
    auto document = read_document(path, *format);
    if (!document) {
        return std::unexpected(document.error());
    }
    return parse_schema_table(*document);
}

}  // namespace apidrift::openapi
