#pragma once

/**
 * @file openapi.hpp
 * @brief Build schema tables from OpenAPI documents
 */

#include "apidrift/common.hpp"
#include "apidrift/schema.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace apidrift::openapi {

enum class DocumentFormat { kJson, kYaml };

/**
 * Pick the document format from the file extension (.json, .yaml, .yml).
 * @return Format or UnsupportedFormat error
 */
[[nodiscard]] Result<DocumentFormat> detect_format(const std::filesystem::path& path);

/**
 * Read one schema node (object or $ref) from its JSON form.
 * Unknown keywords and wrongly typed values are ignored.
 */
[[nodiscard]] schema::SchemaOrRef parse_schema(const nlohmann::json& node);

/**
 * Extract components.schemas from an OpenAPI 3.0/3.1 document.
 * A document without components.schemas yields an empty table.
 *
 * @return Table or InvalidDocument error
 */
[[nodiscard]] Result<schema::SchemaTable> parse_schema_table(const nlohmann::json& document);

/// Parse YAML text into the equivalent JSON value.
[[nodiscard]] Result<nlohmann::json> parse_yaml(std::string_view text);

/**
 * Read an OpenAPI document (JSON or YAML) and extract its schema table.
 * @return Table or IOError / ParseError / UnsupportedFormat / InvalidDocument error
 */
[[nodiscard]] Result<schema::SchemaTable> load_schema_table(const std::filesystem::path& path);

}  // namespace apidrift::openapi
