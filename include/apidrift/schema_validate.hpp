#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation of apidrift's own JSON files
 */

#include "apidrift/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace apidrift::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] VoidResult validate_json(const nlohmann::json& j,
                                       const std::filesystem::path& schema_path);

/// Schema file for a given schema version, e.g. "<dir>/diff_report.v1.schema.json".
[[nodiscard]] std::filesystem::path schema_file(const std::filesystem::path& schema_dir,
                                                std::string_view schema_version);

}  // namespace apidrift::common
