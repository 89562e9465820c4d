#pragma once

/**
 * @file config.hpp
 * @brief Diff run configuration (config file + CLI overrides)
 */

#include "apidrift/common.hpp"
#include "apidrift/rules.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace apidrift::config {

enum class OutputFormat { kText, kJson };

struct DiffConfig
{
    rules::Severity min_severity = rules::Severity::kChange;  ///< Results below are dropped
    bool include_unchanged = true;    ///< Keep schemas without violations
    OutputFormat format = OutputFormat::kText;
    bool validate_output = true;      ///< Check JSON reports against their schema
    std::optional<rules::Severity> fail_on;  ///< Exit code 2 at or above this severity
};

[[nodiscard]] Result<OutputFormat> parse_output_format(std::string_view text);
[[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;

/**
 * Apply the settings present in a config JSON object on top of @p base.
 * Absent keys keep their value from @p base.
 */
[[nodiscard]] Result<DiffConfig> apply_config_json(const nlohmann::json& j, DiffConfig base);

/**
 * Load a config file, validating it against config.v1.schema.json in @p schema_dir.
 * @return Config (defaults for absent keys) or error
 */
[[nodiscard]] Result<DiffConfig> load_config(const std::filesystem::path& path,
                                             const std::filesystem::path& schema_dir);

}  // namespace apidrift::config
