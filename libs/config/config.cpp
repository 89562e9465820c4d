/**
 * @file config.cpp
 * @brief Diff run configuration
 */

#include "apidrift/config.hpp"

#include "apidrift/schema_validate.hpp"
#include "apidrift/version.hpp"

#include <exception>
#include <fstream>
#include <string>

namespace apidrift::config {

namespace {

[[nodiscard]] Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open config file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError",
                        "Failed to parse config file: " + path.string() + ": " + ex.what()));
    }
    return payload;
}

[[nodiscard]] Result<rules::Severity> severity_setting(const nlohmann::json& j, const char* key)
{
    const auto& value = j.at(key);
    if (!value.is_string()) {
        return std::unexpected(
            Error::make("InvalidConfig", std::string(key) + " must be a string"));
    }
    return rules::parse_severity(value.get_ref<const std::string&>());
}

}  // namespace

Result<OutputFormat> parse_output_format(std::string_view text)
{
    if (text == "text") {
        return OutputFormat::kText;
    }
    if (text == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(
        Error::make("InvalidArgument", "Invalid format value: " + std::string(text)));
}

std::string_view to_string(OutputFormat format) noexcept
{
    return format == OutputFormat::kJson ? "json" : "text";
}

Result<DiffConfig> apply_config_json(const nlohmann::json& j, DiffConfig base)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("InvalidConfig", "config must be a JSON object"));
    }
    if (j.contains("min_severity")) {
        auto severity = severity_setting(j, "min_severity");
        if (!severity) {
            return std::unexpected(severity.error());
        }
        base.min_severity = *severity;
    }
    if (j.contains("fail_on")) {
        auto severity = severity_setting(j, "fail_on");
        if (!severity) {
            return std::unexpected(severity.error());
        }
        base.fail_on = *severity;
    }
    if (j.contains("include_unchanged")) {
        if (!j.at("include_unchanged").is_boolean()) {
            return std::unexpected(
                Error::make("InvalidConfig", "include_unchanged must be a boolean"));
        }
        base.include_unchanged = j.at("include_unchanged").get<bool>();
    }
    if (j.contains("validate_output")) {
        if (!j.at("validate_output").is_boolean()) {
            return std::unexpected(
                Error::make("InvalidConfig", "validate_output must be a boolean"));
        }
        base.validate_output = j.at("validate_output").get<bool>();
    }
    if (j.contains("format")) {
        if (!j.at("format").is_string()) {
            return std::unexpected(Error::make("InvalidConfig", "format must be a string"));
        }
        auto format = parse_output_format(j.at("format").get_ref<const std::string&>());
        if (!format) {
            return std::unexpected(format.error());
        }
        base.format = *format;
    }
    return base;
}

Result<DiffConfig> load_config(const std::filesystem::path& path,
                               const std::filesystem::path& schema_dir)
{
    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    const auto schema_path = common::schema_file(schema_dir, kConfigSchemaVersion);
    if (auto validation = common::validate_json(*payload, schema_path); !validation) {
        return std::unexpected(Error::make(
            "SchemaInvalid", "config schema validation failed: " + validation.error().message));
    }
    return apply_config_json(*payload, DiffConfig{});
}

}  // namespace apidrift::config
