/**
 * @file test_report_schema.cpp
 * @brief JSON Schema validation of generated reports and config files
 */

#include "apidrift/matcher.hpp"
#include "apidrift/openapi.hpp"
#include "apidrift/report.hpp"
#include "apidrift/schema_validate.hpp"
#include "apidrift/version.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace apidrift::common::test {

namespace {

std::filesystem::path schema_dir()
{
    return std::filesystem::path(APIDRIFT_SCHEMA_DIR);
}

std::filesystem::path testdata(const std::string& name)
{
    return std::filesystem::path(APIDRIFT_TESTDATA_DIR) / name;
}

nlohmann::json make_petstore_report()
{
    auto base = openapi::load_schema_table(testdata("petstore_base.json"));
    auto current = openapi::load_schema_table(testdata("petstore_current.json"));
    EXPECT_TRUE(base.has_value());
    EXPECT_TRUE(current.has_value());
    if (!base || !current) {
        return nlohmann::json::object();
    }
    const auto results = report::assemble(matcher::SchemaMatcher(*base, *current).match());
    const auto overview = report::build_schema_overview(*current, results);
    return report::build_report_json(results, overview);
}

}  // namespace

TEST(SchemaFile, NamedAfterVersion)
{
    EXPECT_EQ(schema_file("schemas", kReportSchemaVersion),
              std::filesystem::path("schemas") / "diff_report.v1.schema.json");
}

TEST(ReportSchema, GeneratedReportIsValid)
{
    const auto payload = make_petstore_report();
    ASSERT_TRUE(payload.contains("overview"));
    auto result = validate_json(payload, schema_file(schema_dir(), kReportSchemaVersion));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(ReportSchema, EmptyReportIsValid)
{
    const auto payload = report::build_report_json({});
    auto result = validate_json(payload, schema_file(schema_dir(), kReportSchemaVersion));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(ReportSchema, RejectsUnknownSeverity)
{
    auto payload = make_petstore_report();
    payload["results"][0]["severity"] = "Critical";
    auto result = validate_json(payload, schema_file(schema_dir(), kReportSchemaVersion));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(ReportSchema, RejectsMissingSummary)
{
    auto payload = make_petstore_report();
    payload.erase("summary");
    auto result = validate_json(payload, schema_file(schema_dir(), kReportSchemaVersion));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(ConfigSchema, AcceptsFixture)
{
    auto payload = nlohmann::json::parse(R"({
        "schema_version": "config.v1",
        "min_severity": "Warning",
        "include_unchanged": false
    })");
    auto result = validate_json(payload, schema_file(schema_dir(), kConfigSchemaVersion));
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(ConfigSchema, RequiresVersion)
{
    auto payload = nlohmann::json::parse(R"({"format": "json"})");
    auto result = validate_json(payload, schema_file(schema_dir(), kConfigSchemaVersion));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaValidationFailed");
}

TEST(SchemaValidate, MissingSchemaFile)
{
    auto result = validate_json(nlohmann::json::object(), schema_dir() / "nope.schema.json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}

}  // namespace apidrift::common::test
