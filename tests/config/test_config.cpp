/**
 * @file test_config.cpp
 * @brief Tests for diff configuration loading
 */

#include "apidrift/config.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace apidrift::config::test {

namespace {

std::filesystem::path testdata(const std::string& name)
{
    return std::filesystem::path(APIDRIFT_TESTDATA_DIR) / name;
}

std::filesystem::path schema_dir()
{
    return std::filesystem::path(APIDRIFT_SCHEMA_DIR);
}

}  // namespace

TEST(DiffConfig, Defaults)
{
    const DiffConfig config;
    EXPECT_EQ(config.min_severity, rules::Severity::kChange);
    EXPECT_TRUE(config.include_unchanged);
    EXPECT_EQ(config.format, OutputFormat::kText);
    EXPECT_TRUE(config.validate_output);
    EXPECT_FALSE(config.fail_on.has_value());
}

TEST(ParseOutputFormat, KnownValues)
{
    EXPECT_EQ(parse_output_format("text"), OutputFormat::kText);
    EXPECT_EQ(parse_output_format("json"), OutputFormat::kJson);
    EXPECT_FALSE(parse_output_format("xml").has_value());
    EXPECT_EQ(to_string(OutputFormat::kJson), "json");
}

TEST(ApplyConfigJson, AbsentKeysKeepBase)
{
    DiffConfig base;
    base.format = OutputFormat::kJson;
    auto config = apply_config_json(nlohmann::json{
                                        {"min_severity", "breaking"}
    },
                                    base);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->min_severity, rules::Severity::kBreaking);
    EXPECT_EQ(config->format, OutputFormat::kJson);
    EXPECT_TRUE(config->include_unchanged);
}

TEST(ApplyConfigJson, RejectsWrongTypes)
{
    auto bad_flag = apply_config_json(nlohmann::json{
                                          {"include_unchanged", "yes"}
    },
                                      DiffConfig{});
    ASSERT_FALSE(bad_flag.has_value());
    EXPECT_EQ(bad_flag.error().code, "InvalidConfig");

    auto bad_severity = apply_config_json(nlohmann::json{
                                              {"fail_on", "fatal"}
    },
                                          DiffConfig{});
    ASSERT_FALSE(bad_severity.has_value());
    EXPECT_EQ(bad_severity.error().code, "InvalidArgument");

    auto not_object = apply_config_json(nlohmann::json::array(), DiffConfig{});
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, "InvalidConfig");
}

TEST(LoadConfig, ReadsAllSettings)
{
    auto config = load_config(testdata("config_strict.json"), schema_dir());
    ASSERT_TRUE(config.has_value()) << config.error().message;
    EXPECT_EQ(config->min_severity, rules::Severity::kWarning);
    EXPECT_EQ(config->fail_on, rules::Severity::kBreaking);
    EXPECT_FALSE(config->include_unchanged);
    EXPECT_EQ(config->format, OutputFormat::kJson);
    EXPECT_TRUE(config->validate_output);
}

TEST(LoadConfig, UnknownKeyFailsSchemaValidation)
{
    auto config = load_config(testdata("config_unknown_key.json"), schema_dir());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "SchemaInvalid");
}

TEST(LoadConfig, MissingFile)
{
    auto config = load_config(testdata("no_such_config.json"), schema_dir());
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, "IOError");
}

}  // namespace apidrift::config::test
