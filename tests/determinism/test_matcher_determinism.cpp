/**
 * @file test_matcher_determinism.cpp
 * @brief Repeated comparisons produce identical reports
 */

#include "apidrift/matcher.hpp"
#include "apidrift/openapi.hpp"
#include "apidrift/report.hpp"

#include <filesystem>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace apidrift::test {

namespace {

std::filesystem::path testdata(const std::string& name)
{
    return std::filesystem::path(APIDRIFT_TESTDATA_DIR) / name;
}

nlohmann::json run_report(const schema::SchemaTable& base, const schema::SchemaTable& current)
{
    const auto results = report::assemble(matcher::SchemaMatcher(base, current).match());
    const auto overview = report::build_schema_overview(current, results);
    return report::build_report_json(results, overview);
}

}  // namespace

TEST(MatcherDeterminism, RepeatedRunsAreIdentical)
{
    auto base = openapi::load_schema_table(testdata("petstore_base.json"));
    auto current = openapi::load_schema_table(testdata("petstore_current.json"));
    ASSERT_TRUE(base.has_value()) << base.error().message;
    ASSERT_TRUE(current.has_value()) << current.error().message;

    const auto first = run_report(*base, *current).dump();
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(run_report(*base, *current).dump(), first);
    }
}

TEST(MatcherDeterminism, JsonAndYamlDocumentsAgree)
{
    auto base = openapi::load_schema_table(testdata("petstore_base.json"));
    auto from_json = openapi::load_schema_table(testdata("petstore_current.json"));
    auto from_yaml = openapi::load_schema_table(testdata("petstore_current.yaml"));
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(from_json.has_value());
    ASSERT_TRUE(from_yaml.has_value()) << from_yaml.error().message;

    EXPECT_EQ(run_report(*base, *from_json).dump(), run_report(*base, *from_yaml).dump());
}

TEST(MatcherDeterminism, PropertyOrderFollowsNames)
{
    // Declaration order differs between the documents; violations still come out by name.
    const auto base = openapi::parse_schema_table(nlohmann::json::parse(R"({
        "components": {"schemas": {"S": {"properties": {
            "zeta": {"type": "string"}, "alpha": {"type": "string"}, "mid": {"type": "string"}
        }}}}
    })"));
    const auto current = openapi::parse_schema_table(nlohmann::json::parse(R"({
        "components": {"schemas": {"S": {"properties": {
            "mid": {"type": "integer"}, "alpha": {"type": "integer"}, "zeta": {"type": "integer"}
        }}}}
    })"));
    ASSERT_TRUE(base.has_value());
    ASSERT_TRUE(current.has_value());

    const auto result = matcher::SchemaMatcher(*base, *current).match_schema("S");
    ASSERT_EQ(result.violations.size(), 3U);
    EXPECT_EQ(result.violations[0].anchor(), "alpha");
    EXPECT_EQ(result.violations[1].anchor(), "mid");
    EXPECT_EQ(result.violations[2].anchor(), "zeta");
}

}  // namespace apidrift::test
