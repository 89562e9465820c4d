/**
 * @file test_resolver.cpp
 * @brief Tests for internal reference resolution
 */

#include "apidrift/openapi.hpp"
#include "apidrift/resolver.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace apidrift::resolver::test {

namespace {

schema::SchemaTable make_table(const nlohmann::json& schemas)
{
    auto table = openapi::parse_schema_table(nlohmann::json{
        {"components", {{"schemas", schemas}}}
    });
    EXPECT_TRUE(table.has_value());
    return table.value_or(schema::SchemaTable{});
}

}  // namespace

TEST(SchemaNameFromPointer, AcceptsComponentSchemaPointers)
{
    EXPECT_EQ(schema_name_from_pointer("#/components/schemas/User"), "User");
    EXPECT_EQ(schema_name_from_pointer("#/definitions/User"), "User");
    EXPECT_EQ(schema_name_from_pointer("#/$defs/User"), "User");
}

TEST(SchemaNameFromPointer, DecodesEscapedTokens)
{
    EXPECT_EQ(schema_name_from_pointer("#/components/schemas/a~1b~0c"), "a/b~c");
}

TEST(SchemaNameFromPointer, RejectsOtherPointers)
{
    EXPECT_FALSE(schema_name_from_pointer("#/components/schemas/"));
    EXPECT_FALSE(schema_name_from_pointer("#/components/schemas/User/properties/id"));
    EXPECT_FALSE(schema_name_from_pointer("other.yaml#/components/schemas/User"));
    EXPECT_FALSE(schema_name_from_pointer("https://example.com/user.json"));
}

TEST(Resolve, FollowsReferenceChains)
{
    const auto table = make_table({
        {"Alias",                         {{"$ref", "#/components/schemas/User"}}},
        {"Other",                        {{"$ref", "#/components/schemas/Alias"}}},
        { "User", {{"type", "object"}, {"description", "end of chain"}}}
    });

    VisitedNames visited;
    auto resolved = resolve("#/components/schemas/Other", table, visited);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->name, "User");
    ASSERT_NE(resolved->node, nullptr);
    EXPECT_EQ(resolved->node->description, "end of chain");
    EXPECT_EQ(visited, (VisitedNames{"Alias", "Other", "User"}));
}

TEST(Resolve, MissingTargetIsUnresolved)
{
    const auto table = make_table({
        {"User", {{"type", "object"}}}
    });

    VisitedNames visited;
    auto resolved = resolve("#/components/schemas/Ghost", table, visited);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, kUnresolvedReference);
    EXPECT_TRUE(visited.empty());
}

TEST(Resolve, ExternalPointerIsUnresolved)
{
    const schema::SchemaTable table;
    VisitedNames visited;
    auto resolved = resolve("common.yaml#/components/schemas/Error", table, visited);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, kUnresolvedReference);
}

TEST(Resolve, VisitedNameIsCircular)
{
    const auto table = make_table({
        {"A", {{"type", "object"}}}
    });

    VisitedNames visited{"A"};
    auto resolved = resolve("#/components/schemas/A", table, visited);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, kCircularReference);
}

TEST(Resolve, ReferenceLoopTerminates)
{
    const auto table = make_table({
        {"A", {{"$ref", "#/components/schemas/B"}}},
        {"B", {{"$ref", "#/components/schemas/A"}}}
    });

    VisitedNames visited;
    auto resolved = resolve("#/components/schemas/A", table, visited);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, kCircularReference);
}

}  // namespace apidrift::resolver::test
