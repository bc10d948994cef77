/**
 * @file test_dotpath.cpp
 * @brief Unit tests for dot-path utilities (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tidymerge/DotPath.hpp"
#include "tidymerge/Errors.hpp"

using namespace tidymerge;

// ============================================================================
// split / join
// ============================================================================

TEST(SplitDotPath, Basic) {
    EXPECT_EQ(split_dot_path("merge.key"), (std::vector<std::string>{"merge", "key"}));
    EXPECT_EQ(split_dot_path("single"), (std::vector<std::string>{"single"}));
    EXPECT_TRUE(split_dot_path("").empty());
}

TEST(SplitDotPath, DropsEmptySegments) {
    EXPECT_EQ(split_dot_path(".a..b."), (std::vector<std::string>{"a", "b"}));
}

TEST(JoinDotPath, Basic) {
    EXPECT_EQ(join_dot_path({"a", "b", "c"}), "a.b.c");
    EXPECT_EQ(join_dot_path({}), "");
}

// ============================================================================
// Lookups
// ============================================================================

class DotLookupTest : public ::testing::Test {
protected:
    Value data = {
        {"attributes", {
            {"name", "TabSize"},
            {"flags", {"a", "b", "c"}}
        }},
        {"value", 4}
    };
};

TEST_F(DotLookupTest, GetNested) {
    EXPECT_EQ(*get_by_dot(data, "attributes.name"), "TabSize");
    EXPECT_EQ(*get_by_dot(data, "attributes.flags.2"), "c");
}

TEST_F(DotLookupTest, EmptyPathReturnsRoot) {
    EXPECT_EQ(get_by_dot(data, ""), &data);
    EXPECT_EQ(find_by_dot(data, ""), &data);
}

TEST_F(DotLookupTest, GetMissingThrowsKeyError) {
    try {
        get_by_dot(data, "attributes.missing");
        FAIL() << "expected KeyError";
    } catch (const KeyError& e) {
        EXPECT_EQ(e.path(), "attributes.missing");
        EXPECT_EQ(e.segment(), "missing");
    }
    EXPECT_THROW(get_by_dot(data, "attributes.flags.3"), KeyError);
    EXPECT_THROW(get_by_dot(data, "attributes.flags.01"), KeyError);
}

TEST_F(DotLookupTest, GetThroughScalarThrowsTypeError) {
    try {
        get_by_dot(data, "value.inner");
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.actual(), "integer");
    }
}

TEST_F(DotLookupTest, FindNeverThrows) {
    EXPECT_NE(find_by_dot(data, "attributes.flags.0"), nullptr);
    EXPECT_EQ(find_by_dot(data, "attributes.missing"), nullptr);
    EXPECT_EQ(find_by_dot(data, "value.inner"), nullptr);
    EXPECT_EQ(find_by_dot(data, "attributes.flags.99999999999999999999999"), nullptr);
}

TEST_F(DotLookupTest, Contains) {
    EXPECT_TRUE(contains_dot(data, "attributes.name"));
    EXPECT_FALSE(contains_dot(data, "attributes.other"));
    EXPECT_THROW(contains_dot(data, "value.x"), TypeError);
}

// ============================================================================
// set_by_dot
// ============================================================================

TEST(SetByDot, CreatesIntermediates) {
    Value data = Value::object();
    set_by_dot(data, "merge.key", "name");
    EXPECT_EQ(data["merge"]["key"], "name");
}

TEST(SetByDot, OverwritesScalarIntermediate) {
    Value data = {{"output", 2}};
    set_by_dot(data, "output.indent", 4);
    EXPECT_EQ(data["output"]["indent"], 4);
}

TEST(SetByDot, EmptyPathReplacesRoot) {
    Value data = {{"a", 1}};
    set_by_dot(data, "", Value::array());
    EXPECT_TRUE(data.is_array());
}
