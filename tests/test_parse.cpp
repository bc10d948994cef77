/**
 * @file test_parse.cpp
 * @brief Tests for typed value parsing (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tidymerge/Parse.hpp"

using namespace tidymerge;

// ============================================================================
// parse_value
// ============================================================================

TEST(ParseValue, Booleans) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
}

TEST(ParseValue, Null) {
    EXPECT_TRUE(parse_value("Null").is_null());
}

TEST(ParseValue, Integers) {
    EXPECT_EQ(parse_value("4"), 4);
    EXPECT_EQ(parse_value("-17"), -17);
    EXPECT_TRUE(parse_value("4").is_number_integer());
}

TEST(ParseValue, IntegerOverflowStaysString) {
    auto v = parse_value("99999999999999999999999");
    EXPECT_TRUE(v.is_string());
}

TEST(ParseValue, Floats) {
    EXPECT_DOUBLE_EQ(parse_value("3.25").get<double>(), 3.25);
    EXPECT_DOUBLE_EQ(parse_value("-2.5e3").get<double>(), -2500.0);
    EXPECT_TRUE(parse_value("1.").is_string());
    EXPECT_TRUE(parse_value(".5").is_string());
}

TEST(ParseValue, Compound) {
    EXPECT_EQ(parse_value("{\"a\":1}"), (Value{{"a", 1}}));
    EXPECT_EQ(parse_value("[1,2]"), (Value{1, 2}));
    EXPECT_EQ(parse_value("{broken"), "{broken");
}

TEST(ParseValue, QuotedString) {
    EXPECT_EQ(parse_value("\"42\""), "42");
    EXPECT_EQ(parse_value("\"a\\nb\""), "a\nb");
}

TEST(ParseValue, RawString) {
    EXPECT_EQ(parse_value("field:id"), "field:id");
    EXPECT_EQ(parse_value(""), "");
}

// ============================================================================
// parse_overrides
// ============================================================================

TEST(ParseOverrides, SplitsPairs) {
    auto kv = parse_overrides("output.indent:4, log.verbose:true");
    ASSERT_EQ(kv.size(), 2u);
    EXPECT_EQ(kv["output.indent"], 4);
    EXPECT_EQ(kv["log.verbose"], true);
}

TEST(ParseOverrides, FirstColonSeparates) {
    auto kv = parse_overrides("merge.key:field:attributes.name");
    EXPECT_EQ(kv["merge.key"], "field:attributes.name");
}

TEST(ParseOverrides, CommasInsideJsonDoNotSplit) {
    auto kv = parse_overrides("a:[1,2,3], b:{\"x\":1,\"y\":2}, c:\"p,q\"");
    ASSERT_EQ(kv.size(), 3u);
    EXPECT_EQ(kv["a"], (Value{1, 2, 3}));
    EXPECT_EQ(kv["b"]["y"], 2);
    EXPECT_EQ(kv["c"], "p,q");
}

TEST(ParseOverrides, IgnoresMalformedPairs) {
    auto kv = parse_overrides("novalue, :5, ok:1");
    ASSERT_EQ(kv.size(), 1u);
    EXPECT_EQ(kv["ok"], 1);
}

TEST(ParseOverrides, Empty) {
    EXPECT_TRUE(parse_overrides("").empty());
}
