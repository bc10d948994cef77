/**
 * @file test_trivia.cpp
 * @brief Tests for leading_trivia() and sample_separator() (GoogleTest)
 */

#include <gtest/gtest.h>
#include "tidymerge/Trivia.hpp"

#include <stdexcept>

using namespace tidymerge;

// ============================================================================
// leading_trivia
// ============================================================================

class LeadingTriviaTest : public ::testing::Test {
protected:
    // 0 ws, 1 A, 2 ws, 3 comment, 4 ws, 5 B, 6 C, 7 ws
    Container c = Container()
        .append_whitespace("\n  ")
        .append_element("A")
        .append_whitespace("\n  ")
        .append_comment("<!-- b -->")
        .append_whitespace("\n  ")
        .append_element("B")
        .append_element("C")
        .append_whitespace("\n");
};

TEST_F(LeadingTriviaTest, FirstElementTakesEverythingBeforeIt) {
    auto range = leading_trivia(c, 1);
    EXPECT_EQ(range.begin, 0u);
    EXPECT_EQ(range.end, 1u);
}

TEST_F(LeadingTriviaTest, StopsAtPreviousElement) {
    auto range = leading_trivia(c, 5);
    EXPECT_EQ(range.begin, 2u);
    EXPECT_EQ(range.end, 5u);
    EXPECT_EQ(range.size(), 3u);
}

TEST_F(LeadingTriviaTest, AdjacentElementsHaveEmptyRun) {
    auto range = leading_trivia(c, 6);
    EXPECT_TRUE(range.empty());
    EXPECT_EQ(range.begin, 6u);
}

TEST_F(LeadingTriviaTest, NodesAreCopiesInOrder) {
    auto nodes = leading_trivia_nodes(c, 5);
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(std::get<Trivia>(nodes[1]), Trivia::comment("<!-- b -->"));
    EXPECT_EQ(c.size(), 8u);
}

TEST_F(LeadingTriviaTest, OutOfRangeThrows) {
    EXPECT_THROW(leading_trivia(c, 8), std::out_of_range);
}

TEST(LeadingTrivia, ElementAtStart) {
    Container c;
    c.append_element("A").append_whitespace(" ");
    EXPECT_TRUE(leading_trivia(c, 0).empty());
}

// ============================================================================
// sample_separator
// ============================================================================

TEST(SampleSeparator, PrefersPreviousSibling) {
    Container c;
    c.append_whitespace("\n\t").append_element("A").append_whitespace("\n");

    auto sample = sample_separator(c, 1);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(std::get<Trivia>(*sample).text, "\n\t");
}

TEST(SampleSeparator, FallsBackToNextSibling) {
    Container c;
    c.append_comment("# a").append_element("A").append_whitespace("\n    ");

    auto sample = sample_separator(c, 1);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(std::get<Trivia>(*sample).text, "\n    ");
}

TEST(SampleSeparator, CommentsAreNotSeparators) {
    Container c;
    c.append_comment("# a").append_element("A").append_comment("# b");
    EXPECT_FALSE(sample_separator(c, 1).has_value());
}

TEST(SampleSeparator, ElementNeighboursAreNotSeparators) {
    Container c;
    c.append_element("A").append_element("B").append_element("C");
    EXPECT_FALSE(sample_separator(c, 1).has_value());
}

TEST(SampleSeparator, EmptyContainer) {
    Container c;
    EXPECT_FALSE(sample_separator(c, 0).has_value());
}

TEST(SampleSeparator, OriginalStaysInPlace) {
    Container c;
    c.append_whitespace("\n  ").append_element("A");
    const Container before = c;

    auto sample = sample_separator(c, 1);
    ASSERT_TRUE(sample.has_value());
    c.insert(0, {*sample});

    EXPECT_EQ(c.size(), 3u);
    EXPECT_EQ(c[1], before[0]);
}
