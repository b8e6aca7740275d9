/**
 * @file test_string_rewriter.cpp
 * @brief Unit tests for ordered literal substitution
 */

#include <gtest/gtest.h>
#include <internal/numeral_types.hpp>
#include <internal/text/string_rewriter.hpp>
#include <string>

using namespace numeral;
using namespace numeral::text;

TEST(StringRewriterTest, IndependentPairs) {
    EXPECT_EQ(rewrite("python.best", {{"thon", "mrt"}, {"est", "ase"}}), "pymrt.base");
}

TEST(StringRewriterTest, LaterPairsSeeEarlierOutput) {
    EXPECT_EQ(rewrite("x-x-x-x", {{"x", "est"}, {"est", "test"}}), "test-test-test-test");
    EXPECT_EQ(rewrite("ab", {{"a", "b"}, {"b", "c"}}), "cc");
}

TEST(StringRewriterTest, NonOverlappingLeftToRight) {
    EXPECT_EQ(rewrite("x-x-", {{"-x-", ".test"}}), "x.test");
    EXPECT_EQ(replaceAll("aaaa", "aa", "b"), "bb");
    EXPECT_EQ(replaceAll("aaa", "aa", "b"), "ba");
}

TEST(StringRewriterTest, SinglePassOnly) {
    // "XII" -> "XI" + "I" is not rewritten again
    EXPECT_EQ(rewrite("XIII", {{"III", "II"}}), "XII");
}

TEST(StringRewriterTest, EmptyInputsAreNoOps) {
    EXPECT_EQ(rewrite("", {{"a", "b"}}), "");
    EXPECT_EQ(rewrite("abc", {}), "abc");
}

TEST(StringRewriterTest, MultiByteGlyphs) {
    EXPECT_EQ(rewrite("ⅩⅠⅩⅡ", {{"ⅩⅠ", "Ⅺ"}, {"ⅩⅡ", "Ⅻ"}}), "ⅪⅫ");
}

TEST(StringRewriterTest, EmptyPatternIsRejected) {
    EXPECT_THROW(rewrite("abc", {{"", "x"}}), ConfigurationError);
}

TEST(StringRewriterTest, InvertSwapsPairsInOrder) {
    ReplacementList inverted = invert({{"a", "1"}, {"b", "2"}});
    ASSERT_EQ(inverted.size(), 2u);
    EXPECT_EQ(inverted[0].first, "1");
    EXPECT_EQ(inverted[0].second, "a");
    EXPECT_EQ(inverted[1].first, "2");
    EXPECT_EQ(inverted[1].second, "b");
}
