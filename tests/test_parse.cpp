/**
 * @file test_parse.cpp
 * @brief Unit tests for PATH=VALUE literal parsing (GoogleTest)
 *
 * - Only "true"/"false" for booleans (not yes/no/on/off)
 * - Only "null" for null (not none/nil)
 * - Integers above INT64_MAX stay unsigned up to UINT64_MAX, then become floats
 * - Double quotes only (not single quotes)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>
#include "pathpatch/Parse.hpp"
#include "pathpatch/Value.hpp"

#include <cstdint>

using namespace pathpatch;

// ============================================================================
// Boolean and null
// ============================================================================

TEST(ParseBoolean, CaseInsensitive) {
    EXPECT_EQ(parse_value("true"), true);
    EXPECT_EQ(parse_value("True"), true);
    EXPECT_EQ(parse_value("FALSE"), false);
}

TEST(ParseBoolean, OnlyTrueFalse) {
    EXPECT_EQ(parse_value("yes"), "yes");
    EXPECT_EQ(parse_value("off"), "off");
    EXPECT_EQ(parse_value("1"), 1);
}

TEST(ParseNull, NullValues) {
    EXPECT_TRUE(parse_value("null").is_null());
    EXPECT_TRUE(parse_value("NULL").is_null());
    EXPECT_EQ(parse_value("nil"), "nil");
}

// ============================================================================
// Numbers
// ============================================================================

TEST(ParseInteger, Signed) {
    EXPECT_EQ(parse_value("0"), 0);
    EXPECT_EQ(parse_value("42"), 42);
    EXPECT_EQ(parse_value("-12345"), -12345);
    EXPECT_TRUE(parse_value("42").is_number_integer());
}

TEST(ParseInteger, LeadingZeros) {
    EXPECT_EQ(parse_value("007"), 7);
}

TEST(ParseInteger, Int64Limits) {
    EXPECT_EQ(parse_value("9223372036854775807").get<std::int64_t>(), INT64_MAX);
    EXPECT_EQ(parse_value("-9223372036854775808").get<std::int64_t>(), INT64_MIN);
}

TEST(ParseInteger, AboveInt64StaysUnsigned) {
    Value v = parse_value("18446744073709551615");
    EXPECT_TRUE(v.is_number_unsigned());
    EXPECT_EQ(v.get<std::uint64_t>(), UINT64_MAX);

    Value just_past = parse_value("9223372036854775808");
    EXPECT_TRUE(just_past.is_number_unsigned());
    EXPECT_EQ(just_past.get<std::uint64_t>(), 9223372036854775808ULL);
}

TEST(ParseInteger, OverflowBecomesFloat) {
    Value v = parse_value("92233720368547758070");
    EXPECT_TRUE(v.is_number_float());
    EXPECT_DOUBLE_EQ(v.get<double>(), 92233720368547758070.0);
}

TEST(ParseFloat, Decimal) {
    EXPECT_DOUBLE_EQ(parse_value("3.14").get<double>(), 3.14);
    EXPECT_DOUBLE_EQ(parse_value("-0.5").get<double>(), -0.5);
    EXPECT_TRUE(parse_value("3.14").is_number_float());
}

TEST(ParseFloat, ScientificNotation) {
    EXPECT_DOUBLE_EQ(parse_value("1e10").get<double>(), 1e10);
    EXPECT_DOUBLE_EQ(parse_value("1.5e-3").get<double>(), 1.5e-3);
    EXPECT_DOUBLE_EQ(parse_value("-2.5E+2").get<double>(), -250.0);
}

TEST(ParseFloat, IncompleteFormsAreStrings) {
    EXPECT_EQ(parse_value("1."), "1.");
    EXPECT_EQ(parse_value(".5"), ".5");
    EXPECT_EQ(parse_value("1e"), "1e");
}

// ============================================================================
// JSON compounds
// ============================================================================

TEST(ParseJson, Arrays) {
    Value arr = parse_value("[1, \"two\", null]");
    ASSERT_TRUE(arr.is_array());
    EXPECT_EQ(arr, Value({1, "two", nullptr}));
}

TEST(ParseJson, Objects) {
    Value obj = parse_value(R"({"outer": {"inner": 42}})");
    ASSERT_TRUE(obj.is_object());
    EXPECT_EQ(obj["outer"]["inner"], 42);
}

TEST(ParseJson, EmptyContainers) {
    EXPECT_EQ(parse_value("[]"), Value::array());
    EXPECT_EQ(parse_value("{}"), Value::object());
}

TEST(ParseJson, MalformedFallsBackToString) {
    EXPECT_EQ(parse_value("[incomplete"), "[incomplete");
    EXPECT_EQ(parse_value("{bad:json}"), "{bad:json}");
}

// ============================================================================
// Strings
// ============================================================================

TEST(ParseString, DoubleQuoted) {
    EXPECT_EQ(parse_value("\"hello world\""), "hello world");
    EXPECT_EQ(parse_value("\"\""), "");
}

TEST(ParseString, EscapeSequences) {
    EXPECT_EQ(parse_value("\"hello\\nworld\""), "hello\nworld");
    EXPECT_EQ(parse_value("\"quote\\\"here\""), "quote\"here");
}

TEST(ParseString, QuotedScalarsStayStrings) {
    EXPECT_EQ(parse_value("\"42\""), "42");
    EXPECT_EQ(parse_value("\"true\""), "true");
    EXPECT_EQ(parse_value("\"null\""), "null");
}

TEST(ParseString, SingleQuotesAreRaw) {
    EXPECT_EQ(parse_value("'hello'"), "'hello'");
}

TEST(ParseRawString, Fallback) {
    EXPECT_EQ(parse_value("San Francisco"), "San Francisco");
    EXPECT_EQ(parse_value("https://example.com"), "https://example.com");
    EXPECT_EQ(parse_value("123abc"), "123abc");
}

TEST(ParseEdgeCases, EmptyString) {
    EXPECT_EQ(parse_value(""), "");
}

TEST(ParseEdgeCases, WhitespaceIsKept) {
    EXPECT_EQ(parse_value("  42  "), "  42  ");
}
