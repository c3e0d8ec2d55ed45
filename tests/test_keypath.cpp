/**
 * @file test_keypath.cpp
 * @brief Unit tests for the key-path grammar (GoogleTest)
 *
 * Tests cover:
 * - parse_key_path: keys, indices, mixed paths
 * - parse_key_path: every grammar violation reports the full path
 * - format_key_path: canonical rendering
 * - find_by_key_path: lookup, absent nodes, shape mismatches
 */

#include <gtest/gtest.h>
#include "pathpatch/KeyPath.hpp"

using namespace pathpatch;

namespace {

KeyPath parse_ok(const std::string& path) {
    auto parsed = parse_key_path(path);
    EXPECT_TRUE(parsed.ok()) << "expected '" << path << "' to parse";
    return parsed.ok() ? *parsed : KeyPath{};
}

void expect_invalid(const std::string& path) {
    auto parsed = parse_key_path(path);
    ASSERT_FALSE(parsed.ok()) << "expected '" << path << "' to be rejected";
    EXPECT_EQ(parsed.error().kind(), ErrorKind::invalid_key_path);
    EXPECT_EQ(parsed.error().key_path(), path);
}

} // namespace

// ============================================================================
// parse_key_path - valid paths
// ============================================================================

TEST(ParseKeyPath, SingleKey) {
    auto components = parse_ok("name");
    ASSERT_EQ(components.size(), 1u);
    EXPECT_EQ(components[0], PathComponent::make_key("name"));
}

TEST(ParseKeyPath, NestedKeys) {
    auto components = parse_ok("profile.address.city");
    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[0], PathComponent::make_key("profile"));
    EXPECT_EQ(components[1], PathComponent::make_key("address"));
    EXPECT_EQ(components[2], PathComponent::make_key("city"));
}

TEST(ParseKeyPath, ArrayIndex) {
    auto components = parse_ok("tags[1]");
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0], PathComponent::make_key("tags"));
    EXPECT_EQ(components[1], PathComponent::make_index(1));
}

TEST(ParseKeyPath, ConsecutiveIndices) {
    auto components = parse_ok("matrix[0][12]");
    ASSERT_EQ(components.size(), 3u);
    EXPECT_EQ(components[1], PathComponent::make_index(0));
    EXPECT_EQ(components[2], PathComponent::make_index(12));
}

TEST(ParseKeyPath, KeyAfterIndex) {
    auto components = parse_ok("users[3].emails[0].address");
    ASSERT_EQ(components.size(), 6u);
    EXPECT_EQ(components[0], PathComponent::make_key("users"));
    EXPECT_EQ(components[1], PathComponent::make_index(3));
    EXPECT_EQ(components[2], PathComponent::make_key("emails"));
    EXPECT_EQ(components[3], PathComponent::make_index(0));
    EXPECT_EQ(components[4], PathComponent::make_key("address"));
}

TEST(ParseKeyPath, LeadingZerosInIndex) {
    auto components = parse_ok("tags[007]");
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[1], PathComponent::make_index(7));
}

TEST(ParseKeyPath, KeysKeepArbitraryCharacters) {
    auto components = parse_ok("héllo wörld.x-y_z");
    ASSERT_EQ(components.size(), 2u);
    EXPECT_EQ(components[0].key(), "héllo wörld");
    EXPECT_EQ(components[1].key(), "x-y_z");
}

// ============================================================================
// parse_key_path - grammar violations
// ============================================================================

TEST(ParseKeyPathErrors, EmptyPath) {
    expect_invalid("");
}

TEST(ParseKeyPathErrors, LeadingIndex) {
    expect_invalid("[0]");
    expect_invalid("[0].name");
}

TEST(ParseKeyPathErrors, EmptySegments) {
    expect_invalid(".name");
    expect_invalid("a..b");
    expect_invalid("a.");
    expect_invalid("tags[0].");
    expect_invalid(".");
}

TEST(ParseKeyPathErrors, NonDigitIndex) {
    expect_invalid("tags[x]");
    expect_invalid("tags[-1]");
    expect_invalid("tags[1.5]");
    expect_invalid("tags[ 1]");
}

TEST(ParseKeyPathErrors, EmptyIndex) {
    expect_invalid("tags[]");
}

TEST(ParseKeyPathErrors, UnterminatedBracket) {
    expect_invalid("tags[1");
    expect_invalid("tags[");
}

TEST(ParseKeyPathErrors, StrayClosingBracket) {
    expect_invalid("tags]");
    expect_invalid("tags[0]]");
}

TEST(ParseKeyPathErrors, NestedBracket) {
    expect_invalid("tags[[0]]");
}

TEST(ParseKeyPathErrors, DotInsideBracket) {
    expect_invalid("tags[0.1]");
}

TEST(ParseKeyPathErrors, IndexOverflow) {
    expect_invalid("tags[99999999999999999999999999]");
}

// ============================================================================
// format_key_path
// ============================================================================

TEST(FormatKeyPath, Empty) {
    EXPECT_EQ(format_key_path({}), "");
}

TEST(FormatKeyPath, CanonicalForm) {
    KeyPath components = {
        PathComponent::make_key("users"),
        PathComponent::make_index(3),
        PathComponent::make_index(0),
        PathComponent::make_key("name")
    };
    EXPECT_EQ(format_key_path(components), "users[3][0].name");
}

TEST(FormatKeyPath, ReparsesToSameComponents) {
    for (const std::string path : {"a", "a.b.c", "tags[2]", "m[0][1].x", "x[10].y[0]"}) {
        auto components = parse_ok(path);
        EXPECT_EQ(format_key_path(components), path);
        EXPECT_EQ(parse_ok(format_key_path(components)), components);
    }
}

// ============================================================================
// find_by_key_path
// ============================================================================

class FindByKeyPathTest : public ::testing::Test {
protected:
    Value data = {
        {"id", 42},
        {"tags", {"swift", "ios"}},
        {"profile", {
            {"address", {{"city", "Cupertino"}}},
            {"nickname", nullptr}
        }}
    };
};

TEST_F(FindByKeyPathTest, NestedKey) {
    auto found = find_by_key_path(data, "profile.address.city");
    ASSERT_TRUE(found.ok());
    ASSERT_NE(*found, nullptr);
    EXPECT_EQ(**found, "Cupertino");
}

TEST_F(FindByKeyPathTest, ArrayElement) {
    auto found = find_by_key_path(data, "tags[1]");
    ASSERT_TRUE(found.ok());
    ASSERT_NE(*found, nullptr);
    EXPECT_EQ(**found, "ios");
}

TEST_F(FindByKeyPathTest, MissingKeyIsNull) {
    auto found = find_by_key_path(data, "profile.age");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(*found, nullptr);
}

TEST_F(FindByKeyPathTest, IndexPastEndIsNull) {
    auto found = find_by_key_path(data, "tags[2]");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(*found, nullptr);
}

TEST_F(FindByKeyPathTest, NullLeafIsReturned) {
    auto found = find_by_key_path(data, "profile.nickname");
    ASSERT_TRUE(found.ok());
    ASSERT_NE(*found, nullptr);
    EXPECT_TRUE((*found)->is_null());
}

TEST_F(FindByKeyPathTest, TraversingNullIsAbsent) {
    auto found = find_by_key_path(data, "profile.nickname.first");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(*found, nullptr);
}

TEST_F(FindByKeyPathTest, KeyIntoScalarIsInvalid) {
    auto found = find_by_key_path(data, "id.value");
    ASSERT_FALSE(found.ok());
    EXPECT_EQ(found.error().kind(), ErrorKind::invalid_key_path);
    EXPECT_EQ(found.error().key_path(), "id.value");
}

TEST_F(FindByKeyPathTest, IndexIntoObjectIsInvalid) {
    auto found = find_by_key_path(data, "profile[0]");
    ASSERT_FALSE(found.ok());
    EXPECT_EQ(found.error().kind(), ErrorKind::invalid_key_path);
}

TEST_F(FindByKeyPathTest, KeyIntoArrayIsInvalid) {
    auto found = find_by_key_path(data, "tags.first");
    ASSERT_FALSE(found.ok());
    EXPECT_EQ(found.error().kind(), ErrorKind::invalid_key_path);
}

TEST_F(FindByKeyPathTest, MalformedPathIsInvalid) {
    auto found = find_by_key_path(data, "tags[");
    ASSERT_FALSE(found.ok());
    EXPECT_EQ(found.error().key_path(), "tags[");
}
