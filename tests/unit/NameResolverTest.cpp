/**
 * @file NameResolverTest.cpp
 * @brief Unit tests for flag tag parsing and name resolution
 */

#include <gtest/gtest.h>

#include <structflag/NameResolver.hpp>

using namespace StructFlag;

// =============================================================================
// parseFlagTag Tests
// =============================================================================

TEST(ParseFlagTagTest, EmptyTag) {
    FlagTag tag = parseFlagTag("");
    EXPECT_EQ(tag.name, "");
    EXPECT_EQ(tag.description, "");
    EXPECT_EQ(tag.defaultValue, "");
}

TEST(ParseFlagTagTest, NameOnly) {
    FlagTag tag = parseFlagTag("interval");
    EXPECT_EQ(tag.name, "interval");
    EXPECT_EQ(tag.description, "");
    EXPECT_EQ(tag.defaultValue, "");
}

TEST(ParseFlagTagTest, AllComponents) {
    FlagTag tag = parseFlagTag("interval,Some description,5s");
    EXPECT_EQ(tag.name, "interval");
    EXPECT_EQ(tag.description, "Some description");
    EXPECT_EQ(tag.defaultValue, "5s");
}

TEST(ParseFlagTagTest, ExtraComponentsIgnored) {
    FlagTag tag = parseFlagTag("name,desc,1,2,3");
    EXPECT_EQ(tag.name, "name");
    EXPECT_EQ(tag.description, "desc");
    EXPECT_EQ(tag.defaultValue, "1");
}

TEST(ParseFlagTagTest, EmptyNameWithDescription) {
    FlagTag tag = parseFlagTag(",Only a description,");
    EXPECT_EQ(tag.name, "");
    EXPECT_EQ(tag.description, "Only a description");
    EXPECT_EQ(tag.defaultValue, "");
}

// =============================================================================
// resolveFlag Tests
// =============================================================================

TEST(ResolveFlagTest, DeclaredNameVerbatim) {
    ResolvedFlag r = resolveFlag("Timeout", "", "", "");
    EXPECT_EQ(r.name, "Timeout");
    EXPECT_FALSE(r.skip);
    EXPECT_EQ(r.description, "");
    EXPECT_EQ(r.defaultValue, "");
}

TEST(ResolveFlagTest, FlagTagWinsOverJsonTag) {
    ResolvedFlag r = resolveFlag("Duration", "interval,Some description,5s", "duration", "");
    EXPECT_EQ(r.name, "interval");
    EXPECT_EQ(r.description, "Some description");
    EXPECT_EQ(r.defaultValue, "5s");
}

TEST(ResolveFlagTest, JsonTagFirstSegment) {
    ResolvedFlag r = resolveFlag("Int", "", "number,omitempty", "");
    EXPECT_EQ(r.name, "number");
}

TEST(ResolveFlagTest, EmptyFlagTagNameFallsBackToJson) {
    ResolvedFlag r = resolveFlag("Int", ",Count of things,3", "number", "");
    EXPECT_EQ(r.name, "number");
    EXPECT_EQ(r.description, "Count of things");
    EXPECT_EQ(r.defaultValue, "3");
}

TEST(ResolveFlagTest, EmptyJsonNameKeepsDeclaredName) {
    ResolvedFlag r = resolveFlag("Verbose", "", ",omitempty", "");
    EXPECT_EQ(r.name, "Verbose");
}

TEST(ResolveFlagTest, JsonTagCarriesNoDescription) {
    ResolvedFlag r = resolveFlag("Int", "", "number,Not a description,5", "");
    EXPECT_EQ(r.description, "");
    EXPECT_EQ(r.defaultValue, "");
}

TEST(ResolveFlagTest, UnderscoresBecomeHyphens) {
    EXPECT_EQ(resolveFlag("String", "", "string_with_underscores", "").name,
              "string-with-underscores");
    EXPECT_EQ(resolveFlag("read_timeout", "", "", "").name, "read-timeout");
    EXPECT_EQ(resolveFlag("x", "max__body_", "", "").name, "max--body-");
}

TEST(ResolveFlagTest, PrefixJoinedWithHyphen) {
    EXPECT_EQ(resolveFlag("Int", "", "number", "test").name, "test-number");
    EXPECT_EQ(resolveFlag("Int", "", "number", "").name, "number");
}

TEST(ResolveFlagTest, PrefixIsNotHyphenated) {
    // 접두사는 호출자가 준 그대로 사용한다.
    EXPECT_EQ(resolveFlag("a_b", "", "", "my_app").name, "my_app-a-b");
}

TEST(ResolveFlagTest, PlaceholderSkips) {
    ResolvedFlag flagSkip = resolveFlag("Secret", "-", "", "");
    EXPECT_TRUE(flagSkip.skip);
    EXPECT_EQ(flagSkip.name, "-");

    ResolvedFlag jsonSkip = resolveFlag("Secret", "", "-", "");
    EXPECT_TRUE(jsonSkip.skip);
}

TEST(ResolveFlagTest, PlaceholderNotPrefixed) {
    ResolvedFlag r = resolveFlag("Secret", "-", "", "test");
    EXPECT_TRUE(r.skip);
    EXPECT_EQ(r.name, "-");
}

TEST(ResolveFlagTest, UnderscoreAloneSkips) {
    // "_" 는 하이픈 치환 후 "-" 가 되므로 생략 대상이다.
    EXPECT_TRUE(resolveFlag("x", "_", "", "").skip);
}

// =============================================================================
// makeFlagName Tests
// =============================================================================

TEST(MakeFlagNameTest, JoinsOnlyWithPrefix) {
    EXPECT_EQ(makeFlagName("", "port"), "port");
    EXPECT_EQ(makeFlagName("db", "port"), "db-port");
}
