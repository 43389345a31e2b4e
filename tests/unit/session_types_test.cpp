#include "core/session/session_types.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace session::core;

TEST(DecodeUserIdTest, AcceptsEveryIntegerRepresentation) {
    EXPECT_EQ(DecodeUserId(FieldValue(std::int32_t{42})), std::optional<UserId>(42));
    EXPECT_EQ(DecodeUserId(FieldValue(std::int64_t{5000000000})), std::optional<UserId>(5000000000));
    EXPECT_EQ(DecodeUserId(FieldValue(std::string("77"))), std::optional<UserId>(77));
}

TEST(DecodeUserIdTest, RejectsNonPositiveValues) {
    EXPECT_FALSE(DecodeUserId(FieldValue(std::int32_t{0})).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::int64_t{-3})).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string("-1"))).has_value());
}

TEST(DecodeUserIdTest, RejectsMalformedText) {
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string(""))).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string("abc"))).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string("12abc"))).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string(" 12"))).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string("+12"))).has_value());
    EXPECT_FALSE(DecodeUserId(FieldValue(std::string("99999999999999999999"))).has_value());
}

TEST(CachedUidTextTest, SentinelRoundTrips) {
    EXPECT_EQ(EncodeCachedUid(CachedUid(InvalidSession{})), "-1");
    auto parsed = ParseCachedUid("-1");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(IsInvalid(*parsed));
}

TEST(CachedUidTextTest, ParsesPositiveIds) {
    EXPECT_EQ(EncodeCachedUid(CachedUid(UserId{42})), "42");
    auto parsed = ParseCachedUid("42");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_FALSE(IsInvalid(*parsed));
    EXPECT_EQ(std::get<UserId>(*parsed), 42);
}

TEST(CachedUidTextTest, RejectsOtherValues) {
    EXPECT_FALSE(ParseCachedUid("0").has_value());
    EXPECT_FALSE(ParseCachedUid("-2").has_value());
    EXPECT_FALSE(ParseCachedUid("garbage").has_value());
    EXPECT_FALSE(ParseCachedUid("").has_value());
}
