//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_base64.cpp
// Purpose: GoogleTests for the strict standard base64 codec
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "basicauth/auth/Base64.hpp"

using namespace basicauth::auth;

TEST(Base64, EncodesRfc4648Vectors) {
    EXPECT_EQ(encodeBase64(""), std::string(""));
    EXPECT_EQ(encodeBase64("f"), std::string("Zg=="));
    EXPECT_EQ(encodeBase64("fo"), std::string("Zm8="));
    EXPECT_EQ(encodeBase64("foo"), std::string("Zm9v"));
    EXPECT_EQ(encodeBase64("foobar"), std::string("Zm9vYmFy"));
    EXPECT_EQ(encodeBase64("Snorky:Capone"), std::string("U25vcmt5OkNhcG9uZQ=="));
}

TEST(Base64, DecodesPaddedInput) {
    auto one = decodeBase64("Zg==");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one.value(), std::string("f"));

    auto two = decodeBase64("Zm8=");
    ASSERT_TRUE(two.has_value());
    EXPECT_EQ(two.value(), std::string("fo"));

    auto creds = decodeBase64("U25vcmt5OkNhcG9uZQ==");
    ASSERT_TRUE(creds.has_value());
    EXPECT_EQ(creds.value(), std::string("Snorky:Capone"));
}

TEST(Base64, EmptyInputDecodesToEmpty) {
    auto out = decodeBase64("");
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}

TEST(Base64, PreservesBinaryBytes) {
    const std::string raw("a:b\0c", 5);
    EXPECT_EQ(encodeBase64(raw), std::string("YTpiAGM="));
    auto out = decodeBase64("YTpiAGM=");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out.value(), raw);

    const std::string high("\xff\x00\x80", 3);
    EXPECT_EQ(encodeBase64(high), std::string("/wCA"));
    auto back = decodeBase64("/wCA");
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back.value(), high);
}

TEST(Base64, RejectsMissingPadding) {
    EXPECT_FALSE(decodeBase64("Zg").has_value());
    EXPECT_FALSE(decodeBase64("U25vcmt5OkNhcG9uZQ").has_value());
}

TEST(Base64, RejectsUrlSafeAlphabet) {
    // "AP/+" in the URL-safe alphabet
    EXPECT_TRUE(decodeBase64("AP/+").has_value());
    EXPECT_FALSE(decodeBase64("AP_-").has_value());
}

TEST(Base64, RejectsWhitespaceAndGarbage) {
    EXPECT_FALSE(decodeBase64("Zm9v Yg==").has_value());
    EXPECT_FALSE(decodeBase64("Zm9v\nYmFy").has_value());
    EXPECT_FALSE(decodeBase64("not base64!").has_value());
    EXPECT_FALSE(decodeBase64("%%%%").has_value());
}

TEST(Base64, RejectsMisplacedPadding) {
    EXPECT_FALSE(decodeBase64("====").has_value());
    EXPECT_FALSE(decodeBase64("Z===").has_value());
    EXPECT_FALSE(decodeBase64("Zg==Zg==").has_value());
    EXPECT_FALSE(decodeBase64("Zm=v").has_value());
}
