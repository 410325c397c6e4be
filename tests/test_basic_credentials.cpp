//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_basic_credentials.cpp
// Purpose: GoogleTests for Basic Authorization header parsing and construction
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>

#include "basicauth/auth/BasicCredentials.hpp"
#include "basicauth/errors/Errors.h"

using namespace basicauth::auth;
using basicauth::errors::MalformedCredentialsError;

namespace {

Credentials expectCredentials(const std::string& header) {
    AuthAttempt a = parseBasicAuthorization(std::optional<std::string>(header));
    EXPECT_TRUE(std::holds_alternative<Credentials>(a)) << "header: " << header;
    if (!std::holds_alternative<Credentials>(a)) {
        return Credentials{};
    }
    return std::get<Credentials>(a);
}

} // namespace

TEST(BasicCredentials, MissingHeaderIsAbsent) {
    AuthAttempt a = parseBasicAuthorization(std::nullopt);
    EXPECT_TRUE(std::holds_alternative<Absent>(a));
}

TEST(BasicCredentials, OtherSchemesAreAbsent) {
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("Bearer abc"))));
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("Digest username=\"x\""))));
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string(""))));
}

TEST(BasicCredentials, SchemeTokenIsCaseSensitive) {
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("basic U25vcmt5OkNhcG9uZQ=="))));
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("BASIC U25vcmt5OkNhcG9uZQ=="))));
}

TEST(BasicCredentials, RequiresSingleSpaceAfterScheme) {
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("Basic"))));
    EXPECT_TRUE(std::holds_alternative<Absent>(parseBasicAuthorization(std::string("Basic\tU25vcmt5OkNhcG9uZQ=="))));
    // Extra space becomes part of the payload, which is then not valid base64
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic  U25vcmt5OkNhcG9uZQ==")), MalformedCredentialsError);
}

TEST(BasicCredentials, DecodesUsernameAndPassword) {
    Credentials c = expectCredentials("Basic U25vcmt5OkNhcG9uZQ==");
    EXPECT_EQ(c.username, std::string("Snorky"));
    EXPECT_EQ(c.password, std::string("Capone"));

    Credentials rfc = expectCredentials("Basic QWxhZGRpbjpvcGVuIHNlc2FtZQ==");
    EXPECT_EQ(rfc.username, std::string("Aladdin"));
    EXPECT_EQ(rfc.password, std::string("open sesame"));
}

TEST(BasicCredentials, PasswordKeepsColons) {
    Credentials c = expectCredentials("Basic dXNlcjphOmI6Yw==");
    EXPECT_EQ(c.username, std::string("user"));
    EXPECT_EQ(c.password, std::string("a:b:c"));
}

TEST(BasicCredentials, EmptyComponentsAreValid) {
    Credentials both = expectCredentials("Basic Og==");
    EXPECT_EQ(both, (Credentials{"", ""}));

    Credentials noPass = expectCredentials("Basic YWxpY2U6");
    EXPECT_EQ(noPass, (Credentials{"alice", ""}));

    Credentials noUser = expectCredentials("Basic OnNlY3JldA==");
    EXPECT_EQ(noUser, (Credentials{"", "secret"}));
}

TEST(BasicCredentials, Utf8IsPassedThrough) {
    Credentials c = expectCredentials("Basic dXPDqXI6cMOkc3M=");
    EXPECT_EQ(c.username, std::string("us\xC3\xA9r"));
    EXPECT_EQ(c.password, std::string("p\xC3\xA4ss"));
}

TEST(BasicCredentials, InvalidBase64Throws) {
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic not-base64!")), MalformedCredentialsError);
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic U25vcmt5OkNhcG9uZQ")), MalformedCredentialsError);
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic U25vcmt5_kNhcG9uZQ==")), MalformedCredentialsError);
}

TEST(BasicCredentials, MissingColonThrows) {
    // "bob"
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic Ym9i")), MalformedCredentialsError);
    // empty payload decodes to "" which has no separator either
    EXPECT_THROW(parseBasicAuthorization(std::string("Basic ")), MalformedCredentialsError);
}

TEST(BasicCredentials, MakeHeaderParsesBack) {
    const std::string h = makeBasicAuthorization("Snorky", "Capone");
    EXPECT_EQ(h, std::string("Basic U25vcmt5OkNhcG9uZQ=="));

    const Credentials samples[] = {
        {"alice", "wonderland"},
        {"", ""},
        {"svc-account", "p@ss w0rd"},
        {"user", "a:b:c"},
    };
    for (const auto& s : samples) {
        EXPECT_EQ(expectCredentials(makeBasicAuthorization(s.username, s.password)), s);
    }
}
