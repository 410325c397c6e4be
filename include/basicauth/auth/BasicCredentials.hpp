//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BasicCredentials.hpp
// Purpose: Basic scheme credential types, Authorization header parsing and header construction
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace basicauth::auth {

// Scheme token and separator, matched case-sensitively.
inline constexpr std::string_view kBasicSchemePrefix = "Basic ";

//==========================================================================================================
// Credentials
// Purpose: Username/password pair decoded from a Basic Authorization header. Empty strings are valid.
//==========================================================================================================
struct Credentials {
    std::string username;
    std::string password;

    bool operator==(const Credentials&) const = default;
};

//==========================================================================================================
// Absent
// Purpose: Marker for "no usable Basic credentials": no header, or a scheme other than Basic.
//==========================================================================================================
struct Absent {
    bool operator==(const Absent&) const = default;
};

using AuthAttempt = std::variant<Credentials, Absent>;

//==========================================================================================================
// parseBasicAuthorization
// Purpose: Turn an Authorization header value into an AuthAttempt.
// Args:
//   header: First Authorization header value, std::nullopt when the request has none.
// Returns:
//   Absent when the header is missing or does not start with "Basic "; otherwise Credentials split on
//   the first ':' of the decoded payload (the password keeps any further colons).
// Throws:
//   errors::MalformedCredentialsError when the payload is not valid base64 or contains no ':'.
//==========================================================================================================
AuthAttempt parseBasicAuthorization(const std::optional<std::string>& header);

//==========================================================================================================
// makeBasicAuthorization
// Purpose: Build the client-side header value "Basic <base64(username:password)>".
//==========================================================================================================
std::string makeBasicAuthorization(const std::string& username, const std::string& password);

} // namespace basicauth::auth
