//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/auth/BasicCredentials.cpp
// Purpose: Basic Authorization header parsing and construction
//==========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "basicauth/auth/Base64.hpp"
#include "basicauth/auth/BasicCredentials.hpp"
#include "basicauth/errors/Errors.h"

namespace basicauth::auth {

AuthAttempt parseBasicAuthorization(const std::optional<std::string>& header) {
    if (!header.has_value()) {
        return Absent{};
    }
    const std::string& value = header.value();
    if (value.rfind(kBasicSchemePrefix, 0) != 0) {
        return Absent{};
    }

    const auto decoded = decodeBase64(std::string_view(value).substr(kBasicSchemePrefix.size()));
    if (!decoded.has_value()) {
        LOG_WARN("Basic credentials rejected: payload is not valid base64");
        throw errors::MalformedCredentialsError("Basic credentials payload is not valid base64");
    }

    const auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        LOG_WARN("Basic credentials rejected: decoded payload has no ':' separator");
        throw errors::MalformedCredentialsError("Basic credentials payload is not of the form username:password");
    }
    return Credentials{decoded->substr(0, colon), decoded->substr(colon + 1)};
}

std::string makeBasicAuthorization(const std::string& username, const std::string& password) {
    return std::string(kBasicSchemePrefix) + encodeBase64(username + ":" + password);
}

} // namespace basicauth::auth
