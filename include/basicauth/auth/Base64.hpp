//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Base64.hpp
// Purpose: Standard (RFC 4648 section 4) base64 coding for Basic credentials, backed by OpenSSL
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace basicauth::auth {

//==========================================================================================================
// encodeBase64
// Purpose: Encode bytes with the standard alphabet and '=' padding, no line breaks.
//==========================================================================================================
std::string encodeBase64(std::string_view in);

//==========================================================================================================
// decodeBase64
// Purpose: Strictly decode standard base64.
// Notes:
//   - Input length must be a multiple of 4 and padding is required.
//   - The URL-safe alphabet ('-', '_'), whitespace and line breaks are rejected.
//   - The empty string decodes to the empty string.
// Returns:
//   Decoded bytes, or std::nullopt when the input is not valid base64.
//==========================================================================================================
std::optional<std::string> decodeBase64(std::string_view in);

} // namespace basicauth::auth
