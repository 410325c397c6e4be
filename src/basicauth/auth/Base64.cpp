//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/auth/Base64.cpp
// Purpose: Base64 coding via OpenSSL EVP block functions with strict input validation
//==========================================================================================================

#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

#include "basicauth/auth/Base64.hpp"

namespace basicauth::auth {

namespace {
    static bool isAlphabetChar(unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
    }

    // Number of trailing '=' characters, or -1 when the input shape is invalid.
    static int validateShape(std::string_view in) {
        if (in.size() % 4 != 0) {
            return -1;
        }
        int pad = 0;
        if (in.back() == '=') {
            pad = 1;
            if (in[in.size() - 2] == '=') {
                pad = 2;
            }
        }
        for (size_t i = 0; i < in.size() - static_cast<size_t>(pad); ++i) {
            if (!isAlphabetChar(static_cast<unsigned char>(in[i]))) {
                return -1;
            }
        }
        return pad;
    }
}

std::string encodeBase64(std::string_view in) {
    if (in.empty()) {
        return std::string();
    }
    const std::vector<unsigned char> src(in.begin(), in.end());
    // EVP_EncodeBlock appends a NUL terminator
    std::vector<unsigned char> out(4 * ((in.size() + 2) / 3) + 1);
    const int n = ::EVP_EncodeBlock(out.data(), src.data(), static_cast<int>(src.size()));
    return std::string(out.begin(), out.begin() + n);
}

std::optional<std::string> decodeBase64(std::string_view in) {
    if (in.empty()) {
        return std::string();
    }
    const int pad = validateShape(in);
    if (pad < 0) {
        return std::nullopt;
    }
    const std::vector<unsigned char> src(in.begin(), in.end());
    std::vector<unsigned char> out(3 * (in.size() / 4));
    const int n = ::EVP_DecodeBlock(out.data(), src.data(), static_cast<int>(src.size()));
    if (n < 0 || n < pad) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by padding
    return std::string(out.begin(), out.begin() + (n - pad));
}

} // namespace basicauth::auth
