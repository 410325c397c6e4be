//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed exceptions raised by the Basic authentication filter and category mapping helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace basicauth {
namespace errors {

// Categorization of the failures the filter can raise.
enum class ErrorCategory {
    Configuration,
    MalformedCredentials,
    Unknown
};

//==========================================================================================================
// AuthError
// Purpose: Base of every exception thrown by this library; carries its ErrorCategory.
//==========================================================================================================
class AuthError : public std::runtime_error {
public:
    AuthError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), cat(category) {}

    ErrorCategory category() const noexcept { return cat; }

private:
    ErrorCategory cat;
};

//==========================================================================================================
// ConfigurationError
// Purpose: Raised at construction time when a required option (e.g. the validation function) is missing.
//==========================================================================================================
class ConfigurationError : public AuthError {
public:
    explicit ConfigurationError(const std::string& message)
        : AuthError(ErrorCategory::Configuration, message) {}
};

//==========================================================================================================
// MalformedCredentialsError
// Purpose: Raised when an Authorization header uses the Basic scheme but its payload is not valid
//          base64 or does not decode to "username:password".
//==========================================================================================================
class MalformedCredentialsError : public AuthError {
public:
    explicit MalformedCredentialsError(const std::string& message)
        : AuthError(ErrorCategory::MalformedCredentials, message) {}
};

// Map any exception to an ErrorCategory.
//
// Args:
//   e: Exception caught by the host (may or may not derive from AuthError).
//
// Returns:
//   The AuthError category, or Unknown for foreign exceptions (e.g. thrown by a validation function).
inline ErrorCategory errorCategoryOf(const std::exception& e) {
    const auto* ae = dynamic_cast<const AuthError*>(&e);
    if (ae == nullptr) {
        return ErrorCategory::Unknown;
    }
    return ae->category();
}

// Stable short name for log lines.
inline const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Configuration: return "configuration";
        case ErrorCategory::MalformedCredentials: return "malformed_credentials";
        default: return "unknown";
    }
}

} // namespace errors
} // namespace basicauth
