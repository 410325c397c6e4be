//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BasicAuthFilter.hpp
// Purpose: Pipeline stage enforcing HTTP Basic authentication through a caller-supplied validation function
//==========================================================================================================

#pragma once

#include <functional>
#include <string_view>

#include "basicauth/RequestContext.hpp"
#include "basicauth/auth/BasicCredentials.hpp"

namespace basicauth::auth {

// Challenge sent with every 401 produced by the filter.
inline constexpr std::string_view kBasicChallenge = "Basic realm=\"Private Area\"";

enum class Decision {
    Authorized,
    Unauthorized
};

//==========================================================================================================
// ValidationFunction
// Purpose: Decides whether an attempt is authorized. Receives the live context by reference and may
//          inspect or annotate it (e.g. ctx.Assign("user", ...)). Exceptions it throws propagate out of
//          BasicAuthFilter::Process unchanged.
//==========================================================================================================
using ValidationFunction = std::function<Decision(RequestContext& ctx, const AuthAttempt& attempt)>;

class BasicAuthFilter {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   validation: Required. An empty function makes construction throw errors::ConfigurationError.
    //==========================================================================================================
    struct Options {
        ValidationFunction validation;
    };

    explicit BasicAuthFilter(Options opts);

    //==========================================================================================================
    // Process
    // Purpose: Extract Basic credentials from the first Authorization header, ask the validation function,
    //          and apply its decision.
    // Returns:
    //   Outcome::Continue when authorized (context untouched by the filter).
    //   Outcome::Terminated when unauthorized: WWW-Authenticate challenge set, status 401, empty body,
    //   exchange terminated.
    // Throws:
    //   errors::MalformedCredentialsError for an undecodable Basic payload; anything the validation
    //   function throws.
    //==========================================================================================================
    Outcome Process(RequestContext& ctx) const;

    // Allows the filter to be added to a Pipeline directly.
    Outcome operator()(RequestContext& ctx) const { return Process(ctx); }

private:
    ValidationFunction validation;
};

} // namespace basicauth::auth
