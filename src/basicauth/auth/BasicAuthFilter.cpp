//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/auth/BasicAuthFilter.cpp
// Purpose: Basic authentication filter: header extraction, validation dispatch, 401 challenge
//==========================================================================================================

#include <string>
#include <utility>
#include <variant>

#include "logging/Logger.h"
#include "basicauth/auth/BasicAuthFilter.hpp"
#include "basicauth/errors/Errors.h"

namespace basicauth::auth {
namespace http = boost::beast::http;

BasicAuthFilter::BasicAuthFilter(Options opts) : validation(std::move(opts.validation)) {
    if (!validation) {
        throw errors::ConfigurationError("BasicAuthFilter requires a validation function");
    }
}

Outcome BasicAuthFilter::Process(RequestContext& ctx) const {
    const AuthAttempt attempt = parseBasicAuthorization(ctx.FirstRequestHeader(http::field::authorization));
    if (const auto* creds = std::get_if<Credentials>(&attempt)) {
        LOG_DEBUG("BasicAuthFilter: credentials presented for user '{}' on {}", creds->username, ctx.Path());
    } else {
        LOG_DEBUG("BasicAuthFilter: no Basic credentials on {}", ctx.Path());
    }

    if (validation(ctx, attempt) == Decision::Authorized) {
        return Outcome::Continue;
    }

    LOG_INFO("BasicAuthFilter: unauthorized request to {}", ctx.Path());
    ctx.SetResponseHeader(http::field::www_authenticate, std::string(kBasicChallenge));
    ctx.SetStatus(http::status::unauthorized);
    ctx.SetBody(std::string());
    ctx.Terminate();
    return Outcome::Terminated;
}

} // namespace basicauth::auth
