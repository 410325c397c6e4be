//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example protecting GET /speakeasy with HTTP Basic authentication for a single configured user
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "basicauth/HTTPServer.hpp"
#include "basicauth/Pipeline.hpp"
#include "basicauth/auth/BasicAuthFilter.hpp"

using namespace basicauth;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

int main() {
    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);
    Logger::configureFromEnvironment();

    const std::string listen = GetEnvOrDefault("BASICAUTH_LISTEN", "http://127.0.0.1:8080");
    const std::string user = GetEnvOrDefault("BASICAUTH_USER", "Snorky");
    const std::string password = GetEnvOrDefault("BASICAUTH_PASSWORD", "Capone");

    auth::BasicAuthFilter::Options fopts;
    fopts.validation = [user, password](RequestContext& ctx, const auth::AuthAttempt& attempt) {
        const auto* creds = std::get_if<auth::Credentials>(&attempt);
        if (creds != nullptr && creds->username == user && creds->password == password) {
            ctx.Assign("user", creds->username);
            return auth::Decision::Authorized;
        }
        return auth::Decision::Unauthorized;
    };

    Router router;
    router.Get("/speakeasy", [](RequestContext& ctx) {
        ctx.SetResponseHeader(boost::beast::http::field::content_type, "text/plain");
        ctx.SetBody("Welcome to the party.");
    });

    auto pipeline = std::make_shared<Pipeline>();
    pipeline->Use(auth::BasicAuthFilter(std::move(fopts))).Use(router);

    HTTPServerFactory factory;
    auto server = factory.CreateServer(listen);
    server->SetErrorHandler([](const std::string& err) {
        LOG_ERROR("speakeasy: {}", err);
    });
    server->SetPipeline(pipeline);
    server->Start().get();
    if (server->BoundPort() == 0) {
        return 1;
    }

    LOG_INFO("speakeasy: GET /speakeasy is protected; press Ctrl+C to stop");
    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server->Stop().get();
    return 0;
}
