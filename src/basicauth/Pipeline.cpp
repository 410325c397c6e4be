//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/Pipeline.cpp
// Purpose: Pipeline stage execution and Router dispatch
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "basicauth/Pipeline.hpp"

namespace basicauth {
namespace http = boost::beast::http;

Pipeline& Pipeline::Use(Stage stage) {
    stages.push_back(std::move(stage));
    return *this;
}

Outcome Pipeline::Run(RequestContext& ctx) const {
    for (size_t i = 0; i < stages.size(); ++i) {
        const Outcome out = stages[i](ctx);
        if (out == Outcome::Terminated || ctx.IsTerminated()) {
            ctx.Terminate();
            LOG_DEBUG("Pipeline: terminated at stage {} of {}", i + 1, stages.size());
            return Outcome::Terminated;
        }
    }
    return Outcome::Continue;
}

Router& Router::Route(http::verb method, std::string path, Handler handler) {
    routes.push_back(Entry{method, std::move(path), std::move(handler)});
    return *this;
}

Router& Router::Get(std::string path, Handler handler) {
    return Route(http::verb::get, std::move(path), std::move(handler));
}

Router& Router::Post(std::string path, Handler handler) {
    return Route(http::verb::post, std::move(path), std::move(handler));
}

Outcome Router::operator()(RequestContext& ctx) const {
    const std::string path = ctx.Path();
    const http::verb method = ctx.GetRequest().method();
    for (const auto& r : routes) {
        if (r.method == method && r.path == path) {
            r.handler(ctx);
            ctx.Terminate();
            return Outcome::Terminated;
        }
    }
    ctx.SetStatus(http::status::not_found);
    ctx.SetResponseHeader(http::field::content_type, "text/plain");
    ctx.SetBody("Not found");
    ctx.Terminate();
    return Outcome::Terminated;
}

} // namespace basicauth
