//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/RequestContext.cpp
// Purpose: RequestContext accessors and response mutation primitives
//==========================================================================================================

#include <utility>

#include "basicauth/RequestContext.hpp"

namespace basicauth {
namespace http = boost::beast::http;

RequestContext::RequestContext(Request r)
    : req(std::move(r)), res(http::status::ok, req.version()) {}

std::string RequestContext::Path() const {
    const auto target = req.target();
    std::string path(target.data(), target.size());
    auto q = path.find('?');
    if (q != std::string::npos) {
        path.erase(q);
    }
    return path;
}

std::optional<std::string> RequestContext::FirstRequestHeader(http::field name) const {
    // equal_range keeps insertion order, so .first is the earliest occurrence
    auto range = req.equal_range(name);
    if (range.first == range.second) {
        return std::nullopt;
    }
    const auto v = range.first->value();
    return std::string(v.data(), v.size());
}

void RequestContext::SetResponseHeader(http::field name, const std::string& value) {
    res.set(name, value);
}

void RequestContext::SetStatus(http::status status) {
    res.result(status);
}

void RequestContext::SetBody(std::string body) {
    res.body() = std::move(body);
}

void RequestContext::Terminate() {
    terminated = true;
}

void RequestContext::Assign(const std::string& key, std::string value) {
    assigns[key] = std::move(value);
}

std::optional<std::string> RequestContext::GetAssign(const std::string& key) const {
    auto it = assigns.find(key);
    if (it == assigns.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace basicauth
