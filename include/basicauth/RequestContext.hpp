//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RequestContext.hpp
// Purpose: Per-request exchange (Beast request + response under construction) passed through the pipeline
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/http.hpp>

namespace basicauth {

using Request = boost::beast::http::request<boost::beast::http::string_body>;
using Response = boost::beast::http::response<boost::beast::http::string_body>;

//==========================================================================================================
// Outcome
// Purpose: Result of a pipeline stage. Terminated means the response is final and no later stage runs.
//==========================================================================================================
enum class Outcome {
    Continue,
    Terminated
};

//==========================================================================================================
// RequestContext
// Purpose: Owns one request and the response being built for it. The host (Pipeline / HTTPServer)
//          creates it per request; stages read request headers and mutate the response.
// Notes:
//   - The response starts as 200 OK with the request's HTTP version and an empty body.
//   - Assigns are free-form annotations stages may attach (e.g. the authenticated user).
//==========================================================================================================
class RequestContext {
public:
    explicit RequestContext(Request req);

    const Request& GetRequest() const { return req; }
    Response& GetResponse() { return res; }
    const Response& GetResponse() const { return res; }

    // Request target without the query string.
    std::string Path() const;

    // Value of the first occurrence of a request header, std::nullopt when absent.
    std::optional<std::string> FirstRequestHeader(boost::beast::http::field name) const;

    void SetResponseHeader(boost::beast::http::field name, const std::string& value);
    void SetStatus(boost::beast::http::status status);
    void SetBody(std::string body);

    // Marks the exchange as final. Idempotent.
    void Terminate();
    bool IsTerminated() const { return terminated; }

    void Assign(const std::string& key, std::string value);
    std::optional<std::string> GetAssign(const std::string& key) const;

private:
    Request req;
    Response res;
    bool terminated{false};
    std::unordered_map<std::string, std::string> assigns;
};

} // namespace basicauth
