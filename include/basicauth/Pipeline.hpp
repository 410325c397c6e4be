//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Pipeline.hpp
// Purpose: Ordered request-processing stages with short-circuit on termination, and a terminal Router
//==========================================================================================================

#pragma once

#include <functional>
#include <string>
#include <vector>

#include <boost/beast/http.hpp>

#include "basicauth/RequestContext.hpp"

namespace basicauth {

class Pipeline {
public:
    using Stage = std::function<Outcome(RequestContext&)>;

    // Appends a stage; stages run in insertion order.
    Pipeline& Use(Stage stage);

    //==========================================================================================================
    // Run
    // Purpose: Executes stages until one returns Outcome::Terminated or marks the context terminated.
    // Returns:
    //   Outcome::Terminated if any stage terminated the exchange, otherwise Outcome::Continue.
    // Notes:
    //   Exceptions thrown by a stage propagate; later stages do not run.
    //==========================================================================================================
    Outcome Run(RequestContext& ctx) const;

    size_t Size() const { return stages.size(); }

private:
    std::vector<Stage> stages;
};

//==========================================================================================================
// Router
// Purpose: Terminal stage dispatching on (method, path). The matched handler fills in the response and the
//          exchange is terminated afterwards. Unmatched requests get 404 "Not found".
//==========================================================================================================
class Router {
public:
    using Handler = std::function<void(RequestContext&)>;

    Router& Route(boost::beast::http::verb method, std::string path, Handler handler);
    Router& Get(std::string path, Handler handler);
    Router& Post(std::string path, Handler handler);

    Outcome operator()(RequestContext& ctx) const;

private:
    struct Entry {
        boost::beast::http::verb method;
        std::string path;
        Handler handler;
    };
    std::vector<Entry> routes;
};

} // namespace basicauth
