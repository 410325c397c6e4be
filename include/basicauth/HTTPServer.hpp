//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS host server using Boost.Beast (TLS 1.3 only for HTTPS) that runs a
//          request Pipeline per request
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <functional>
#include <memory>

#include "basicauth/Pipeline.hpp"

namespace basicauth {

  class HTTPServer {
  public:
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port (default: 8080)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listener, then runs the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the acceptor is listening (or binding failed; the error handler
    //   has then been called and BoundPort() returns 0).
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // SetPipeline
    // Purpose: Installs the per-request pipeline. Must be called before Start().
    // Notes:
    //   - Each request becomes a RequestContext and runs through the pipeline once.
    //   - An exception escaping the pipeline (e.g. malformed Basic credentials, a failing validation
    //     function) is logged and answered with 500 and an empty body.
    //   - Without a pipeline every request is answered with 404.
    //==========================================================================================================
    void SetPipeline(std::shared_ptr<const Pipeline> pipeline);

    //==========================================================================================================
    // Sets the error handler for transport/server errors.
    // Args:
    //   handler: Callback invoked with error strings.
    //==========================================================================================================
    void SetErrorHandler(ErrorHandler handler);

    // Port the acceptor is bound to (resolves port "0"); 0 before a successful Start().
    unsigned short BoundPort() const;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Runs one request through the pipeline and returns the finished response (payload prepared,
    //          connection: close). Used by the sessions; callable directly without a socket.
    //==========================================================================================================
    Response HandleRequest(Request req);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Creates servers from a listen URI:
  //            - "http://<address>:<port>" (e.g., http://127.0.0.1:0)
  //            - "https://<address>:<port>?cert=<pem>&key=<pem>"
  //            - "[<ipv6>]:<port>" forms are accepted for the host part
  //          Unknown parameters are ignored. If scheme is omitted, defaults to http.
  //==========================================================================================================
  class HTTPServerFactory {
  public:
    static HTTPServer::Options ParseListenUri(const std::string& config);
    std::unique_ptr<HTTPServer> CreateServer(const std::string& config);
  };

} // namespace basicauth
