//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/basicauth/HTTPServer.cpp
// Purpose: HTTP/HTTPS host server using Boost.Beast (TLS 1.3 only for HTTPS) running a request Pipeline
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "basicauth/HTTPServer.hpp"
#include "basicauth/errors/Errors.h"

#include <openssl/ssl.h>

namespace basicauth {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::shared_ptr<const Pipeline> pipeline;
    HTTPServer::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionFault(const char* where, const std::exception& e) {
        if (!running.load()) {
            // Shutdown-related errors (operation_aborted and friends)
            LOG_DEBUG("HTTPServer {} suppressed during shutdown: {}", where, e.what());
            return;
        }
        LOG_ERROR("HTTPServer {} error: {}", where, e.what());
        setError(std::string("HTTPServer ") + where + " error: " + e.what());
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = handle(std::move(req));
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFault("plain session", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = handle(std::move(req));
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFault("TLS session", e);
        }
        co_return;
    }

    static Response internalError(unsigned version) {
        Response failed{http::status::internal_server_error, version};
        failed.keep_alive(false);
        failed.prepare_payload();
        return failed;
    }

    Response handle(Request req) {
        const unsigned version = req.version();
        RequestContext ctx(std::move(req));
        if (!pipeline) {
            ctx.SetStatus(http::status::not_found);
            ctx.SetBody("Not found");
        } else {
            try {
                pipeline->Run(ctx);
            } catch (const std::exception& e) {
                const auto cat = errors::errorCategoryOf(e);
                LOG_ERROR("HTTPServer: request to {} failed ({}): {}", ctx.Path(), errors::errorCategoryName(cat), e.what());
                setError(std::string("HTTPServer request failed: ") + e.what());
                return internalError(version);
            } catch (...) {
                LOG_ERROR("HTTPServer: request to {} failed ({}): non-standard exception", ctx.Path(),
                          errors::errorCategoryName(errors::ErrorCategory::Unknown));
                setError("HTTPServer request failed: non-standard exception");
                return internalError(version);
            }
        }
        Response res = std::move(ctx.GetResponse());
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    //==========================================================================================================
    // listen
    // Purpose: Validates the port and binds the acceptor synchronously, so that Start() only reports ready
    //          once connections can be accepted. Failures are reported through the error handler.
    //==========================================================================================================
    bool listen() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            setError("HTTPServer invalid port: empty");
            return false;
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits) {
            setError(std::string("HTTPServer invalid port (non-numeric): ") + opts.port);
            return false;
        }
        if (opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            setError(std::string("HTTPServer invalid port (out of range): ") + opts.port);
            return false;
        }
        try {
            tcp::resolver resolver(ioc);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
        } catch (const boost::system::system_error& e) {
            LOG_ERROR("HTTPServer: cannot listen on {}:{}: {}", opts.address, opts.port, e.what());
            setError(std::string("HTTPServer listen error: ") + e.what());
            acceptor.reset();
            return false;
        }
        LOG_INFO("HTTPServer listening on {}://{}:{}", opts.scheme, opts.address, acceptor->local_endpoint().port());
        return true;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            sessionFault("accept", e);
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load()) {
        LOG_WARN("HTTPServer: Start() called while already running; ignored");
        ready.set_value();
        return fut;
    }
    if (!pImpl->listen()) {
        ready.set_value();
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer I/O thread terminated: {}", e.what());
            pImpl->setError(e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void HTTPServer::SetPipeline(std::shared_ptr<const Pipeline> pipeline) {
    pImpl->pipeline = std::move(pipeline);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::BoundPort() const {
    if (!pImpl->acceptor) {
        return 0;
    }
    boost::system::error_code ec;
    auto ep = pImpl->acceptor->local_endpoint(ec);
    return ec ? 0 : ep.port();
}

Response HTTPServer::HandleRequest(Request req) {
    return pImpl->handle(std::move(req));
}

HTTPServer::Options HTTPServerFactory::ParseListenUri(const std::string& config) {
    HTTPServer::Options opts;

    std::string cfg = config;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
    }
    trim(hostPort);

    // host[:port], IPv6 as [addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::CreateServer(const std::string& config) {
    return std::make_unique<HTTPServer>(ParseListenUri(config));
}

} // namespace basicauth
