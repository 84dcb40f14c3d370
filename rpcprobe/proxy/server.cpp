// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "server.hpp"

#include <utility>

#include <absl/strings/str_cat.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>

#include "session.hpp"

namespace rpcprobe::proxy {

namespace ssl = boost::asio::ssl;

std::tuple<std::string, std::string> Server::parse_endpoint(const std::string& tcp_end_point) {
    const auto separator = tcp_end_point.rfind(':');
    if (separator == std::string::npos) {
        throw ConfigError{absl::StrCat("invalid listen end-point: ", tcp_end_point)};
    }
    auto host = tcp_end_point.substr(0, separator);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return {host, tcp_end_point.substr(separator + 1)};
}

Server::Server(const std::string& end_point,
               std::shared_ptr<RequestHandler> handler,
               boost::asio::io_context& ioc,
               std::shared_ptr<ssl::context> tls_context)
    : handler_{std::move(handler)},
      acceptor_{ioc},
      tls_context_{std::move(tls_context)} {
    const auto [host, port] = parse_endpoint(end_point);

    // Open the acceptor with the option to reuse the address (i.e. SO_REUSEADDR).
    boost::asio::ip::tcp::resolver resolver{acceptor_.get_executor()};
    const boost::asio::ip::tcp::endpoint endpoint = *resolver.resolve(host, port).begin();
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    local_endpoint_ = acceptor_.local_endpoint();
}

std::shared_ptr<ssl::context> Server::make_tls_context(const std::string& cert_file, const std::string& key_file) {
    auto context = std::make_shared<ssl::context>(ssl::context::tls_server);
    try {
        context->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
        context->use_certificate_chain_file(cert_file);
        context->use_private_key_file(key_file, ssl::context::pem);
    } catch (const boost::system::system_error& se) {
        throw ConfigError{absl::StrCat("cannot load TLS certificate ", cert_file, " and key ", key_file, ": ", se.what())};
    }
    return context;
}

void Server::start() {
    boost::asio::co_spawn(acceptor_.get_executor(), run(), [&](const std::exception_ptr& eptr) {
        if (eptr) std::rethrow_exception(eptr);
    });
}

void Server::stop() {
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    });
}

Task<void> Server::run() {
    auto this_executor = co_await boost::asio::this_coro::executor;
    try {
        PROBE_INFO << "Proxy listening on " << local_endpoint_ << (tls_context_ ? " with TLS" : "");
        while (acceptor_.is_open()) {
            // One strand per connection: the session coroutines race timers against I/O on a multi-threaded context
            boost::asio::ip::tcp::socket socket{boost::asio::make_strand(this_executor)};
            co_await acceptor_.async_accept(socket, boost::asio::use_awaitable);
            if (!acceptor_.is_open()) {
                PROBE_TRACE << "Server::run returning...";
                co_return;
            }

            const auto session_id = ++session_counter_;
            boost::system::error_code ec;
            PROBE_TRACE << "Server::run accepted connection " << session_id << " from " << socket.remote_endpoint(ec);

            auto session_executor = socket.get_executor();
            auto session = std::make_shared<Session>(std::move(socket), tls_context_, session_id, handler_);
            boost::asio::co_spawn(session_executor, Session::run(std::move(session)), boost::asio::detached);
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() != boost::asio::error::operation_aborted) {
            PROBE_ERROR << "Server::run system_error: " << se.what();
            throw;
        }
        PROBE_DEBUG << "Server::run operation_aborted: " << se.what();
    }
    PROBE_DEBUG << "Server::run exiting...";
}

}  // namespace rpcprobe::proxy
