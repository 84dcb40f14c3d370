// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

#include "request_handler.hpp"

namespace rpcprobe::proxy {

//! The top-level class of the intercepting proxy: accepts connections and spawns one Session for each
class Server {
  public:
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //! Construct the server listening on the specified local <host>:<port> end-point, plain HTTP when no TLS context
    Server(const std::string& end_point,
           std::shared_ptr<RequestHandler> handler,
           boost::asio::io_context& ioc,
           std::shared_ptr<boost::asio::ssl::context> tls_context = nullptr);

    void start();

    //! Stop accepting new connections
    void stop();

    //! The bound end-point, useful when listening on port 0
    boost::asio::ip::tcp::endpoint local_endpoint() const { return local_endpoint_; }

    //! TLS server context from PEM certificate chain and private key, throw ConfigError if unusable
    static std::shared_ptr<boost::asio::ssl::context> make_tls_context(const std::string& cert_file, const std::string& key_file);

  private:
    static std::tuple<std::string, std::string> parse_endpoint(const std::string& tcp_end_point);

    Task<void> run();

    std::shared_ptr<RequestHandler> handler_;

    //! The acceptor used to listen for incoming TCP connections
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::endpoint local_endpoint_;

    std::shared_ptr<boost::asio::ssl::context> tls_context_;

    std::atomic_uint32_t session_counter_{0};
};

}  // namespace rpcprobe::proxy
