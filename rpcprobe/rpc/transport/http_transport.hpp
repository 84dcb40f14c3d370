// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

#include "resolver.hpp"
#include "transport.hpp"

namespace rpcprobe::rpc {

//! HTTP/1.1 client transport over plain TCP or TLS keeping idle keep-alive connections per endpoint
class HttpTransport : public Transport {
  public:
    static constexpr size_t kDefaultMaxIdleConnections{16};

    explicit HttpTransport(
        std::shared_ptr<const HostResolver> resolver = std::make_shared<HostResolver>(),
        size_t max_idle_per_endpoint = kDefaultMaxIdleConnections);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    Task<tl::expected<HttpReply, TransportError>> post(
        const Endpoint& endpoint,
        std::string body,
        std::chrono::milliseconds timeout) override;

    size_t idle_connections(const Endpoint& endpoint) const;

  private:
    class Connection;
    using Deadline = std::chrono::steady_clock::time_point;

    Task<std::unique_ptr<Connection>> connect(const Endpoint& endpoint, Deadline deadline);
    std::shared_ptr<boost::asio::ssl::context> tls_context(const Endpoint& endpoint);

    std::unique_ptr<Connection> take_idle(const std::string& key, const boost::asio::any_io_executor& executor);
    void give_back(const std::string& key, std::unique_ptr<Connection> connection);

    std::shared_ptr<const HostResolver> resolver_;
    size_t max_idle_per_endpoint_;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<std::unique_ptr<Connection>>> idle_connections_;
    std::map<std::string, std::shared_ptr<boost::asio::ssl::context>> tls_contexts_;
};

}  // namespace rpcprobe::rpc
