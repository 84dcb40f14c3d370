// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <variant>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include "id_mapper.hpp"
#include "request_handler.hpp"

namespace rpcprobe::proxy {

//! One inbound client connection, optionally TLS-terminated, with its own id mapping
class Session {
  public:
    //! Serve the connection until closed
    //! \note This is co_spawn-friendly because the session lifetime is tied to the coroutine frame
    static Task<void> run(std::shared_ptr<Session> session);

    Session(boost::asio::ip::tcp::socket socket,
            std::shared_ptr<boost::asio::ssl::context> tls_context,
            uint32_t session_id,
            std::shared_ptr<RequestHandler> handler);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    uint32_t id() const { return id_mapper_.session_id(); }

  private:
    using PlainStream = boost::beast::tcp_stream;
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;

    Task<void> read_loop();

    //! Read and serve one request, return false when the connection must be closed
    Task<bool> do_read();

    Task<void> do_write(const Reply& reply, unsigned int version, bool keep_alive);

    std::shared_ptr<boost::asio::ssl::context> tls_context_;
    std::variant<PlainStream, TlsStream> stream_;
    boost::beast::flat_buffer buffer_;
    IdMapper id_mapper_;
    std::shared_ptr<RequestHandler> handler_;
};

}  // namespace rpcprobe::proxy
