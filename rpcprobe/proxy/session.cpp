// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "session.hpp"

#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>

namespace rpcprobe::proxy {

namespace beast = boost::beast;
namespace http = boost::beast::http;

using boost::asio::use_awaitable;

static constexpr uint64_t kMaxPayloadSize{30 * 1024 * 1024};

static std::variant<beast::tcp_stream, beast::ssl_stream<beast::tcp_stream>> make_stream(
    boost::asio::ip::tcp::socket socket,
    const std::shared_ptr<boost::asio::ssl::context>& tls_context) {
    if (tls_context) {
        return std::variant<beast::tcp_stream, beast::ssl_stream<beast::tcp_stream>>{
            std::in_place_index<1>, beast::tcp_stream{std::move(socket)}, *tls_context};
    }
    return std::variant<beast::tcp_stream, beast::ssl_stream<beast::tcp_stream>>{std::in_place_index<0>, std::move(socket)};
}

Task<void> Session::run(std::shared_ptr<Session> session) {
    co_await session->read_loop();
}

Session::Session(boost::asio::ip::tcp::socket socket,
                 std::shared_ptr<boost::asio::ssl::context> tls_context,
                 uint32_t session_id,
                 std::shared_ptr<RequestHandler> handler)
    : tls_context_{std::move(tls_context)},
      stream_{make_stream(std::move(socket), tls_context_)},
      id_mapper_{session_id},
      handler_{std::move(handler)} {
    PROBE_TRACE << "Session::Session created session " << session_id;
}

Session::~Session() {
    boost::system::error_code ignored;
    std::visit([&](auto& stream) { beast::get_lowest_layer(stream).socket().close(ignored); }, stream_);
    PROBE_TRACE << "Session::~Session session " << id() << " closed";
}

Task<void> Session::read_loop() {
    try {
        if (auto* tls_stream = std::get_if<TlsStream>(&stream_)) {
            co_await tls_stream->async_handshake(boost::asio::ssl::stream_base::server, use_awaitable);
        }
        bool continue_processing{true};
        while (continue_processing) {
            continue_processing = co_await do_read();
        }
    } catch (const boost::system::system_error& se) {
        if (se.code() == http::error::end_of_stream) {
            PROBE_TRACE << "Session::read_loop received graceful close in session " << id();
        } else {
            PROBE_TRACE << "Session::read_loop system_error in session " << id() << ": " << se.code().message();
        }
    } catch (const std::exception& e) {
        PROBE_ERROR << "Session::read_loop exception in session " << id() << ": " << e.what();
    }
}

Task<bool> Session::do_read() {
    http::request_parser<http::string_body> parser;
    parser.body_limit(kMaxPayloadSize);

    co_await std::visit([&](auto& stream) { return http::async_read(stream, buffer_, parser, use_awaitable); }, stream_);
    if (!parser.is_done()) {
        co_return true;
    }

    const auto request = parser.release();
    const bool keep_alive = request.keep_alive();
    PROBE_TRACE << "Session::do_read session " << id() << " body: " << request.body();

    if (request.method() != http::verb::post) {
        co_await do_write(Reply{.status = 405, .body = "method not allowed\n"}, request.version(), keep_alive);
        co_return keep_alive;
    }

    const auto reply = co_await handler_->handle(request.body(), id_mapper_);
    co_await do_write(reply, request.version(), keep_alive);
    co_return keep_alive;
}

Task<void> Session::do_write(const Reply& reply, unsigned int version, bool keep_alive) {
    http::response<http::string_body> response{static_cast<http::status>(reply.status), version};
    response.set(http::field::server, kUserAgent);
    response.set(http::field::content_type, "application/json");
    for (const auto& [name, value] : reply.headers) {
        response.set(name, value);
    }
    response.keep_alive(keep_alive);
    response.body() = reply.body;
    response.prepare_payload();

    co_await std::visit([&](auto& stream) { return http::async_write(stream, response, use_awaitable); }, stream_);
}

}  // namespace rpcprobe::proxy
