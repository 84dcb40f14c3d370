// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>
#include <nlohmann/json.hpp>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>

namespace rpcprobe::rpc::test_util {

//! What a stub node answers to one HTTP request
struct StubReply {
    unsigned int status{200};
    nlohmann::json body;
    //! Sent verbatim instead of body when not empty
    std::string raw_body;
    std::chrono::milliseconds delay{0};
};

/**
 * In-process JSON-RPC node listening on 127.0.0.1 with an ephemeral port, served by its own thread.
 * Each received request body is handed to the handler which decides the reply.
 */
class StubBackend {
  public:
    using Handler = std::function<StubReply(const nlohmann::json& request)>;

    explicit StubBackend(Handler handler)
        : handler_{std::move(handler)},
          acceptor_{ioc_, boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}} {
        boost::asio::co_spawn(ioc_, accept_loop(), boost::asio::detached);
        thread_ = std::thread{[this]() { ioc_.run(); }};
    }
    ~StubBackend() {
        ioc_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    StubBackend(const StubBackend&) = delete;
    StubBackend& operator=(const StubBackend&) = delete;

    uint16_t port() const { return acceptor_.local_endpoint().port(); }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port()); }
    Endpoint endpoint(std::string name) const { return Endpoint::parse(std::move(name), url()); }

    size_t request_count() const {
        std::scoped_lock lock{mutex_};
        return requests_.size();
    }
    std::vector<nlohmann::json> requests() const {
        std::scoped_lock lock{mutex_};
        return requests_;
    }

    //! Successful answer echoing the request id
    static StubReply result(const nlohmann::json& request, nlohmann::json result) {
        return {.body = {{"jsonrpc", "2.0"}, {"id", request.value("id", nlohmann::json{})}, {"result", std::move(result)}}};
    }

    //! JSON-RPC error answer echoing the request id
    static StubReply error(const nlohmann::json& request, int64_t code, const std::string& message) {
        return {.body = {
                    {"jsonrpc", "2.0"},
                    {"id", request.value("id", nlohmann::json{})},
                    {"error", {{"code", code}, {"message", message}}},
                }};
    }

  private:
    Task<void> accept_loop() {
        auto executor = co_await boost::asio::this_coro::executor;
        while (acceptor_.is_open()) {
            boost::asio::ip::tcp::socket socket{executor};
            co_await acceptor_.async_accept(socket, boost::asio::use_awaitable);
            boost::asio::co_spawn(executor, serve(std::move(socket)), boost::asio::detached);
        }
    }

    Task<void> serve(boost::asio::ip::tcp::socket socket) {
        namespace http = boost::beast::http;
        boost::beast::tcp_stream stream{std::move(socket)};
        boost::beast::flat_buffer buffer;
        try {
            while (true) {
                http::request<http::string_body> request;
                co_await http::async_read(stream, buffer, request, boost::asio::use_awaitable);

                const auto json = nlohmann::json::parse(request.body(), nullptr, /*allow_exceptions=*/false);
                {
                    std::scoped_lock lock{mutex_};
                    requests_.push_back(json);
                }
                const auto reply = handler_(json);
                if (reply.delay.count() > 0) {
                    boost::asio::steady_timer timer{stream.get_executor()};
                    timer.expires_after(reply.delay);
                    co_await timer.async_wait(boost::asio::use_awaitable);
                }

                http::response<http::string_body> response{static_cast<http::status>(reply.status), request.version()};
                response.set(http::field::content_type, "application/json");
                response.keep_alive(request.keep_alive());
                response.body() = reply.raw_body.empty() ? reply.body.dump() : reply.raw_body;
                response.prepare_payload();
                co_await http::async_write(stream, response, boost::asio::use_awaitable);
                if (!response.keep_alive()) {
                    break;
                }
            }
        } catch (const boost::system::system_error& se) {
            PROBE_TRACE << "StubBackend::serve closed: " << se.code().message();
        }
    }

    Handler handler_;
    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> requests_;
};

}  // namespace rpcprobe::rpc::test_util
