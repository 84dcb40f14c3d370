// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "http_transport.hpp"

#include <iterator>
#include <utility>
#include <variant>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/concurrency/awaitable_wait_for_one.hpp>
#include <rpcprobe/infra/concurrency/deadline.hpp>
#include <rpcprobe/rpc/common/constants.hpp>

namespace rpcprobe::rpc {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

using boost::asio::use_awaitable;
using concurrency::awaitable_wait_for_one::operator||;

static constexpr uint64_t kMaxPayloadSize{64 * 1024 * 1024};

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

class HttpTransport::Connection {
  public:
    explicit Connection(PlainStream stream) : stream_{std::in_place_type<PlainStream>, std::move(stream)} {}
    Connection(PlainStream stream, std::shared_ptr<ssl::context> context)
        : context_{std::move(context)},
          stream_{std::in_place_type<TlsStream>, std::move(stream), *context_} {}

    ~Connection() {
        boost::system::error_code ignored;
        lowest_layer().socket().close(ignored);
    }

    beast::tcp_stream& lowest_layer() {
        return std::visit([](auto& stream) -> beast::tcp_stream& { return beast::get_lowest_layer(stream); }, stream_);
    }

    TlsStream* tls_stream() { return std::get_if<TlsStream>(&stream_); }

    boost::asio::any_io_executor executor() { return lowest_layer().get_executor(); }

    Task<HttpReply> exchange(const http::request<http::string_body>& request, Deadline deadline) {
        return std::visit([&](auto& stream) { return do_exchange(stream, buffer_, request, deadline); }, stream_);
    }

  private:
    template <typename Stream>
    static Task<HttpReply> do_exchange(
        Stream& stream,
        beast::flat_buffer& buffer,
        const http::request<http::string_body>& request,
        Deadline deadline) {
        beast::get_lowest_layer(stream).expires_at(deadline);
        co_await http::async_write(stream, request, use_awaitable);

        http::response_parser<http::string_body> parser;
        parser.body_limit(kMaxPayloadSize);
        co_await http::async_read(stream, buffer, parser, use_awaitable);
        beast::get_lowest_layer(stream).expires_never();

        auto response = parser.release();
        HttpReply reply{
            .status = response.result_int(),
            .keep_alive = response.keep_alive(),
        };
        for (const auto& field : response) {
            reply.headers.insert_or_assign(absl::AsciiStrToLower(std::string{field.name_string()}), std::string{field.value()});
        }
        reply.body = std::move(response.body());
        co_return reply;
    }

    std::shared_ptr<ssl::context> context_;
    std::variant<PlainStream, TlsStream> stream_;
    beast::flat_buffer buffer_;
};

static std::string make_pool_key(const Endpoint& endpoint) {
    return absl::StrCat(endpoint.name(), "|", endpoint.is_tls() ? "https://" : "http://", endpoint.authority());
}

static std::string make_host_header(const Endpoint& endpoint) {
    const bool default_port = endpoint.port() == (endpoint.is_tls() ? kDefaultHttpsPort : kDefaultHttpPort);
    const bool ipv6 = endpoint.host().find(':') != std::string::npos;
    const auto host = ipv6 ? absl::StrCat("[", endpoint.host(), "]") : endpoint.host();
    return default_port ? host : absl::StrCat(host, ":", endpoint.port());
}

static http::request<http::string_body> make_request(const Endpoint& endpoint, std::string body) {
    http::request<http::string_body> request{http::verb::post, endpoint.target(), 11};
    request.set(http::field::host, make_host_header(endpoint));
    request.set(http::field::user_agent, kUserAgent);
    request.set(http::field::content_type, "application/json");
    request.set(http::field::accept, "application/json");
    for (const auto& [name, value] : endpoint.headers()) {
        request.set(name, value);
    }
    request.keep_alive(true);
    request.body() = std::move(body);
    request.prepare_payload();
    return request;
}

static TransportError make_transport_error(const boost::system::error_code& code, const Endpoint& endpoint) {
    if (code == beast::error::timeout) {
        return {.kind = TransportError::Kind::kTimeout, .message = absl::StrCat("timeout talking to ", endpoint.url())};
    }
    if (code == boost::asio::error::operation_aborted || code == boost::system::errc::operation_canceled) {
        return TransportError::cancelled();
    }
    return {
        .kind = TransportError::Kind::kConnectionFailed,
        .message = absl::StrCat(endpoint.url(), ": ", code.message()),
    };
}

//! Errors telling that a pooled connection has been closed by the peer while idle
static bool is_stale_connection_error(const boost::system::error_code& code) {
    return code == http::error::end_of_stream ||
           code == http::error::partial_message ||
           code == boost::asio::error::eof ||
           code == boost::asio::error::connection_reset ||
           code == boost::asio::error::broken_pipe ||
           code == ssl::error::stream_truncated;
}

HttpTransport::HttpTransport(std::shared_ptr<const HostResolver> resolver, size_t max_idle_per_endpoint)
    : resolver_{std::move(resolver)}, max_idle_per_endpoint_{max_idle_per_endpoint} {}

HttpTransport::~HttpTransport() = default;

size_t HttpTransport::idle_connections(const Endpoint& endpoint) const {
    std::scoped_lock lock{mutex_};
    const auto it = idle_connections_.find(make_pool_key(endpoint));
    return it == idle_connections_.end() ? 0 : it->second.size();
}

std::unique_ptr<HttpTransport::Connection> HttpTransport::take_idle(const std::string& key, const boost::asio::any_io_executor& executor) {
    std::scoped_lock lock{mutex_};
    const auto it = idle_connections_.find(key);
    if (it == idle_connections_.end()) {
        return nullptr;
    }
    // A connection is reused only by coroutines of the executor (or strand) owning its I/O objects
    auto& idle = it->second;
    for (auto candidate = idle.rbegin(); candidate != idle.rend(); ++candidate) {
        if ((*candidate)->executor() == executor) {
            auto connection = std::move(*candidate);
            idle.erase(std::next(candidate).base());
            return connection;
        }
    }
    return nullptr;
}

void HttpTransport::give_back(const std::string& key, std::unique_ptr<Connection> connection) {
    std::scoped_lock lock{mutex_};
    auto& idle = idle_connections_[key];
    if (idle.size() < max_idle_per_endpoint_) {
        idle.push_back(std::move(connection));
    }
}

std::shared_ptr<ssl::context> HttpTransport::tls_context(const Endpoint& endpoint) {
    const auto key = make_pool_key(endpoint);
    std::scoped_lock lock{mutex_};
    if (const auto it = tls_contexts_.find(key); it != tls_contexts_.end()) {
        return it->second;
    }

    auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
    const auto& tls = endpoint.tls();
    if (tls.verify) {
        context->set_verify_mode(ssl::verify_peer);
        if (tls.ca_file.empty()) {
            context->set_default_verify_paths();
        } else {
            context->load_verify_file(tls.ca_file);
        }
    } else {
        context->set_verify_mode(ssl::verify_none);
    }
    if (!tls.cert_file.empty()) {
        context->use_certificate_chain_file(tls.cert_file);
    }
    if (!tls.key_file.empty()) {
        context->use_private_key_file(tls.key_file, ssl::context::pem);
    }
    tls_contexts_.emplace(key, context);
    return context;
}

Task<std::unique_ptr<HttpTransport::Connection>> HttpTransport::connect(const Endpoint& endpoint, Deadline deadline) {
    if (concurrency::remaining_until(deadline).count() <= 0) {
        throw boost::system::system_error{beast::error::timeout};
    }

    std::vector<boost::asio::ip::tcp::endpoint> addresses;
    try {
        auto resolved = co_await (resolver_->resolve(endpoint.host(), endpoint.port()) || concurrency::expire_at(deadline));
        if (resolved.index() != 0) {
            throw boost::system::system_error{beast::error::timeout};
        }
        addresses = std::move(std::get<0>(resolved));
    } catch (const concurrency::DeadlineExpiredError&) {
        throw boost::system::system_error{beast::error::timeout};
    }

    auto executor = co_await boost::asio::this_coro::executor;
    PlainStream stream{executor};
    stream.expires_at(deadline);
    const auto remote = co_await stream.async_connect(addresses, use_awaitable);
    PROBE_TRACE << "HttpTransport::connect connected to " << endpoint << " at " << remote;

    if (!endpoint.is_tls()) {
        co_return std::make_unique<Connection>(std::move(stream));
    }

    auto connection = std::make_unique<Connection>(std::move(stream), tls_context(endpoint));
    TlsStream& tls_stream = *connection->tls_stream();
    boost::system::error_code address_error;
    boost::asio::ip::make_address(endpoint.host(), address_error);
    if (address_error) {
        // Server Name Indication only for host names
        if (!SSL_set_tlsext_host_name(tls_stream.native_handle(), endpoint.host().c_str())) {
            throw boost::system::system_error{
                boost::system::error_code{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()}};
        }
    }
    if (endpoint.tls().verify) {
        tls_stream.set_verify_callback(ssl::host_name_verification{endpoint.host()});
    }
    beast::get_lowest_layer(tls_stream).expires_at(deadline);
    co_await tls_stream.async_handshake(ssl::stream_base::client, use_awaitable);
    co_return connection;
}

Task<tl::expected<HttpReply, TransportError>> HttpTransport::post(
    const Endpoint& endpoint,
    std::string body,
    std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto key = make_pool_key(endpoint);
    const auto request = make_request(endpoint, std::move(body));

    auto connection = take_idle(key, co_await boost::asio::this_coro::executor);
    if (connection) {
        try {
            auto reply = co_await connection->exchange(request, deadline);
            if (reply.keep_alive) {
                give_back(key, std::move(connection));
            }
            co_return reply;
        } catch (const boost::system::system_error& se) {
            if (!is_stale_connection_error(se.code())) {
                PROBE_DEBUG << "HttpTransport::post " << endpoint << " failed on pooled connection: " << se.code().message();
                co_return tl::make_unexpected(make_transport_error(se.code(), endpoint));
            }
            PROBE_TRACE << "HttpTransport::post " << endpoint << " pooled connection is stale, reconnecting";
        }
        connection.reset();
    }

    try {
        connection = co_await connect(endpoint, deadline);
        auto reply = co_await connection->exchange(request, deadline);
        if (reply.keep_alive) {
            give_back(key, std::move(connection));
        }
        co_return reply;
    } catch (const boost::system::system_error& se) {
        PROBE_DEBUG << "HttpTransport::post " << endpoint << " failed: " << se.code().message();
        co_return tl::make_unexpected(make_transport_error(se.code(), endpoint));
    }
}

}  // namespace rpcprobe::rpc
