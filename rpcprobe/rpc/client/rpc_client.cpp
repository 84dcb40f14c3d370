// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_client.hpp"

#include <algorithm>
#include <random>

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/concurrency/deadline.hpp>

namespace rpcprobe::rpc {

using std::chrono::milliseconds;
using concurrency::remaining_until;

static constexpr size_t kMaxBodyExcerpt{256};

static std::mt19937_64& random_engine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

RpcClient::RpcClient(std::shared_ptr<Transport> transport) : transport_{std::move(transport)} {}

nlohmann::json RpcClient::make_request(std::string_view method, const nlohmann::json& params) {
    return json_rpc::make_request(++id_counter_, method, params);
}

Task<CallResult> RpcClient::call(const Endpoint& endpoint, std::string_view method, nlohmann::json params, CallOptions options) {
    auto request = make_request(method, params);
    co_return co_await forward(endpoint, std::move(request), std::move(options));
}

Task<CallResult> RpcClient::forward(const Endpoint& endpoint, nlohmann::json request, CallOptions options) {
    const auto body = request.dump();
    const uint32_t max_attempts = std::max<uint32_t>(options.retry.max_attempts, 1);

    for (uint32_t attempt = 1;; ++attempt) {
        milliseconds attempt_timeout = options.timeout;
        if (options.deadline) {
            const auto remaining = remaining_until(*options.deadline);
            if (remaining.count() <= 0) {
                co_return tl::make_unexpected(TransportError::cancelled());
            }
            attempt_timeout = std::min(attempt_timeout, remaining);
        }

        PROBE_TRACE << "RpcClient::forward " << endpoint << " attempt " << attempt << " request: " << body;
        const auto reply = co_await transport_->post(endpoint, body, attempt_timeout);
        auto result = reply ? interpret(*reply, request) : CallResult{tl::make_unexpected(reply.error())};
        if (result) {
            PROBE_TRACE << "RpcClient::forward " << endpoint << " response: " << result->dump();
            co_return result;
        }

        auto& error = result.error();
        if (options.deadline && error.kind == TransportError::Kind::kTimeout && remaining_until(*options.deadline).count() <= 0) {
            co_return tl::make_unexpected(TransportError::cancelled());
        }
        if (!error.retryable() || attempt >= max_attempts) {
            PROBE_DEBUG << "RpcClient::forward " << endpoint << " failed after " << attempt << " attempt(s): " << error;
            co_return result;
        }

        auto delay = options.retry.backoff(attempt + 1, random_engine());
        if (options.deadline) {
            delay = std::min(delay, remaining_until(*options.deadline));
        }
        PROBE_DEBUG << "RpcClient::forward " << endpoint << " attempt " << attempt << " failed: " << error
                    << ", retrying in " << delay.count() << "ms";
        if (delay.count() > 0) {
            co_await concurrency::sleep_for(delay);
        }
    }
}

CallResult RpcClient::interpret(const HttpReply& reply, const nlohmann::json& request) const {
    if (reply.status < 200 || reply.status >= 300) {
        return tl::make_unexpected(TransportError{
            .kind = TransportError::Kind::kHttpStatus,
            .message = reply.body.substr(0, kMaxBodyExcerpt),
            .http_status = reply.status,
        });
    }

    auto response = json_rpc::Response::parse(reply.body);
    if (!response) {
        return tl::make_unexpected(TransportError{
            .kind = TransportError::Kind::kMalformedResponse,
            .message = response.error(),
        });
    }

    if (request.is_object() && response->kind() != json_rpc::Response::Kind::kBatch) {
        const auto& id = response->id();
        if (!id.is_null() && id != request.value("id", nlohmann::json{})) {
            return tl::make_unexpected(TransportError{
                .kind = TransportError::Kind::kMalformedResponse,
                .message = absl::StrCat("response id ", id.dump(), " does not match request id ", request.value("id", nlohmann::json{}).dump()),
            });
        }
    } else if (request.is_object()) {
        return tl::make_unexpected(TransportError{
            .kind = TransportError::Kind::kMalformedResponse,
            .message = "batch request and response shapes do not match",
        });
    }
    response->set_headers(reply.headers);
    return std::move(*response);
}

}  // namespace rpcprobe::rpc
