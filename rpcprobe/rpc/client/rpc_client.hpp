// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <rpcprobe/rpc/common/constants.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>
#include <rpcprobe/rpc/json_rpc/message.hpp>
#include <rpcprobe/rpc/transport/transport.hpp>

#include "retry_policy.hpp"
#include "transport_error.hpp"

namespace rpcprobe::rpc {

struct CallOptions {
    //! Bound of each single attempt
    std::chrono::milliseconds timeout{kDefaultTimeout};
    RetryPolicy retry;
    //! When set, no attempt nor backoff sleep extends beyond it
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

using CallResult = tl::expected<json_rpc::Response, TransportError>;

//! JSON-RPC 2.0 client retrying transport-level failures with exponential backoff
class RpcClient {
  public:
    explicit RpcClient(std::shared_ptr<Transport> transport);

    //! Invoke the method with positional (array) or named (object) params
    Task<CallResult> call(const Endpoint& endpoint, std::string_view method, nlohmann::json params, CallOptions options = {});

    //! Send a pre-built request (or batch) unchanged
    Task<CallResult> forward(const Endpoint& endpoint, nlohmann::json request, CallOptions options = {});

    //! Build a request with a fresh id
    nlohmann::json make_request(std::string_view method, const nlohmann::json& params);

  private:
    CallResult interpret(const HttpReply& reply, const nlohmann::json& request) const;

    std::shared_ptr<Transport> transport_;
    std::atomic_uint64_t id_counter_{0};
};

}  // namespace rpcprobe::rpc
