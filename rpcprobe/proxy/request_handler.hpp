// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <rpcprobe/rpc/client/rpc_client.hpp>

#include "fan_out.hpp"
#include "id_mapper.hpp"
#include "settings.hpp"
#include "traffic_recorder.hpp"

namespace rpcprobe::proxy {

//! JSON-RPC error code answered when no upstream produced a response
inline constexpr int64_t kUpstreamError{-32000};

struct Reply {
    unsigned int status{200};
    std::string body;
    std::map<std::string, std::string> headers;
};

//! Relay of one inbound JSON-RPC request (or batch) to the upstreams, shared by all sessions
class RequestHandler {
  public:
    RequestHandler(const ProxySettings& settings,
                   std::shared_ptr<rpc::RpcClient> client,
                   std::shared_ptr<TrafficRecorder> recorder = nullptr);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    Task<Reply> handle(std::string_view body, IdMapper& id_mapper);

    Mode mode() const { return mode_; }

  private:
    void record(const std::vector<UpstreamOutcome>& outcomes, const Reply& reply);

    Mode mode_;
    FanOut fan_out_;
    std::shared_ptr<TrafficRecorder> recorder_;
};

}  // namespace rpcprobe::proxy
