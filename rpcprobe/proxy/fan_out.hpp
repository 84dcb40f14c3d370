// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <nlohmann/json.hpp>

#include <rpcprobe/rpc/client/rpc_client.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>

#include "comparator.hpp"
#include "settings.hpp"

namespace rpcprobe::proxy {

struct UpstreamOutcome {
    std::string upstream;
    rpc::CallResult result{tl::make_unexpected(rpc::TransportError::cancelled())};
    std::chrono::milliseconds elapsed{0};
};

//! Failed upstreams as JSON array of {upstream, error}
nlohmann::json failures_to_json(const std::vector<UpstreamOutcome>& outcomes);

struct FanOutResult {
    //! One outcome per upstream in target order
    std::vector<UpstreamOutcome> outcomes;
    //! Index of the outcome answered to the client
    size_t chosen{0};
    //! Set in compare strategy when some successful upstream disagrees with the chosen one
    std::optional<nlohmann::json> divergence;

    const json_rpc::Response& response() const { return *outcomes.at(chosen).result; }
    bool has_failures() const;
};

//! Every upstream failed to produce a JSON-RPC response
class ProxyUpstreamError : public std::runtime_error {
  public:
    explicit ProxyUpstreamError(std::vector<UpstreamOutcome> outcomes);

    const std::vector<UpstreamOutcome>& outcomes() const { return outcomes_; }

  private:
    std::vector<UpstreamOutcome> outcomes_;
};

/**
 * Issue the same request concurrently to all upstreams and wait for all of them, within the deadline.
 * Upstreams are attempted once: the proxy never retries.
 */
class FanOut {
  public:
    FanOut(std::shared_ptr<rpc::RpcClient> client,
           std::vector<rpc::Endpoint> upstreams,
           FanOutStrategy strategy,
           ResponseComparator comparator,
           std::chrono::milliseconds deadline,
           std::chrono::milliseconds upstream_timeout);

    //! Throw ProxyUpstreamError if no upstream succeeds
    Task<FanOutResult> dispatch(nlohmann::json request) const;

    const std::vector<rpc::Endpoint>& upstreams() const { return upstreams_; }

  private:
    Task<void> call_upstream(const rpc::Endpoint& upstream, const nlohmann::json& request, rpc::CallOptions options, UpstreamOutcome& outcome) const;

    std::optional<nlohmann::json> compare(const FanOutResult& result) const;

    std::shared_ptr<rpc::RpcClient> client_;
    std::vector<rpc::Endpoint> upstreams_;
    FanOutStrategy strategy_;
    ResponseComparator comparator_;
    std::chrono::milliseconds deadline_;
    std::chrono::milliseconds upstream_timeout_;
};

}  // namespace rpcprobe::proxy
