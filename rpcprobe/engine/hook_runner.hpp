// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <string>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <rpcprobe/rpc/client/rpc_client.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>

#include "fixture_tool.hpp"
#include "suite.hpp"
#include "suite_state.hpp"

namespace rpcprobe::engine {

using Captures = std::map<std::string, nlohmann::json>;

//! Executor of suite setup and teardown hooks
class HookRunner {
  public:
    HookRunner(std::shared_ptr<rpc::RpcClient> client, std::shared_ptr<FixtureTool> fixture_tool);

    //! Run the hook against the target, return the captured values or the failure description
    Task<tl::expected<Captures, std::string>> run(
        const Hook& hook,
        const rpc::Endpoint& target,
        const SuiteState& state,
        rpc::CallOptions options);

  private:
    Task<tl::expected<Captures, std::string>> run_rpc(
        const Hook& hook,
        const rpc::Endpoint& target,
        const SuiteState& state,
        rpc::CallOptions options);

    Task<tl::expected<Captures, std::string>> run_fixture(const Hook& hook, const SuiteState& state);

    std::shared_ptr<rpc::RpcClient> client_;
    std::shared_ptr<FixtureTool> fixture_tool_;
};

}  // namespace rpcprobe::engine
