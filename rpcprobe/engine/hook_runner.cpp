// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "hook_runner.hpp"

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/log.hpp>

#include "case.hpp"

namespace rpcprobe::engine {

HookRunner::HookRunner(std::shared_ptr<rpc::RpcClient> client, std::shared_ptr<FixtureTool> fixture_tool)
    : client_{std::move(client)}, fixture_tool_{std::move(fixture_tool)} {}

Task<tl::expected<Captures, std::string>> HookRunner::run(
    const Hook& hook,
    const rpc::Endpoint& target,
    const SuiteState& state,
    rpc::CallOptions options) {
    PROBE_DEBUG << "HookRunner: running " << to_string(hook.kind) << " hook " << hook.name << " on " << target.name();
    if (hook.kind == Hook::Kind::kRpc) {
        co_return co_await run_rpc(hook, target, state, options);
    }
    co_return co_await run_fixture(hook, state);
}

Task<tl::expected<Captures, std::string>> HookRunner::run_rpc(
    const Hook& hook,
    const rpc::Endpoint& target,
    const SuiteState& state,
    rpc::CallOptions options) {
    const auto params = state.substitute(hook.params);
    if (!params) {
        co_return tl::make_unexpected(absl::StrCat("undefined variable ", params.error()));
    }
    const auto result = co_await client_->call(target, hook.method, *params, options);
    if (!result) {
        co_return tl::make_unexpected(absl::StrCat(hook.method, " failed: ", result.error().message));
    }
    if (result->kind() != json_rpc::Response::Kind::kResult) {
        co_return tl::make_unexpected(absl::StrCat(hook.method, " returned ", result->dump()));
    }
    const auto captures = capture_values(hook.capture, result->result(), "/result");
    if (!captures) {
        co_return tl::make_unexpected(absl::StrCat("capture failed: ", validation::to_string(captures.error())));
    }
    co_return *captures;
}

Task<tl::expected<Captures, std::string>> HookRunner::run_fixture(const Hook& hook, const SuiteState& state) {
    if (!fixture_tool_) {
        co_return tl::make_unexpected("no fixture tool available");
    }
    FixtureInvocation invocation{hook.fixture};
    invocation.args.clear();
    for (const auto& arg : hook.fixture.args) {
        const auto substituted = state.substitute(arg);
        if (!substituted) {
            co_return tl::make_unexpected(absl::StrCat("undefined variable ", substituted.error()));
        }
        invocation.args.push_back(substituted->is_string() ? substituted->get<std::string>() : substituted->dump());
    }

    const auto output = co_await fixture_tool_->run(invocation);
    if (!output) {
        co_return tl::make_unexpected(output.error());
    }
    const auto captures = capture_values(hook.capture, *output, "");
    if (!captures) {
        co_return tl::make_unexpected(absl::StrCat("capture failed: ", validation::to_string(captures.error())));
    }
    co_return *captures;
}

}  // namespace rpcprobe::engine
