// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "hook_runner.hpp"

#include <absl/strings/match.h>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <rpcprobe/infra/test_util/log.hpp>
#include <rpcprobe/infra/test_util/task_runner.hpp>
#include <rpcprobe/rpc/test_util/mock_transport.hpp>

namespace rpcprobe::engine {

using namespace std::chrono_literals;
using rpc::test_util::make_reply;
using testing::_;
using testing::InvokeWithoutArgs;

class MockFixtureTool : public FixtureTool {  // NOLINT
  public:
    MOCK_METHOD((Task<FixtureResult>), run, (const FixtureInvocation&), (override));
};

static Task<FixtureResult> make_output(FixtureResult output) {
    co_return output;
}

struct HookRunnerTest : public rpcprobe::test_util::TaskRunner {
    HookRunnerTest()
        : transport{std::make_shared<testing::StrictMock<rpc::test_util::MockTransport>>()},
          fixture_tool{std::make_shared<testing::StrictMock<MockFixtureTool>>()},
          hook_runner{std::make_shared<rpc::RpcClient>(transport), fixture_tool} {}

    tl::expected<Captures, std::string> run_hook(const Hook& hook) {
        return run(hook_runner.run(hook, target, state, {.timeout = 1s, .retry = rpc::RetryPolicy::single_attempt()}));
    }

    rpcprobe::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<testing::StrictMock<rpc::test_util::MockTransport>> transport;
    std::shared_ptr<testing::StrictMock<MockFixtureTool>> fixture_tool;
    HookRunner hook_runner;
    rpc::Endpoint target{rpc::Endpoint::parse("juno", "http://127.0.0.1:6060")};
    SuiteState state;
};

TEST_CASE_METHOD(HookRunnerTest, "HookRunner: rpc hook captures from the result", "[engine][hook_runner]") {
    const Hook hook{
        .name = "latest",
        .kind = Hook::Kind::kRpc,
        .method = "starknet_blockHashAndNumber",
        .capture = {{"hash", "/block_hash"}, {"number", "/block_number"}},
    };

    SECTION("success") {
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() {
            return make_reply(200, R"({"jsonrpc":"2.0","id":1,"result":{"block_hash":"0xabc","block_number":7}})");
        }));
        const auto captures = run_hook(hook);
        REQUIRE(captures);
        CHECK(captures->at("hash") == "0xabc");
        CHECK(captures->at("number") == 7);
    }
    SECTION("error response") {
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() {
            return make_reply(200, R"({"jsonrpc":"2.0","id":1,"error":{"code":32,"message":"There are no blocks"}})");
        }));
        const auto captures = run_hook(hook);
        REQUIRE_FALSE(captures);
        CHECK(absl::StrContains(captures.error(), "starknet_blockHashAndNumber returned"));
    }
    SECTION("transport failure") {
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() { return make_reply(502, "Bad Gateway"); }));
        const auto captures = run_hook(hook);
        REQUIRE_FALSE(captures);
        CHECK(absl::StrContains(captures.error(), "starknet_blockHashAndNumber failed"));
    }
    SECTION("missing captured value") {
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(InvokeWithoutArgs([]() {
            return make_reply(200, R"({"jsonrpc":"2.0","id":1,"result":{"block_hash":"0xabc"}})");
        }));
        const auto captures = run_hook(hook);
        REQUIRE_FALSE(captures);
        CHECK(captures.error() == "capture failed: /result/block_number: expected value captured as number, got missing");
    }
}

TEST_CASE_METHOD(HookRunnerTest, "HookRunner: fixture hook", "[engine][hook_runner]") {
    Hook hook{
        .name = "deploy",
        .kind = Hook::Kind::kFixture,
        .fixture = {.program = "deploy-account", .args = {"--class", "${class_hash}", "--salt", "${salt}"}},
        .capture = {{"account", "/address"}},
    };
    state.set("class_hash", "0x2");
    state.set("salt", 5);

    SECTION("placeholders substituted into args") {
        EXPECT_CALL(*fixture_tool, run(testing::Field(&FixtureInvocation::args, std::vector<std::string>{"--class", "0x2", "--salt", "5"})))
            .WillOnce(InvokeWithoutArgs([]() { return make_output(R"({"address": "0x1234"})"_json); }));
        const auto captures = run_hook(hook);
        REQUIRE(captures);
        CHECK(captures->at("account") == "0x1234");
    }
    SECTION("tool failure") {
        EXPECT_CALL(*fixture_tool, run(_)).WillOnce(InvokeWithoutArgs([]() {
            return make_output(tl::make_unexpected(std::string{"deploy-account exited with code 1: "}));
        }));
        const auto captures = run_hook(hook);
        REQUIRE_FALSE(captures);
        CHECK(captures.error() == "deploy-account exited with code 1: ");
    }
    SECTION("undefined variable") {
        hook.fixture.args.push_back("${nonce}");
        const auto captures = run_hook(hook);
        REQUIRE_FALSE(captures);
        CHECK(captures.error() == "undefined variable nonce");
    }
}

}  // namespace rpcprobe::engine
