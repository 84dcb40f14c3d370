// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "case_executor.hpp"

#include <absl/strings/match.h>
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

#include <rpcprobe/infra/test_util/log.hpp>
#include <rpcprobe/infra/test_util/task_runner.hpp>
#include <rpcprobe/rpc/test_util/mock_transport.hpp>
#include <rpcprobe/validation/test_util/sample_specification.hpp>

namespace rpcprobe::engine {

using namespace std::chrono_literals;
using rpc::test_util::make_failure;
using rpc::test_util::make_reply;
using testing::_;
using testing::Invoke;
using testing::InvokeWithoutArgs;

static constexpr const char* kBlockHash{"0x49d36570d4e46f48e99674bd3fcc84644ddd6b96f7c741b1562b82f9e004dc7"};

//! Mock action answering with the given result and the id of the request
static auto reply_result(nlohmann::json result) {
    return Invoke([result](const rpc::Endpoint&, const std::string& body, std::chrono::milliseconds) {
        const auto request = nlohmann::json::parse(body);
        return make_reply(200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}}.dump());
    });
}

static auto reply_error(int64_t code, std::string message) {
    return Invoke([code, message](const rpc::Endpoint&, const std::string& body, std::chrono::milliseconds) {
        const auto request = nlohmann::json::parse(body);
        const nlohmann::json error{{"code", code}, {"message", message}};
        return make_reply(200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"error", error}}.dump());
    });
}

struct CaseExecutorTest : public rpcprobe::test_util::TaskRunner {
    CaseExecutorTest()
        : transport{std::make_shared<testing::StrictMock<rpc::test_util::MockTransport>>()},
          executor{std::make_shared<rpc::RpcClient>(transport), spec, checker,
                   ExecutorSettings{.retry = {.max_attempts = 2, .initial_backoff = 1ms, .max_backoff = 1ms}}} {}

    CaseOutcome execute(const Case& test_case, std::chrono::milliseconds budget = 5s) {
        return run(executor.execute(test_case, target, state, CaseExecutor::Clock::now() + budget));
    }

    rpcprobe::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<const validation::Specification> spec{validation::test_util::sample_specification()};
    std::shared_ptr<validation::SemanticChecker> checker{std::make_shared<validation::SemanticChecker>()};
    std::shared_ptr<testing::StrictMock<rpc::test_util::MockTransport>> transport;
    CaseExecutor executor;
    rpc::Endpoint target{rpc::Endpoint::parse("juno", "http://127.0.0.1:6060")};
    SuiteState state;
};

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: valid result passes", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(640000));
    const auto outcome = execute(Case{.name = "block number", .method = "starknet_blockNumber"});
    CHECK(outcome.result.verdict == Verdict::kPass);
    CHECK(outcome.result.target == "juno");
    CHECK(outcome.result.request["method"] == "starknet_blockNumber");
    CHECK(outcome.result.response["result"] == 640000);
    CHECK(outcome.result.details.empty());
    CHECK_FALSE(outcome.transport_error);
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: schema violation", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result("0xa"));
    const auto outcome = execute(Case{.name = "block number", .method = "starknet_blockNumber"});
    CHECK(outcome.result.verdict == Verdict::kSchemaViolation);
    REQUIRE(outcome.result.violations.size() == 1);
    CHECK(outcome.result.violations[0].path == "/result");
    CHECK(outcome.result.details == "/result: expected integer, got string");
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: unexpected error is a semantic violation", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_error(24, "Block not found"));
    const auto outcome = execute(Case{.name = "block", .method = "starknet_getBlockWithTxHashes", .params = R"(["latest"])"_json});
    CHECK(outcome.result.verdict == Verdict::kSemanticViolation);
    CHECK(outcome.result.details == "/error: expected result, got error 24: Block not found");
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: expected error code", "[engine][case_executor]") {
    Case test_case{.name = "missing block", .method = "starknet_getBlockWithTxHashes", .params = R"([{"block_number": 99999999}])"_json};
    test_case.expect.outcome = Expectation::Outcome::kError;

    SECTION("declared code") {
        test_case.expect.error_code = 24;
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_error(24, "Block not found"));
        CHECK(execute(test_case).result.verdict == Verdict::kPass);
    }
    SECTION("undeclared code") {
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_error(20, "Contract not found"));
        const auto outcome = execute(test_case);
        CHECK(outcome.result.verdict == Verdict::kSemanticViolation);
        CHECK(outcome.result.violations[0].path == "/error/code");
    }
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: transport retry then pass", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _))
        .WillOnce(InvokeWithoutArgs([]() { return make_reply(503, "Service Unavailable"); }))
        .WillOnce(reply_result(10));
    CHECK(execute(Case{.name = "block number", .method = "starknet_blockNumber"}).result.verdict == Verdict::kPass);
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: transport error", "[engine][case_executor]") {
    const rpc::TransportError refused{.kind = rpc::TransportError::Kind::kConnectionFailed, .message = "connection refused"};
    EXPECT_CALL(*transport, post(_, _, _)).Times(2).WillRepeatedly(InvokeWithoutArgs([=]() { return make_failure(refused); }));
    const auto outcome = execute(Case{.name = "block number", .method = "starknet_blockNumber"});
    CHECK(outcome.result.verdict == Verdict::kTransportError);
    REQUIRE(outcome.transport_error);
    CHECK(outcome.transport_error->kind == rpc::TransportError::Kind::kConnectionFailed);
    CHECK(absl::StrContains(outcome.result.details, "connection refused"));
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: expired deadline", "[engine][case_executor]") {
    const auto outcome = execute(Case{.name = "block number", .method = "starknet_blockNumber"}, -1ms);
    CHECK(outcome.result.verdict == Verdict::kTransportError);
    CHECK(outcome.result.details == "cancelled");
    REQUIRE(outcome.transport_error);
    CHECK(outcome.transport_error->kind == rpc::TransportError::Kind::kCancelled);
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: placeholders and captures", "[engine][case_executor]") {
    Case test_case{
        .name = "block",
        .method = "starknet_getBlockWithTxHashes",
        .params = R"([{"block_hash": "${hash}"}])"_json,
        .capture = {{"parent", "/parent_hash"}, {"number", "/block_number"}},
    };

    SECTION("undefined variable skips") {
        const auto outcome = execute(test_case);
        CHECK(outcome.result.verdict == Verdict::kSkipped);
        CHECK(outcome.result.details == "undefined variable hash");
    }
    SECTION("substituted and captured") {
        state.set("hash", kBlockHash);
        const nlohmann::json block{
            {"block_hash", kBlockHash},
            {"parent_hash", "0x1"},
            {"block_number", 10},
            {"timestamp", 1700000000},
            {"status", "ACCEPTED_ON_L2"},
            {"transactions", nlohmann::json::array()},
        };
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(block));
        const auto outcome = execute(test_case);
        CHECK(outcome.result.verdict == Verdict::kPass);
        CHECK(outcome.result.request["params"] == nlohmann::json::array({nlohmann::json{{"block_hash", kBlockHash}}}));
        CHECK(outcome.captures.at("parent") == "0x1");
        CHECK(outcome.captures.at("number") == 10);
    }
    SECTION("missing captured value") {
        state.set("hash", kBlockHash);
        test_case.capture = {{"sequencer", "/sequencer_address"}};
        const nlohmann::json block{
            {"block_hash", kBlockHash},
            {"parent_hash", "0x1"},
            {"block_number", 10},
            {"timestamp", 1700000000},
            {"status", "ACCEPTED_ON_L2"},
            {"transactions", nlohmann::json::array()},
        };
        EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(block));
        const auto outcome = execute(test_case);
        CHECK(outcome.result.verdict == Verdict::kSemanticViolation);
        CHECK(outcome.result.details == "/result/sequencer_address: expected value captured as sequencer, got missing");
        CHECK(outcome.captures.empty());
    }
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: regression across calls", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(10)).WillOnce(reply_result(9));
    const Case test_case{.name = "block number", .method = "starknet_blockNumber"};
    CHECK(execute(test_case).result.verdict == Verdict::kPass);
    const auto outcome = execute(test_case);
    CHECK(outcome.result.verdict == Verdict::kSemanticViolation);
    CHECK(outcome.result.violations[0].expected == ">= 10 (non-decreasing starknet_blockNumber)");
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: schema violation that also regresses", "[engine][case_executor]") {
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(20)).WillOnce(reply_result("0x5"));
    const Case test_case{.name = "block number", .method = "starknet_blockNumber"};
    CHECK(execute(test_case).result.verdict == Verdict::kPass);

    const auto outcome = execute(test_case);
    CHECK(outcome.result.verdict == Verdict::kSchemaViolation);
    REQUIRE(outcome.result.violations.size() == 2);
    CHECK(outcome.result.violations[0].path == "/result");
    CHECK(outcome.result.violations[1].expected == ">= 20 (non-decreasing starknet_blockNumber)");
    CHECK(absl::StartsWith(outcome.result.details, "2 violations, first: /result"));
}

TEST_CASE_METHOD(CaseExecutorTest, "CaseExecutor: first violation mode stops at the schema", "[engine][case_executor]") {
    CaseExecutor first_executor{std::make_shared<rpc::RpcClient>(transport), spec, checker,
                                ExecutorSettings{.validation_mode = validation::ValidationMode::kFirst, .retry = rpc::RetryPolicy::single_attempt()}};
    EXPECT_CALL(*transport, post(_, _, _)).WillOnce(reply_result(20)).WillOnce(reply_result("0x5"));
    const Case test_case{.name = "block number", .method = "starknet_blockNumber"};
    CHECK(run(first_executor.execute(test_case, target, state, CaseExecutor::Clock::now() + 5s)).result.verdict == Verdict::kPass);

    const auto outcome = run(first_executor.execute(test_case, target, state, CaseExecutor::Clock::now() + 5s));
    CHECK(outcome.result.verdict == Verdict::kSchemaViolation);
    REQUIRE(outcome.result.violations.size() == 1);
    CHECK(outcome.result.violations[0].path == "/result");
}

TEST_CASE("describe TransportError", "[engine][case_executor]") {
    CHECK(describe(rpc::TransportError::cancelled()) == "cancelled");
    CHECK(describe({.kind = rpc::TransportError::Kind::kHttpStatus, .message = "bad gateway", .http_status = 502}) ==
          "http-status 502: bad gateway");
}

}  // namespace rpcprobe::engine
