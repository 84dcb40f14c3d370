// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "scheduler.hpp"

#include <atomic>
#include <map>

#include <absl/strings/match.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch.hpp>

#include <rpcprobe/infra/test_util/log.hpp>
#include <rpcprobe/infra/test_util/task_runner.hpp>
#include <rpcprobe/rpc/test_util/stub_backend.hpp>
#include <rpcprobe/rpc/transport/http_transport.hpp>
#include <rpcprobe/validation/test_util/sample_specification.hpp>

namespace rpcprobe::engine {

using namespace std::chrono_literals;
using rpc::test_util::StubBackend;
using rpc::test_util::StubReply;

static constexpr const char* kBlockHash{"0x49d36570d4e46f48e99674bd3fcc84644ddd6b96f7c741b1562b82f9e004dc7"};

using MethodHandlers = std::map<std::string, std::function<StubReply(const nlohmann::json&)>>;

//! Stub node dispatching on the request method, unknown methods answer -32601
static StubBackend::Handler dispatch(MethodHandlers handlers) {
    return [handlers = std::move(handlers)](const nlohmann::json& request) {
        const auto it = handlers.find(request.value("method", ""));
        if (it == handlers.end()) {
            return StubBackend::error(request, -32601, "Method not found");
        }
        return it->second(request);
    };
}

static std::function<StubReply(const nlohmann::json&)> answer(nlohmann::json result, std::chrono::milliseconds delay = 0ms) {
    return [result = std::move(result), delay](const nlohmann::json& request) {
        auto reply = StubBackend::result(request, result);
        reply.delay = delay;
        return reply;
    };
}

static Case make_case(std::string name, std::string method, nlohmann::json params = nlohmann::json::array()) {
    return Case{.name = std::move(name), .method = std::move(method), .params = std::move(params)};
}

static const CaseResult& case_result(const ResultNode& root, std::string_view name) {
    const auto* node = root.find(name);
    REQUIRE(node != nullptr);
    REQUIRE(node->case_result);
    return *node->case_result;
}

struct SchedulerTest : public rpcprobe::test_util::TaskRunner {
    explicit SchedulerTest(std::vector<validation::MonotonicRule> rules = validation::SemanticChecker::default_rules())
        : checker{std::make_shared<validation::SemanticChecker>(std::move(rules))},
          executor{std::make_shared<CaseExecutor>(client, spec, checker, ExecutorSettings{.retry = rpc::RetryPolicy::single_attempt()})},
          hook_runner{std::make_shared<HookRunner>(client, nullptr)} {}

    ResultNode run_suite(const Suite& suite, const std::vector<rpc::Endpoint>& targets, SchedulerSettings settings = {}) {
        settings.hook_retry = rpc::RetryPolicy::single_attempt();
        Scheduler scheduler{settings, executor, hook_runner};
        return run(scheduler.run(suite, targets));
    }

    rpcprobe::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    std::shared_ptr<const validation::Specification> spec{validation::test_util::sample_specification()};
    std::shared_ptr<rpc::RpcClient> client{std::make_shared<rpc::RpcClient>(std::make_shared<rpc::HttpTransport>())};
    std::shared_ptr<validation::SemanticChecker> checker;
    std::shared_ptr<CaseExecutor> executor;
    std::shared_ptr<HookRunner> hook_runner;
};

TEST_CASE_METHOD(SchedulerTest, "Scheduler: result tree per target", "[engine][scheduler]") {
    StubBackend juno{dispatch({{"starknet_chainId", answer("0x534e5f5345504f4c4941")}, {"starknet_blockNumber", answer(10)}})};
    StubBackend pathfinder{dispatch({{"starknet_chainId", answer("SN_SEPOLIA")}, {"starknet_blockNumber", answer(10)}})};
    const Suite suite{.name = "basics", .cases = {make_case("chain id", "starknet_chainId"), make_case("block number", "starknet_blockNumber")}};

    const auto root = run_suite(suite, {juno.endpoint("juno"), pathfinder.endpoint("pathfinder")});

    CHECK(root.kind == ResultNode::Kind::kRun);
    REQUIRE(root.children.size() == 2);
    const auto& juno_node = root.children[0];
    const auto& pathfinder_node = root.children[1];
    CHECK(juno_node.kind == ResultNode::Kind::kTarget);
    CHECK(juno_node.name == "juno");
    CHECK(juno_node.status() == Status::kPass);
    CHECK(pathfinder_node.name == "pathfinder");
    CHECK(pathfinder_node.status() == Status::kFail);

    REQUIRE(pathfinder_node.children.size() == 1);
    const auto& suite_node = pathfinder_node.children[0];
    CHECK(suite_node.name == "basics");
    CHECK(suite_node.target == "pathfinder");
    REQUIRE(suite_node.children.size() == 2);
    CHECK(suite_node.children[0].case_result->verdict == Verdict::kSchemaViolation);
    CHECK(suite_node.children[1].case_result->verdict == Verdict::kPass);
    CHECK(suite_node.children[1].case_result->attempts == 1);
    CHECK(root.status() == Status::kFail);
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: suite deadline cancels running cases", "[engine][scheduler]") {
    StubBackend juno{dispatch({{"starknet_blockNumber", answer(10, 500ms)}, {"starknet_chainId", answer("0x1", 10ms)}})};
    const Suite suite{
        .name = "deadline",
        .deadline = 100ms,
        .cases = {make_case("slow", "starknet_blockNumber"), make_case("fast", "starknet_chainId")},
    };

    const auto started = std::chrono::steady_clock::now();
    const auto root = run_suite(suite, {juno.endpoint("juno")});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    const auto& slow = case_result(root, "slow");
    CHECK(slow.verdict == Verdict::kTransportError);
    CHECK(slow.details == "cancelled");
    CHECK(case_result(root, "fast").verdict == Verdict::kPass);
    CHECK(elapsed < 450ms);
    CHECK(root.status() == Status::kFail);
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: suite deadlines beyond the clock range never expire", "[engine][scheduler]") {
    StubBackend juno{dispatch({{"starknet_chainId", answer("0x1")}})};
    Suite nested{.name = "nested", .deadline = std::chrono::milliseconds{10'000'000'000'000}, .cases = {make_case("inner case", "starknet_chainId")}};
    const Suite suite{
        .name = "outer",
        .deadline = std::chrono::milliseconds::max(),
        .cases = {make_case("outer case", "starknet_chainId")},
        .suites = {std::move(nested)},
    };

    const auto root = run_suite(suite, {juno.endpoint("juno")});

    CHECK(case_result(root, "outer case").verdict == Verdict::kPass);
    CHECK(case_result(root, "inner case").verdict == Verdict::kPass);
    CHECK(root.status() == Status::kPass);
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: suite deadline on a multi-threaded pool", "[engine][scheduler]") {
    const auto handlers = [] { return dispatch({{"starknet_blockNumber", answer(10, 500ms)}, {"starknet_chainId", answer("0x1", 10ms)}}); };
    StubBackend juno{handlers()};
    StubBackend pathfinder{handlers()};
    const Suite suite{
        .name = "deadline",
        .deadline = 100ms,
        .cases = {make_case("slow", "starknet_blockNumber"), make_case("fast", "starknet_chainId")},
    };
    const std::vector<rpc::Endpoint> targets{juno.endpoint("juno"), pathfinder.endpoint("pathfinder")};

    boost::asio::thread_pool pool{4};
    Scheduler scheduler{{.hook_retry = rpc::RetryPolicy::single_attempt()}, executor, hook_runner};
    for (int round = 0; round < 3; ++round) {
        const auto root = boost::asio::co_spawn(pool, scheduler.run(suite, targets), boost::asio::use_future).get();
        REQUIRE(root.children.size() == 2);
        for (const auto& target_node : root.children) {
            CHECK(case_result(target_node, "slow").details == "cancelled");
            CHECK(case_result(target_node, "fast").verdict == Verdict::kPass);
        }
    }
    pool.join();
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: case retry on transport errors only", "[engine][scheduler]") {
    std::atomic<int> calls{0};
    StubBackend juno{dispatch({
        {"starknet_blockNumber", [&calls](const nlohmann::json& request) {
             if (++calls < 3) return StubReply{.status = 503, .raw_body = "overloaded"};
             return StubBackend::result(request, 10);
         }},
        {"starknet_chainId", answer(7)},
    })};

    SECTION("transport error retried") {
        const Suite suite{.name = "retry", .cases = {make_case("block number", "starknet_blockNumber")}};
        const auto root = run_suite(suite, {juno.endpoint("juno")}, {.case_retries = 2});
        const auto& result = case_result(root, "block number");
        CHECK(result.verdict == Verdict::kPass);
        CHECK(result.attempts == 3);
    }
    SECTION("retries exhausted") {
        const Suite suite{.name = "retry", .cases = {make_case("block number", "starknet_blockNumber")}};
        const auto root = run_suite(suite, {juno.endpoint("juno")}, {.case_retries = 1});
        const auto& result = case_result(root, "block number");
        CHECK(result.verdict == Verdict::kTransportError);
        CHECK(result.attempts == 2);
        CHECK(absl::StrContains(result.details, "503"));
    }
    SECTION("violations never retried") {
        const Suite suite{.name = "retry", .cases = {make_case("chain id", "starknet_chainId")}};
        const auto root = run_suite(suite, {juno.endpoint("juno")}, {.case_retries = 2});
        const auto& result = case_result(root, "chain id");
        CHECK(result.verdict == Verdict::kSchemaViolation);
        CHECK(result.attempts == 1);
        CHECK(juno.request_count() == 1);
    }
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: dependencies and captures", "[engine][scheduler]") {
    const nlohmann::json block{
        {"block_hash", kBlockHash},
        {"parent_hash", "0x1"},
        {"block_number", 10},
        {"timestamp", 1700000000},
        {"status", "ACCEPTED_ON_L2"},
        {"transactions", nlohmann::json::array()},
    };
    StubBackend juno{dispatch({
        {"starknet_blockHashAndNumber", answer({{"block_hash", kBlockHash}, {"block_number", 10}})},
        {"starknet_getBlockWithTxHashes", answer(block)},
        {"starknet_chainId", answer(1)},
    })};

    auto latest = make_case("latest", "starknet_blockHashAndNumber");
    latest.capture = {{"hash", "/block_hash"}};
    auto by_hash = make_case("by hash", "starknet_getBlockWithTxHashes", R"([{"block_hash": "${hash}"}])"_json);
    by_hash.depends_on = {"latest"};
    by_hash.expect.equals = {{"/block_hash", "${hash}"}};
    auto chain_id = make_case("chain id", "starknet_chainId");
    auto after_chain_id = make_case("after chain id", "starknet_blockHashAndNumber");
    after_chain_id.depends_on = {"chain id"};

    const Suite suite{.name = "captures", .cases = {latest, by_hash, chain_id, after_chain_id}};
    const auto root = run_suite(suite, {juno.endpoint("juno")});

    CHECK(case_result(root, "latest").verdict == Verdict::kPass);
    const auto& by_hash_result = case_result(root, "by hash");
    CHECK(by_hash_result.verdict == Verdict::kPass);
    CHECK(by_hash_result.request["params"][0]["block_hash"] == kBlockHash);

    CHECK(case_result(root, "chain id").verdict == Verdict::kSchemaViolation);
    const auto& skipped = case_result(root, "after chain id");
    CHECK(skipped.verdict == Verdict::kSkipped);
    CHECK(skipped.details == "dependency chain id did not pass");
    CHECK(skipped.attempts == 0);

    // Children keep the declaration order
    const auto& suite_node = root.children[0].children[0];
    REQUIRE(suite_node.children.size() == 4);
    CHECK(suite_node.children[1].name == "by hash");
    CHECK(suite_node.children[3].name == "after chain id");
}

TEST_CASE_METHOD(SchedulerTest, "Scheduler: setup hooks and nested suites", "[engine][scheduler]") {
    StubBackend juno{dispatch({
        {"starknet_blockHashAndNumber", answer({{"block_hash", kBlockHash}, {"block_number", 10}})},
        {"starknet_getStorageAt", answer("0x0")},
        {"starknet_blockNumber", answer(10)},
    })};

    Suite nested{.name = "storage", .cases = {make_case("storage", "starknet_getStorageAt", R"(["${hash}", "0x1", "latest"])"_json)}};
    Suite suite{
        .name = "root",
        .setup = {Hook{.name = "latest", .method = "starknet_blockHashAndNumber", .capture = {{"hash", "/block_hash"}}}},
        .cases = {make_case("block number", "starknet_blockNumber")},
        .suites = {nested},
    };

    SECTION("setup captures reach nested suites") {
        const auto root = run_suite(suite, {juno.endpoint("juno")});
        CHECK(root.status() == Status::kPass);
        CHECK(case_result(root, "storage").request["params"][0] == kBlockHash);
        const auto& suite_node = root.children[0].children[0];
        REQUIRE(suite_node.children.size() == 2);
        CHECK(suite_node.children[0].kind == ResultNode::Kind::kCase);
        CHECK(suite_node.children[1].kind == ResultNode::Kind::kSuite);
    }
    SECTION("failing setup skips every child") {
        suite.setup.front().method = "starknet_traceTransaction";
        const auto root = run_suite(suite, {juno.endpoint("juno")});
        const auto& suite_node = root.children[0].children[0];
        REQUIRE(suite_node.setup_failure);
        CHECK(absl::StrContains(*suite_node.setup_failure, "setup hook latest failed"));
        CHECK(suite_node.status() == Status::kFail);
        CHECK(case_result(root, "block number").verdict == Verdict::kSkipped);
        CHECK(case_result(root, "storage").verdict == Verdict::kSkipped);
        CHECK(juno.request_count() == 1);
    }
    SECTION("failing teardown is a note") {
        suite.teardown = {Hook{.name = "cleanup", .kind = Hook::Kind::kFixture, .fixture = {.program = "cleanup"}}};
        const auto root = run_suite(suite, {juno.endpoint("juno")});
        const auto& suite_node = root.children[0].children[0];
        REQUIRE(suite_node.notes.size() == 1);
        CHECK(absl::StrContains(suite_node.notes[0], "teardown hook cleanup failed"));
        CHECK(suite_node.status() == Status::kPass);
    }
    SECTION("optional nested suite") {
        StubBackend broken{dispatch({
            {"starknet_blockHashAndNumber", answer({{"block_hash", kBlockHash}, {"block_number", 10}})},
            {"starknet_getStorageAt", answer(5)},
            {"starknet_blockNumber", answer(10)},
        })};
        suite.suites.front().required = false;
        const auto root = run_suite(suite, {broken.endpoint("broken")});
        CHECK(case_result(root, "storage").verdict == Verdict::kSchemaViolation);
        CHECK(root.status() == Status::kPass);
    }
}

struct RegressionTest : public SchedulerTest {
    RegressionTest() : SchedulerTest{{{.method = "getBlockByNumber", .json_pointer = "/block_number"}}} {}
};

TEST_CASE_METHOD(RegressionTest, "Scheduler: block number regression across cases", "[engine][scheduler]") {
    std::atomic<int> calls{0};
    StubBackend juno{dispatch({
        {"getBlockByNumber", [&calls](const nlohmann::json& request) {
             const int64_t number = ++calls == 1 ? 10 : 9;
             return StubBackend::result(request, {{"block_hash", kBlockHash}, {"block_number", number}});
         }},
    })};

    auto first = make_case("first", "getBlockByNumber", R"(["latest"])"_json);
    auto second = make_case("second", "getBlockByNumber", R"(["latest"])"_json);
    second.depends_on = {"first"};
    const Suite suite{.name = "regression", .cases = {first, second}};

    const auto root = run_suite(suite, {juno.endpoint("juno")});

    CHECK(case_result(root, "first").verdict == Verdict::kPass);
    const auto& result = case_result(root, "second");
    CHECK(result.verdict == Verdict::kSemanticViolation);
    REQUIRE(result.violations.size() == 1);
    CHECK(result.violations[0].path == "/result/block_number");
    CHECK(result.violations[0].expected == ">= 10 (non-decreasing getBlockByNumber)");
    CHECK(result.violations[0].actual == "9");
    CHECK(root.status() == Status::kFail);
}

}  // namespace rpcprobe::engine
