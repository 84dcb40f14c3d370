// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "reporter.hpp"

#include <fstream>
#include <sstream>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <rpcprobe/infra/common/terminal.hpp>
#include <rpcprobe/infra/test_util/log.hpp>
#include <rpcprobe/infra/test_util/temporary_file.hpp>

namespace rpcprobe::engine {

using namespace std::chrono_literals;

static ResultNode sample_tree() {
    ResultNode suite{.kind = ResultNode::Kind::kSuite, .name = "blocks", .target = "juno"};
    suite.children.push_back(ResultNode::make_case(
        CaseResult{
            .name = "block number",
            .method = "starknet_blockNumber",
            .target = "juno",
            .verdict = Verdict::kPass,
            .notes = {"divergence: pathfinder"},
            .elapsed = 12ms,
            .attempts = 1,
            .request = R"({"jsonrpc":"2.0","id":1,"method":"starknet_blockNumber","params":[]})"_json,
            .response = R"({"jsonrpc":"2.0","id":1,"result":10})"_json,
        },
        true));
    suite.children.push_back(ResultNode::make_case(
        CaseResult{
            .name = "chain id",
            .method = "starknet_chainId",
            .target = "juno",
            .verdict = Verdict::kSchemaViolation,
            .details = "/result: expected string, got integer",
            .violations = {{.path = "/result", .expected = "string", .actual = "integer"}},
            .attempts = 1,
        },
        true));
    suite.children.push_back(ResultNode::make_case(
        CaseResult{.name = "trace", .method = "starknet_traceTransaction", .target = "juno", .verdict = Verdict::kTransportError},
        false));

    ResultNode target{.kind = ResultNode::Kind::kTarget, .name = "juno", .target = "juno"};
    target.children.push_back(std::move(suite));
    ResultNode root{.kind = ResultNode::Kind::kRun, .name = "openrpc"};
    root.children.push_back(std::move(target));
    return root;
}

TEST_CASE("Reporter::to_json", "[engine][reporter]") {
    const auto root = sample_tree();
    const Reporter reporter{root};
    const auto json = reporter.to_json();

    CHECK(json["name"] == "openrpc");
    CHECK(json["kind"] == "run");
    CHECK(json["status"] == "Fail");
    CHECK(json["summary"]["total"] == 3);
    CHECK(json["summary"]["required_failures"] == 1);
    CHECK(json["summary"]["verdicts"]["Pass"] == 1);
    CHECK(json["summary"]["verdicts"]["SchemaViolation"] == 1);
    CHECK(json["summary"]["verdicts"]["TransportError"] == 1);
    CHECK(json["summary"]["verdicts"]["Skipped"] == 0);

    const auto& suite = json["children"][0]["children"][0];
    CHECK(suite["kind"] == "suite");
    CHECK(suite["target"] == "juno");
    REQUIRE(suite["children"].size() == 3);

    const auto& passed = suite["children"][0];
    CHECK(passed["kind"] == "case");
    CHECK(passed["method"] == "starknet_blockNumber");
    CHECK(passed["verdict"] == "Pass");
    CHECK(passed["status"] == "Pass");
    CHECK(passed["elapsed_ms"] == 12);
    CHECK(passed["attempts"] == 1);
    CHECK(passed["notes"] == R"(["divergence: pathfinder"])"_json);
    CHECK(passed["response"]["result"] == 10);
    CHECK(passed["children"].empty());

    const auto& failed = suite["children"][1];
    CHECK(failed["verdict"] == "SchemaViolation");
    CHECK(failed["details"] == "/result: expected string, got integer");
    CHECK(failed["violations"] == R"([{"path": "/result", "expected": "string", "actual": "integer"}])"_json);

    CHECK(suite["children"][2]["required"] == false);
    CHECK(suite["children"][2]["request"].is_null());
}

TEST_CASE("Reporter summary and exit code", "[engine][reporter]") {
    auto root = sample_tree();

    SECTION("failing run") {
        const Reporter reporter{root};
        CHECK(reporter.exit_code() == 1);
        std::stringstream out;
        reporter.print_summary(out, /*colored=*/false);
        const auto text = out.str();
        CHECK(absl::StrContains(text, "SchemaViolation juno/blocks/chain id: /result: expected string, got integer"));
        CHECK(absl::StrContains(text, "TransportError juno/blocks/trace (optional)"));
        CHECK(absl::StrContains(text, "3 cases: Pass=1 SchemaViolation=1 TransportError=1"));
        CHECK(absl::StrContains(text, "Status: Fail"));
        CHECK_FALSE(absl::StrContains(text, "\x1b["));
    }
    SECTION("passing run with optional failure") {
        auto& cases = root.children[0].children[0].children;
        cases.erase(cases.begin() + 1);
        const Reporter reporter{root};
        CHECK(reporter.summary().status == Status::kPass);
        CHECK(reporter.summary().required_failures == 0);
        CHECK(reporter.exit_code() == 0);
        std::stringstream out;
        reporter.print_summary(out, /*colored=*/true);
        CHECK(absl::StrContains(out.str(), std::string{kColorGreenHigh}));
    }
}

TEST_CASE("Reporter::write_json", "[engine][reporter]") {
    rpcprobe::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    const auto root = sample_tree();
    const Reporter reporter{root};

    rpcprobe::test_util::TemporaryFile file;
    reporter.write_json(file.path());
    std::ifstream stream{file.path()};
    CHECK(nlohmann::json::parse(stream) == reporter.to_json());

    CHECK_THROWS_AS(reporter.write_json("/proc/rpcprobe/report.json"), std::exception);
}

}  // namespace rpcprobe::engine
