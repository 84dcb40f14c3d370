// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "case.hpp"

#include <catch2/catch.hpp>

namespace rpcprobe::engine {

using json_rpc::Response;
using validation::ValidationMode;
using validation::Violation;

static Response make_response(const nlohmann::json& json) {
    auto response = Response::from_json(json);
    REQUIRE(response);
    return std::move(*response);
}

static Response make_result(nlohmann::json result) {
    return make_response({{"jsonrpc", "2.0"}, {"id", 1}, {"result", std::move(result)}});
}

static Response make_error(int64_t code) {
    return make_response({{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", code}, {"message", "Block not found"}}}});
}

TEST_CASE("check_expectation success", "[engine][case]") {
    Case test_case{.name = "chain id", .method = "starknet_chainId"};
    const SuiteState state;

    CHECK(check_expectation(test_case, make_result("0x1"), state, ValidationMode::kFirst).ok());

    const auto outcome = check_expectation(test_case, make_error(24), state, ValidationMode::kFirst);
    REQUIRE_FALSE(outcome.ok());
    CHECK(*outcome.first() == Violation{.path = "/error", .expected = "result", .actual = "error 24: Block not found"});

    const auto batch = make_response(R"([{"jsonrpc":"2.0","id":1,"result":1}])"_json);
    CHECK(check_expectation(test_case, batch, state, ValidationMode::kFirst).first()->actual == "batch");
}

TEST_CASE("check_expectation error", "[engine][case]") {
    Case test_case{.name = "missing block", .method = "starknet_getBlockWithTxHashes"};
    test_case.expect.outcome = Expectation::Outcome::kError;
    const SuiteState state;

    SECTION("any error code") {
        CHECK(check_expectation(test_case, make_error(24), state, ValidationMode::kFirst).ok());
        const auto outcome = check_expectation(test_case, make_result(1), state, ValidationMode::kFirst);
        REQUIRE_FALSE(outcome.ok());
        CHECK(*outcome.first() == Violation{.path = "/result", .expected = "error", .actual = "1"});
    }
    SECTION("specific error code") {
        test_case.expect.error_code = 24;
        CHECK(check_expectation(test_case, make_error(24), state, ValidationMode::kFirst).ok());
        const auto outcome = check_expectation(test_case, make_error(20), state, ValidationMode::kFirst);
        REQUIRE_FALSE(outcome.ok());
        CHECK(*outcome.first() == Violation{.path = "/error/code", .expected = "24", .actual = "20"});
        CHECK(check_expectation(test_case, make_result(1), state, ValidationMode::kFirst).first()->expected == "error 24");
    }
}

TEST_CASE("check_expectation any outcome", "[engine][case]") {
    Case test_case{.name = "any", .method = "starknet_blockNumber"};
    test_case.expect.outcome = Expectation::Outcome::kAny;
    const SuiteState state;
    CHECK(check_expectation(test_case, make_result(1), state, ValidationMode::kFirst).ok());
    CHECK(check_expectation(test_case, make_error(32), state, ValidationMode::kFirst).ok());
}

TEST_CASE("check_expectation equals", "[engine][case]") {
    Case test_case{.name = "block", .method = "starknet_blockHashAndNumber"};
    test_case.expect.equals = {{"/block_number", 10}, {"/block_hash", "${hash}"}};
    SuiteState state;
    state.set("hash", "0xabc");

    CHECK(check_expectation(test_case, make_result({{"block_hash", "0xabc"}, {"block_number", 10}}), state, ValidationMode::kExhaustive).ok());

    SECTION("mismatch") {
        const auto outcome = check_expectation(test_case, make_result({{"block_hash", "0xdef"}, {"block_number", 9}}), state,
                                               ValidationMode::kExhaustive);
        REQUIRE(outcome.violations().size() == 2);
        CHECK(outcome.violations()[0] == Violation{.path = "/result/block_hash", .expected = R"("0xabc")", .actual = R"("0xdef")"});
        CHECK(outcome.violations()[1] == Violation{.path = "/result/block_number", .expected = "10", .actual = "9"});
    }
    SECTION("first mode stops at the first mismatch") {
        const auto outcome = check_expectation(test_case, make_result({{"block_hash", "0xdef"}, {"block_number", 9}}), state,
                                               ValidationMode::kFirst);
        CHECK(outcome.violations().size() == 1);
    }
    SECTION("missing value") {
        const auto outcome = check_expectation(test_case, make_result({{"block_hash", "0xabc"}}), state, ValidationMode::kExhaustive);
        REQUIRE(outcome.violations().size() == 1);
        CHECK(outcome.first()->actual == "missing");
    }
    SECTION("undefined variable") {
        const auto outcome = check_expectation(test_case, make_result({{"block_hash", "0xabc"}, {"block_number", 10}}), SuiteState{},
                                               ValidationMode::kExhaustive);
        REQUIRE(outcome.violations().size() == 1);
        CHECK(outcome.first()->expected == "defined variable hash");
    }
}

TEST_CASE("capture_values", "[engine][case]") {
    const auto result = R"({"block_hash": "0xabc", "block_number": 10, "transactions": ["0x1", "0x2"]})"_json;

    const auto values = capture_values({{"hash", "/block_hash"}, {"tx", "/transactions/1"}, {"block", ""}}, result, "/result");
    REQUIRE(values);
    CHECK(values->at("hash") == "0xabc");
    CHECK(values->at("tx") == "0x2");
    CHECK(values->at("block") == result);

    const auto missing = capture_values({{"parent", "/parent_hash"}}, result, "/result");
    REQUIRE_FALSE(missing);
    CHECK(missing.error() == Violation{.path = "/result/parent_hash", .expected = "value captured as parent", .actual = "missing"});
}

}  // namespace rpcprobe::engine
