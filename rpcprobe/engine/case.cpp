// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "case.hpp"

#include <absl/strings/str_cat.h>

namespace rpcprobe::engine {

std::string_view to_string(Expectation::Outcome outcome) {
    switch (outcome) {
        case Expectation::Outcome::kSuccess:
            return "success";
        case Expectation::Outcome::kError:
            return "error";
        case Expectation::Outcome::kAny:
            return "any";
    }
    return "unknown";
}

static std::string describe_error(const json_rpc::Response& response) {
    const auto& error = response.error();
    return absl::StrCat("error ", error.value("code", nlohmann::json{}).dump(), ": ", error.value("message", std::string{}));
}

static void check_equals(const Case& test_case,
                         const nlohmann::json& result,
                         const SuiteState& state,
                         validation::ValidationOutcome& outcome) {
    for (const auto& [pointer, expected_template] : test_case.expect.equals) {
        if (outcome.saturated()) return;
        const auto path = absl::StrCat("/result", pointer);
        const auto expected = state.substitute(expected_template);
        if (!expected) {
            outcome.add({.path = path, .expected = absl::StrCat("defined variable ", expected.error()), .actual = "undefined"});
            continue;
        }
        const nlohmann::json::json_pointer json_pointer{pointer};
        if (!result.contains(json_pointer)) {
            outcome.add({.path = path, .expected = expected->dump(), .actual = "missing"});
            continue;
        }
        const auto& actual = result.at(json_pointer);
        if (actual != *expected) {
            outcome.add({.path = path, .expected = expected->dump(), .actual = actual.dump()});
        }
    }
}

validation::ValidationOutcome check_expectation(
    const Case& test_case,
    const json_rpc::Response& response,
    const SuiteState& state,
    validation::ValidationMode mode) {
    validation::ValidationOutcome outcome{mode};
    const auto& expect = test_case.expect;

    if (response.kind() == json_rpc::Response::Kind::kBatch) {
        outcome.add({.path = "", .expected = "single response", .actual = "batch"});
        return outcome;
    }

    switch (expect.outcome) {
        case Expectation::Outcome::kSuccess:
            if (response.kind() != json_rpc::Response::Kind::kResult) {
                outcome.add({.path = "/error", .expected = "result", .actual = describe_error(response)});
                return outcome;
            }
            break;
        case Expectation::Outcome::kError:
            if (response.kind() != json_rpc::Response::Kind::kError) {
                outcome.add({
                    .path = "/result",
                    .expected = expect.error_code ? absl::StrCat("error ", *expect.error_code) : "error",
                    .actual = response.result().dump(),
                });
                return outcome;
            }
            if (expect.error_code && response.error_code() != expect.error_code) {
                const auto code = response.error_code();
                outcome.add({
                    .path = "/error/code",
                    .expected = absl::StrCat(*expect.error_code),
                    .actual = code ? absl::StrCat(*code) : response.error().value("code", nlohmann::json{}).dump(),
                });
            }
            return outcome;
        case Expectation::Outcome::kAny:
            break;
    }

    if (response.kind() == json_rpc::Response::Kind::kResult) {
        check_equals(test_case, response.result(), state, outcome);
    }
    return outcome;
}

tl::expected<std::map<std::string, nlohmann::json>, validation::Violation> capture_values(
    const std::map<std::string, std::string>& capture,
    const nlohmann::json& value,
    std::string_view base_path) {
    std::map<std::string, nlohmann::json> values;
    for (const auto& [variable, pointer] : capture) {
        const nlohmann::json::json_pointer json_pointer{pointer};
        if (!value.contains(json_pointer)) {
            return tl::make_unexpected(validation::Violation{
                .path = absl::StrCat(base_path, pointer),
                .expected = absl::StrCat("value captured as ", variable),
                .actual = "missing",
            });
        }
        values.emplace(variable, value.at(json_pointer));
    }
    return values;
}

}  // namespace rpcprobe::engine
