// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <rpcprobe/rpc/json_rpc/message.hpp>
#include <rpcprobe/validation/validation_outcome.hpp>

#include "suite_state.hpp"

namespace rpcprobe::engine {

//! What a case expects from the node
struct Expectation {
    enum class Outcome {
        kSuccess,  // result present and valid against the method schema
        kError,    // error response, with a specific code when set
        kAny,      // any well-formed response
    };

    Outcome outcome{Outcome::kSuccess};
    std::optional<int64_t> error_code;
    //! Expected values at JSON pointers of the result, may contain placeholders
    std::map<std::string, nlohmann::json> equals;

    bool error_expected() const { return outcome == Outcome::kError; }
};

std::string_view to_string(Expectation::Outcome outcome);

//! One RPC call with its expectation, bound to a target when the suite is expanded
struct Case {
    std::string name;
    std::string method;
    //! Positional (array) or named (object) params, may contain placeholders
    nlohmann::json params{nlohmann::json::array()};
    Expectation expect;
    bool required{true};
    std::vector<std::string> depends_on;
    //! Suite variables assigned from JSON pointers of the result
    std::map<std::string, std::string> capture;
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * Check the response against the expectation of the case.
 * Violations are semantic: the response may be well-formed and still not the expected one.
 */
validation::ValidationOutcome check_expectation(
    const Case& test_case,
    const json_rpc::Response& response,
    const SuiteState& state,
    validation::ValidationMode mode);

//! Extract the captured values from a successful response, fail with the violation of the first missing pointer
tl::expected<std::map<std::string, nlohmann::json>, validation::Violation> capture_values(
    const std::map<std::string, std::string>& capture,
    const nlohmann::json& value,
    std::string_view base_path);

}  // namespace rpcprobe::engine
