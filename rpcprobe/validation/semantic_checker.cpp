// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "semantic_checker.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <rpcprobe/infra/common/ensure.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>

#include "felt.hpp"

namespace rpcprobe::validation {

std::string_view to_string(DivergencePolicy policy) {
    switch (policy) {
        case DivergencePolicy::kFail:
            return "fail";
        case DivergencePolicy::kRecord:
            return "record";
    }
    return "unknown";
}

std::optional<DivergencePolicy> divergence_policy_from_string(std::string_view text) {
    if (text == "fail") return DivergencePolicy::kFail;
    if (text == "record") return DivergencePolicy::kRecord;
    return std::nullopt;
}

std::vector<MonotonicRule> SemanticChecker::default_rules() {
    return {
        {.method = "starknet_blockNumber", .json_pointer = ""},
        {.method = "starknet_blockHashAndNumber", .json_pointer = "/block_number"},
    };
}

SemanticChecker::SemanticChecker(std::vector<MonotonicRule> rules, DivergencePolicy divergence_policy)
    : rules_{std::move(rules)}, divergence_policy_{divergence_policy} {}

std::optional<intx::uint256> SemanticChecker::numeric_value(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return intx::uint256{value.get<uint64_t>()};
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return intx::uint256{static_cast<uint64_t>(value.get<int64_t>())};
    }
    if (value.is_string()) {
        return parse_hex_uint256(value.get_ref<const std::string&>());
    }
    return std::nullopt;
}

SemanticOutcome SemanticChecker::check(const CallRecord& call) {
    ensure(call.method != nullptr && call.response != nullptr, "SemanticChecker::check: incomplete call record");

    SemanticOutcome outcome;
    check_monotonic(call, outcome);
    check_error_code(call, outcome);
    check_divergence(call, outcome);
    return outcome;
}

void SemanticChecker::reset() {
    std::scoped_lock lock{mutex_};
    observations_.clear();
}

void SemanticChecker::check_monotonic(const CallRecord& call, SemanticOutcome& outcome) {
    if (call.response->kind() != json_rpc::Response::Kind::kResult) {
        return;
    }
    const auto& result = call.response->result();
    for (size_t index = 0; index < rules_.size(); ++index) {
        const auto& rule = rules_[index];
        if (rule.method != call.method->name) continue;

        const nlohmann::json::json_pointer pointer{rule.json_pointer};
        if (!result.contains(pointer)) continue;
        // Values of unexpected shape are left to the schema validation
        const auto value = numeric_value(result.at(pointer));
        if (!value) continue;

        std::scoped_lock lock{mutex_};
        auto& observations = observations_[{call.scope, index}];
        std::optional<intx::uint256> highest;
        for (const auto& observation : observations) {
            if (observation.completed > call.started) continue;
            if (!highest || observation.value > *highest) {
                highest = observation.value;
            }
        }
        if (highest && *value < *highest) {
            PROBE_DEBUG << "SemanticChecker: " << rule.method << rule.json_pointer << " regressed on " << call.scope
                        << " from " << intx::to_string(*highest) << " to " << intx::to_string(*value);
            outcome.violations.add(Violation{
                .path = absl::StrCat("/result", rule.json_pointer),
                .expected = absl::StrCat(">= ", intx::to_string(*highest), " (non-decreasing ", rule.method, ")"),
                .actual = intx::to_string(*value),
            });
        }
        observations.push_back({.value = *value, .completed = call.completed});
    }
}

void SemanticChecker::check_error_code(const CallRecord& call, SemanticOutcome& outcome) const {
    if (!call.error_expected || call.response->kind() != json_rpc::Response::Kind::kError) {
        return;
    }
    const auto code = call.response->error_code();
    if (!code || json_rpc::is_standard_error_code(*code) || call.method->declares_error(*code)) {
        return;
    }
    std::vector<int64_t> declared;
    for (const auto& [declared_code, _] : call.method->errors) {
        declared.push_back(declared_code);
    }
    outcome.violations.add(Violation{
        .path = "/error/code",
        .expected = absl::StrCat("error code declared by ", call.method->name, " [", absl::StrJoin(declared, ", "), "]"),
        .actual = absl::StrCat(*code),
    });
}

void SemanticChecker::check_divergence(const CallRecord& call, SemanticOutcome& outcome) const {
    if (const auto failures = call.response->header(std::string{kUpstreamFailuresHeader})) {
        outcome.notes.push_back(absl::StrCat("upstream failures: ", *failures));
    }
    const auto divergence = call.response->header(std::string{kDivergenceHeader});
    if (!divergence) {
        return;
    }
    outcome.notes.push_back(absl::StrCat("divergence: ", *divergence));
    if (divergence_policy_ == DivergencePolicy::kFail) {
        outcome.violations.add(Violation{
            .path = "",
            .expected = "agreement between upstreams",
            .actual = *divergence,
        });
    }
}

}  // namespace rpcprobe::validation
