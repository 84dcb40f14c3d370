// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include <intx/intx.hpp>

#include <rpcprobe/rpc/json_rpc/message.hpp>

#include "method_spec.hpp"
#include "validation_outcome.hpp"

namespace rpcprobe::validation {

enum class DivergencePolicy {
    kFail,    // divergence between upstreams is a semantic violation
    kRecord,  // divergence is only annotated
};

std::string_view to_string(DivergencePolicy policy);
std::optional<DivergencePolicy> divergence_policy_from_string(std::string_view text);

//! Value at json_pointer inside the result of method must never decrease within a run
struct MonotonicRule {
    std::string method;
    std::string json_pointer;

    bool operator==(const MonotonicRule&) const = default;
};

//! One completed call as seen by the checker
struct CallRecord {
    //! Observations are compared only within the same scope, usually the target name
    std::string scope;
    const MethodSpec* method{nullptr};
    const json_rpc::Response* response{nullptr};
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point completed;
    bool error_expected{false};
};

struct SemanticOutcome {
    ValidationOutcome violations{ValidationMode::kExhaustive};
    std::vector<std::string> notes;
};

/**
 * Invariants spanning multiple calls of a run.
 *
 * A monotonic value is compared only with the observations of calls completed before the checked call started,
 * so that calls overlapping in time never raise false regressions. The observation log is internally synchronized.
 */
class SemanticChecker {
  public:
    static std::vector<MonotonicRule> default_rules();

    explicit SemanticChecker(
        std::vector<MonotonicRule> rules = default_rules(),
        DivergencePolicy divergence_policy = DivergencePolicy::kRecord);

    SemanticOutcome check(const CallRecord& call);

    //! Forget every observation, e.g. at the start of a new run
    void reset();

    DivergencePolicy divergence_policy() const { return divergence_policy_; }
    const std::vector<MonotonicRule>& rules() const { return rules_; }

    //! Numeric value of a JSON integer or 0x-prefixed hex string
    static std::optional<intx::uint256> numeric_value(const nlohmann::json& value);

  private:
    struct Observation {
        intx::uint256 value;
        std::chrono::steady_clock::time_point completed;
    };

    void check_monotonic(const CallRecord& call, SemanticOutcome& outcome);
    void check_error_code(const CallRecord& call, SemanticOutcome& outcome) const;
    void check_divergence(const CallRecord& call, SemanticOutcome& outcome) const;

    std::vector<MonotonicRule> rules_;
    DivergencePolicy divergence_policy_;

    std::mutex mutex_;
    //! Observations by (scope, rule index)
    std::map<std::tuple<std::string, size_t>, std::vector<Observation>> observations_;
};

}  // namespace rpcprobe::validation
