// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <rpcprobe/rpc/client/rpc_client.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>
#include <rpcprobe/validation/method_spec.hpp>
#include <rpcprobe/validation/schema_validator.hpp>
#include <rpcprobe/validation/semantic_checker.hpp>

#include "case.hpp"
#include "hook_runner.hpp"
#include "result.hpp"
#include "suite_state.hpp"

namespace rpcprobe::engine {

struct ExecutorSettings {
    validation::ValidationMode validation_mode{validation::ValidationMode::kExhaustive};
    //! Transport-level retry of every single call
    rpc::RetryPolicy retry;
    //! Bound of each call attempt when the case has no timeout
    std::chrono::milliseconds case_timeout{kDefaultTimeout};
};

struct CaseOutcome {
    CaseResult result;
    //! Values to assign into the suite state, only when the case passed
    Captures captures;
    //! Set when the verdict is a transport error
    std::optional<rpc::TransportError> transport_error;
};

//! Verdict details of a transport failure
std::string describe(const rpc::TransportError& error);

//! Single execution of a case: call, schema validation, semantic checks, expectation and captures
class CaseExecutor {
  public:
    using Clock = std::chrono::steady_clock;

    CaseExecutor(std::shared_ptr<rpc::RpcClient> client,
                 std::shared_ptr<const validation::Specification> spec,
                 std::shared_ptr<validation::SemanticChecker> checker,
                 ExecutorSettings settings = {});

    //! Execute the case once against the target, failures of the node are reported in the result verdict
    Task<CaseOutcome> execute(const Case& test_case, const rpc::Endpoint& target, const SuiteState& state, Clock::time_point deadline);

    validation::SemanticChecker& checker() { return *checker_; }
    const ExecutorSettings& settings() const { return settings_; }

  private:
    void judge(const Case& test_case,
               const validation::MethodSpec& method,
               const json_rpc::Response& response,
               const validation::CallRecord& call,
               const SuiteState& state,
               CaseOutcome& outcome);

    std::shared_ptr<rpc::RpcClient> client_;
    std::shared_ptr<const validation::Specification> spec_;
    std::shared_ptr<validation::SemanticChecker> checker_;
    ExecutorSettings settings_;
    validation::SchemaValidator validator_;
};

}  // namespace rpcprobe::engine
