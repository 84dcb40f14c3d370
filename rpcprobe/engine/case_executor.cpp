// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "case_executor.hpp"

#include <algorithm>
#include <sstream>

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::engine {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

static std::string summarize(const std::vector<validation::Violation>& violations) {
    if (violations.empty()) {
        return {};
    }
    if (violations.size() == 1) {
        return validation::to_string(violations.front());
    }
    return absl::StrCat(violations.size(), " violations, first: ", validation::to_string(violations.front()));
}

std::string describe(const rpc::TransportError& error) {
    if (error.kind == rpc::TransportError::Kind::kCancelled) {
        return error.message;
    }
    std::stringstream details;
    details << error;
    return details.str();
}

CaseExecutor::CaseExecutor(std::shared_ptr<rpc::RpcClient> client,
                           std::shared_ptr<const validation::Specification> spec,
                           std::shared_ptr<validation::SemanticChecker> checker,
                           ExecutorSettings settings)
    : client_{std::move(client)},
      spec_{std::move(spec)},
      checker_{std::move(checker)},
      settings_{std::move(settings)} {}

Task<CaseOutcome> CaseExecutor::execute(const Case& test_case, const rpc::Endpoint& target, const SuiteState& state, Clock::time_point deadline) {
    CaseOutcome outcome;
    auto& result = outcome.result;
    result.name = test_case.name;
    result.method = test_case.method;
    result.target = target.name();

    const auto& method = spec_->method(test_case.method);
    const auto params = state.substitute(test_case.params);
    if (!params) {
        result.verdict = Verdict::kSkipped;
        result.details = absl::StrCat("undefined variable ", params.error());
        co_return outcome;
    }
    result.request = client_->make_request(test_case.method, *params);

    const auto started = Clock::now();
    const auto remaining = duration_cast<milliseconds>(deadline - started);
    if (remaining.count() <= 0) {
        outcome.transport_error = rpc::TransportError::cancelled();
        result.verdict = Verdict::kTransportError;
        result.details = outcome.transport_error->message;
        co_return outcome;
    }
    const rpc::CallOptions options{
        .timeout = std::min(test_case.timeout.value_or(settings_.case_timeout), remaining),
        .retry = settings_.retry,
        .deadline = deadline,
    };
    const auto call_result = co_await client_->forward(target, result.request, options);
    const auto completed = Clock::now();
    result.elapsed = duration_cast<milliseconds>(completed - started);

    if (!call_result) {
        outcome.transport_error = call_result.error();
        result.verdict = Verdict::kTransportError;
        result.details = describe(call_result.error());
        PROBE_DEBUG << "CaseExecutor: " << test_case.name << " on " << target.name() << " failed: " << result.details;
        co_return outcome;
    }

    result.response = call_result->json();
    const validation::CallRecord call{
        .scope = target.name(),
        .method = &method,
        .response = &*call_result,
        .started = started,
        .completed = completed,
        .error_expected = test_case.expect.error_expected(),
    };
    judge(test_case, method, *call_result, call, state, outcome);
    PROBE_DEBUG << "CaseExecutor: " << test_case.name << " on " << target.name() << " " << result.verdict
                << " in " << result.elapsed.count() << " ms";
    co_return outcome;
}

void CaseExecutor::judge(const Case& test_case,
                         const validation::MethodSpec& method,
                         const json_rpc::Response& response,
                         const validation::CallRecord& call,
                         const SuiteState& state,
                         CaseOutcome& outcome) {
    auto& result = outcome.result;

    const auto schema_outcome = validator_.validate(method, response, settings_.validation_mode);
    auto semantic_outcome = checker_->check(call);
    result.notes = std::move(semantic_outcome.notes);

    if (!schema_outcome.ok()) {
        // The schema verdict wins, exhaustive mode still lists the semantic violations after the schema ones
        validation::ValidationOutcome violations{settings_.validation_mode};
        violations.merge(schema_outcome);
        if (!violations.saturated()) {
            violations.merge(semantic_outcome.violations);
        }
        result.verdict = Verdict::kSchemaViolation;
        result.violations = violations.violations();
        result.details = summarize(result.violations);
        return;
    }

    validation::ValidationOutcome semantic_violations{settings_.validation_mode};
    semantic_violations.merge(semantic_outcome.violations);
    if (!semantic_violations.saturated()) {
        semantic_violations.merge(check_expectation(test_case, response, state, settings_.validation_mode));
    }
    if (!semantic_violations.ok()) {
        result.verdict = Verdict::kSemanticViolation;
        result.violations = semantic_violations.violations();
        result.details = summarize(result.violations);
        return;
    }

    if (!test_case.capture.empty()) {
        const bool is_result = response.kind() == json_rpc::Response::Kind::kResult;
        auto captures = capture_values(test_case.capture, is_result ? response.result() : response.error(), is_result ? "/result" : "/error");
        if (!captures) {
            result.verdict = Verdict::kSemanticViolation;
            result.violations = {captures.error()};
            result.details = summarize(result.violations);
            return;
        }
        outcome.captures = std::move(*captures);
    }
    result.verdict = Verdict::kPass;
}

}  // namespace rpcprobe::engine
