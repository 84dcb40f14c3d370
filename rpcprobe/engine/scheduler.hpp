// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <rpcprobe/infra/concurrency/async_semaphore.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>

#include "case_executor.hpp"
#include "hook_runner.hpp"
#include "result.hpp"
#include "suite.hpp"
#include "suite_state.hpp"

namespace rpcprobe::engine {

struct SchedulerSettings {
    //! Maximum number of cases running at the same time against one target
    size_t concurrency{4};
    //! Re-executions of a case ending with a transport error
    uint32_t case_retries{0};
    std::chrono::milliseconds hook_timeout{kDefaultTimeout};
    rpc::RetryPolicy hook_retry;
};

/**
 * Execution of a suite tree against every target, producing the result tree.
 *
 * Each target runs as a sibling subtree with its own concurrency bound. Within a suite, cases run by dependency
 * level: cases of one level run concurrently, levels run in order and the values captured by a level are
 * assigned into the suite state before the next one starts. Nested suites run concurrently with the cases of their
 * parent, on a snapshot of the parent state taken after its setup hooks.
 * The suite deadline bounds all its cases: cases still running when it expires end as cancelled transport errors.
 */
class Scheduler {
  public:
    using Clock = std::chrono::steady_clock;

    Scheduler(SchedulerSettings settings, std::shared_ptr<CaseExecutor> executor, std::shared_ptr<HookRunner> hook_runner);

    Task<ResultNode> run(const Suite& suite, const std::vector<rpc::Endpoint>& targets);

  private:
    Task<void> run_target(const Suite& suite, const rpc::Endpoint& target, ResultNode& node);

    Task<ResultNode> run_suite(
        const Suite& suite,
        const rpc::Endpoint& target,
        SuiteState state,
        concurrency::AsyncSemaphore& semaphore,
        Clock::time_point parent_deadline);

    Task<void> run_nested_suite(
        const Suite& suite,
        const rpc::Endpoint& target,
        const SuiteState& snapshot,
        concurrency::AsyncSemaphore& semaphore,
        Clock::time_point deadline,
        ResultNode& node);

    Task<void> run_cases(
        const Suite& suite,
        const rpc::Endpoint& target,
        SuiteState& state,
        concurrency::AsyncSemaphore& semaphore,
        Clock::time_point deadline,
        std::vector<std::optional<CaseOutcome>>& outcomes);

    Task<void> run_case(
        const Case& test_case,
        const rpc::Endpoint& target,
        const SuiteState& state,
        concurrency::AsyncSemaphore& semaphore,
        Clock::time_point deadline,
        std::optional<CaseOutcome>& outcome);

    Task<CaseOutcome> execute_with_retries(
        const Case& test_case,
        const rpc::Endpoint& target,
        const SuiteState& state,
        concurrency::AsyncSemaphore& semaphore,
        Clock::time_point deadline,
        uint32_t& attempts);

    //! Run the hook and assign its captures, return the failure description if any
    Task<std::optional<std::string>> run_hook(const Hook& hook, const rpc::Endpoint& target, SuiteState& state, Clock::time_point deadline);

    static CaseOutcome skipped(const Case& test_case, const rpc::Endpoint& target, std::string reason);
    static ResultNode skipped_suite(const Suite& suite, const rpc::Endpoint& target, const std::string& reason);

    SchedulerSettings settings_;
    std::shared_ptr<CaseExecutor> executor_;
    std::shared_ptr<HookRunner> hook_runner_;
};

}  // namespace rpcprobe::engine
