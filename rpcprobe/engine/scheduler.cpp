// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "scheduler.hpp"

#include <algorithm>
#include <map>
#include <variant>

#include <absl/strings/str_cat.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <rpcprobe/infra/common/ensure.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/concurrency/awaitable_wait_for_one.hpp>
#include <rpcprobe/infra/concurrency/parallel_group.hpp>
#include <rpcprobe/infra/concurrency/deadline.hpp>

namespace rpcprobe::engine {

using namespace concurrency::awaitable_wait_for_one;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

static bool is_retryable(const CaseOutcome& outcome) {
    return outcome.transport_error && outcome.transport_error->kind != rpc::TransportError::Kind::kCancelled;
}

static CaseOutcome transport_failure(const Case& test_case, const rpc::Endpoint& target, rpc::TransportError error) {
    CaseOutcome outcome;
    outcome.result.name = test_case.name;
    outcome.result.method = test_case.method;
    outcome.result.target = target.name();
    outcome.result.verdict = Verdict::kTransportError;
    outcome.result.details = describe(error);
    outcome.transport_error = std::move(error);
    return outcome;
}

Scheduler::Scheduler(SchedulerSettings settings, std::shared_ptr<CaseExecutor> executor, std::shared_ptr<HookRunner> hook_runner)
    : settings_{std::move(settings)}, executor_{std::move(executor)}, hook_runner_{std::move(hook_runner)} {
    ensure(settings_.concurrency > 0, "Scheduler: concurrency must be positive");
}

Task<ResultNode> Scheduler::run(const Suite& suite, const std::vector<rpc::Endpoint>& targets) {
    executor_->checker().reset();

    ResultNode root{.kind = ResultNode::Kind::kRun, .name = suite.name};
    root.children.resize(targets.size());
    PROBE_INFO << "Scheduler: running suite " << suite.name << " (" << suite.case_count() << " cases) against "
               << targets.size() << " target(s)";

    // Each target subtree runs on its own strand: its coroutines race timers against I/O and must not run in parallel
    auto executor = co_await boost::asio::this_coro::executor;
    co_await concurrency::generate_parallel_group_task(targets.size(), [&](size_t index) {
        return boost::asio::co_spawn(boost::asio::make_strand(executor),
                                     run_target(suite, targets[index], root.children[index]),
                                     boost::asio::use_awaitable);
    });
    co_return root;
}

Task<void> Scheduler::run_target(const Suite& suite, const rpc::Endpoint& target, ResultNode& node) {
    auto executor = co_await boost::asio::this_coro::executor;
    concurrency::AsyncSemaphore semaphore{executor, settings_.concurrency};

    node.kind = ResultNode::Kind::kTarget;
    node.name = target.name();
    node.target = target.name();
    node.children.push_back(co_await run_suite(suite, target, SuiteState{}, semaphore, Clock::time_point::max()));
    PROBE_INFO << "Scheduler: target " << target.name() << " completed with status " << to_string(node.status());
}

Task<ResultNode> Scheduler::run_suite(
    const Suite& suite,
    const rpc::Endpoint& target,
    SuiteState state,
    concurrency::AsyncSemaphore& semaphore,
    Clock::time_point parent_deadline) {
    const auto deadline = concurrency::bounded_deadline(parent_deadline, suite.deadline);

    for (const auto& hook : suite.setup) {
        if (auto failure = co_await run_hook(hook, target, state, deadline)) {
            const auto reason = absl::StrCat("setup hook ", hook.name, " failed: ", *failure);
            PROBE_WARN << "Scheduler: suite " << suite.name << " on " << target.name() << " " << reason;
            auto node = skipped_suite(suite, target, reason);
            node.setup_failure = reason;
            co_return node;
        }
    }

    std::vector<std::optional<CaseOutcome>> outcomes(suite.cases.size());
    std::vector<ResultNode> suite_nodes(suite.suites.size());
    const SuiteState snapshot{state};

    co_await concurrency::generate_parallel_group_task(1 + suite.suites.size(), [&](size_t index) {
        if (index == 0) {
            return run_cases(suite, target, state, semaphore, deadline, outcomes);
        }
        return run_nested_suite(suite.suites[index - 1], target, snapshot, semaphore, deadline, suite_nodes[index - 1]);
    });

    ResultNode node{.kind = ResultNode::Kind::kSuite, .name = suite.name, .target = target.name(), .required = suite.required};
    for (size_t i = 0; i < suite.cases.size(); ++i) {
        ensure_invariant(outcomes[i].has_value(), [&]() { return "case " + suite.cases[i].name + " produced no result"; });
        node.children.push_back(ResultNode::make_case(std::move(outcomes[i]->result), suite.cases[i].required));
    }
    for (auto& suite_node : suite_nodes) {
        node.children.push_back(std::move(suite_node));
    }

    // Teardown is not bounded by the suite deadline
    for (const auto& hook : suite.teardown) {
        if (auto failure = co_await run_hook(hook, target, state, concurrency::bounded_deadline(Clock::time_point::max(), settings_.hook_timeout))) {
            PROBE_WARN << "Scheduler: suite " << suite.name << " on " << target.name() << " teardown hook " << hook.name << " failed: " << *failure;
            node.notes.push_back(absl::StrCat("teardown hook ", hook.name, " failed: ", *failure));
        }
    }
    co_return node;
}

Task<void> Scheduler::run_nested_suite(
    const Suite& suite,
    const rpc::Endpoint& target,
    const SuiteState& snapshot,
    concurrency::AsyncSemaphore& semaphore,
    Clock::time_point deadline,
    ResultNode& node) {
    node = co_await run_suite(suite, target, snapshot, semaphore, deadline);
}

Task<void> Scheduler::run_cases(
    const Suite& suite,
    const rpc::Endpoint& target,
    SuiteState& state,
    concurrency::AsyncSemaphore& semaphore,
    Clock::time_point deadline,
    std::vector<std::optional<CaseOutcome>>& outcomes) {
    std::map<std::string, size_t, std::less<>> index_by_name;
    for (size_t i = 0; i < suite.cases.size(); ++i) {
        index_by_name.emplace(suite.cases[i].name, i);
    }

    for (const auto& level : suite.dependency_levels()) {
        std::vector<size_t> runnable;
        for (const auto index : level) {
            const auto& test_case = suite.cases[index];
            const auto failed = std::find_if(test_case.depends_on.begin(), test_case.depends_on.end(), [&](const auto& dependency) {
                const auto& dependency_outcome = outcomes[index_by_name.at(dependency)];
                return !dependency_outcome || dependency_outcome->result.verdict != Verdict::kPass;
            });
            if (failed != test_case.depends_on.end()) {
                outcomes[index] = skipped(test_case, target, absl::StrCat("dependency ", *failed, " did not pass"));
            } else {
                runnable.push_back(index);
            }
        }

        co_await concurrency::generate_parallel_group_task(runnable.size(), [&](size_t i) {
            const auto index = runnable[i];
            return run_case(suite.cases[index], target, state, semaphore, deadline, outcomes[index]);
        });

        // Single writer: captures of a level are assigned in declaration order once the whole level completed
        for (const auto index : runnable) {
            const auto& outcome = outcomes[index];
            if (!outcome || outcome->result.verdict != Verdict::kPass) continue;
            for (const auto& [variable, value] : outcome->captures) {
                state.set(variable, value);
            }
        }
    }
}

Task<void> Scheduler::run_case(
    const Case& test_case,
    const rpc::Endpoint& target,
    const SuiteState& state,
    concurrency::AsyncSemaphore& semaphore,
    Clock::time_point deadline,
    std::optional<CaseOutcome>& outcome) {
    CaseLifecycle lifecycle;
    lifecycle.start();
    const auto started = Clock::now();
    uint32_t attempts{0};

    try {
        if (started >= deadline) {
            outcome = transport_failure(test_case, target, rpc::TransportError::cancelled());
        } else {
            auto execution = co_await (execute_with_retries(test_case, target, state, semaphore, deadline, attempts) ||
                                       concurrency::expire_at(deadline));
            if (execution.index() == 0) {
                outcome = std::move(std::get<0>(execution));
            } else {
                outcome = transport_failure(test_case, target, rpc::TransportError::cancelled());
            }
        }
        // A transport failure racing the suite deadline is a cancellation
        if (outcome->transport_error && Clock::now() >= deadline) {
            outcome = transport_failure(test_case, target, rpc::TransportError::cancelled());
        }
    } catch (const concurrency::DeadlineExpiredError&) {
        outcome = transport_failure(test_case, target, rpc::TransportError::cancelled());
    } catch (const std::exception& e) {
        PROBE_ERROR << "Scheduler: case " << test_case.name << " on " << target.name() << " raised: " << e.what();
        outcome = transport_failure(test_case, target, {.kind = rpc::TransportError::Kind::kConnectionFailed, .message = e.what()});
    }

    outcome->result.attempts = attempts;
    outcome->result.elapsed = duration_cast<milliseconds>(Clock::now() - started);
    lifecycle.finish(outcome->result.verdict);
}

Task<CaseOutcome> Scheduler::execute_with_retries(
    const Case& test_case,
    const rpc::Endpoint& target,
    const SuiteState& state,
    concurrency::AsyncSemaphore& semaphore,
    Clock::time_point deadline,
    uint32_t& attempts) {
    auto permit = co_await semaphore.acquire();

    CaseOutcome outcome;
    const uint32_t max_attempts = 1 + settings_.case_retries;
    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        attempts = attempt;
        outcome = co_await executor_->execute(test_case, target, state, deadline);
        if (!is_retryable(outcome) || Clock::now() >= deadline) {
            break;
        }
        if (attempt < max_attempts) {
            PROBE_DEBUG << "Scheduler: retrying case " << test_case.name << " on " << target.name() << " after " << outcome.result.details;
        }
    }
    co_return outcome;
}

Task<std::optional<std::string>> Scheduler::run_hook(const Hook& hook, const rpc::Endpoint& target, SuiteState& state, Clock::time_point deadline) {
    const auto remaining = concurrency::remaining_until(deadline);
    if (remaining.count() == 0) {
        co_return "suite deadline expired";
    }
    const rpc::CallOptions options{
        .timeout = std::min(settings_.hook_timeout, remaining),
        .retry = settings_.hook_retry,
        .deadline = deadline,
    };

    tl::expected<Captures, std::string> captures;
    try {
        captures = co_await hook_runner_->run(hook, target, state, options);
    } catch (const std::exception& e) {
        captures = tl::make_unexpected(std::string{e.what()});
    }
    if (!captures) {
        co_return captures.error();
    }
    for (auto& [variable, value] : *captures) {
        state.set(variable, std::move(value));
    }
    co_return std::nullopt;
}

CaseOutcome Scheduler::skipped(const Case& test_case, const rpc::Endpoint& target, std::string reason) {
    CaseLifecycle lifecycle;
    lifecycle.finish(Verdict::kSkipped);

    CaseOutcome outcome;
    outcome.result.name = test_case.name;
    outcome.result.method = test_case.method;
    outcome.result.target = target.name();
    outcome.result.verdict = *lifecycle.verdict();
    outcome.result.details = std::move(reason);
    return outcome;
}

ResultNode Scheduler::skipped_suite(const Suite& suite, const rpc::Endpoint& target, const std::string& reason) {
    ResultNode node{.kind = ResultNode::Kind::kSuite, .name = suite.name, .target = target.name(), .required = suite.required};
    for (const auto& test_case : suite.cases) {
        node.children.push_back(ResultNode::make_case(skipped(test_case, target, reason).result, test_case.required));
    }
    for (const auto& nested : suite.suites) {
        node.children.push_back(skipped_suite(nested, target, reason));
    }
    return node;
}

}  // namespace rpcprobe::engine
