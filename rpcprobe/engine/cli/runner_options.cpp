// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "runner_options.hpp"

#include <map>
#include <string>
#include <vector>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/rpc/cli/endpoint_options.hpp>

namespace rpcprobe::cmd::common {

//! Validates monotonic rules in the form <method>:<json_pointer>
struct MonotonicRuleValidator : public CLI::Validator {
    MonotonicRuleValidator() {
        func_ = [](const std::string& value) -> std::string {
            const auto separator = value.find(':');
            if (separator == std::string::npos || separator == 0) {
                return "Value " + value + " is not a valid rule, expected <method>:<json_pointer>";
            }
            const auto pointer = value.substr(separator + 1);
            if (!pointer.empty() && pointer.front() != '/') {
                return "Value " + value + " has invalid JSON pointer " + pointer;
            }
            return {};
        };
    }
};

static validation::MonotonicRule parse_monotonic_rule(const std::string& value) {
    const auto separator = value.find(':');
    return {.method = value.substr(0, separator), .json_pointer = value.substr(separator + 1)};
}

static void add_options_execution(CLI::App& cli, engine::RunnerSettings& settings) {
    cli.add_option("--concurrency", settings.concurrency)
        ->description("Maximum number of cases running at the same time against each target")
        ->check(CLI::Range(1, 1024))
        ->capture_default_str();

    cli.add_option("--case-retries", settings.case_retries)
        ->description("Re-executions of a case ending with a transport error")
        ->check(CLI::Range(0, 10))
        ->capture_default_str();

    cli.add_option("--max-attempts", settings.max_attempts)
        ->description("Attempts of each single call on retryable transport errors, including the first one")
        ->check(CLI::Range(1, 10))
        ->capture_default_str();

    cli.add_option_function<uint32_t>(
           "--case-timeout",
           [&settings](uint32_t milliseconds) { settings.case_timeout = std::chrono::milliseconds{milliseconds}; },
           "Time in milliseconds allowed to each call of cases without explicit timeout")
        ->check(CLI::Range(1u, 600'000u))
        ->default_str(std::to_string(settings.case_timeout.count()));

    cli.add_option("--threads", settings.num_threads)
        ->description("Number of threads executing the cases")
        ->check(CLI::Range(1, 256))
        ->capture_default_str();

    cli.add_option("--fixture.threads", settings.fixture_threads)
        ->description("Number of fixture tools allowed to run at the same time")
        ->check(CLI::Range(1, 64))
        ->capture_default_str();
}

static void add_options_validation(CLI::App& cli, engine::RunnerSettings& settings) {
    const std::map<std::string, validation::DivergencePolicy> divergence_mapping{
        {"fail", validation::DivergencePolicy::kFail},
        {"record", validation::DivergencePolicy::kRecord},
    };
    cli.add_option("--divergence", settings.divergence_policy)
        ->description("Handling of proxy divergence signals: fail the case or record it as a note")
        ->transform(CLI::CheckedTransformer(divergence_mapping, CLI::ignore_case))
        ->capture_default_str();

    const std::map<std::string, validation::ValidationMode> validation_mapping{
        {"first", validation::ValidationMode::kFirst},
        {"exhaustive", validation::ValidationMode::kExhaustive},
    };
    cli.add_option("--validation", settings.validation_mode)
        ->description("Schema validation stopping at the first violation or collecting all of them")
        ->transform(CLI::CheckedTransformer(validation_mapping, CLI::ignore_case))
        ->capture_default_str();

    cli.add_option_function<std::vector<std::string>>(
           "--monotonic",
           [&settings](const std::vector<std::string>& rules) {
               for (const auto& rule : rules) {
                   settings.monotonic_rules.push_back(parse_monotonic_rule(rule));
               }
           },
           "Non-decreasing value as <method>:<json_pointer> into the result (repeatable)")
        ->check(MonotonicRuleValidator{});
}

void add_runner_options(CLI::App& cli, engine::RunnerSettings& settings) {
    cli.add_option("--spec", settings.spec_files)
        ->description("OpenRPC document, the main API first then the documents it references (repeatable)")
        ->check(CLI::ExistingFile)
        ->required();

    cli.add_option("--suite", settings.suite_file)
        ->description("Conformance suite JSON file")
        ->check(CLI::ExistingFile)
        ->required();

    auto* targets_option = add_option_targets(cli, settings.targets);
    auto* targets_file_option = cli.add_option_function<std::string>(
                                       "--targets",
                                       [&settings](const std::string& path) { settings.targets_file = path; },
                                       "JSON file listing the targets as endpoint objects")
                                    ->check(CLI::ExistingFile);
    cli.callback([targets_option, targets_file_option]() {
        if (targets_option->count() == 0 && targets_file_option->count() == 0) {
            throw CLI::RequiredError{"--target or --targets"};
        }
    });
    add_option_resolve(cli, settings.resolve_overrides);

    cli.add_option_function<std::string>(
        "--report",
        [&settings](const std::string& path) { settings.report_file = path; },
        "Path of the JSON report artifact");

    add_options_execution(cli, settings);
    add_options_validation(cli, settings);
}

}  // namespace rpcprobe::cmd::common
