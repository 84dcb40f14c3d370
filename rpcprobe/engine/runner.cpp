// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "runner.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <system_error>

#include <absl/strings/str_join.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_future.hpp>

#include <rpcprobe/infra/cli/common.hpp>
#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/common/terminal.hpp>
#include <rpcprobe/rpc/client/rpc_client.hpp>
#include <rpcprobe/rpc/transport/http_transport.hpp>

#include "case_executor.hpp"
#include "hook_runner.hpp"
#include "reporter.hpp"
#include "scheduler.hpp"
#include "suite_loader.hpp"

namespace rpcprobe::engine {

int Runner::run(const RunnerSettings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main-thread");

    try {
        Runner runner{settings};

        std::vector<std::string> target_names;
        for (const auto& target : runner.targets().endpoints()) {
            target_names.push_back(target.name());
        }
        PROBE_INFO << "Runner: suite " << runner.suite().name << " against [" << absl::StrJoin(target_names, ", ")
                   << "] with concurrency " << settings.concurrency;

        const auto root = runner.execute();

        const Reporter reporter{root};
        if (settings.report_file) {
            reporter.write_json(*settings.report_file);
        }
        reporter.print_summary(std::cout, is_terminal_stdout() && !settings.log_settings.no_color);
        return reporter.exit_code();
    } catch (const ConfigError& ce) {
        PROBE_CRIT << "Runner configuration error: " << ce.what();
        return cmd::common::kExitConfigError;
    } catch (const std::system_error& se) {
        PROBE_CRIT << "Runner system error: " << se.what();
        return cmd::common::kExitRuntimeError;
    } catch (const std::exception& e) {
        PROBE_CRIT << "Runner exception: " << e.what();
        return cmd::common::kExitRuntimeError;
    }
}

Runner::Runner(const RunnerSettings& settings, std::shared_ptr<rpc::Transport> transport, std::shared_ptr<FixtureTool> fixture_tool)
    : settings_{settings},
      transport_{std::move(transport)},
      fixture_tool_{std::move(fixture_tool)},
      pool_{std::max<uint32_t>(settings.num_threads, 1)} {
    if (settings_.spec_files.empty()) {
        throw ConfigError{"at least one OpenRPC document is required"};
    }
    std::vector<std::filesystem::path> spec_paths{settings_.spec_files.begin(), settings_.spec_files.end()};
    spec_ = validation::Specification::load_files(spec_paths);

    for (const auto& target : settings_.targets) {
        targets_.add(target);
    }
    if (settings_.targets_file) {
        targets_.load_file(*settings_.targets_file);
    }
    if (targets_.empty()) {
        throw ConfigError{"at least one target is required"};
    }

    SuiteLoader loader{spec_};
    suite_ = loader.load_file(settings_.suite_file);
    if (!loader.warnings().empty()) {
        PROBE_WARN << "Runner: suite " << suite_.name << " loaded with " << loader.warnings().size() << " warning(s)";
    }

    if (!transport_) {
        transport_ = std::make_shared<rpc::HttpTransport>(std::make_shared<rpc::HostResolver>(settings_.resolve_overrides));
    }
    if (!fixture_tool_) {
        fixture_tool_ = std::make_shared<ProcessFixtureTool>(std::max<uint32_t>(settings_.fixture_threads, 1));
    }
}

ResultNode Runner::execute() {
    auto client = std::make_shared<rpc::RpcClient>(transport_);

    auto rules = validation::SemanticChecker::default_rules();
    rules.insert(rules.end(), settings_.monotonic_rules.begin(), settings_.monotonic_rules.end());
    auto checker = std::make_shared<validation::SemanticChecker>(std::move(rules), settings_.divergence_policy);

    const rpc::RetryPolicy retry{.max_attempts = std::max<uint32_t>(settings_.max_attempts, 1)};
    auto executor = std::make_shared<CaseExecutor>(client, spec_, checker, ExecutorSettings{
        .validation_mode = settings_.validation_mode,
        .retry = retry,
        .case_timeout = settings_.case_timeout,
    });
    auto hook_runner = std::make_shared<HookRunner>(client, fixture_tool_);

    Scheduler scheduler{
        SchedulerSettings{
            .concurrency = std::max<uint32_t>(settings_.concurrency, 1),
            .case_retries = settings_.case_retries,
            .hook_timeout = settings_.case_timeout,
            .hook_retry = retry,
        },
        std::move(executor),
        std::move(hook_runner),
    };

    auto result = boost::asio::co_spawn(boost::asio::make_strand(pool_), scheduler.run(suite_, targets_.endpoints()), boost::asio::use_future);
    return result.get();
}

}  // namespace rpcprobe::engine
