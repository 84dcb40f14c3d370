// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>

#include <CLI/CLI.hpp>

#include <rpcprobe/engine/cli/runner_options.hpp>
#include <rpcprobe/engine/runner.hpp>
#include <rpcprobe/infra/cli/common.hpp>
#include <rpcprobe/infra/common/config_error.hpp>

using namespace rpcprobe;
using namespace rpcprobe::cmd::common;

int main(int argc, char* argv[]) {
    CLI::App cli{"rpcprobe - Starknet JSON-RPC conformance runner"};

    engine::RunnerSettings settings;

    try {
        // Parse and validate program arguments
        add_logging_options(cli, settings.log_settings);
        add_runner_options(cli, settings);
        cli.parse(argc, argv);

        return engine::Runner::run(settings);
    } catch (const CLI::ParseError& pe) {
        const int exit_code = cli.exit(pe);
        return exit_code == static_cast<int>(CLI::ExitCodes::Success) ? kExitSuccess : kExitConfigError;
    } catch (const ConfigError& ce) {
        std::cerr << "Invalid configuration: " << ce.what() << "\n";
        return kExitConfigError;
    }
}
