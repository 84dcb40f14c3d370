// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include <iostream>

#include <CLI/CLI.hpp>

#include <rpcprobe/infra/cli/common.hpp>
#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/proxy/cli/proxy_options.hpp>
#include <rpcprobe/proxy/daemon.hpp>

using namespace rpcprobe;
using namespace rpcprobe::cmd::common;

int main(int argc, char* argv[]) {
    CLI::App cli{"rpcprobe proxy - intercepting JSON-RPC relay between conformance tests and Starknet nodes"};

    proxy::ProxySettings settings;

    try {
        // Parse and validate program arguments
        add_logging_options(cli, settings.log_settings);
        add_proxy_options(cli, settings);
        cli.parse(argc, argv);

        return proxy::Daemon::run(settings);
    } catch (const CLI::ParseError& pe) {
        const int exit_code = cli.exit(pe);
        return exit_code == static_cast<int>(CLI::ExitCodes::Success) ? kExitSuccess : kExitConfigError;
    } catch (const ConfigError& ce) {
        std::cerr << "Invalid configuration: " << ce.what() << "\n";
        return kExitConfigError;
    }
}
