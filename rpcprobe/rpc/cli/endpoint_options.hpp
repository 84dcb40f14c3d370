// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <CLI/CLI.hpp>

#include <rpcprobe/rpc/common/endpoint.hpp>
#include <rpcprobe/rpc/transport/resolver.hpp>

namespace rpcprobe::cmd::common {

//! \brief Set up repeatable option for named node endpoints in the form <name>=<url>
//! \details Endpoints are parsed while parsing the command line, malformed URLs raise ConfigError
CLI::Option* add_option_targets(CLI::App& cli, std::vector<rpc::Endpoint>& targets);

//! \brief Set up repeatable option for static DNS overrides in the form <host>:<port>:<address>
CLI::Option* add_option_resolve(CLI::App& cli, std::vector<rpc::ResolveOverride>& overrides);

}  // namespace rpcprobe::cmd::common
