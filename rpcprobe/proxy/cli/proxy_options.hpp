// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <rpcprobe/proxy/settings.hpp>

namespace rpcprobe::cmd::common {

void add_proxy_options(CLI::App& cli, proxy::ProxySettings& settings);

}  // namespace rpcprobe::cmd::common
