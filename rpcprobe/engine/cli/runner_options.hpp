// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <rpcprobe/engine/settings.hpp>

namespace rpcprobe::cmd::common {

//! \brief Set up options to populate conformance runner settings after cli.parse()
void add_runner_options(CLI::App& cli, engine::RunnerSettings& settings);

}  // namespace rpcprobe::cmd::common
