// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <CLI/CLI.hpp>

#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::cmd::common {

//! Process exit codes shared by the executables
inline constexpr int kExitSuccess{0};
inline constexpr int kExitFailure{1};
inline constexpr int kExitConfigError{2};
//! The run could not complete, e.g. the report cannot be written
inline constexpr int kExitRuntimeError{3};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

}  // namespace rpcprobe::cmd::common
