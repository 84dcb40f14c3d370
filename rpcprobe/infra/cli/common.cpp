// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>

#include <CLI/CLI.hpp>

namespace rpcprobe::cmd::common {

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> levels;
    for (const auto level : {log::Level::kCritical, log::Level::kError, log::Level::kWarning, log::Level::kInfo,
                             log::Level::kDebug, log::Level::kTrace}) {
        levels.emplace(log::to_string(level), level);
    }
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.verbosity, "Maximum verbosity of log lines")
        ->transform(CLI::CheckedTransformer(levels, CLI::ignore_case))
        ->default_val(log::to_string(log::Level::kInfo));
    log_opts.add_flag("--log.stdout", log_settings.to_stdout, "Log on standard output instead of standard error");
    log_opts.add_flag("--log.nocolor", log_settings.no_color, "Disable colors on log lines and run summary");
    log_opts.add_flag("!--log.localtime", log_settings.utc, "Print log timestamps in local time instead of UTC");
    log_opts.add_flag("--log.threads", log_settings.thread_names, "Tag log lines with thread names");
    log_opts.add_option("--log.file", log_settings.file, "Also append log lines to this file");
}

}  // namespace rpcprobe::cmd::common
