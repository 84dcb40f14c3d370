// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace rpcprobe::cmd::common {

//! Local listening address as <ip>:<port> or [<ipv6>]:<port>, port 0 picks an ephemeral one
struct ListenAddressValidator : public CLI::Validator {
    ListenAddressValidator();
};

void add_option_listen_address(CLI::App& cli, const std::string& name, std::string& address, const std::string& description);

}  // namespace rpcprobe::cmd::common
