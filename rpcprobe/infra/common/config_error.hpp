// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace rpcprobe {

//! Malformed configuration (endpoints, suites, OpenRPC documents) detected before any case is executed
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error{message} {}
};

}  // namespace rpcprobe
