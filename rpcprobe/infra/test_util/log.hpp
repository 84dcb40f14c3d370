// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::test_util {

//! Overrides the log verbosity for the lifetime of a test
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : saved_{log::get_verbosity()} { log::set_verbosity(level); }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_); }

    SetLogVerbosityGuard(const SetLogVerbosityGuard&) = delete;
    SetLogVerbosityGuard& operator=(const SetLogVerbosityGuard&) = delete;

  private:
    log::Level saved_;
};

}  // namespace rpcprobe::test_util
