// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

namespace rpcprobe {

bool is_terminal_stdout() {
    return isatty(STDOUT_FILENO) == 1;
}

bool is_terminal_stderr() {
    return isatty(STDERR_FILENO) == 1;
}

}  // namespace rpcprobe
