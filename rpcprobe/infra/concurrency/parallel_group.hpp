// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>

#include "task.hpp"

#include <absl/functional/function_ref.h>

namespace rpcprobe::concurrency {

/**
 * Run task_factory(0), ..., task_factory(count - 1) concurrently on the current executor and wait for all of them.
 * The first subtask failing cancels the others, then its exception is rethrown once every subtask completed.
 * Cancellation errors of the other subtasks are never preferred to the original failure.
 */
Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory);

}  // namespace rpcprobe::concurrency
