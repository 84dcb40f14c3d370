// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <stdexcept>

#include <rpcprobe/infra/concurrency/task.hpp>

namespace rpcprobe::concurrency {

using Deadline = std::chrono::steady_clock::time_point;

class DeadlineExpiredError : public std::runtime_error {
  public:
    DeadlineExpiredError() : std::runtime_error("deadline expired") {}
};

//! Milliseconds left before the deadline, zero once expired
std::chrono::milliseconds remaining_until(Deadline deadline);

//! The earlier of the parent deadline and now + budget, saturating instead of overflowing the clock
Deadline bounded_deadline(Deadline parent, std::chrono::milliseconds budget, Deadline now = std::chrono::steady_clock::now());

/**
 * Complete at the deadline by throwing DeadlineExpiredError, unless cancelled before.
 * Meant to be raced against an operation with awaitable_wait_for_one::operator||:
 *
 * \code
 * auto result = co_await (call_node() || concurrency::expire_at(deadline));
 * \endcode
 */
Task<void> expire_at(Deadline deadline);

//! Suspend the calling coroutine for the given duration, cancellation completes it early with an exception
Task<void> sleep_for(std::chrono::milliseconds duration);

}  // namespace rpcprobe::concurrency
