// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace rpcprobe::rpc {

//! Exponential backoff with full jitter bounded by the number of attempts
struct RetryPolicy {
    uint32_t max_attempts{3};
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{5'000};

    //! Delay before the given attempt (attempt 2 is the first retry): uniform in [0, min(max, initial * 2^(attempt-2))]
    std::chrono::milliseconds backoff(uint32_t attempt, std::mt19937_64& rng) const;

    //! Upper bound of the delay before the given attempt
    std::chrono::milliseconds backoff_ceiling(uint32_t attempt) const;

    static RetryPolicy single_attempt() { return {.max_attempts = 1}; }
};

}  // namespace rpcprobe::rpc
