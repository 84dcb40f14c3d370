// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "retry_policy.hpp"

#include <algorithm>

namespace rpcprobe::rpc {

std::chrono::milliseconds RetryPolicy::backoff_ceiling(uint32_t attempt) const {
    if (attempt < 2) {
        return std::chrono::milliseconds::zero();
    }
    // Saturate the exponent long before the shift overflows
    const uint32_t exponent = std::min<uint32_t>(attempt - 2, 30);
    const auto initial = std::max<int64_t>(initial_backoff.count(), 0);
    const auto ceiling = std::max<int64_t>(max_backoff.count(), 0);
    if (initial == 0) {
        return std::chrono::milliseconds::zero();
    }
    if (initial > (ceiling >> exponent)) {
        return std::chrono::milliseconds{ceiling};
    }
    return std::chrono::milliseconds{initial << exponent};
}

std::chrono::milliseconds RetryPolicy::backoff(uint32_t attempt, std::mt19937_64& rng) const {
    const auto ceiling = backoff_ceiling(attempt);
    if (ceiling.count() == 0) {
        return ceiling;
    }
    std::uniform_int_distribution<int64_t> distribution{0, ceiling.count()};
    return std::chrono::milliseconds{distribution(rng)};
}

}  // namespace rpcprobe::rpc
