// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace rpcprobe {

inline constexpr std::string_view kJsonRpcVersion{"2.0"};
inline constexpr std::string_view kUserAgent{"rpcprobe"};

inline constexpr std::string_view kDivergenceHeader{"x-rpcprobe-divergence"};
inline constexpr std::string_view kUpstreamFailuresHeader{"x-rpcprobe-upstream-failures"};

inline constexpr std::string_view kDefaultListenAddress{"127.0.0.1:8080"};
inline constexpr std::chrono::milliseconds kDefaultTimeout{10'000};
inline constexpr std::chrono::milliseconds kDefaultFanOutDeadline{30'000};

inline constexpr uint16_t kDefaultHttpPort{80};
inline constexpr uint16_t kDefaultHttpsPort{443};

}  // namespace rpcprobe
