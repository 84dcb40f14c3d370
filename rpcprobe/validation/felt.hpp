// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <intx/intx.hpp>

namespace rpcprobe::validation {

//! Prime of the Starknet field: P = 2^251 + 17 * 2^192 + 1
inline constexpr intx::uint256 kFieldPrime{(intx::uint256{1} << 251) + (intx::uint256{17} << 192) + 1};

//! Parse a 0x-prefixed hex string of at most 256 bits
std::optional<intx::uint256> parse_hex_uint256(std::string_view text);

//! Check that the 0x-prefixed hex string is a field element, i.e. its value is lower than the field prime
bool is_felt(std::string_view text);

}  // namespace rpcprobe::validation
