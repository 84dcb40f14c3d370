// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "felt.hpp"

#include <string>

#include <absl/strings/ascii.h>

namespace rpcprobe::validation {

std::optional<intx::uint256> parse_hex_uint256(std::string_view text) {
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'X')) {
        return std::nullopt;
    }
    auto digits = text.substr(2);
    for (const char c : digits) {
        if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    const auto first_significant = digits.find_first_not_of('0');
    if (first_significant == std::string_view::npos) {
        return intx::uint256{0};
    }
    digits = digits.substr(first_significant);
    if (digits.size() > 64) {
        return std::nullopt;
    }
    return intx::from_string<intx::uint256>("0x" + std::string{digits});
}

bool is_felt(std::string_view text) {
    const auto value = parse_hex_uint256(text);
    return value && *value < kFieldPrime;
}

}  // namespace rpcprobe::validation
