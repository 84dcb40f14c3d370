// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

namespace rpcprobe::proxy {

std::string_view to_string(Mode mode) {
    switch (mode) {
        case Mode::kPassThrough:
            return "pass-through";
        case Mode::kFanOut:
            return "fanout";
    }
    return "unknown";
}

std::optional<Mode> mode_from_string(std::string_view text) {
    if (text == "pass-through") return Mode::kPassThrough;
    if (text == "fanout") return Mode::kFanOut;
    return std::nullopt;
}

std::string_view to_string(FanOutStrategy strategy) {
    switch (strategy) {
        case FanOutStrategy::kFirst:
            return "first";
        case FanOutStrategy::kCompare:
            return "compare";
    }
    return "unknown";
}

}  // namespace rpcprobe::proxy
