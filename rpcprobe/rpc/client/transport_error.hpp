// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace rpcprobe::rpc {

//! Failure below the JSON-RPC layer: the node did not produce a usable JSON-RPC response
struct TransportError {
    enum class Kind {
        kConnectionFailed,
        kTimeout,
        kHttpStatus,
        kMalformedResponse,
        kCancelled,
    };

    Kind kind{Kind::kConnectionFailed};
    std::string message;
    unsigned int http_status{0};

    //! Connection failures, timeouts and HTTP 5xx may succeed when attempted again
    bool retryable() const {
        switch (kind) {
            case Kind::kConnectionFailed:
            case Kind::kTimeout:
                return true;
            case Kind::kHttpStatus:
                return http_status >= 500;
            case Kind::kMalformedResponse:
            case Kind::kCancelled:
                return false;
        }
        return false;
    }

    static TransportError cancelled() { return {.kind = Kind::kCancelled, .message = "cancelled"}; }

    bool operator==(const TransportError&) const = default;
};

std::string_view to_string(TransportError::Kind kind);

std::ostream& operator<<(std::ostream& out, const TransportError& error);

}  // namespace rpcprobe::rpc
