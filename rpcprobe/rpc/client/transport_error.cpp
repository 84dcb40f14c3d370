// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "transport_error.hpp"

namespace rpcprobe::rpc {

std::string_view to_string(TransportError::Kind kind) {
    switch (kind) {
        case TransportError::Kind::kConnectionFailed:
            return "connection-failed";
        case TransportError::Kind::kTimeout:
            return "timeout";
        case TransportError::Kind::kHttpStatus:
            return "http-status";
        case TransportError::Kind::kMalformedResponse:
            return "malformed-response";
        case TransportError::Kind::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& out, const TransportError& error) {
    out << to_string(error.kind);
    if (error.kind == TransportError::Kind::kHttpStatus) {
        out << " " << error.http_status;
    }
    if (!error.message.empty()) {
        out << ": " << error.message;
    }
    return out;
}

}  // namespace rpcprobe::rpc
