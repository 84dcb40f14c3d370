// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <tl/expected.hpp>

#include <rpcprobe/rpc/client/transport_error.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>

namespace rpcprobe::rpc {

//! Raw HTTP answer to a POST request, header names are lower case
struct HttpReply {
    unsigned int status{0};
    std::string body;
    HttpHeaders headers;
    bool keep_alive{true};
};

//! The HTTP layer used to reach node endpoints
class Transport {
  public:
    virtual ~Transport() = default;

    //! POST the body to the endpoint, the whole exchange (connect included) is bounded by timeout
    virtual Task<tl::expected<HttpReply, TransportError>> post(
        const Endpoint& endpoint,
        std::string body,
        std::chrono::milliseconds timeout) = 0;
};

}  // namespace rpcprobe::rpc
