// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <gmock/gmock.h>

#include <rpcprobe/rpc/transport/transport.hpp>

namespace rpcprobe::rpc::test_util {

class MockTransport : public Transport {  // NOLINT
  public:
    MOCK_METHOD((Task<tl::expected<HttpReply, TransportError>>), post, (const Endpoint&, std::string, std::chrono::milliseconds), (override));
};

inline Task<tl::expected<HttpReply, TransportError>> make_reply(unsigned int status, std::string body) {
    co_return HttpReply{.status = status, .body = std::move(body)};
}

inline Task<tl::expected<HttpReply, TransportError>> make_failure(TransportError error) {
    co_return tl::make_unexpected(std::move(error));
}

}  // namespace rpcprobe::rpc::test_util
