// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace rpcprobe::rpc {

//! Static mapping of <host>:<port> to a fixed IP address
struct ResolveOverride {
    std::string host;
    uint16_t port{0};
    boost::asio::ip::address address;

    //! Parse <host>:<port>:<address>, throw ConfigError if malformed
    static ResolveOverride parse(std::string_view text);
};

//! DNS resolution where static overrides take precedence over the system resolver
class HostResolver {
  public:
    HostResolver() = default;
    explicit HostResolver(const std::vector<ResolveOverride>& overrides);

    static HostResolver from_options(const std::vector<std::string>& options);

    std::optional<boost::asio::ip::address> find_override(std::string_view host, uint16_t port) const;

    //! Resolve the host into the endpoints to try in order, throw boost::system::system_error on failure
    Task<std::vector<boost::asio::ip::tcp::endpoint>> resolve(const std::string& host, uint16_t port) const;

    size_t size() const { return overrides_.size(); }

  private:
    std::map<std::string, boost::asio::ip::address, std::less<>> overrides_;
};

}  // namespace rpcprobe::rpc
