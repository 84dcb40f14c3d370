// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "resolver.hpp"

#include <charconv>

#include <absl/strings/str_cat.h>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::rpc {

static std::string make_key(std::string_view host, uint16_t port) {
    return absl::StrCat(host, ":", port);
}

ResolveOverride ResolveOverride::parse(std::string_view text) {
    const auto first = text.find(':');
    const auto second = first == std::string_view::npos ? std::string_view::npos : text.find(':', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos || first == 0) {
        throw ConfigError{absl::StrCat("resolve override must be <host>:<port>:<address>: ", text)};
    }

    ResolveOverride entry;
    entry.host = std::string{text.substr(0, first)};

    const auto port_text = text.substr(first + 1, second - first - 1);
    unsigned int port{0};
    const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
    if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535) {
        throw ConfigError{absl::StrCat("invalid port in resolve override: ", text)};
    }
    entry.port = static_cast<uint16_t>(port);

    auto address_text = text.substr(second + 1);
    if (address_text.size() > 2 && address_text.front() == '[' && address_text.back() == ']') {
        address_text = address_text.substr(1, address_text.size() - 2);
    }
    boost::system::error_code error;
    entry.address = boost::asio::ip::make_address(std::string{address_text}, error);
    if (error) {
        throw ConfigError{absl::StrCat("invalid address in resolve override: ", text)};
    }
    return entry;
}

HostResolver::HostResolver(const std::vector<ResolveOverride>& overrides) {
    for (const auto& entry : overrides) {
        overrides_.insert_or_assign(make_key(entry.host, entry.port), entry.address);
    }
}

HostResolver HostResolver::from_options(const std::vector<std::string>& options) {
    std::vector<ResolveOverride> overrides;
    overrides.reserve(options.size());
    for (const auto& option : options) {
        overrides.push_back(ResolveOverride::parse(option));
    }
    return HostResolver{overrides};
}

std::optional<boost::asio::ip::address> HostResolver::find_override(std::string_view host, uint16_t port) const {
    const auto it = overrides_.find(make_key(host, port));
    if (it == overrides_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Task<std::vector<boost::asio::ip::tcp::endpoint>> HostResolver::resolve(const std::string& host, uint16_t port) const {
    if (const auto address = find_override(host, port)) {
        PROBE_TRACE << "HostResolver::resolve " << host << ":" << port << " overridden by " << address->to_string();
        co_return std::vector<boost::asio::ip::tcp::endpoint>{{*address, port}};
    }

    boost::system::error_code error;
    const auto literal = boost::asio::ip::make_address(host, error);
    if (!error) {
        co_return std::vector<boost::asio::ip::tcp::endpoint>{{literal, port}};
    }

    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::ip::tcp::resolver resolver{executor};
    const auto results = co_await resolver.async_resolve(host, std::to_string(port), boost::asio::use_awaitable);
    std::vector<boost::asio::ip::tcp::endpoint> endpoints;
    for (const auto& entry : results) {
        endpoints.push_back(entry.endpoint());
    }
    co_return endpoints;
}

}  // namespace rpcprobe::rpc
