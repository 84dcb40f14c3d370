// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "listen_address_option.hpp"

#include <cstdint>
#include <string_view>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <boost/asio/ip/address.hpp>
#include <boost/system/error_code.hpp>

namespace rpcprobe::cmd::common {

static std::string check_listen_address(const std::string& value) {
    const auto separator = value.rfind(':');
    if (separator == std::string::npos) {
        return absl::StrCat("Value ", value, " is not an <address>:<port> end-point");
    }
    std::string_view host{value.data(), separator};
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    if (ec) {
        return absl::StrCat("Value ", host, " is not a valid IP address");
    }

    uint32_t port{0};
    if (!absl::SimpleAtoi(std::string_view{value}.substr(separator + 1), &port) || port > 65535) {
        return absl::StrCat("Value ", value.substr(separator + 1), " is not a valid port");
    }
    return {};
}

ListenAddressValidator::ListenAddressValidator() : CLI::Validator{"LISTEN_ADDRESS"} {
    func_ = check_listen_address;
}

void add_option_listen_address(CLI::App& cli, const std::string& name, std::string& address, const std::string& description) {
    cli.add_option(name, address, description)
        ->capture_default_str()
        ->check(ListenAddressValidator{});
}

}  // namespace rpcprobe::cmd::common
