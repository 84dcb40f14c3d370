// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace rpcprobe::rpc {

//! TLS material used when connecting to an https endpoint
struct TlsSettings {
    std::string ca_file;
    std::string cert_file;
    std::string key_file;
    bool verify{true};
};

using HttpHeaders = std::map<std::string, std::string>;

//! A named node endpoint reachable through JSON-RPC over HTTP(S)
class Endpoint {
  public:
    //! Parse the URL in the form <scheme>://<host>[:<port>][/<path>], throw ConfigError if malformed
    static Endpoint parse(std::string name, std::string_view url, TlsSettings tls = {}, HttpHeaders headers = {});

    //! Build from {"name", "url", "ca_file", "cert_file", "key_file", "verify", "headers"}
    static Endpoint from_json(const nlohmann::json& json);

    //! Build from <name>=<url>
    static Endpoint from_option(std::string_view option);

    const std::string& name() const { return name_; }
    const std::string& url() const { return url_; }
    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }
    const std::string& target() const { return target_; }
    bool is_tls() const { return tls_enabled_; }
    const TlsSettings& tls() const { return tls_; }
    const HttpHeaders& headers() const { return headers_; }

    //! <host>:<port>, used as key for pooled connections and DNS overrides
    std::string authority() const;

  private:
    Endpoint() = default;

    std::string name_;
    std::string url_;
    std::string host_;
    uint16_t port_{0};
    std::string target_;
    bool tls_enabled_{false};
    TlsSettings tls_;
    HttpHeaders headers_;
};

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint);

}  // namespace rpcprobe::rpc
