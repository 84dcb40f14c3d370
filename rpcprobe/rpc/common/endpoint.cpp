// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <charconv>
#include <ostream>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/config_error.hpp>

#include "constants.hpp"

namespace rpcprobe::rpc {

static uint16_t parse_port(std::string_view text, std::string_view url) {
    unsigned int port{0};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc{} || ptr != text.data() + text.size() || port == 0 || port > 65535) {
        throw ConfigError{absl::StrCat("invalid port '", text, "' in URL: ", url)};
    }
    return static_cast<uint16_t>(port);
}

Endpoint Endpoint::parse(std::string name, std::string_view url, TlsSettings tls, HttpHeaders headers) {
    if (name.empty()) {
        throw ConfigError{absl::StrCat("endpoint name is empty for URL: ", url)};
    }

    Endpoint endpoint;
    endpoint.name_ = std::move(name);
    endpoint.url_ = std::string{url};
    endpoint.tls_ = std::move(tls);
    endpoint.headers_ = std::move(headers);

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw ConfigError{absl::StrCat("missing scheme in URL: ", url)};
    }
    const auto scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
    if (scheme == "http") {
        endpoint.tls_enabled_ = false;
    } else if (scheme == "https") {
        endpoint.tls_enabled_ = true;
    } else {
        throw ConfigError{absl::StrCat("unsupported scheme '", scheme, "' in URL: ", url)};
    }

    std::string_view rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find_first_of("/?");
    std::string_view authority = rest.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        endpoint.target_ = "/";
    } else if (rest[path_start] == '?') {
        endpoint.target_ = absl::StrCat("/", rest.substr(path_start));
    } else {
        endpoint.target_ = std::string{rest.substr(path_start)};
    }

    if (authority.empty()) {
        throw ConfigError{absl::StrCat("missing host in URL: ", url)};
    }
    if (authority.find('@') != std::string_view::npos) {
        throw ConfigError{absl::StrCat("credentials in URL are not supported: ", url)};
    }

    std::string_view port_text;
    if (authority.front() == '[') {
        // IPv6 literal
        const auto closing = authority.find(']');
        if (closing == std::string_view::npos) {
            throw ConfigError{absl::StrCat("unterminated IPv6 address in URL: ", url)};
        }
        endpoint.host_ = std::string{authority.substr(1, closing - 1)};
        const auto after = authority.substr(closing + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw ConfigError{absl::StrCat("malformed authority in URL: ", url)};
            }
            port_text = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            endpoint.host_ = std::string{authority.substr(0, colon)};
            port_text = authority.substr(colon + 1);
        } else {
            endpoint.host_ = std::string{authority};
        }
    }
    if (endpoint.host_.empty()) {
        throw ConfigError{absl::StrCat("missing host in URL: ", url)};
    }

    if (port_text.empty()) {
        endpoint.port_ = endpoint.tls_enabled_ ? kDefaultHttpsPort : kDefaultHttpPort;
    } else {
        endpoint.port_ = parse_port(port_text, url);
    }

    return endpoint;
}

Endpoint Endpoint::from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ConfigError{"target entry must be an object: " + json.dump()};
    }
    if (!json.contains("name") || !json["name"].is_string() || !json.contains("url") || !json["url"].is_string()) {
        throw ConfigError{"target entry requires string fields 'name' and 'url': " + json.dump()};
    }
    try {
        TlsSettings tls{
            .ca_file = json.value("ca_file", ""),
            .cert_file = json.value("cert_file", ""),
            .key_file = json.value("key_file", ""),
            .verify = json.value("verify", true),
        };
        HttpHeaders headers;
        if (const auto it = json.find("headers"); it != json.end()) {
            headers = it->get<HttpHeaders>();
        }
        return parse(json["name"].get<std::string>(), json["url"].get<std::string>(), std::move(tls), std::move(headers));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{absl::StrCat("invalid target entry ", json.dump(), ": ", e.what())};
    }
}

Endpoint Endpoint::from_option(std::string_view option) {
    const auto separator = option.find('=');
    if (separator == std::string_view::npos) {
        throw ConfigError{absl::StrCat("target must be <name>=<url>: ", option)};
    }
    return parse(std::string{option.substr(0, separator)}, option.substr(separator + 1));
}

std::string Endpoint::authority() const {
    return absl::StrCat(host_, ":", port_);
}

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint) {
    out << endpoint.name() << "(" << endpoint.url() << ")";
    return out;
}

}  // namespace rpcprobe::rpc
