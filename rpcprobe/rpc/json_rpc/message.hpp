// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace rpcprobe::json_rpc {

inline constexpr int64_t kParseError{-32700};
inline constexpr int64_t kInvalidRequest{-32600};
inline constexpr int64_t kMethodNotFound{-32601};
inline constexpr int64_t kInvalidParams{-32602};
inline constexpr int64_t kInternalError{-32603};

//! Error codes reserved by JSON-RPC 2.0 for protocol-level failures, accepted for every method
inline bool is_standard_error_code(int64_t code) {
    return code >= kParseError && code <= kInvalidRequest;
}

nlohmann::json make_request(const nlohmann::json& id, std::string_view method, const nlohmann::json& params);

nlohmann::json make_error_response(const nlohmann::json& id, int64_t code, std::string_view message);

//! A JSON-RPC 2.0 response (or batch of responses) received from a node
class Response {
  public:
    enum class Kind {
        kResult,
        kError,
        kBatch,
    };

    //! Parse a raw body, failing when it is not a JSON-RPC response
    static tl::expected<Response, std::string> parse(std::string_view body);
    static tl::expected<Response, std::string> from_json(nlohmann::json json);

    Kind kind() const { return kind_; }

    const nlohmann::json& id() const;
    const nlohmann::json& result() const;
    const nlohmann::json& error() const;

    //! The error code when this is an error response carrying an integer code
    std::optional<int64_t> error_code() const;

    const nlohmann::json& json() const { return json_; }
    std::string dump() const { return json_.dump(); }

    //! HTTP headers of the reply carrying this response, names in lower case
    const std::map<std::string, std::string>& headers() const { return headers_; }
    void set_headers(std::map<std::string, std::string> headers) { headers_ = std::move(headers); }
    std::optional<std::string> header(const std::string& name) const;

  private:
    Response(nlohmann::json json, Kind kind) : json_{std::move(json)}, kind_{kind} {}

    nlohmann::json json_;
    Kind kind_;
    std::map<std::string, std::string> headers_;
};

std::string_view to_string(Response::Kind kind);

}  // namespace rpcprobe::json_rpc
