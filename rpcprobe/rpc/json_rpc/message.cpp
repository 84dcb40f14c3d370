// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "message.hpp"

#include <rpcprobe/infra/common/ensure.hpp>
#include <rpcprobe/rpc/common/constants.hpp>

namespace rpcprobe::json_rpc {

nlohmann::json make_request(const nlohmann::json& id, std::string_view method, const nlohmann::json& params) {
    nlohmann::json request{
        {"jsonrpc", kJsonRpcVersion},
        {"method", method},
        {"id", id},
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

nlohmann::json make_error_response(const nlohmann::json& id, int64_t code, std::string_view message) {
    return {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}},
    };
}

static tl::expected<Response::Kind, std::string> classify(const nlohmann::json& json) {
    if (!json.is_object()) {
        return tl::make_unexpected("response is not an object: " + json.dump());
    }
    if (const auto version = json.find("jsonrpc"); version != json.end() && (!version->is_string() || version->get<std::string>() != kJsonRpcVersion)) {
        return tl::make_unexpected("unsupported jsonrpc version: " + version->dump());
    }
    if (!json.contains("id")) {
        return tl::make_unexpected("response has no id");
    }
    const bool has_result = json.contains("result");
    const bool has_error = json.contains("error");
    if (has_result == has_error) {
        return tl::make_unexpected("response must have exactly one of result and error");
    }
    return has_result ? Response::Kind::kResult : Response::Kind::kError;
}

tl::expected<Response, std::string> Response::parse(std::string_view body) {
    auto json = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        constexpr size_t kMaxExcerpt{256};
        return tl::make_unexpected("invalid JSON body: " + std::string{body.substr(0, kMaxExcerpt)});
    }
    return from_json(std::move(json));
}

tl::expected<Response, std::string> Response::from_json(nlohmann::json json) {
    if (json.is_array()) {
        if (json.empty()) {
            return tl::make_unexpected("empty batch response");
        }
        for (const auto& element : json) {
            if (auto kind = classify(element); !kind) {
                return tl::make_unexpected("invalid batch element: " + kind.error());
            }
        }
        return Response{std::move(json), Kind::kBatch};
    }
    auto kind = classify(json);
    if (!kind) {
        return tl::make_unexpected(kind.error());
    }
    return Response{std::move(json), *kind};
}

const nlohmann::json& Response::id() const {
    ensure(kind_ != Kind::kBatch, "Response::id: batch has no single id");
    return json_.at("id");
}

const nlohmann::json& Response::result() const {
    ensure(kind_ == Kind::kResult, "Response::result: not a result response");
    return json_.at("result");
}

const nlohmann::json& Response::error() const {
    ensure(kind_ == Kind::kError, "Response::error: not an error response");
    return json_.at("error");
}

std::optional<int64_t> Response::error_code() const {
    if (kind_ != Kind::kError) {
        return std::nullopt;
    }
    const auto& error = json_.at("error");
    if (!error.is_object()) {
        return std::nullopt;
    }
    const auto code = error.find("code");
    if (code == error.end() || !code->is_number_integer()) {
        return std::nullopt;
    }
    return code->get<int64_t>();
}

std::optional<std::string> Response::header(const std::string& name) const {
    const auto it = headers_.find(name);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string_view to_string(Response::Kind kind) {
    switch (kind) {
        case Response::Kind::kResult:
            return "result";
        case Response::Kind::kError:
            return "error";
        case Response::Kind::kBatch:
            return "batch";
    }
    return "unknown";
}

}  // namespace rpcprobe::json_rpc
