// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "request_handler.hpp"

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>
#include <rpcprobe/rpc/json_rpc/message.hpp>

namespace rpcprobe::proxy {

static std::vector<rpc::Endpoint> select_upstreams(const ProxySettings& settings) {
    if (settings.targets.empty()) {
        throw ConfigError{"proxy needs at least one upstream target"};
    }
    if (settings.mode == Mode::kPassThrough) {
        if (settings.targets.size() > 1) {
            throw ConfigError{absl::StrCat("pass-through mode takes exactly one target, got ", settings.targets.size())};
        }
        return {settings.targets.front()};
    }
    return settings.targets;
}

static Reply make_error_reply(unsigned int status, const nlohmann::json& id, int64_t code, std::string_view message) {
    return {
        .status = status,
        .body = json_rpc::make_error_response(id, code, message).dump(),
    };
}

RequestHandler::RequestHandler(const ProxySettings& settings,
                               std::shared_ptr<rpc::RpcClient> client,
                               std::shared_ptr<TrafficRecorder> recorder)
    : mode_{settings.mode},
      fan_out_{std::move(client),
               select_upstreams(settings),
               settings.mode == Mode::kPassThrough ? FanOutStrategy::kFirst : settings.strategy,
               ResponseComparator{settings.ignored_fields},
               settings.fanout_deadline,
               settings.upstream_timeout},
      recorder_{std::move(recorder)} {}

Task<Reply> RequestHandler::handle(std::string_view body, IdMapper& id_mapper) {
    if (recorder_) {
        recorder_->record_request(body);
    }

    auto request = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (request.is_discarded()) {
        PROBE_DEBUG << "RequestHandler::handle invalid JSON request: " << body;
        co_return make_error_reply(400, nullptr, json_rpc::kParseError, "Parse error");
    }
    if (!(request.is_object() || (request.is_array() && !request.empty()))) {
        co_return make_error_reply(400, nullptr, json_rpc::kInvalidRequest, "Invalid request");
    }
    const auto original_id = request.is_object() ? request.value("id", nlohmann::json{}) : nlohmann::json{};

    auto remapped = id_mapper.remap_request(std::move(request));
    try {
        const auto result = co_await fan_out_.dispatch(remapped);
        Reply reply{.body = id_mapper.restore_response(result.response().json()).dump()};
        if (result.divergence) {
            reply.headers.emplace(kDivergenceHeader, result.divergence->dump());
        }
        if (result.has_failures()) {
            reply.headers.emplace(kUpstreamFailuresHeader, failures_to_json(result.outcomes).dump());
        }
        record(result.outcomes, reply);
        co_return reply;
    } catch (const ProxyUpstreamError& e) {
        PROBE_WARN << "RequestHandler::handle " << e.what();
        id_mapper.discard(remapped);
        auto reply = make_error_reply(502, original_id, kUpstreamError, e.what());
        reply.headers.emplace(kUpstreamFailuresHeader, failures_to_json(e.outcomes()).dump());
        record(e.outcomes(), reply);
        co_return reply;
    }
}

void RequestHandler::record(const std::vector<UpstreamOutcome>& outcomes, const Reply& reply) {
    if (!recorder_) return;
    for (const auto& outcome : outcomes) {
        recorder_->record_upstream(outcome);
    }
    recorder_->record_reply(reply.status, reply.body);
}

}  // namespace rpcprobe::proxy
