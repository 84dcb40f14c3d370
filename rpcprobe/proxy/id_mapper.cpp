// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "id_mapper.hpp"

namespace rpcprobe::proxy {

nlohmann::json IdMapper::remap_request(nlohmann::json request) {
    if (request.is_array()) {
        for (auto& element : request) {
            remap_one(element);
        }
    } else {
        remap_one(request);
    }
    return request;
}

nlohmann::json IdMapper::restore_response(nlohmann::json response) {
    if (response.is_array()) {
        for (auto& element : response) {
            restore_one(element);
        }
    } else {
        restore_one(response);
    }
    return response;
}

void IdMapper::discard(const nlohmann::json& request) {
    auto forget = [&](const nlohmann::json& element) {
        if (!element.is_object()) return;
        const auto id = element.find("id");
        if (id != element.end() && id->is_number_unsigned()) {
            original_ids_.erase(id->get<uint64_t>());
        }
    };
    if (request.is_array()) {
        for (const auto& element : request) {
            forget(element);
        }
    } else {
        forget(request);
    }
}

void IdMapper::remap_one(nlohmann::json& request) {
    if (!request.is_object()) return;
    const auto id = request.find("id");
    if (id == request.end()) return;

    const uint64_t internal_id = (uint64_t{session_id_} << 32) | ++sequence_;
    original_ids_.insert_or_assign(internal_id, std::move(*id));
    *id = internal_id;
}

void IdMapper::restore_one(nlohmann::json& response) {
    if (!response.is_object()) return;
    const auto id = response.find("id");
    if (id == response.end() || !id->is_number_unsigned()) return;

    const auto it = original_ids_.find(id->get<uint64_t>());
    if (it == original_ids_.end()) return;
    *id = std::move(it->second);
    original_ids_.erase(it);
}

}  // namespace rpcprobe::proxy
