// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "target_registry.hpp"

#include <algorithm>
#include <fstream>

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::engine {

void TargetRegistry::add(rpc::Endpoint endpoint) {
    if (find(endpoint.name())) {
        throw ConfigError{absl::StrCat("duplicate target ", endpoint.name())};
    }
    PROBE_DEBUG << "TargetRegistry: added target " << endpoint;
    endpoints_.push_back(std::move(endpoint));
}

void TargetRegistry::add_json(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw ConfigError{"targets must be a JSON array of endpoint objects"};
    }
    for (const auto& target : json) {
        add(rpc::Endpoint::from_json(target));
    }
}

void TargetRegistry::load_file(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw ConfigError{absl::StrCat("cannot open targets file ", path.string())};
    }
    const auto json = nlohmann::json::parse(stream, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        throw ConfigError{absl::StrCat("targets file ", path.string(), " is not valid JSON")};
    }
    add_json(json);
}

const rpc::Endpoint* TargetRegistry::find(std::string_view name) const {
    const auto it = std::find_if(endpoints_.begin(), endpoints_.end(), [&](const auto& endpoint) { return endpoint.name() == name; });
    return it != endpoints_.end() ? &*it : nullptr;
}

const rpc::Endpoint& TargetRegistry::get(std::string_view name) const {
    const auto* endpoint = find(name);
    if (!endpoint) {
        throw ConfigError{absl::StrCat("unknown target ", name)};
    }
    return *endpoint;
}

}  // namespace rpcprobe::engine
