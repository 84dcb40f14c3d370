// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <rpcprobe/rpc/common/endpoint.hpp>

namespace rpcprobe::engine {

//! Named node endpoints under test, populated at startup and read-only afterwards
class TargetRegistry {
  public:
    //! Throw ConfigError if a target with the same name is already registered
    void add(rpc::Endpoint endpoint);

    //! Register the targets of a JSON array of endpoint objects
    void add_json(const nlohmann::json& json);

    //! Register the targets declared in a JSON file, throw ConfigError if unreadable or malformed
    void load_file(const std::filesystem::path& path);

    const rpc::Endpoint* find(std::string_view name) const;

    //! Throw ConfigError if not registered
    const rpc::Endpoint& get(std::string_view name) const;

    const std::vector<rpc::Endpoint>& endpoints() const { return endpoints_; }
    size_t size() const { return endpoints_.size(); }
    bool empty() const { return endpoints_.empty(); }

  private:
    std::vector<rpc::Endpoint> endpoints_;
};

}  // namespace rpcprobe::engine
