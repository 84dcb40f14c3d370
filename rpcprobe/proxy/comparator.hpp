// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>

namespace rpcprobe::proxy {

//! Structural equality of JSON-RPC responses modulo the request id and dynamic fields
class ResponseComparator {
  public:
    explicit ResponseComparator(std::set<std::string> ignored_fields = {}) : ignored_fields_{std::move(ignored_fields)} {}

    //! Copy without the top-level ids and without the ignored fields at any depth
    nlohmann::json normalize(const nlohmann::json& response) const;

    bool equivalent(const nlohmann::json& lhs, const nlohmann::json& rhs) const;

    //! JSON pointer of the first difference, empty when equivalent
    std::optional<std::string> first_difference(const nlohmann::json& lhs, const nlohmann::json& rhs) const;

    const std::set<std::string>& ignored_fields() const { return ignored_fields_; }

  private:
    void strip(nlohmann::json& node) const;

    std::set<std::string> ignored_fields_;
};

}  // namespace rpcprobe::proxy
