// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "comparator.hpp"

namespace rpcprobe::proxy {

nlohmann::json ResponseComparator::normalize(const nlohmann::json& response) const {
    auto normalized = response;
    if (normalized.is_array()) {
        for (auto& element : normalized) {
            if (element.is_object()) element.erase("id");
        }
    } else if (normalized.is_object()) {
        normalized.erase("id");
    }
    strip(normalized);
    return normalized;
}

void ResponseComparator::strip(nlohmann::json& node) const {
    if (node.is_object()) {
        for (const auto& field : ignored_fields_) {
            node.erase(field);
        }
        for (auto& [_, value] : node.items()) {
            strip(value);
        }
    } else if (node.is_array()) {
        for (auto& element : node) {
            strip(element);
        }
    }
}

bool ResponseComparator::equivalent(const nlohmann::json& lhs, const nlohmann::json& rhs) const {
    return normalize(lhs) == normalize(rhs);
}

std::optional<std::string> ResponseComparator::first_difference(const nlohmann::json& lhs, const nlohmann::json& rhs) const {
    const auto patch = nlohmann::json::diff(normalize(lhs), normalize(rhs));
    if (patch.empty()) {
        return std::nullopt;
    }
    const auto& path = patch.front().at("path").get_ref<const std::string&>();
    return path;
}

}  // namespace rpcprobe::proxy
