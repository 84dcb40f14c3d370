// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "validation_outcome.hpp"

#include <sstream>

namespace rpcprobe::validation {

std::ostream& operator<<(std::ostream& out, const Violation& violation) {
    out << (violation.path.empty() ? "/" : violation.path) << ": expected " << violation.expected << ", got " << violation.actual;
    return out;
}

std::string to_string(const Violation& violation) {
    std::stringstream out;
    out << violation;
    return out.str();
}

std::optional<Violation> ValidationOutcome::first() const {
    if (violations_.empty()) {
        return std::nullopt;
    }
    return violations_.front();
}

void ValidationOutcome::add(Violation violation) {
    if (saturated()) return;
    violations_.push_back(std::move(violation));
}

void ValidationOutcome::merge(const ValidationOutcome& other) {
    for (const auto& violation : other.violations_) {
        add(violation);
    }
}

nlohmann::json ValidationOutcome::to_json() const {
    auto json = nlohmann::json::array();
    for (const auto& violation : violations_) {
        json.push_back({{"path", violation.path}, {"expected", violation.expected}, {"actual", violation.actual}});
    }
    return json;
}

}  // namespace rpcprobe::validation
