// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rpcprobe::validation {

//! A single mismatch between a value and its contract, path is a JSON pointer into the response
struct Violation {
    std::string path;
    std::string expected;
    std::string actual;

    bool operator==(const Violation&) const = default;
};

std::ostream& operator<<(std::ostream& out, const Violation& violation);

std::string to_string(const Violation& violation);

enum class ValidationMode {
    kFirst,       // stop at the first violation
    kExhaustive,  // collect all violations
};

class ValidationOutcome {
  public:
    ValidationOutcome() = default;
    explicit ValidationOutcome(ValidationMode mode) : mode_{mode} {}

    bool ok() const { return violations_.empty(); }
    explicit operator bool() const { return ok(); }

    std::optional<Violation> first() const;
    const std::vector<Violation>& violations() const { return violations_; }

    ValidationMode mode() const { return mode_; }

    //! No more violations are collected once the first one is found in kFirst mode
    bool saturated() const { return mode_ == ValidationMode::kFirst && !violations_.empty(); }

    void add(Violation violation);
    void merge(const ValidationOutcome& other);

    nlohmann::json to_json() const;

  private:
    ValidationMode mode_{ValidationMode::kExhaustive};
    std::vector<Violation> violations_;
};

}  // namespace rpcprobe::validation
