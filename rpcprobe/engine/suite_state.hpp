// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace rpcprobe::engine {

/**
 * Variables shared by the cases of one suite run, e.g. a block hash captured by a case and used by later ones.
 *
 * Placeholders ${name} inside params are replaced by the variable value: a string made only of one placeholder
 * takes the captured JSON value as is (numbers stay numbers), a placeholder inside a longer string is replaced
 * by the value text.
 */
class SuiteState {
  public:
    void set(const std::string& name, nlohmann::json value);
    std::optional<nlohmann::json> get(const std::string& name) const;
    bool contains(const std::string& name) const { return variables_.contains(name); }

    const std::map<std::string, nlohmann::json>& variables() const { return variables_; }

    //! Replace every placeholder, fail with the name of the first undefined variable
    tl::expected<nlohmann::json, std::string> substitute(const nlohmann::json& value) const;

    //! Names of the variables referenced by the value
    static std::set<std::string> placeholders(const nlohmann::json& value);

  private:
    tl::expected<nlohmann::json, std::string> substitute_string(const std::string& text) const;

    std::map<std::string, nlohmann::json> variables_;
};

}  // namespace rpcprobe::engine
