// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <set>
#include <string>

#include <nlohmann/json.hpp>

#include <rpcprobe/rpc/json_rpc/message.hpp>

#include "method_spec.hpp"
#include "validation_outcome.hpp"

namespace rpcprobe::validation {

//! Structural and format validation of responses and params against OpenRPC method contracts
class SchemaValidator {
  public:
    //! Names of the schemas whose values must be field elements
    static std::set<std::string> default_felt_schemas();

    explicit SchemaValidator(std::set<std::string> felt_schemas = default_felt_schemas());

    ValidationOutcome validate(
        const MethodSpec& method_spec,
        const json_rpc::Response& response,
        ValidationMode mode = ValidationMode::kFirst) const;

    ValidationOutcome validate_params(
        const MethodSpec& method_spec,
        const nlohmann::json& params,
        ValidationMode mode = ValidationMode::kExhaustive) const;

    //! Validate a value against one schema of the method registry, path is the JSON pointer of the value
    ValidationOutcome validate_value(
        const SchemaRegistry& registry,
        const nlohmann::json& value,
        const nlohmann::json& schema,
        const std::string& path,
        ValidationMode mode) const;

  private:
    struct Context;

    bool validate_schema(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const;
    bool validate_type(Context& context, const nlohmann::json& value, const nlohmann::json& type, const std::string& path) const;
    bool validate_string(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const;
    bool validate_number(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const;
    bool validate_object(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const;
    bool validate_array(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const;
    bool validate_alternatives(Context& context, const nlohmann::json& value, const nlohmann::json& alternatives, const std::string& keyword, const std::string& path) const;

    std::set<std::string> felt_schemas_;
};

}  // namespace rpcprobe::validation
