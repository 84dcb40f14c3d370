// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rpcprobe/validation/method_spec.hpp>
#include <rpcprobe/validation/schema_validator.hpp>

#include "suite.hpp"

namespace rpcprobe::engine {

/**
 * Build suites from their JSON description:
 *
 * \code
 * {
 *   "name": "openrpc", "required": true, "deadline_ms": 60000,
 *   "setup": [{"name": "latest", "rpc": {"method": "starknet_blockHashAndNumber"}, "capture": {"hash": "/block_hash"}}],
 *   "cases": [{"name": "block", "method": "starknet_getBlockWithTxHashes", "params": [{"block_hash": "${hash}"}],
 *              "expect": {"outcome": "success", "equals": {"/status": "ACCEPTED_ON_L2"}}}],
 *   "suites": [...]
 * }
 * \endcode
 *
 * Every case method must be declared by the specification. Params not matching their declared schemas are
 * reported as warnings, the case is kept so that nodes can be tested against malformed requests too.
 */
class SuiteLoader {
  public:
    explicit SuiteLoader(std::shared_ptr<const validation::Specification> spec);

    //! Load and validate a suite file, throw ConfigError if malformed
    Suite load_file(const std::filesystem::path& path);

    Suite from_json(const nlohmann::json& json);

    const std::vector<std::string>& warnings() const { return warnings_; }

  private:
    Suite parse_suite(const nlohmann::json& json, const std::string& location);
    std::vector<Case> parse_cases(const nlohmann::json& json, const std::string& location);
    Hook parse_hook(const nlohmann::json& json, const std::string& location) const;
    Expectation parse_expectation(const nlohmann::json& json, const std::string& location) const;
    void check_params(const Case& test_case, const std::string& location);
    void warn(std::string warning);

    std::shared_ptr<const validation::Specification> spec_;
    validation::SchemaValidator validator_;
    std::vector<std::string> warnings_;
};

}  // namespace rpcprobe::engine
