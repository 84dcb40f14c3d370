// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>
#include <rpcprobe/rpc/transport/resolver.hpp>
#include <rpcprobe/validation/schema_validator.hpp>
#include <rpcprobe/validation/semantic_checker.hpp>

namespace rpcprobe::engine {

struct RunnerSettings {
    log::Settings log_settings;
    //! Main OpenRPC document followed by the documents it references
    std::vector<std::string> spec_files;
    std::string suite_file;
    std::vector<rpc::Endpoint> targets;
    std::optional<std::string> targets_file;
    std::vector<rpc::ResolveOverride> resolve_overrides;
    std::optional<std::string> report_file;
    //! Cases in flight per target
    uint32_t concurrency{4};
    uint32_t case_retries{0};
    //! Attempts of each single call, including the first one
    uint32_t max_attempts{3};
    std::chrono::milliseconds case_timeout{kDefaultTimeout};
    validation::DivergencePolicy divergence_policy{validation::DivergencePolicy::kRecord};
    validation::ValidationMode validation_mode{validation::ValidationMode::kExhaustive};
    //! Non-decreasing values checked besides the built-in block number rules
    std::vector<validation::MonotonicRule> monotonic_rules;
    uint32_t num_threads{2};
    uint32_t fixture_threads{1};
};

}  // namespace rpcprobe::engine
