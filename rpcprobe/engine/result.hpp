// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include <rpcprobe/validation/validation_outcome.hpp>

#include "verdict.hpp"

namespace rpcprobe::engine {

//! What one case produced against one target
struct CaseResult {
    std::string name;
    std::string method;
    std::string target;
    Verdict verdict{Verdict::kSkipped};
    std::string details;
    std::vector<validation::Violation> violations;
    //! Annotations not affecting the verdict, e.g. proxy divergence
    std::vector<std::string> notes;
    std::chrono::milliseconds elapsed{0};
    //! Number of executions, zero when never executed
    uint32_t attempts{0};
    //! Null when nothing was sent or received
    nlohmann::json request;
    nlohmann::json response;
};

//! Node of the result tree: the run, one subtree per target, suites and cases
struct ResultNode {
    enum class Kind {
        kRun,
        kTarget,
        kSuite,
        kCase,
    };

    Kind kind{Kind::kSuite};
    std::string name;
    std::string target;
    //! Optional nodes are reported but never affect the aggregate of their parent
    bool required{true};
    //! Set on case nodes once the case reached its verdict
    std::optional<CaseResult> case_result;
    //! Set on suite nodes whose setup failed, their children are all skipped
    std::optional<std::string> setup_failure;
    std::vector<std::string> notes;
    std::vector<ResultNode> children;

    static ResultNode make_case(CaseResult result, bool required);

    //! Aggregate status: Fail if setup failed or any required child is not Pass
    Status status() const;

    //! Depth-first search of the first node with the given name
    const ResultNode* find(std::string_view node_name) const;

    //! Case results of the subtree in depth-first order
    std::vector<const CaseResult*> case_results() const;
};

std::string_view to_string(ResultNode::Kind kind);

}  // namespace rpcprobe::engine
