// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "result.hpp"

#include <rpcprobe/infra/common/ensure.hpp>

namespace rpcprobe::engine {

std::string_view to_string(ResultNode::Kind kind) {
    switch (kind) {
        case ResultNode::Kind::kRun:
            return "run";
        case ResultNode::Kind::kTarget:
            return "target";
        case ResultNode::Kind::kSuite:
            return "suite";
        case ResultNode::Kind::kCase:
            return "case";
    }
    return "unknown";
}

ResultNode ResultNode::make_case(CaseResult result, bool required) {
    ResultNode node;
    node.kind = Kind::kCase;
    node.name = result.name;
    node.target = result.target;
    node.required = required;
    node.case_result = std::move(result);
    return node;
}

Status ResultNode::status() const {
    if (kind == Kind::kCase) {
        ensure_invariant(case_result.has_value(), [&]() { return "case " + name + " has no result yet"; });
        return case_result->verdict == Verdict::kPass ? Status::kPass : Status::kFail;
    }
    if (setup_failure) {
        return Status::kFail;
    }
    Status aggregate{Status::kPass};
    for (const auto& child : children) {
        if (!child.required) continue;
        if (child.status() == Status::kFail) {
            aggregate = Status::kFail;
        }
    }
    return aggregate;
}

const ResultNode* ResultNode::find(std::string_view node_name) const {
    if (name == node_name) {
        return this;
    }
    for (const auto& child : children) {
        if (const auto* node = child.find(node_name)) {
            return node;
        }
    }
    return nullptr;
}

std::vector<const CaseResult*> ResultNode::case_results() const {
    std::vector<const CaseResult*> results;
    if (case_result) {
        results.push_back(&*case_result);
    }
    for (const auto& child : children) {
        const auto child_results = child.case_results();
        results.insert(results.end(), child_results.begin(), child_results.end());
    }
    return results;
}

}  // namespace rpcprobe::engine
