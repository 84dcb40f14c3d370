// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "verdict.hpp"

#include <string>

#include <rpcprobe/infra/common/ensure.hpp>

namespace rpcprobe::engine {

std::string_view to_string(Verdict verdict) {
    switch (verdict) {
        case Verdict::kPass:
            return "Pass";
        case Verdict::kSchemaViolation:
            return "SchemaViolation";
        case Verdict::kSemanticViolation:
            return "SemanticViolation";
        case Verdict::kTransportError:
            return "TransportError";
        case Verdict::kSkipped:
            return "Skipped";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, Verdict verdict) {
    out << to_string(verdict);
    return out;
}

std::string_view to_string(Status status) {
    return status == Status::kPass ? "Pass" : "Fail";
}

std::string_view to_string(CaseLifecycle::State state) {
    switch (state) {
        case CaseLifecycle::State::kPending:
            return "Pending";
        case CaseLifecycle::State::kRunning:
            return "Running";
        case CaseLifecycle::State::kFinished:
            return "Finished";
    }
    return "Unknown";
}

void CaseLifecycle::start() {
    ensure(state_ == State::kPending, [&]() { return "CaseLifecycle: cannot start from " + std::string{to_string(state_)}; });
    state_ = State::kRunning;
}

void CaseLifecycle::finish(Verdict verdict) {
    ensure(state_ != State::kFinished, [&]() {
        return "CaseLifecycle: already finished with " + std::string{to_string(*verdict_)};
    });
    // Only a skip may bypass the running state
    ensure(state_ == State::kRunning || verdict == Verdict::kSkipped, [&]() {
        return "CaseLifecycle: cannot finish with " + std::string{to_string(verdict)} + " before running";
    });
    state_ = State::kFinished;
    verdict_ = verdict;
}

}  // namespace rpcprobe::engine
