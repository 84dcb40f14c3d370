// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace rpcprobe::engine {

//! Terminal outcome of one case execution
enum class Verdict {
    kPass,
    kSchemaViolation,
    kSemanticViolation,
    kTransportError,
    kSkipped,
};

std::string_view to_string(Verdict verdict);
std::ostream& operator<<(std::ostream& out, Verdict verdict);

//! Aggregate outcome of a suite (or of the whole run)
enum class Status {
    kPass,
    kFail,
};

std::string_view to_string(Status status);

/**
 * Case lifecycle: Pending -> Running -> terminal verdict, or Pending -> Skipped.
 * Terminal states are final, any illegal transition throws std::logic_error.
 */
class CaseLifecycle {
  public:
    enum class State {
        kPending,
        kRunning,
        kFinished,
    };

    void start();
    void finish(Verdict verdict);

    State state() const { return state_; }
    std::optional<Verdict> verdict() const { return verdict_; }
    bool finished() const { return state_ == State::kFinished; }

  private:
    State state_{State::kPending};
    std::optional<Verdict> verdict_;
};

std::string_view to_string(CaseLifecycle::State state);

}  // namespace rpcprobe::engine
