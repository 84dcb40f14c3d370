// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "fan_out.hpp"

#include <algorithm>
#include <sstream>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <rpcprobe/infra/common/ensure.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/concurrency/parallel_group.hpp>

namespace rpcprobe::proxy {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

static std::string describe(const rpc::TransportError& error) {
    std::stringstream out;
    out << error;
    return out.str();
}

nlohmann::json failures_to_json(const std::vector<UpstreamOutcome>& outcomes) {
    auto failures = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        if (!outcome.result) {
            failures.push_back({{"upstream", outcome.upstream}, {"error", describe(outcome.result.error())}});
        }
    }
    return failures;
}

bool FanOutResult::has_failures() const {
    return std::any_of(outcomes.begin(), outcomes.end(), [](const auto& outcome) { return !outcome.result; });
}

static std::string make_upstream_error_message(const std::vector<UpstreamOutcome>& outcomes) {
    std::vector<std::string> failures;
    for (const auto& outcome : outcomes) {
        if (!outcome.result) {
            failures.push_back(absl::StrCat(outcome.upstream, " (", describe(outcome.result.error()), ")"));
        }
    }
    return absl::StrCat("all upstreams failed: ", absl::StrJoin(failures, ", "));
}

ProxyUpstreamError::ProxyUpstreamError(std::vector<UpstreamOutcome> outcomes)
    : std::runtime_error{make_upstream_error_message(outcomes)}, outcomes_{std::move(outcomes)} {}

FanOut::FanOut(std::shared_ptr<rpc::RpcClient> client,
               std::vector<rpc::Endpoint> upstreams,
               FanOutStrategy strategy,
               ResponseComparator comparator,
               milliseconds deadline,
               milliseconds upstream_timeout)
    : client_{std::move(client)},
      upstreams_{std::move(upstreams)},
      strategy_{strategy},
      comparator_{std::move(comparator)},
      deadline_{deadline},
      upstream_timeout_{upstream_timeout} {
    ensure(!upstreams_.empty(), "FanOut: no upstream");
}

Task<void> FanOut::call_upstream(const rpc::Endpoint& upstream, const nlohmann::json& request, rpc::CallOptions options, UpstreamOutcome& outcome) const {
    const auto start = steady_clock::now();
    try {
        outcome.result = co_await client_->forward(upstream, request, options);
    } catch (const std::exception& e) {
        outcome.result = tl::make_unexpected(rpc::TransportError{.kind = rpc::TransportError::Kind::kConnectionFailed, .message = e.what()});
    }
    outcome.elapsed = std::chrono::duration_cast<milliseconds>(steady_clock::now() - start);
    PROBE_TRACE << "FanOut::call_upstream " << upstream.name() << " completed in " << outcome.elapsed.count() << "ms";
}

Task<FanOutResult> FanOut::dispatch(nlohmann::json request) const {
    const rpc::CallOptions options{
        .timeout = upstream_timeout_,
        .retry = rpc::RetryPolicy::single_attempt(),
        .deadline = steady_clock::now() + deadline_,
    };

    FanOutResult result;
    result.outcomes.resize(upstreams_.size());
    for (size_t i = 0; i < upstreams_.size(); ++i) {
        result.outcomes[i].upstream = upstreams_[i].name();
    }

    co_await concurrency::generate_parallel_group_task(upstreams_.size(), [&](size_t index) {
        return call_upstream(upstreams_[index], request, options, result.outcomes[index]);
    });

    const auto chosen = std::find_if(result.outcomes.begin(), result.outcomes.end(), [](const auto& outcome) { return outcome.result.has_value(); });
    if (chosen == result.outcomes.end()) {
        PROBE_DEBUG << "FanOut::dispatch all " << upstreams_.size() << " upstream(s) failed";
        throw ProxyUpstreamError{std::move(result.outcomes)};
    }
    result.chosen = static_cast<size_t>(std::distance(result.outcomes.begin(), chosen));

    if (strategy_ == FanOutStrategy::kCompare) {
        result.divergence = compare(result);
    }
    co_return result;
}

std::optional<nlohmann::json> FanOut::compare(const FanOutResult& result) const {
    const auto& reference = result.outcomes[result.chosen];
    auto divergent = nlohmann::json::array();
    for (size_t i = 0; i < result.outcomes.size(); ++i) {
        const auto& outcome = result.outcomes[i];
        if (i == result.chosen || !outcome.result) continue;
        if (const auto path = comparator_.first_difference(reference.result->json(), outcome.result->json())) {
            divergent.push_back({{"upstream", outcome.upstream}, {"path", *path}});
        }
    }
    if (divergent.empty()) {
        return std::nullopt;
    }
    PROBE_DEBUG << "FanOut::compare divergence from " << reference.upstream << ": " << divergent.dump();
    return nlohmann::json{{"reference", reference.upstream}, {"divergent", std::move(divergent)}};
}

}  // namespace rpcprobe::proxy
