// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "case.hpp"
#include "fixture_tool.hpp"

namespace rpcprobe::engine {

inline constexpr std::chrono::milliseconds kDefaultSuiteDeadline{300'000};
//! Upper bound of suite deadlines and case timeouts read from suite files
inline constexpr std::chrono::milliseconds kMaxDuration{std::chrono::hours{24 * 7}};

//! Setup or teardown step of a suite
struct Hook {
    enum class Kind {
        kRpc,      // RPC call to the target
        kFixture,  // external fixture tool invocation
    };

    std::string name;
    Kind kind{Kind::kRpc};
    std::string method;
    nlohmann::json params{nlohmann::json::array()};
    FixtureInvocation fixture;
    //! Suite variables assigned from JSON pointers of the RPC result or of the fixture output
    std::map<std::string, std::string> capture;
};

std::string_view to_string(Hook::Kind kind);

//! Hierarchical group of cases sharing hooks, state and a deadline
struct Suite {
    std::string name;
    bool required{true};
    std::chrono::milliseconds deadline{kDefaultSuiteDeadline};
    std::vector<Hook> setup;
    std::vector<Hook> teardown;
    std::vector<Case> cases;
    std::vector<Suite> suites;

    /**
     * Case indices grouped by dependency level (Kahn topological sort): cases of a level depend only on cases
     * of previous levels. Within a level indices keep the declaration order.
     * Throw ConfigError on duplicate names, unknown dependencies and cycles.
     */
    std::vector<std::vector<size_t>> dependency_levels() const;

    //! Check the whole tree, throw ConfigError at the first malformed suite
    void validate() const;

    //! Number of cases in the whole tree
    size_t case_count() const;
};

}  // namespace rpcprobe::engine
