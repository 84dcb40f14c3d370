// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "suite.hpp"

#include <algorithm>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <rpcprobe/infra/common/config_error.hpp>

namespace rpcprobe::engine {

std::string_view to_string(Hook::Kind kind) {
    switch (kind) {
        case Hook::Kind::kRpc:
            return "rpc";
        case Hook::Kind::kFixture:
            return "fixture";
    }
    return "unknown";
}

std::vector<std::vector<size_t>> Suite::dependency_levels() const {
    std::map<std::string, size_t, std::less<>> index_by_name;
    for (size_t i = 0; i < cases.size(); ++i) {
        if (!index_by_name.emplace(cases[i].name, i).second) {
            throw ConfigError{absl::StrCat("suite ", name, " has duplicate case ", cases[i].name)};
        }
    }

    std::vector<size_t> in_degree(cases.size(), 0);
    std::vector<std::vector<size_t>> dependents(cases.size());
    for (size_t i = 0; i < cases.size(); ++i) {
        const std::set<std::string> dependencies{cases[i].depends_on.begin(), cases[i].depends_on.end()};
        for (const auto& dependency : dependencies) {
            const auto it = index_by_name.find(dependency);
            if (it == index_by_name.end()) {
                throw ConfigError{absl::StrCat("case ", cases[i].name, " in suite ", name, " depends on unknown case ", dependency)};
            }
            if (it->second == i) {
                throw ConfigError{absl::StrCat("case ", cases[i].name, " in suite ", name, " depends on itself")};
            }
            dependents[it->second].push_back(i);
            ++in_degree[i];
        }
    }

    std::vector<std::vector<size_t>> levels;
    std::vector<size_t> current;
    for (size_t i = 0; i < cases.size(); ++i) {
        if (in_degree[i] == 0) current.push_back(i);
    }
    size_t sorted{0};
    while (!current.empty()) {
        sorted += current.size();
        std::vector<size_t> next;
        for (const auto index : current) {
            for (const auto dependent : dependents[index]) {
                if (--in_degree[dependent] == 0) {
                    next.push_back(dependent);
                }
            }
        }
        std::sort(next.begin(), next.end());
        levels.push_back(std::move(current));
        current = std::move(next);
    }

    if (sorted != cases.size()) {
        std::vector<std::string> cyclic;
        for (size_t i = 0; i < cases.size(); ++i) {
            if (in_degree[i] > 0) cyclic.push_back(cases[i].name);
        }
        throw ConfigError{absl::StrCat("suite ", name, " has cyclic dependencies among cases: ", absl::StrJoin(cyclic, ", "))};
    }
    return levels;
}

void Suite::validate() const {
    if (name.empty()) {
        throw ConfigError{"suite without name"};
    }
    dependency_levels();

    std::set<std::string> suite_names;
    for (const auto& suite : suites) {
        if (!suite_names.insert(suite.name).second) {
            throw ConfigError{absl::StrCat("suite ", name, " has duplicate nested suite ", suite.name)};
        }
        suite.validate();
    }
}

size_t Suite::case_count() const {
    size_t count{cases.size()};
    for (const auto& suite : suites) {
        count += suite.case_count();
    }
    return count;
}

}  // namespace rpcprobe::engine
