// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint_options.hpp"

#include <string>

namespace rpcprobe::cmd::common {

//! CLI11 validator for a named target, only checking the <name>=<url> shape (URL is parsed by Endpoint)
struct NamedTargetValidator : public CLI::Validator {
    NamedTargetValidator() {
        func_ = [](const std::string& value) -> std::string {
            const auto separator = value.find('=');
            if (separator == std::string::npos || separator == 0 || separator + 1 == value.size()) {
                return "Value " + value + " is not a valid target, expected <name>=<url>";
            }
            return {};
        };
    }
};

//! CLI11 validator for a static resolve override
struct ResolveOverrideValidator : public CLI::Validator {
    ResolveOverrideValidator() {
        func_ = [](const std::string& value) -> std::string {
            const auto first = value.find(':');
            const auto last = value.rfind(':');
            if (first == std::string::npos || first == last || first == 0 || last + 1 == value.size()) {
                return "Value " + value + " is not a valid override, expected <host>:<port>:<address>";
            }
            return {};
        };
    }
};

CLI::Option* add_option_targets(CLI::App& cli, std::vector<rpc::Endpoint>& targets) {
    return cli
        .add_option_function<std::vector<std::string>>(
            "--target",
            [&targets](const std::vector<std::string>& values) {
                for (const auto& value : values) {
                    targets.push_back(rpc::Endpoint::from_option(value));
                }
            },
            "Node endpoint as <name>=<url> (repeatable), e.g. juno=http://localhost:6060")
        ->check(NamedTargetValidator{});
}

CLI::Option* add_option_resolve(CLI::App& cli, std::vector<rpc::ResolveOverride>& overrides) {
    return cli
        .add_option_function<std::vector<std::string>>(
            "--resolve",
            [&overrides](const std::vector<std::string>& values) {
                for (const auto& value : values) {
                    overrides.push_back(rpc::ResolveOverride::parse(value));
                }
            },
            "Static DNS override as <host>:<port>:<address> (repeatable)")
        ->check(ResolveOverrideValidator{});
}

}  // namespace rpcprobe::cmd::common
