// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "suite_loader.hpp"

#include <fstream>
#include <map>
#include <set>

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>

namespace rpcprobe::engine {

static const std::set<std::string> kSuiteKeys{"name", "description", "required", "deadline_ms", "setup", "teardown", "cases", "suites"};
static const std::set<std::string> kCaseKeys{
    "name", "description", "method", "params", "param_sets", "expect", "required", "depends_on", "capture", "timeout_ms"};

template <typename T>
static T field(const nlohmann::json& json, const char* key, const std::string& location, T default_value) {
    if (!json.contains(key)) {
        return default_value;
    }
    try {
        return json[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{absl::StrCat(location, ": invalid ", key, ": ", e.what())};
    }
}

static std::chrono::milliseconds duration_field(const nlohmann::json& json, const char* key, const std::string& location,
                                                std::chrono::milliseconds default_value) {
    const auto value = field<uint64_t>(json, key, location, static_cast<uint64_t>(default_value.count()));
    if (value == 0) {
        throw ConfigError{absl::StrCat(location, ": ", key, " must be positive")};
    }
    if (value > static_cast<uint64_t>(kMaxDuration.count())) {
        throw ConfigError{absl::StrCat(location, ": ", key, " exceeds ", kMaxDuration.count(), " ms")};
    }
    return std::chrono::milliseconds{value};
}

static std::string required_string(const nlohmann::json& json, const char* key, const std::string& location) {
    if (!json.contains(key) || !json[key].is_string() || json[key].get_ref<const std::string&>().empty()) {
        throw ConfigError{absl::StrCat(location, ": missing ", key)};
    }
    return json[key].get<std::string>();
}

static void check_pointer(const std::string& pointer, const std::string& location) {
    try {
        [[maybe_unused]] const nlohmann::json::json_pointer json_pointer{pointer};
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{absl::StrCat(location, ": invalid JSON pointer '", pointer, "': ", e.what())};
    }
}

static std::map<std::string, std::string> parse_capture(const nlohmann::json& json, const std::string& location) {
    auto capture = field(json, "capture", location, std::map<std::string, std::string>{});
    for (const auto& [variable, pointer] : capture) {
        check_pointer(pointer, absl::StrCat(location, " capture ", variable));
    }
    return capture;
}

SuiteLoader::SuiteLoader(std::shared_ptr<const validation::Specification> spec) : spec_{std::move(spec)} {}

Suite SuiteLoader::load_file(const std::filesystem::path& path) {
    std::ifstream stream{path};
    if (!stream) {
        throw ConfigError{absl::StrCat("cannot open suite file ", path.string())};
    }
    const auto json = nlohmann::json::parse(stream, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        throw ConfigError{absl::StrCat("suite file ", path.string(), " is not valid JSON")};
    }
    return from_json(json);
}

Suite SuiteLoader::from_json(const nlohmann::json& json) {
    warnings_.clear();
    auto suite = parse_suite(json, "suite");
    suite.validate();
    PROBE_DEBUG << "SuiteLoader: loaded suite " << suite.name << " with " << suite.case_count() << " cases";
    return suite;
}

void SuiteLoader::warn(std::string warning) {
    PROBE_WARN << warning;
    warnings_.push_back(std::move(warning));
}

Suite SuiteLoader::parse_suite(const nlohmann::json& json, const std::string& parent_location) {
    if (!json.is_object()) {
        throw ConfigError{absl::StrCat(parent_location, ": suite must be an object")};
    }
    Suite suite;
    suite.name = required_string(json, "name", parent_location);
    const auto location = absl::StrCat("suite ", suite.name);
    for (const auto& [key, _] : json.items()) {
        if (!kSuiteKeys.contains(key)) warn(absl::StrCat(location, ": unknown key ", key));
    }

    suite.required = field(json, "required", location, true);
    suite.deadline = duration_field(json, "deadline_ms", location, kDefaultSuiteDeadline);

    for (const char* key : {"setup", "teardown"}) {
        const auto hooks = field(json, key, location, nlohmann::json::array());
        if (!hooks.is_array()) {
            throw ConfigError{absl::StrCat(location, ": ", key, " must be an array")};
        }
        auto& target = std::string_view{key} == "setup" ? suite.setup : suite.teardown;
        for (const auto& hook : hooks) {
            target.push_back(parse_hook(hook, absl::StrCat(location, " ", key)));
        }
    }

    const auto cases = field(json, "cases", location, nlohmann::json::array());
    if (!cases.is_array()) {
        throw ConfigError{absl::StrCat(location, ": cases must be an array")};
    }
    std::map<std::string, std::vector<std::string>> expansions;
    for (const auto& case_json : cases) {
        auto expanded = parse_cases(case_json, location);
        if (expanded.size() > 1) {
            auto& names = expansions[case_json["name"].get<std::string>()];
            for (const auto& test_case : expanded) {
                names.push_back(test_case.name);
            }
        }
        for (auto& test_case : expanded) {
            suite.cases.push_back(std::move(test_case));
        }
    }
    // A dependency on a parameterized case means a dependency on all its expansions
    for (auto& test_case : suite.cases) {
        std::vector<std::string> depends_on;
        for (const auto& dependency : test_case.depends_on) {
            const auto it = expansions.find(dependency);
            if (it == expansions.end()) {
                depends_on.push_back(dependency);
            } else {
                depends_on.insert(depends_on.end(), it->second.begin(), it->second.end());
            }
        }
        test_case.depends_on = std::move(depends_on);
    }

    const auto suites = field(json, "suites", location, nlohmann::json::array());
    if (!suites.is_array()) {
        throw ConfigError{absl::StrCat(location, ": suites must be an array")};
    }
    for (const auto& nested : suites) {
        suite.suites.push_back(parse_suite(nested, location));
    }
    return suite;
}

std::vector<Case> SuiteLoader::parse_cases(const nlohmann::json& json, const std::string& suite_location) {
    if (!json.is_object()) {
        throw ConfigError{absl::StrCat(suite_location, ": case must be an object")};
    }
    Case test_case;
    test_case.name = required_string(json, "name", suite_location);
    const auto location = absl::StrCat(suite_location, " case ", test_case.name);
    for (const auto& [key, _] : json.items()) {
        if (!kCaseKeys.contains(key)) warn(absl::StrCat(location, ": unknown key ", key));
    }

    test_case.method = required_string(json, "method", location);
    if (!spec_->find(test_case.method)) {
        throw ConfigError{absl::StrCat(location, ": method ", test_case.method, " not declared by the specification")};
    }
    test_case.params = field(json, "params", location, nlohmann::json::array());
    if (!test_case.params.is_array() && !test_case.params.is_object()) {
        throw ConfigError{absl::StrCat(location, ": params must be an array or an object")};
    }
    test_case.expect = parse_expectation(field(json, "expect", location, nlohmann::json::object()), location);
    test_case.required = field(json, "required", location, true);
    test_case.depends_on = field(json, "depends_on", location, std::vector<std::string>{});
    test_case.capture = parse_capture(json, location);
    if (json.contains("timeout_ms")) {
        test_case.timeout = duration_field(json, "timeout_ms", location, kDefaultTimeout);
    }

    std::vector<Case> cases;
    if (!json.contains("param_sets")) {
        check_params(test_case, location);
        cases.push_back(std::move(test_case));
        return cases;
    }

    if (json.contains("params")) {
        throw ConfigError{absl::StrCat(location, ": params and param_sets are mutually exclusive")};
    }
    const auto& param_sets = json["param_sets"];
    if (!param_sets.is_array() || param_sets.empty()) {
        throw ConfigError{absl::StrCat(location, ": param_sets must be a non-empty array")};
    }
    for (size_t i = 0; i < param_sets.size(); ++i) {
        if (!param_sets[i].is_array() && !param_sets[i].is_object()) {
            throw ConfigError{absl::StrCat(location, ": param set ", i, " must be an array or an object")};
        }
        Case expanded{test_case};
        expanded.name = absl::StrCat(test_case.name, "[", i, "]");
        expanded.params = param_sets[i];
        check_params(expanded, absl::StrCat(suite_location, " case ", expanded.name));
        cases.push_back(std::move(expanded));
    }
    return cases;
}

Hook SuiteLoader::parse_hook(const nlohmann::json& json, const std::string& suite_location) const {
    if (!json.is_object()) {
        throw ConfigError{absl::StrCat(suite_location, ": hook must be an object")};
    }
    Hook hook;
    hook.name = required_string(json, "name", suite_location);
    const auto location = absl::StrCat(suite_location, " hook ", hook.name);
    if (json.contains("rpc") == json.contains("fixture")) {
        throw ConfigError{absl::StrCat(location, ": exactly one of rpc and fixture is required")};
    }
    if (json.contains("rpc")) {
        const auto& rpc = json["rpc"];
        if (!rpc.is_object()) {
            throw ConfigError{absl::StrCat(location, ": rpc must be an object")};
        }
        hook.kind = Hook::Kind::kRpc;
        hook.method = required_string(rpc, "method", location);
        hook.params = field(rpc, "params", location, nlohmann::json::array());
        if (!hook.params.is_array() && !hook.params.is_object()) {
            throw ConfigError{absl::StrCat(location, ": params must be an array or an object")};
        }
    } else {
        hook.kind = Hook::Kind::kFixture;
        hook.fixture = FixtureInvocation::from_json(json["fixture"]);
    }
    hook.capture = parse_capture(json, location);
    return hook;
}

Expectation SuiteLoader::parse_expectation(const nlohmann::json& json, const std::string& location) const {
    if (!json.is_object()) {
        throw ConfigError{absl::StrCat(location, ": expect must be an object")};
    }
    Expectation expectation;
    if (json.contains("error_code")) {
        expectation.outcome = Expectation::Outcome::kError;
        expectation.error_code = field<int64_t>(json, "error_code", location, 0);
    }
    const auto outcome = field(json, "outcome", location, std::string{});
    if (outcome == "success") {
        expectation.outcome = Expectation::Outcome::kSuccess;
    } else if (outcome == "error") {
        expectation.outcome = Expectation::Outcome::kError;
    } else if (outcome == "any") {
        expectation.outcome = Expectation::Outcome::kAny;
    } else if (!outcome.empty()) {
        throw ConfigError{absl::StrCat(location, ": unknown expected outcome ", outcome)};
    }
    if (expectation.error_code && expectation.outcome != Expectation::Outcome::kError) {
        throw ConfigError{absl::StrCat(location, ": error_code requires the error outcome")};
    }

    const auto equals = field(json, "equals", location, nlohmann::json::object());
    if (!equals.is_object()) {
        throw ConfigError{absl::StrCat(location, ": equals must be an object")};
    }
    for (const auto& [pointer, value] : equals.items()) {
        check_pointer(pointer, location);
        expectation.equals.emplace(pointer, value);
    }
    if (!expectation.equals.empty() && expectation.outcome == Expectation::Outcome::kError) {
        throw ConfigError{absl::StrCat(location, ": equals cannot be checked on error responses")};
    }
    return expectation;
}

void SuiteLoader::check_params(const Case& test_case, const std::string& location) {
    // Placeholders are resolved at run time only
    if (!SuiteState::placeholders(test_case.params).empty()) {
        return;
    }
    const auto outcome = validator_.validate_params(spec_->method(test_case.method), test_case.params);
    for (const auto& violation : outcome.violations()) {
        warn(absl::StrCat(location, ": params do not match ", test_case.method, " declaration: ", validation::to_string(violation)));
    }
}

}  // namespace rpcprobe::engine
