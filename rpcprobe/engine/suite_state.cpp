// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "suite_state.hpp"

#include <absl/strings/str_cat.h>
#include <boost/regex.hpp>

namespace rpcprobe::engine {

static const boost::regex kPlaceholder{R"(\$\{([A-Za-z_][A-Za-z0-9_.\-]*)\})"};

void SuiteState::set(const std::string& name, nlohmann::json value) {
    variables_.insert_or_assign(name, std::move(value));
}

std::optional<nlohmann::json> SuiteState::get(const std::string& name) const {
    const auto it = variables_.find(name);
    if (it == variables_.end()) {
        return std::nullopt;
    }
    return it->second;
}

tl::expected<nlohmann::json, std::string> SuiteState::substitute(const nlohmann::json& value) const {
    if (value.is_string()) {
        return substitute_string(value.get_ref<const std::string&>());
    }
    if (value.is_array()) {
        auto substituted = nlohmann::json::array();
        for (const auto& element : value) {
            auto element_value = substitute(element);
            if (!element_value) return element_value;
            substituted.push_back(std::move(*element_value));
        }
        return substituted;
    }
    if (value.is_object()) {
        auto substituted = nlohmann::json::object();
        for (const auto& [key, element] : value.items()) {
            auto element_value = substitute(element);
            if (!element_value) return element_value;
            substituted[key] = std::move(*element_value);
        }
        return substituted;
    }
    return value;
}

tl::expected<nlohmann::json, std::string> SuiteState::substitute_string(const std::string& text) const {
    boost::smatch match;
    if (boost::regex_match(text, match, kPlaceholder)) {
        const auto name = match[1].str();
        const auto it = variables_.find(name);
        if (it == variables_.end()) {
            return tl::make_unexpected(name);
        }
        return it->second;
    }

    std::string result;
    auto begin = text.cbegin();
    while (boost::regex_search(begin, text.cend(), match, kPlaceholder)) {
        const auto name = match[1].str();
        const auto it = variables_.find(name);
        if (it == variables_.end()) {
            return tl::make_unexpected(name);
        }
        absl::StrAppend(&result, std::string{begin, match[0].first});
        absl::StrAppend(&result, it->second.is_string() ? it->second.get<std::string>() : it->second.dump());
        begin = match[0].second;
    }
    absl::StrAppend(&result, std::string{begin, text.cend()});
    return nlohmann::json(result);
}

std::set<std::string> SuiteState::placeholders(const nlohmann::json& value) {
    std::set<std::string> names;
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        for (boost::sregex_iterator it{text.begin(), text.end(), kPlaceholder}, end; it != end; ++it) {
            names.insert((*it)[1].str());
        }
    } else if (value.is_structured()) {
        for (const auto& element : value) {
            names.merge(placeholders(element));
        }
    }
    return names;
}

}  // namespace rpcprobe::engine
