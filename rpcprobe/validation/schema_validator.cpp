// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "schema_validator.hpp"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <boost/regex.hpp>

#include <rpcprobe/infra/common/ensure.hpp>

#include "felt.hpp"

namespace rpcprobe::validation {

static constexpr size_t kMaxExcerpt{120};
static constexpr int kMaxDepth{256};

struct SchemaValidator::Context {
    const SchemaRegistry& registry;
    ValidationOutcome& outcome;
    int depth{0};
};

static std::string excerpt(const nlohmann::json& value) {
    auto text = value.dump();
    if (text.size() > kMaxExcerpt) {
        text.resize(kMaxExcerpt);
        text += "...";
    }
    return text;
}

static std::string type_name(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    return value.type_name();
}

static bool fail(ValidationOutcome& outcome, const std::string& path, std::string expected, std::string actual) {
    outcome.add(Violation{.path = path, .expected = std::move(expected), .actual = std::move(actual)});
    return false;
}

static std::string child_path(const std::string& path, std::string_view token) {
    std::string escaped;
    for (const char c : token) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped += c;
        }
    }
    return absl::StrCat(path, "/", escaped);
}

static std::string child_path(const std::string& path, size_t index) {
    return absl::StrCat(path, "/", index);
}

std::set<std::string> SchemaValidator::default_felt_schemas() {
    return {"FELT", "ADDRESS", "BLOCK_HASH", "TXN_HASH", "CHAIN_ID", "STORAGE_KEY", "CONTRACT_ADDRESS"};
}

SchemaValidator::SchemaValidator(std::set<std::string> felt_schemas) : felt_schemas_{std::move(felt_schemas)} {}

ValidationOutcome SchemaValidator::validate(
    const MethodSpec& method_spec,
    const json_rpc::Response& response,
    ValidationMode mode) const {
    ensure(method_spec.registry != nullptr, "SchemaValidator::validate: method spec without registry");

    ValidationOutcome outcome{mode};
    Context context{*method_spec.registry, outcome};
    switch (response.kind()) {
        case json_rpc::Response::Kind::kResult:
            if (!method_spec.result_schema.is_null()) {
                validate_schema(context, response.result(), method_spec.result_schema, "/result");
            }
            break;
        case json_rpc::Response::Kind::kError: {
            const auto& error = response.error();
            if (!error.is_object()) {
                fail(outcome, "/error", "object", type_name(error));
                break;
            }
            const auto code = error.find("code");
            if (code == error.end()) {
                fail(outcome, "/error/code", "integer", "missing");
            } else if (!code->is_number_integer()) {
                fail(outcome, "/error/code", "integer", type_name(*code));
            }
            const auto message = error.find("message");
            if (message == error.end()) {
                fail(outcome, "/error/message", "string", "missing");
            } else if (!message->is_string()) {
                fail(outcome, "/error/message", "string", type_name(*message));
            }
            break;
        }
        case json_rpc::Response::Kind::kBatch:
            fail(outcome, "", "single response", "batch");
            break;
    }
    return outcome;
}

ValidationOutcome SchemaValidator::validate_params(
    const MethodSpec& method_spec,
    const nlohmann::json& params,
    ValidationMode mode) const {
    ensure(method_spec.registry != nullptr, "SchemaValidator::validate_params: method spec without registry");

    ValidationOutcome outcome{mode};
    Context context{*method_spec.registry, outcome};
    const std::string path{"/params"};

    if (params.is_null() || params.is_array()) {
        const size_t count = params.is_null() ? 0 : params.size();
        if (count > method_spec.params.size()) {
            fail(outcome, path, absl::StrCat("at most ", method_spec.params.size(), " params"), absl::StrCat(count));
        }
        for (size_t i = 0; i < method_spec.params.size() && !outcome.saturated(); ++i) {
            const auto& param = method_spec.params[i];
            if (i >= count) {
                if (param.required) {
                    fail(outcome, child_path(path, i), absl::StrCat("required param ", param.name), "missing");
                }
                continue;
            }
            validate_schema(context, params[i], param.schema, child_path(path, i));
        }
    } else if (params.is_object()) {
        for (const auto& param : method_spec.params) {
            if (outcome.saturated()) break;
            const auto it = params.find(param.name);
            if (it == params.end()) {
                if (param.required) {
                    fail(outcome, child_path(path, param.name), absl::StrCat("required param ", param.name), "missing");
                }
                continue;
            }
            validate_schema(context, *it, param.schema, child_path(path, param.name));
        }
        for (const auto& [name, _] : params.items()) {
            const bool known = std::any_of(method_spec.params.begin(), method_spec.params.end(),
                                           [&](const ParamSpec& param) { return param.name == name; });
            if (!known) {
                fail(outcome, child_path(path, name), "declared param", "unknown param " + name);
            }
        }
    } else {
        fail(outcome, path, "array or object", type_name(params));
    }
    return outcome;
}

ValidationOutcome SchemaValidator::validate_value(
    const SchemaRegistry& registry,
    const nlohmann::json& value,
    const nlohmann::json& schema,
    const std::string& path,
    ValidationMode mode) const {
    ValidationOutcome outcome{mode};
    Context context{registry, outcome};
    validate_schema(context, value, schema, path);
    return outcome;
}

bool SchemaValidator::validate_schema(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const {
    if (context.outcome.saturated()) {
        return false;
    }
    if (schema.is_boolean()) {
        return schema.get<bool>() || fail(context.outcome, path, "nothing (false schema)", excerpt(value));
    }
    if (!schema.is_object()) {
        return true;
    }
    if (context.depth >= kMaxDepth) {
        return fail(context.outcome, path, "schema nesting within limits", "too deep");
    }
    ++context.depth;

    bool valid{true};
    if (const auto ref = schema.find("$ref"); ref != schema.end() && ref->is_string()) {
        const auto& ref_text = ref->get_ref<const std::string&>();
        const bool ref_valid = validate_schema(context, value, context.registry.resolve(ref_text), path);
        valid = ref_valid && valid;
        const auto name = SchemaRegistry::ref_name(ref_text);
        if (ref_valid && value.is_string() && felt_schemas_.contains(name) && !is_felt(value.get_ref<const std::string&>())) {
            valid = fail(context.outcome, path, absl::StrCat(name, " lower than field prime"), excerpt(value));
        }
    }
    if (const auto type = schema.find("type"); type != schema.end()) {
        valid = validate_type(context, value, *type, path) && valid;
    }
    if (const auto values = schema.find("enum"); values != schema.end() && values->is_array()) {
        if (std::find(values->begin(), values->end(), value) == values->end()) {
            valid = fail(context.outcome, path, absl::StrCat("one of ", values->dump()), excerpt(value));
        }
    }
    if (const auto constant = schema.find("const"); constant != schema.end() && *constant != value) {
        valid = fail(context.outcome, path, constant->dump(), excerpt(value));
    }
    if (const auto all_of = schema.find("allOf"); all_of != schema.end() && all_of->is_array()) {
        for (const auto& sub_schema : *all_of) {
            valid = validate_schema(context, value, sub_schema, path) && valid;
        }
    }
    if (const auto any_of = schema.find("anyOf"); any_of != schema.end() && any_of->is_array()) {
        valid = validate_alternatives(context, value, *any_of, "anyOf", path) && valid;
    }
    if (const auto one_of = schema.find("oneOf"); one_of != schema.end() && one_of->is_array()) {
        valid = validate_alternatives(context, value, *one_of, "oneOf", path) && valid;
    }
    if (const auto negated = schema.find("not"); negated != schema.end()) {
        ValidationOutcome scratch{ValidationMode::kFirst};
        Context scratch_context{context.registry, scratch, context.depth};
        if (validate_schema(scratch_context, value, *negated, path)) {
            valid = fail(context.outcome, path, absl::StrCat("not ", negated->dump()), excerpt(value));
        }
    }

    if (value.is_string()) {
        valid = validate_string(context, value, schema, path) && valid;
    } else if (value.is_number()) {
        valid = validate_number(context, value, schema, path) && valid;
    } else if (value.is_object()) {
        valid = validate_object(context, value, schema, path) && valid;
    } else if (value.is_array()) {
        valid = validate_array(context, value, schema, path) && valid;
    }

    --context.depth;
    return valid;
}

bool SchemaValidator::validate_type(Context& context, const nlohmann::json& value, const nlohmann::json& type, const std::string& path) const {
    auto matches = [&](const std::string& name) {
        if (name == "string") return value.is_string();
        if (name == "integer") return value.is_number_integer();
        if (name == "number") return value.is_number();
        if (name == "object") return value.is_object();
        if (name == "array") return value.is_array();
        if (name == "boolean") return value.is_boolean();
        if (name == "null") return value.is_null();
        return false;
    };

    if (type.is_string()) {
        if (matches(type.get<std::string>())) return true;
        return fail(context.outcome, path, type.get<std::string>(), type_name(value));
    }
    if (type.is_array()) {
        std::vector<std::string> names;
        for (const auto& element : type) {
            if (!element.is_string()) continue;
            if (matches(element.get<std::string>())) return true;
            names.push_back(element.get<std::string>());
        }
        return fail(context.outcome, path, absl::StrJoin(names, " or "), type_name(value));
    }
    return true;
}

bool SchemaValidator::validate_string(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const {
    const auto& text = value.get_ref<const std::string&>();
    bool valid{true};
    if (const auto pattern = schema.find("pattern"); pattern != schema.end() && pattern->is_string()) {
        const auto& pattern_text = pattern->get_ref<const std::string&>();
        const auto* regex = context.registry.pattern(pattern_text);
        if (!regex) {
            valid = fail(context.outcome, path, absl::StrCat("prebuilt pattern ", pattern_text), "pattern not found");
        } else if (!boost::regex_search(text, *regex)) {
            valid = fail(context.outcome, path, absl::StrCat("string matching ", pattern_text), excerpt(value));
        }
    }
    if (const auto min_length = schema.find("minLength"); min_length != schema.end() && min_length->is_number_unsigned()) {
        if (text.size() < min_length->get<size_t>()) {
            valid = fail(context.outcome, path, absl::StrCat("length >= ", min_length->get<size_t>()), excerpt(value));
        }
    }
    if (const auto max_length = schema.find("maxLength"); max_length != schema.end() && max_length->is_number_unsigned()) {
        if (text.size() > max_length->get<size_t>()) {
            valid = fail(context.outcome, path, absl::StrCat("length <= ", max_length->get<size_t>()), excerpt(value));
        }
    }
    return valid;
}

bool SchemaValidator::validate_number(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const {
    bool valid{true};
    const auto number = value.get<double>();
    if (const auto minimum = schema.find("minimum"); minimum != schema.end() && minimum->is_number()) {
        if (number < minimum->get<double>()) {
            valid = fail(context.outcome, path, absl::StrCat(">= ", minimum->dump()), excerpt(value));
        }
    }
    if (const auto maximum = schema.find("maximum"); maximum != schema.end() && maximum->is_number()) {
        if (number > maximum->get<double>()) {
            valid = fail(context.outcome, path, absl::StrCat("<= ", maximum->dump()), excerpt(value));
        }
    }
    return valid;
}

bool SchemaValidator::validate_object(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const {
    bool valid{true};
    if (const auto required = schema.find("required"); required != schema.end() && required->is_array()) {
        for (const auto& field : *required) {
            if (!field.is_string()) continue;
            const auto& name = field.get_ref<const std::string&>();
            if (!value.contains(name)) {
                valid = fail(context.outcome, child_path(path, name), "required field", "missing");
            }
        }
    }
    // Unknown fields are tolerated
    if (const auto properties = schema.find("properties"); properties != schema.end() && properties->is_object()) {
        for (const auto& [name, field_value] : value.items()) {
            if (context.outcome.saturated()) break;
            if (const auto property = properties->find(name); property != properties->end()) {
                valid = validate_schema(context, field_value, *property, child_path(path, name)) && valid;
            }
        }
    }
    return valid;
}

bool SchemaValidator::validate_array(Context& context, const nlohmann::json& value, const nlohmann::json& schema, const std::string& path) const {
    bool valid{true};
    if (const auto min_items = schema.find("minItems"); min_items != schema.end() && min_items->is_number_unsigned()) {
        if (value.size() < min_items->get<size_t>()) {
            valid = fail(context.outcome, path, absl::StrCat("at least ", min_items->get<size_t>(), " items"), absl::StrCat(value.size()));
        }
    }
    if (const auto max_items = schema.find("maxItems"); max_items != schema.end() && max_items->is_number_unsigned()) {
        if (value.size() > max_items->get<size_t>()) {
            valid = fail(context.outcome, path, absl::StrCat("at most ", max_items->get<size_t>(), " items"), absl::StrCat(value.size()));
        }
    }
    if (const auto items = schema.find("items"); items != schema.end()) {
        for (size_t i = 0; i < value.size() && !context.outcome.saturated(); ++i) {
            valid = validate_schema(context, value[i], *items, child_path(path, i)) && valid;
        }
    }
    return valid;
}

bool SchemaValidator::validate_alternatives(
    Context& context,
    const nlohmann::json& value,
    const nlohmann::json& alternatives,
    const std::string& keyword,
    const std::string& path) const {
    // At least one alternative must hold: unknown extra fields are tolerated, so oneOf exclusivity is not enforced
    std::vector<std::string> titles;
    for (const auto& alternative : alternatives) {
        ValidationOutcome scratch{ValidationMode::kFirst};
        Context scratch_context{context.registry, scratch, context.depth};
        if (validate_schema(scratch_context, value, alternative, path)) {
            return true;
        }
        if (alternative.contains("title") && alternative["title"].is_string()) {
            titles.push_back(alternative["title"].get<std::string>());
        } else if (alternative.contains("$ref") && alternative["$ref"].is_string()) {
            titles.push_back(SchemaRegistry::ref_name(alternative["$ref"].get<std::string>()));
        }
    }
    auto expected = absl::StrCat("value matching ", keyword, " alternatives");
    if (!titles.empty()) {
        absl::StrAppend(&expected, " [", absl::StrJoin(titles, ", "), "]");
    }
    return fail(context.outcome, path, std::move(expected), excerpt(value));
}

}  // namespace rpcprobe::validation
