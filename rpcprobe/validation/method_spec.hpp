// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

namespace rpcprobe::validation {

/**
 * Set of OpenRPC documents addressable by file name.
 *
 * At load every "$ref" is rewritten in the absolute form <document>#<json-pointer> and checked to point to an
 * existing node, so that resolution does not depend anymore on the document containing the reference.
 * Every "pattern" keyword is compiled once.
 */
class SchemaRegistry {
  public:
    //! Provide a document referenced but not loaded yet, by file name
    using DocumentLoader = std::function<std::optional<nlohmann::json>(const std::string& name)>;

    void add_document(const std::string& name, nlohmann::json document);

    //! Rewrite references and compile patterns, throw ConfigError on dangling references or invalid patterns
    void finalize(const DocumentLoader& loader = {});

    const std::map<std::string, nlohmann::json>& documents() const { return documents_; }

    //! The schema pointed to by an absolute reference, throw ConfigError if missing
    const nlohmann::json& resolve(const std::string& ref) const;

    //! The compiled pattern or nullptr if not found at load
    const boost::regex* pattern(const std::string& text) const;

    //! Last token of the reference pointer, e.g. FELT for starknet_api_openrpc.json#/components/schemas/FELT
    static std::string ref_name(std::string_view ref);

  private:
    std::string canonical_ref(const std::string& document, const std::string& ref) const;
    void rewrite_refs(const std::string& document, nlohmann::json& node, std::set<std::string>& referenced) const;
    void compile_patterns(const nlohmann::json& node);

    std::map<std::string, nlohmann::json> documents_;
    std::map<std::string, boost::regex> patterns_;
};

struct ParamSpec {
    std::string name;
    nlohmann::json schema;
    bool required{false};
};

//! Contract of one RPC method as declared by the OpenRPC specification
struct MethodSpec {
    std::string name;
    std::string document;
    std::vector<ParamSpec> params;
    //! Null when the method declares no result
    nlohmann::json result_schema;
    //! Declared error codes mapped to their message
    std::map<int64_t, std::string> errors;
    std::shared_ptr<const SchemaRegistry> registry;

    bool declares_error(int64_t code) const { return errors.contains(code); }
};

class Specification {
  public:
    //! Load one or more OpenRPC documents, referenced sibling documents are looked up beside them
    static std::shared_ptr<const Specification> load_files(const std::vector<std::filesystem::path>& paths);
    static std::shared_ptr<const Specification> load_file(const std::filesystem::path& path);

    //! Build from an in-memory document, optionally with its sibling documents by file name
    static std::shared_ptr<const Specification> from_json(
        const nlohmann::json& document,
        const std::string& name = "openrpc.json",
        const std::map<std::string, nlohmann::json>& siblings = {});

    const MethodSpec* find(std::string_view method) const;

    //! The method contract, throw ConfigError if not declared
    const MethodSpec& method(std::string_view method) const;

    std::vector<std::string> method_names() const;

    const std::string& openrpc_version() const { return openrpc_version_; }
    const SchemaRegistry& registry() const { return *registry_; }

  private:
    Specification() = default;

    static std::shared_ptr<const Specification> build(
        std::shared_ptr<SchemaRegistry> registry,
        const std::vector<std::string>& primary_documents,
        const SchemaRegistry::DocumentLoader& loader);

    MethodSpec parse_method(const std::string& document, const nlohmann::json& method) const;

    std::string openrpc_version_;
    std::shared_ptr<SchemaRegistry> registry_;
    std::map<std::string, MethodSpec, std::less<>> methods_;
};

}  // namespace rpcprobe::validation
