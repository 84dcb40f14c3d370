// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "method_spec.hpp"

#include <catch2/catch.hpp>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/test_util/temporary_file.hpp>
#include <rpcprobe/validation/test_util/sample_specification.hpp>

namespace rpcprobe::validation {

TEST_CASE("Specification::from_json", "[validation][method_spec]") {
    const auto spec = test_util::sample_specification();

    CHECK(spec->openrpc_version() == "1.0.0-rc1");
    CHECK(spec->method_names().size() == 6);
    CHECK(spec->find("starknet_chainId") != nullptr);
    CHECK(spec->find("starknet_traceTransaction") == nullptr);
    CHECK_THROWS_AS(spec->method("starknet_traceTransaction"), ConfigError);

    SECTION("params") {
        const auto& method = spec->method("starknet_getStorageAt");
        REQUIRE(method.params.size() == 3);
        CHECK(method.params[0].name == "contract_address");
        CHECK(method.params[0].required);
        CHECK(method.params[0].schema == R"({"$ref":"starknet_api_openrpc.json#/components/schemas/ADDRESS"})"_json);
        CHECK(method.params[2].name == "block_id");
    }
    SECTION("declared errors resolved through references") {
        const auto& method = spec->method("starknet_getStorageAt");
        CHECK(method.errors.size() == 2);
        CHECK(method.declares_error(20));
        CHECK(method.declares_error(24));
        CHECK_FALSE(method.declares_error(32));
        CHECK(method.errors.at(24) == "Block not found");
    }
    SECTION("result schema") {
        const auto& method = spec->method("starknet_blockNumber");
        CHECK(method.result_schema == R"({"$ref":"starknet_api_openrpc.json#/components/schemas/BLOCK_NUMBER"})"_json);
        CHECK(method.registry->resolve(method.result_schema["$ref"].get<std::string>()) == R"({"type":"integer","minimum":0})"_json);
    }
}

TEST_CASE("Specification::from_json sibling documents", "[validation][method_spec]") {
    const auto api = R"({
        "openrpc": "1.0.0",
        "methods": [{
            "name": "starknet_getNonce",
            "params": [],
            "result": {"name": "result", "schema": {"$ref": "./api/starknet_api_openrpc.json#/components/schemas/FELT"}},
            "errors": [{"$ref": "./api/starknet_api_openrpc.json#/components/errors/CONTRACT_NOT_FOUND"}]
        }]
    })"_json;
    const std::map<std::string, nlohmann::json> siblings{{"starknet_api_openrpc.json", test_util::sample_openrpc_document()}};

    const auto spec = Specification::from_json(api, "starknet_write_api.json", siblings);
    const auto& method = spec->method("starknet_getNonce");
    CHECK(method.result_schema == R"({"$ref":"starknet_api_openrpc.json#/components/schemas/FELT"})"_json);
    CHECK(method.declares_error(20));
    // Methods of sibling documents are not part of the specification
    CHECK(spec->find("starknet_chainId") == nullptr);
    CHECK(spec->registry().pattern("^0x[a-fA-F0-9]+$") != nullptr);
}

TEST_CASE("Specification::from_json errors", "[validation][method_spec]") {
    SECTION("dangling reference") {
        const auto doc = R"({"methods":[{"name":"m","result":{"name":"r","schema":{"$ref":"#/components/schemas/MISSING"}}}]})"_json;
        CHECK_THROWS_AS(Specification::from_json(doc), ConfigError);
    }
    SECTION("missing sibling document") {
        const auto doc = R"({"methods":[{"name":"m","result":{"name":"r","schema":{"$ref":"other.json#/components/schemas/FELT"}}}]})"_json;
        CHECK_THROWS_AS(Specification::from_json(doc), ConfigError);
    }
    SECTION("duplicate method") {
        const auto doc = R"({"methods":[{"name":"m"},{"name":"m"}]})"_json;
        CHECK_THROWS_AS(Specification::from_json(doc), ConfigError);
    }
    SECTION("invalid pattern") {
        const auto doc = R"({"methods":[{"name":"m","result":{"name":"r","schema":{"type":"string","pattern":"^(0x"}}}]})"_json;
        CHECK_THROWS_AS(Specification::from_json(doc), ConfigError);
    }
    SECTION("method without name") {
        const auto doc = R"({"methods":[{"params":[]}]})"_json;
        CHECK_THROWS_AS(Specification::from_json(doc), ConfigError);
    }
    SECTION("not an object") {
        CHECK_THROWS_AS(Specification::from_json(R"([1, 2])"_json), ConfigError);
    }
}

TEST_CASE("Specification::load_file", "[validation][method_spec]") {
    SECTION("valid file") {
        rpcprobe::test_util::TemporaryFile file;
        file.write(test_util::sample_openrpc_document().dump());
        const auto spec = Specification::load_file(file.path());
        CHECK(spec->find("getBlockByNumber") != nullptr);
    }
    SECTION("invalid JSON") {
        rpcprobe::test_util::TemporaryFile file;
        file.write("{\"methods\": [");
        CHECK_THROWS_AS(Specification::load_file(file.path()), ConfigError);
    }
    SECTION("missing file") {
        CHECK_THROWS_AS(Specification::load_file("/nonexistent/starknet_api_openrpc.json"), ConfigError);
    }
}

TEST_CASE("SchemaRegistry::ref_name", "[validation][method_spec]") {
    CHECK(SchemaRegistry::ref_name("starknet_api_openrpc.json#/components/schemas/FELT") == "FELT");
    CHECK(SchemaRegistry::ref_name("#/components/schemas/BLOCK_HASH") == "BLOCK_HASH");
    CHECK(SchemaRegistry::ref_name("FELT").empty());
}

}  // namespace rpcprobe::validation
