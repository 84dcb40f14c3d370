// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include <rpcprobe/validation/method_spec.hpp>

namespace rpcprobe::validation::test_util {

//! Reduced Starknet node OpenRPC document plus a generic getBlockByNumber method
inline nlohmann::json sample_openrpc_document() {
    return R"json({
        "openrpc": "1.0.0-rc1",
        "info": {"title": "Starknet Node API", "version": "0.7.1"},
        "methods": [
            {
                "name": "starknet_chainId",
                "params": [],
                "result": {"name": "result", "schema": {"$ref": "#/components/schemas/CHAIN_ID"}}
            },
            {
                "name": "starknet_blockNumber",
                "params": [],
                "result": {"name": "result", "schema": {"$ref": "#/components/schemas/BLOCK_NUMBER"}},
                "errors": [{"$ref": "#/components/errors/NO_BLOCKS"}]
            },
            {
                "name": "starknet_blockHashAndNumber",
                "params": [],
                "result": {
                    "name": "result",
                    "schema": {
                        "type": "object",
                        "properties": {
                            "block_hash": {"$ref": "#/components/schemas/BLOCK_HASH"},
                            "block_number": {"$ref": "#/components/schemas/BLOCK_NUMBER"}
                        },
                        "required": ["block_hash", "block_number"]
                    }
                },
                "errors": [{"$ref": "#/components/errors/NO_BLOCKS"}]
            },
            {
                "name": "starknet_getBlockWithTxHashes",
                "params": [{"name": "block_id", "required": true, "schema": {"$ref": "#/components/schemas/BLOCK_ID"}}],
                "result": {"name": "result", "schema": {"$ref": "#/components/schemas/BLOCK_WITH_TX_HASHES"}},
                "errors": [{"$ref": "#/components/errors/BLOCK_NOT_FOUND"}]
            },
            {
                "name": "starknet_getStorageAt",
                "params": [
                    {"name": "contract_address", "required": true, "schema": {"$ref": "#/components/schemas/ADDRESS"}},
                    {"name": "key", "required": true, "schema": {"$ref": "#/components/schemas/STORAGE_KEY"}},
                    {"name": "block_id", "required": true, "schema": {"$ref": "#/components/schemas/BLOCK_ID"}}
                ],
                "result": {"name": "result", "schema": {"$ref": "#/components/schemas/FELT"}},
                "errors": [
                    {"$ref": "#/components/errors/CONTRACT_NOT_FOUND"},
                    {"$ref": "#/components/errors/BLOCK_NOT_FOUND"}
                ]
            },
            {
                "name": "getBlockByNumber",
                "params": [{"name": "block_id", "required": true, "schema": {"$ref": "#/components/schemas/BLOCK_ID"}}],
                "result": {
                    "name": "result",
                    "schema": {
                        "type": "object",
                        "properties": {
                            "block_hash": {"$ref": "#/components/schemas/BLOCK_HASH"},
                            "block_number": {"$ref": "#/components/schemas/BLOCK_NUMBER"}
                        },
                        "required": ["block_hash", "block_number"]
                    }
                },
                "errors": [{"$ref": "#/components/errors/BLOCK_NOT_FOUND"}]
            }
        ],
        "components": {
            "schemas": {
                "FELT": {"type": "string", "title": "Field element", "pattern": "^0x(0|[a-fA-F1-9]{1}[a-fA-F0-9]{0,62})$"},
                "ADDRESS": {"$ref": "#/components/schemas/FELT"},
                "BLOCK_HASH": {"$ref": "#/components/schemas/FELT"},
                "TXN_HASH": {"$ref": "#/components/schemas/FELT"},
                "STORAGE_KEY": {"type": "string", "pattern": "^0x(0|[0-7]{1}[a-fA-F0-9]{0,62}$)"},
                "CHAIN_ID": {"type": "string", "pattern": "^0x[a-fA-F0-9]+$"},
                "BLOCK_NUMBER": {"type": "integer", "minimum": 0},
                "BLOCK_TAG": {"type": "string", "enum": ["latest", "pending"]},
                "BLOCK_STATUS": {"type": "string", "enum": ["PENDING", "ACCEPTED_ON_L2", "ACCEPTED_ON_L1", "REJECTED"]},
                "BLOCK_ID": {
                    "oneOf": [
                        {
                            "title": "Block hash",
                            "type": "object",
                            "properties": {"block_hash": {"$ref": "#/components/schemas/BLOCK_HASH"}},
                            "required": ["block_hash"]
                        },
                        {
                            "title": "Block number",
                            "type": "object",
                            "properties": {"block_number": {"$ref": "#/components/schemas/BLOCK_NUMBER"}},
                            "required": ["block_number"]
                        },
                        {"title": "Block tag", "$ref": "#/components/schemas/BLOCK_TAG"}
                    ]
                },
                "BLOCK_HEADER": {
                    "type": "object",
                    "properties": {
                        "block_hash": {"$ref": "#/components/schemas/BLOCK_HASH"},
                        "parent_hash": {"$ref": "#/components/schemas/BLOCK_HASH"},
                        "block_number": {"$ref": "#/components/schemas/BLOCK_NUMBER"},
                        "timestamp": {"type": "integer", "minimum": 0},
                        "sequencer_address": {"$ref": "#/components/schemas/FELT"}
                    },
                    "required": ["block_hash", "parent_hash", "block_number", "timestamp"]
                },
                "BLOCK_WITH_TX_HASHES": {
                    "allOf": [
                        {"$ref": "#/components/schemas/BLOCK_HEADER"},
                        {
                            "type": "object",
                            "properties": {
                                "status": {"$ref": "#/components/schemas/BLOCK_STATUS"},
                                "transactions": {"type": "array", "items": {"$ref": "#/components/schemas/TXN_HASH"}}
                            },
                            "required": ["status", "transactions"]
                        }
                    ]
                }
            },
            "errors": {
                "CONTRACT_NOT_FOUND": {"code": 20, "message": "Contract not found"},
                "BLOCK_NOT_FOUND": {"code": 24, "message": "Block not found"},
                "NO_BLOCKS": {"code": 32, "message": "There are no blocks"}
            }
        }
    })json"_json;
}

inline std::shared_ptr<const Specification> sample_specification() {
    return Specification::from_json(sample_openrpc_document(), "starknet_api_openrpc.json");
}

}  // namespace rpcprobe::validation::test_util
