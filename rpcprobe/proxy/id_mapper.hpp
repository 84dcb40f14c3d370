// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <map>

#include <nlohmann/json.hpp>

namespace rpcprobe::proxy {

/**
 * Rewrite of client request ids into proxy-internal ids unique across sessions.
 *
 * The internal id is session_id << 32 | sequence, so that requests of different connections using the same client id
 * never collide upstream. Notifications (no id) are left untouched, batches are rewritten element-wise.
 */
class IdMapper {
  public:
    explicit IdMapper(uint32_t session_id) : session_id_{session_id} {}

    uint32_t session_id() const { return session_id_; }

    //! Replace the ids of a request or batch, remembering the originals
    nlohmann::json remap_request(nlohmann::json request);

    //! Restore the original ids in a response or batch, forgetting them
    nlohmann::json restore_response(nlohmann::json response);

    //! Forget the ids of a request whose response will never come back
    void discard(const nlohmann::json& request);

    size_t pending() const { return original_ids_.size(); }

  private:
    void remap_one(nlohmann::json& request);
    void restore_one(nlohmann::json& response);

    uint32_t session_id_;
    uint32_t sequence_{0};
    std::map<uint64_t, nlohmann::json> original_ids_;
};

}  // namespace rpcprobe::proxy
