// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "fan_out.hpp"
#include "settings.hpp"

namespace rpcprobe::proxy {

/**
 * Proxy traffic recording into size-rotated files, one timestamped line per message:
 *   REQ -> <inbound request>
 *   UPS <upstream> <- <upstream response>
 *   UPS <upstream> !! <upstream failure>
 *   RSP <status> <- <reply to the client>
 * Thread-safe, shared by every session of the proxy.
 */
class TrafficRecorder {
  public:
    explicit TrafficRecorder(RecorderSettings settings);
    ~TrafficRecorder();

    TrafficRecorder(const TrafficRecorder&) = delete;
    TrafficRecorder& operator=(const TrafficRecorder&) = delete;

    const std::filesystem::path& path() const { return path_; }

    void record_request(std::string_view body);
    void record_upstream(const UpstreamOutcome& outcome);
    void record_reply(unsigned int status, std::string_view body);

    void flush();

  private:
    template <typename... Args>
    void write(spdlog::format_string_t<Args...> fmt, Args&&... args);

    RecorderSettings settings_;
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace rpcprobe::proxy
