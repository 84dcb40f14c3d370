// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/common/constants.hpp>
#include <rpcprobe/rpc/common/endpoint.hpp>
#include <rpcprobe/rpc/transport/resolver.hpp>

namespace rpcprobe::proxy {

enum class Mode {
    kPassThrough,  // relay to the single upstream
    kFanOut,       // duplicate to every upstream
};

enum class FanOutStrategy {
    kFirst,    // answer with the first successful upstream in target order
    kCompare,  // answer as kFirst and signal divergence between upstreams
};

std::string_view to_string(Mode mode);
std::optional<Mode> mode_from_string(std::string_view text);

std::string_view to_string(FanOutStrategy strategy);

inline constexpr std::chrono::milliseconds kDefaultUpstreamTimeout{10'000};

struct RecorderSettings {
    bool enabled{false};
    //! Base name of the recording files
    std::string name{"rpcprobe_proxy"};
    std::filesystem::path folder{"logs/"};
    size_t max_file_size_mb{1};
    size_t max_files{100};
    bool auto_flush{true};
    //! Record upstream answers and replies, otherwise inbound requests only
    bool include_replies{true};
};

struct ProxySettings {
    log::Settings log_settings;
    RecorderSettings record_settings;
    std::string listen_address{kDefaultListenAddress};
    Mode mode{Mode::kPassThrough};
    FanOutStrategy strategy{FanOutStrategy::kFirst};
    std::vector<rpc::Endpoint> targets;
    std::vector<rpc::ResolveOverride> resolve_overrides;
    //! Both set to terminate TLS on inbound connections
    std::optional<std::string> tls_cert_file;
    std::optional<std::string> tls_key_file;
    std::chrono::milliseconds fanout_deadline{kDefaultFanOutDeadline};
    std::chrono::milliseconds upstream_timeout{kDefaultUpstreamTimeout};
    //! Object fields ignored when comparing upstream responses
    std::set<std::string> ignored_fields{"timestamp"};
    uint32_t num_threads{1};
};

}  // namespace rpcprobe::proxy
