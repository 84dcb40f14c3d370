// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "proxy_options.hpp"

#include <map>
#include <string>
#include <vector>

#include <rpcprobe/infra/cli/listen_address_option.hpp>
#include <rpcprobe/rpc/cli/endpoint_options.hpp>

namespace rpcprobe::cmd::common {

static void add_options_recording(CLI::App& cli, proxy::RecorderSettings& settings) {
    cli.add_flag("--record", settings.enabled)
        ->description("Record inbound requests, upstream responses and replies into rotating files")
        ->capture_default_str();

    cli.add_option("--record.dir", settings.folder)
        ->description("Folder of the recording files")
        ->capture_default_str();

    cli.add_option("--record.max_files", settings.max_files)
        ->description("Maximum number of rotated recording files")
        ->check(CLI::Range(1, 500))
        ->capture_default_str();

    cli.add_option("--record.max_file_size", settings.max_file_size_mb)
        ->description("Maximum size in megabytes of each recording file")
        ->check(CLI::Range(1, 1024))
        ->capture_default_str();

    cli.add_flag_callback(
        "--record.requests_only",
        [&settings]() { settings.include_replies = false; },
        "Record inbound requests only, neither upstream responses nor replies");
}

void add_proxy_options(CLI::App& cli, proxy::ProxySettings& settings) {
    add_option_listen_address(cli, "--listen", settings.listen_address, "Proxy local end-point as <address>:<port>");

    const std::map<std::string, proxy::Mode> mode_mapping{
        {"pass-through", proxy::Mode::kPassThrough},
        {"fanout", proxy::Mode::kFanOut},
    };
    cli.add_option("--mode", settings.mode)
        ->description("Relay mode: pass-through to one upstream or fanout to every upstream")
        ->transform(CLI::CheckedTransformer(mode_mapping, CLI::ignore_case))
        ->capture_default_str();

    add_option_targets(cli, settings.targets)->required();
    add_option_resolve(cli, settings.resolve_overrides);

    add_options_recording(cli, settings.record_settings);

    auto* cert_option = cli.add_option_function<std::string>(
        "--tls.cert",
        [&settings](const std::string& path) { settings.tls_cert_file = path; },
        "PEM certificate chain used to terminate TLS on inbound connections");
    auto* key_option = cli.add_option_function<std::string>(
        "--tls.key",
        [&settings](const std::string& path) { settings.tls_key_file = path; },
        "PEM private key used to terminate TLS on inbound connections");
    cert_option->check(CLI::ExistingFile)->needs(key_option);
    key_option->check(CLI::ExistingFile)->needs(cert_option);

    cli.add_flag_callback(
        "--compare",
        [&settings]() { settings.strategy = proxy::FanOutStrategy::kCompare; },
        "Compare upstream responses in fanout mode and signal divergence");

    cli.add_option_function<uint32_t>(
           "--fanout.deadline",
           [&settings](uint32_t milliseconds) { settings.fanout_deadline = std::chrono::milliseconds{milliseconds}; },
           "Time in milliseconds to wait for all upstreams in fanout mode")
        ->check(CLI::Range(1u, 600'000u))
        ->default_str(std::to_string(settings.fanout_deadline.count()));

    cli.add_option_function<uint32_t>(
           "--upstream.timeout",
           [&settings](uint32_t milliseconds) { settings.upstream_timeout = std::chrono::milliseconds{milliseconds}; },
           "Time in milliseconds allowed to each upstream request")
        ->check(CLI::Range(1u, 600'000u))
        ->default_str(std::to_string(settings.upstream_timeout.count()));

    cli.add_option_function<std::vector<std::string>>(
        "--ignore-field",
        [&settings](const std::vector<std::string>& fields) { settings.ignored_fields.insert(fields.begin(), fields.end()); },
        "Object field ignored when comparing upstream responses (repeatable), timestamp is always ignored");

    cli.add_option("--threads", settings.num_threads)
        ->description("Number of threads serving connections")
        ->check(CLI::Range(1, 256))
        ->capture_default_str();
}

}  // namespace rpcprobe::cmd::common
