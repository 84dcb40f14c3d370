// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "daemon.hpp"

#include <algorithm>
#include <exception>
#include <string>

#include <absl/strings/str_join.h>
#include <boost/system/system_error.hpp>

#include <rpcprobe/infra/cli/common.hpp>
#include <rpcprobe/infra/cli/shutdown_signal.hpp>
#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/rpc/transport/http_transport.hpp>

namespace rpcprobe::proxy {

int Daemon::run(const ProxySettings& settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main-thread");

    try {
        std::vector<std::string> target_names;
        for (const auto& target : settings.targets) {
            target_names.push_back(target.name());
        }
        PROBE_INFO << "Proxy starting in " << to_string(settings.mode) << " mode"
                   << (settings.mode == Mode::kFanOut ? " with strategy " + std::string{to_string(settings.strategy)} : "")
                   << " to [" << absl::StrJoin(target_names, ", ") << "] using " << settings.num_threads << " threads";

        Daemon daemon{settings};

        boost::asio::io_context signal_ioc;
        cmd::common::ShutdownSignal shutdown_signal{signal_ioc.get_executor()};
        shutdown_signal.on_signal([&](cmd::common::ShutdownSignal::SignalNumber) {
            daemon.stop();
        });

        daemon.start();
        std::thread signal_thread{[&]() { signal_ioc.run(); }};
        daemon.join();

        shutdown_signal.cancel();
        signal_thread.join();

        PROBE_INFO << "Proxy exiting";
        return cmd::common::kExitSuccess;
    } catch (const ConfigError& ce) {
        PROBE_CRIT << "Proxy configuration error: " << ce.what();
        return cmd::common::kExitConfigError;
    } catch (const boost::system::system_error& se) {
        PROBE_CRIT << "Proxy system error: " << se.what();
        return cmd::common::kExitFailure;
    } catch (const std::exception& e) {
        PROBE_CRIT << "Proxy exception: " << e.what();
        return cmd::common::kExitFailure;
    }
}

Daemon::Daemon(const ProxySettings& settings) : settings_{settings} {
    auto resolver = std::make_shared<rpc::HostResolver>(settings_.resolve_overrides);
    auto client = std::make_shared<rpc::RpcClient>(std::make_shared<rpc::HttpTransport>(std::move(resolver)));
    if (settings_.record_settings.enabled) {
        recorder_ = std::make_shared<TrafficRecorder>(settings_.record_settings);
        PROBE_INFO << "Proxy recording traffic into " << recorder_->path().string();
    }
    handler_ = std::make_shared<RequestHandler>(settings_, std::move(client), recorder_);

    std::shared_ptr<boost::asio::ssl::context> tls_context;
    if (settings_.tls_cert_file && settings_.tls_key_file) {
        tls_context = Server::make_tls_context(*settings_.tls_cert_file, *settings_.tls_key_file);
    } else if (settings_.tls_cert_file || settings_.tls_key_file) {
        throw ConfigError{"TLS termination requires both certificate and key"};
    }

    try {
        server_ = std::make_unique<Server>(settings_.listen_address, handler_, ioc_, std::move(tls_context));
    } catch (const boost::system::system_error& se) {
        throw ConfigError{"cannot listen on " + settings_.listen_address + ": " + se.code().message()};
    }
}

void Daemon::start() {
    server_->start();
    const auto num_threads = std::max<uint32_t>(settings_.num_threads, 1);
    for (uint32_t i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this, i]() {
            log::set_thread_name("proxy-io-" + std::to_string(i));
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                PROBE_CRIT << "Proxy I/O thread " << i << " terminated: " << e.what();
                ioc_.stop();
            }
        });
    }
}

void Daemon::stop() {
    server_->stop();
    ioc_.stop();
}

void Daemon::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    if (recorder_) {
        recorder_->flush();
    }
}

}  // namespace rpcprobe::proxy
