// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <csignal>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::cmd::common {

ShutdownSignal::ShutdownSignal(const boost::asio::any_io_executor& executor)
    : signals_{executor, SIGINT, SIGTERM} {}

void ShutdownSignal::on_signal(Callback callback) {
    signals_.async_wait([callback = std::move(callback)](const boost::system::error_code& error, int signal_number) {
        if (error == boost::asio::error::operation_aborted) {
            PROBE_DEBUG << "ShutdownSignal: cancelled";
            return;
        }
        if (error) {
            PROBE_ERROR << "ShutdownSignal: wait failed: " << error.message();
            return;
        }
        PROBE_INFO << "ShutdownSignal: caught signal " << signal_number << ", shutting down";
        callback(signal_number);
    });
}

void ShutdownSignal::cancel() {
    boost::asio::post(signals_.get_executor(), [this]() { signals_.cancel(); });
}

}  // namespace rpcprobe::cmd::common
