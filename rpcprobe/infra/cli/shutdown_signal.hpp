// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace rpcprobe::cmd::common {

//! Watcher of SIGINT and SIGTERM, invoking its callback on the first one caught
class ShutdownSignal {
  public:
    using SignalNumber = int;
    using Callback = std::function<void(SignalNumber)>;

    explicit ShutdownSignal(const boost::asio::any_io_executor& executor);

    //! Arm the watcher: the callback runs at most once, on the executor given at construction
    void on_signal(Callback callback);

    //! Disarm the watcher without invoking the callback, safe from any thread
    void cancel();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace rpcprobe::cmd::common
