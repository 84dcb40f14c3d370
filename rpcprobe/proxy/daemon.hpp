// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <rpcprobe/rpc/client/rpc_client.hpp>
#include "traffic_recorder.hpp"

#include "request_handler.hpp"
#include "server.hpp"
#include "settings.hpp"

namespace rpcprobe::proxy {

//! The proxy process: wires settings into the server and serves until a shutdown signal
class Daemon {
  public:
    //! Run the proxy until SIGINT/SIGTERM, return the process exit code
    static int run(const ProxySettings& settings);

    explicit Daemon(const ProxySettings& settings);

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    void start();
    void stop();
    void join();

  private:
    const ProxySettings& settings_;
    boost::asio::io_context ioc_;
    std::shared_ptr<TrafficRecorder> recorder_;
    std::shared_ptr<RequestHandler> handler_;
    std::unique_ptr<Server> server_;
    std::vector<std::thread> threads_;
};

}  // namespace rpcprobe::proxy
