// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <rpcprobe/infra/concurrency/task.hpp>

namespace rpcprobe::test_util {

//! Drives Task-s to completion on a private io_context from the test thread
class TaskRunner {
  public:
    virtual ~TaskRunner() = default;

    template <typename T>
    T run(Task<T> task) {
        using namespace std::chrono_literals;
        auto result = boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
        ioc_.restart();
        // Completions may arrive from other threads, so never block on an idle context
        while (result.wait_for(0s) != std::future_status::ready) {
            if (ioc_.run_one_for(5ms) == 0 && ioc_.stopped()) {
                ioc_.restart();
            }
        }
        return result.get();
    }

    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  protected:
    boost::asio::io_context ioc_;
};

}  // namespace rpcprobe::test_util
