// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <utility>

#include "task.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

namespace rpcprobe::concurrency {

/**
 * AsyncSemaphore bounds the number of coroutines running a section at the same time.
 *
 * Permits are tokens buffered into a channel having the semaphore capacity: acquiring sends a token
 * (suspending while the buffer is full), releasing takes one token back out.
 *
 * \code
 *
 * AsyncSemaphore semaphore{executor, 4};
 *
 * Task<void> call_node() {
 *     auto permit = co_await semaphore.acquire();
 *     co_await do_call();
 * }
 *
 * \endcode
 */
class AsyncSemaphore {
  public:
    //! RAII handle giving back its permit on destruction
    class Permit {
      public:
        Permit() = default;
        explicit Permit(AsyncSemaphore* semaphore) : semaphore_{semaphore} {}
        ~Permit() { reset(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        Permit(Permit&& other) noexcept : semaphore_{std::exchange(other.semaphore_, nullptr)} {}
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                reset();
                semaphore_ = std::exchange(other.semaphore_, nullptr);
            }
            return *this;
        }

        void reset() {
            if (semaphore_) {
                std::exchange(semaphore_, nullptr)->release();
            }
        }

      private:
        AsyncSemaphore* semaphore_{nullptr};
    };

    AsyncSemaphore(const boost::asio::any_io_executor& executor, size_t permits)
        : permits_{permits}, tokens_{executor, permits} {}

    AsyncSemaphore(const AsyncSemaphore&) = delete;
    AsyncSemaphore& operator=(const AsyncSemaphore&) = delete;

    Task<Permit> acquire() {
        co_await tokens_.async_send(boost::system::error_code{}, boost::asio::use_awaitable);
        co_return Permit{this};
    }

    size_t permits() const { return permits_; }

  private:
    void release() {
        tokens_.try_receive([](const boost::system::error_code&) {});
    }

    size_t permits_;
    boost::asio::experimental::concurrent_channel<void(boost::system::error_code)> tokens_;
};

}  // namespace rpcprobe::concurrency
