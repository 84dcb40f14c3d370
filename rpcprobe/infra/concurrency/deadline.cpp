// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "deadline.hpp"

#include <algorithm>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace rpcprobe::concurrency {

using std::chrono::milliseconds;

milliseconds remaining_until(Deadline deadline) {
    const auto remaining = std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now());
    return std::max(remaining, milliseconds::zero());
}

Deadline bounded_deadline(Deadline parent, milliseconds budget, Deadline now) {
    if (parent <= now || budget <= milliseconds::zero()) {
        return std::min(parent, now);
    }
    // Compare in milliseconds: converting a large budget to the clock period would overflow
    if (budget >= std::chrono::duration_cast<milliseconds>(parent - now)) {
        return parent;
    }
    return now + budget;
}

Task<void> expire_at(Deadline deadline) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer{executor};
    timer.expires_at(deadline);

    try {
        co_await timer.async_wait(boost::asio::use_awaitable);
    } catch (const boost::system::system_error& ex) {
        // the raced operation completed first
        if (ex.code() == boost::system::errc::operation_canceled) {
            co_return;
        }
        throw;
    }

    throw DeadlineExpiredError{};
}

Task<void> sleep_for(milliseconds duration) {
    auto executor = co_await boost::asio::this_coro::executor;
    boost::asio::steady_timer timer{executor};
    timer.expires_after(duration);
    co_await timer.async_wait(boost::asio::use_awaitable);
}

}  // namespace rpcprobe::concurrency
