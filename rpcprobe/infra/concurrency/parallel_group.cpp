// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "parallel_group.hpp"

#include <exception>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/deferred.hpp>
#include <boost/asio/experimental/cancellation_condition.hpp>
#include <boost/asio/experimental/parallel_group.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/errc.hpp>
#include <boost/system/system_error.hpp>

namespace rpcprobe::concurrency {

static bool is_cancellation(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const boost::system::system_error& e) {
        return e.code() == boost::system::errc::operation_canceled;
    } catch (const std::exception&) {
        return false;
    }
}

Task<void> generate_parallel_group_task(size_t count, absl::FunctionRef<Task<void>(size_t)> task_factory) {
    if (count == 0) {
        co_return;
    }
    auto executor = co_await boost::asio::this_coro::executor;

    using Operation = decltype(boost::asio::co_spawn(executor, task_factory(0), boost::asio::deferred));
    std::vector<Operation> operations;
    operations.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        operations.push_back(boost::asio::co_spawn(executor, task_factory(i), boost::asio::deferred));
    }

    auto [order, errors] = co_await boost::asio::experimental::make_parallel_group(std::move(operations))
                               .async_wait(boost::asio::experimental::wait_for_one_error(), boost::asio::use_awaitable);

    // Completion order: the first failure is the cause, later ones are mostly its cancellation side effects
    std::exception_ptr cancellation;
    for (const size_t index : order) {
        const auto& error = errors[index];
        if (!error) continue;
        if (!is_cancellation(error)) {
            std::rethrow_exception(error);
        }
        if (!cancellation) {
            cancellation = error;
        }
    }
    if (cancellation) {
        std::rethrow_exception(cancellation);
    }
}

}  // namespace rpcprobe::concurrency
