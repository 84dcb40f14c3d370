// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "async_semaphore.hpp"

#include <algorithm>

#include <catch2/catch.hpp>

#include <rpcprobe/infra/concurrency/deadline.hpp>
#include <rpcprobe/infra/concurrency/parallel_group.hpp>
#include <rpcprobe/infra/test_util/task_runner.hpp>

namespace rpcprobe::concurrency {

using namespace std::chrono_literals;

struct Occupancy {
    size_t current{0};
    size_t highest{0};
};

static Task<void> occupy(AsyncSemaphore& semaphore, Occupancy& occupancy) {
    auto permit = co_await semaphore.acquire();
    ++occupancy.current;
    occupancy.highest = std::max(occupancy.highest, occupancy.current);
    co_await sleep_for(5ms);
    --occupancy.current;
}

TEST_CASE("AsyncSemaphore bounds concurrent holders", "[infra][concurrency][async_semaphore]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{runner.executor(), 2};
    CHECK(semaphore.permits() == 2);

    Occupancy occupancy;
    runner.run(generate_parallel_group_task(8, [&](size_t) { return occupy(semaphore, occupancy); }));
    CHECK(occupancy.highest == 2);
    CHECK(occupancy.current == 0);
}

TEST_CASE("AsyncSemaphore::Permit", "[infra][concurrency][async_semaphore]") {
    test_util::TaskRunner runner;
    AsyncSemaphore semaphore{runner.executor(), 1};

    SECTION("released on reset") {
        auto permit = runner.run(semaphore.acquire());
        permit.reset();
        auto next = runner.run(semaphore.acquire());
    }
    SECTION("moved permit released once") {
        auto permit = runner.run(semaphore.acquire());
        AsyncSemaphore::Permit moved{std::move(permit)};
        permit.reset();
        moved = AsyncSemaphore::Permit{};
        auto next = runner.run(semaphore.acquire());
        next.reset();
        auto last = runner.run(semaphore.acquire());
    }
}

}  // namespace rpcprobe::concurrency
