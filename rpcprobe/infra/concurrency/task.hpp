// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#if !__has_include(<coroutine>)
#error "rpcprobe requires C++20 coroutines"
#endif

#include <coroutine>

#include <boost/asio/awaitable.hpp>

/// Use just \rpcprobe as namespace here to make these definitions available everywhere
/// So that we can write Task<void> foo(); instead of concurrency::Task<void> foo();
namespace rpcprobe {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace rpcprobe
