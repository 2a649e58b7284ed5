#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace aoa {

/// Every suspension point in aoa (process waits, the merge gate, timers) is
/// a co_await inside one of these, running on the pool's io_context.
template <typename T = void> using task = boost::asio::awaitable<T>;

using boost::asio::co_spawn;
using boost::asio::use_awaitable;

// `a && b` runs both awaitables concurrently and waits for both.
namespace awaitable_ops = boost::asio::experimental::awaitable_operators;

} // namespace aoa
