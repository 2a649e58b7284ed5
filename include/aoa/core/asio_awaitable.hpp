#pragma once

#include "aoa/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <tuple>

namespace aoa {

inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

template <typename T>
[[nodiscard]] inline auto
as_result(std::tuple<boost::system::error_code, T> &&v) -> Result<T> {
  auto [ec, value] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok(std::move(value));
}

[[nodiscard]] inline auto as_result(std::tuple<boost::system::error_code> &&v)
    -> Result<void> {
  auto [ec] = std::move(v);
  if (ec) {
    return fail(ec);
  }
  return ok();
}

/// Suspend the calling coroutine for `duration` on its own executor.
/// Cancellation of the timer is not an error.
template <typename Rep, typename Period>
[[nodiscard]] auto async_sleep(std::chrono::duration<Rep, Period> duration)
    -> boost::asio::awaitable<void> {
  boost::asio::steady_timer timer(
      co_await boost::asio::this_coro::executor,
      std::chrono::duration_cast<std::chrono::nanoseconds>(duration));
  auto [ec] = co_await timer.async_wait(use_nothrow);
  if (ec && ec != boost::asio::error::operation_aborted) {
    throw boost::system::system_error(ec);
  }
}

} // namespace aoa
