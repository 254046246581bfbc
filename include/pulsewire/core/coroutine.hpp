#pragma once

#include "pulsewire/core/error.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include <system_error>
#include <tuple>

namespace pulsewire {

template <typename T = void> using task = boost::asio::awaitable<T>;

/// Coroutines started with co_spawn(..., detached).
using spawn_task = task<void>;

using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;

/// Completion token that yields `(error_code, values...)` instead of throwing.
inline constexpr auto use_nothrow =
    boost::asio::as_tuple(boost::asio::use_awaitable);

/// Awaits a `use_nothrow` operation and folds its error into a Result.
template <typename T>
[[nodiscard]] auto
co_as_result(task<std::tuple<boost::system::error_code, T>> op)
    -> task<Result<T>> {
  auto [ec, value] = co_await std::move(op);
  if (ec) {
    co_return fail(ec);
  }
  co_return ok(std::move(value));
}

[[nodiscard]] inline auto
co_as_result(task<std::tuple<boost::system::error_code>> op)
    -> task<Result<void>> {
  auto [ec] = co_await std::move(op);
  if (ec) {
    co_return fail(ec);
  }
  co_return ok();
}

// A timer cancel or channel close, as opposed to a transport failure.
[[nodiscard]] inline auto is_cancellation(const std::error_code &ec) -> bool {
  using boost::system::error_code;
  const std::error_code aborted =
      error_code(boost::asio::error::operation_aborted);
  const std::error_code closed =
      error_code(boost::asio::experimental::error::channel_closed);
  const std::error_code cancelled =
      error_code(boost::asio::experimental::error::channel_cancelled);
  return ec == make_error_code(Error::Cancelled) || ec == aborted ||
         ec == closed || ec == cancelled;
}

} // namespace pulsewire
