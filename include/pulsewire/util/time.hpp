#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace pulsewire::util {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Formats time point to ISO 8601 with milliseconds (YYYY-MM-DDTHH:MM:SS.mmmZ).
// The epoch (a default-constructed time point) formats as an empty string.
[[nodiscard]] inline auto format_iso8601(Timestamp tp) -> std::string {
  if (tp == Timestamp{}) {
    return {};
  }
  auto const ms_tp = std::chrono::floor<std::chrono::milliseconds>(tp);
  return std::format("{:%Y-%m-%dT%H:%M:%S}Z", ms_tp);
}

// Converts time_point to Unix epoch milliseconds.
[[nodiscard]] inline auto to_unix_millis(Timestamp tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

/// Parses RFC 3339 / ISO 8601 instants: "YYYY-MM-DDTHH:MM:SS", an optional
/// fraction of any length, then "Z", "+hh:mm" or "-hh:mm". A missing zone is
/// read as UTC.
[[nodiscard]] auto parse_iso8601(std::string_view text)
    -> std::optional<Timestamp>;

/// Monotonic milliseconds, used for liveness bookkeeping.
[[nodiscard]] inline auto steady_now_ms() noexcept -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

} // namespace pulsewire::util
