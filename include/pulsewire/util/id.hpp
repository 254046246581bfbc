#pragma once

#include <atomic>
#include <cstdint>
#include <format>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace pulsewire {

/// Identity a client claims at upgrade time. Several sessions may share one.
class ClientId {
public:
  ClientId() = default;
  explicit ClientId(std::string value) : value_(std::move(value)) {}
  explicit ClientId(std::string_view value) : value_(value) {}
  explicit ClientId(const char *value) : value_(value) {}

  /// Non-empty and free of control characters.
  [[nodiscard]] static auto is_valid(std::string_view text) noexcept -> bool;

  [[nodiscard]] auto value() const noexcept -> std::string_view {
    return value_;
  }
  [[nodiscard]] auto str() const noexcept -> const std::string & {
    return value_;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return value_.empty(); }

  friend auto operator==(const ClientId &, const ClientId &) -> bool = default;
  friend auto operator==(const ClientId &lhs, std::string_view rhs) noexcept
      -> bool {
    return lhs.value_ == rhs;
  }
  friend auto operator<<(std::ostream &os, const ClientId &id)
      -> std::ostream & {
    return os << id.value_;
  }

private:
  std::string value_;
};

/// Process-unique session handle; never reused within one process.
using SessionId = std::uint64_t;

[[nodiscard]] inline auto next_session_id() noexcept -> SessionId {
  static std::atomic<SessionId> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

/// "<prefix>-" followed by eight random hex digits.
[[nodiscard]] auto generate_client_id(std::string_view prefix) -> ClientId;

} // namespace pulsewire

template <>
struct std::formatter<pulsewire::ClientId>
    : std::formatter<std::string_view> {
  auto format(const pulsewire::ClientId &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
