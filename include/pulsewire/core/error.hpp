#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace pulsewire {

// Zero stays reserved so that no enumerator compares equal to "no error".
enum class Error : std::uint8_t {
  Success,
  // configuration
  FileNotFound,
  ParseError,
  InvalidArgument,
  // lifecycle
  NotFound,
  AlreadyExists,
  InvalidState,
  SystemNotRunning,
  Cancelled,
  Timeout,
  // wire
  ProtocolError,
  MessageTooLarge,
  InvalidUrl,
  // admission
  Unauthorized,
  MissingClientId,
  // transport
  NotConnected,
  ConnectionClosed,
  Unknown,
};

class ErrorCategory final : public std::error_category {
public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "pulsewire";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    switch (static_cast<Error>(ev)) {
    case Error::Success:
      return "success";
    case Error::FileNotFound:
      return "file not found";
    case Error::ParseError:
      return "parse error";
    case Error::InvalidArgument:
      return "invalid argument";
    case Error::NotFound:
      return "not found";
    case Error::AlreadyExists:
      return "already exists";
    case Error::InvalidState:
      return "invalid state transition";
    case Error::SystemNotRunning:
      return "system not running";
    case Error::Cancelled:
      return "cancelled";
    case Error::Timeout:
      return "timed out";
    case Error::ProtocolError:
      return "protocol error";
    case Error::MessageTooLarge:
      return "message too large";
    case Error::InvalidUrl:
      return "invalid URL";
    case Error::Unauthorized:
      return "unauthorized";
    case Error::MissingClientId:
      return "missing or invalid client id";
    case Error::NotConnected:
      return "not connected";
    case Error::ConnectionClosed:
      return "connection closed";
    case Error::Unknown:
      break;
    }
    return "unknown error";
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace pulsewire

template <> struct std::is_error_code_enum<pulsewire::Error> : std::true_type {};
