#pragma once

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/http/websocket.hpp"

#include <arpa/inet.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <format>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace pulsewire::test {

// Drives `coro` to completion on a private io_context. Exceptions escaping the
// coroutine are rethrown; running past `timeout` throws std::runtime_error.
template <typename T>
auto run_coro(task<T> coro,
              std::chrono::milliseconds timeout = std::chrono::seconds(10))
    -> T {
  boost::asio::io_context io;
  std::exception_ptr error;
  bool finished = false;
  std::conditional_t<std::is_void_v<T>, bool, std::optional<T>> result{};
  boost::asio::co_spawn(
      io,
      [&]() -> task<void> {
        if constexpr (std::is_void_v<T>) {
          co_await std::move(coro);
        } else {
          result.emplace(co_await std::move(coro));
        }
        finished = true;
      },
      [&](std::exception_ptr e) { error = e; });
  io.run_for(timeout);
  if (error) {
    std::rethrow_exception(error);
  }
  if (!finished) {
    throw std::runtime_error("run_coro timed out");
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*result);
  }
}

template <typename Predicate>
[[nodiscard]] auto
poll_until(Predicate &&predicate, std::chrono::milliseconds timeout,
           std::chrono::milliseconds interval = std::chrono::milliseconds(10))
    -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!std::invoke(predicate)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(interval);
  }
  return true;
}

inline void sleep_ms(std::chrono::milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

/// Overrides an environment variable until the guard goes out of scope.
class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      saved_ = old;
    }
    ::setenv(name, value, 1);
  }
  ~ScopedEnv() {
    if (saved_) {
      ::setenv(name_.c_str(), saved_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> saved_;
};

/// Creates an empty file under /tmp and returns its path ("" on failure).
[[nodiscard]] inline auto make_temp_path(std::string_view prefix) -> std::string {
  auto path = std::format("/tmp/{}XXXXXX", prefix);
  const int fd = ::mkstemp(path.data());
  if (fd < 0) {
    return {};
  }
  ::close(fd);
  return path;
}

// --- raw sockets ------------------------------------------------------------

/// SO_RCVTIMEO so that a blocking recv in a test fails instead of hanging.
inline void set_recv_timeout(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(timeout.count() / 1000);
  tv.tv_usec =
      static_cast<decltype(tv.tv_usec)>((timeout.count() % 1000) * 1000);
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

/// Blocking TCP connection to 127.0.0.1:port, or -1.
[[nodiscard]] inline auto connect_loopback(
    std::uint16_t port,
    std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> int {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return -1;
  }
  set_recv_timeout(fd, timeout);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<const sockaddr *>(&addr), sizeof(addr)) !=
      0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

[[nodiscard]] inline auto read_until_closed(int fd) -> std::string {
  std::string out;
  char chunk[4096];
  for (;;) {
    const auto n = ::recv(fd, chunk, sizeof(chunk), 0);
    if (n <= 0) {
      return out;
    }
    out.append(chunk, static_cast<std::size_t>(n));
  }
}

/// Status code from an HTTP status line ("HTTP/1.1 401 ..."), 0 if malformed.
[[nodiscard]] inline auto parse_status_code(std::string_view response) -> int {
  const auto sp = response.find(' ');
  if (sp == std::string_view::npos || response.size() < sp + 4) {
    return 0;
  }
  int code = 0;
  for (const char ch : response.substr(sp + 1, 3)) {
    if (ch < '0' || ch > '9') {
      return 0;
    }
    code = code * 10 + (ch - '0');
  }
  return code;
}

/// One-shot GET with Connection: close; {-1, ""} if the connect fails.
[[nodiscard]] inline auto http_get(std::uint16_t port, std::string_view path)
    -> std::pair<int, std::string> {
  const int fd = connect_loopback(port);
  if (fd < 0) {
    return {-1, ""};
  }
  const auto request = std::format(
      "GET {} HTTP/1.1\r\nHost: localhost\r\nConnection: close\r\n\r\n", path);
  (void)::send(fd, request.data(), request.size(), 0);
  const auto response = read_until_closed(fd);
  ::close(fd);

  const auto head_end = response.find("\r\n\r\n");
  return {parse_status_code(response),
          head_end == std::string::npos ? std::string{}
                                        : response.substr(head_end + 4)};
}

// --- hand-rolled WebSocket client -------------------------------------------

[[nodiscard]] inline auto upgrade_request(std::string_view target)
    -> std::string {
  return std::format("GET {} HTTP/1.1\r\n"
                     "Host: localhost\r\n"
                     "Upgrade: websocket\r\n"
                     "Connection: Upgrade\r\n"
                     "Sec-WebSocket-Key: dGhlIHNhbXBsZSBub25jZQ==\r\n"
                     "Sec-WebSocket-Version: 13\r\n\r\n",
                     target);
}

/// Sends the upgrade request and returns the response status, -1 if the
/// request could not be sent. Stops at the blank line so that frames sent
/// right after the 101 stay in the socket.
[[nodiscard]] inline auto perform_client_handshake(int fd,
                                                   std::string_view target)
    -> int {
  const auto request = upgrade_request(target);
  if (::send(fd, request.data(), request.size(), 0) !=
      static_cast<ssize_t>(request.size())) {
    return -1;
  }
  std::string head;
  char ch = 0;
  while (!head.ends_with("\r\n\r\n")) {
    if (::recv(fd, &ch, 1, 0) != 1) {
      return head.empty() ? -1 : parse_status_code(head);
    }
    head.push_back(ch);
  }
  return parse_status_code(head);
}

/// Client frames must be masked; a fixed key is fine for tests.
inline auto send_frame(int fd, http::WebSocketOpCode opcode,
                       std::string_view payload) -> bool {
  constexpr std::uint8_t kMask[4] = {0x12, 0x34, 0x56, 0x78};
  std::string frame;
  frame.push_back(static_cast<char>(0x80 | std::to_underlying(opcode)));
  const std::uint64_t len = payload.size();
  if (len < 126) {
    frame.push_back(static_cast<char>(0x80 | len));
  } else if (len <= 0xFFFF) {
    frame.push_back(static_cast<char>(0x80 | 126));
    frame.push_back(static_cast<char>(len >> 8));
    frame.push_back(static_cast<char>(len & 0xFF));
  } else {
    frame.push_back(static_cast<char>(0x80 | 127));
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<char>((len >> shift) & 0xFF));
    }
  }
  frame.append(reinterpret_cast<const char *>(kMask), sizeof(kMask));
  for (std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ kMask[i % 4]));
  }
  return ::send(fd, frame.data(), frame.size(), 0) ==
         static_cast<ssize_t>(frame.size());
}

inline auto send_text(int fd, std::string_view payload) -> bool {
  return send_frame(fd, http::WebSocketOpCode::Text, payload);
}

namespace detail {
inline auto recv_all(int fd, void *dst, std::size_t size) -> bool {
  auto *p = static_cast<char *>(dst);
  while (size > 0) {
    const auto n = ::recv(fd, p, size, 0);
    if (n <= 0) {
      return false;
    }
    p += n;
    size -= static_cast<std::size_t>(n);
  }
  return true;
}
} // namespace detail

struct ServerFrame {
  http::WebSocketOpCode opcode{http::WebSocketOpCode::Continuation};
  std::string payload;
};

/// Next frame from the server, unmasking if needed; nullopt on EOF/timeout.
[[nodiscard]] inline auto read_frame(int fd) -> std::optional<ServerFrame> {
  std::uint8_t head[2];
  if (!detail::recv_all(fd, head, sizeof(head))) {
    return std::nullopt;
  }
  ServerFrame frame;
  frame.opcode = static_cast<http::WebSocketOpCode>(head[0] & 0x0F);

  std::uint64_t len = head[1] & 0x7F;
  if (len >= 126) {
    std::uint8_t ext[8];
    const std::size_t ext_size = len == 126 ? 2 : 8;
    if (!detail::recv_all(fd, ext, ext_size)) {
      return std::nullopt;
    }
    len = 0;
    for (std::size_t i = 0; i < ext_size; ++i) {
      len = (len << 8) | ext[i];
    }
  }

  std::uint8_t mask[4] = {};
  const bool masked = (head[1] & 0x80) != 0;
  if (masked && !detail::recv_all(fd, mask, sizeof(mask))) {
    return std::nullopt;
  }
  frame.payload.resize(len);
  if (len > 0 && !detail::recv_all(fd, frame.payload.data(), len)) {
    return std::nullopt;
  }
  if (masked) {
    for (std::size_t i = 0; i < frame.payload.size(); ++i) {
      frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
    }
  }
  return frame;
}

/// Payload of the next text frame; control frames other than close are
/// skipped, a close frame yields nullopt.
[[nodiscard]] inline auto read_text_frame(int fd)
    -> std::optional<std::string> {
  while (auto frame = read_frame(fd)) {
    switch (frame->opcode) {
    case http::WebSocketOpCode::Text:
      return std::move(frame->payload);
    case http::WebSocketOpCode::Close:
      return std::nullopt;
    default:
      break;
    }
  }
  return std::nullopt;
}

} // namespace pulsewire::test
