#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <cstdio>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <variant>

namespace pulsewire::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

struct LevelTraits {
  std::string_view name;
  std::string_view color; // ANSI SGR, used only on terminals
};

inline constexpr std::array<LevelTraits, 6> kLevels{{
    {"trace", "\o{33}[90m"},
    {"debug", "\o{33}[36m"},
    {"info", "\o{33}[32m"},
    {"warn", "\o{33}[33m"},
    {"error", "\o{33}[31m"},
    {"off", ""},
}};

[[nodiscard]] inline auto traits(Level level) -> const LevelTraits & {
  return kLevels.at(std::to_underlying(level));
}

/// "trace".."error" or "off"; case-sensitive.
[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
    -> std::optional<Level> {
  for (std::size_t i = 0; i < kLevels.size(); ++i) {
    if (kLevels[i].name == name) {
      return static_cast<Level>(i);
    }
  }
  return std::nullopt;
}

[[nodiscard]] inline auto is_level_name(std::string_view name) noexcept
    -> bool {
  return parse_level(name).has_value();
}

/// Switch the writer's sink; an empty path means stdout.
struct RedirectOutput {
  std::string path;
};

using LogRecord = std::variant<std::string, RedirectOutput>;

/// Asynchronous line logger. Producers format on their own thread and hand
/// the line to a writer thread through a bounded channel. Before start() and
/// after stop() lines are written synchronously.
class Logger {
public:
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  Logger() = default;
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  auto start() -> void;
  auto stop() -> void;

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }
  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level != Level::Off &&
           level >= level_.load(std::memory_order_acquire);
  }

  auto set_output_file(std::string_view path) -> bool;
  auto set_output_stderr() -> void;

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_messages_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }
    auto line = line_prefix(level);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');
    submit(std::move(line));
  }

private:
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, LogRecord)>;

  // "[2025-01-01 12:00:00.000] [info] [tid] "
  [[nodiscard]] auto line_prefix(Level level) const -> std::string;
  auto submit(std::string line) -> void;
  auto write_now(std::string_view line) -> void;
  auto open_sink(const std::string &path) -> bool;
  auto use_sink(FILE *out) -> void;
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void;
  [[nodiscard]] auto current_output() const noexcept -> FILE *;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> colorize_{false};
  std::atomic<FILE *> output_{stdout};
  std::atomic<std::uint64_t> dropped_messages_{0};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;
};

auto logger() -> Logger &;

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

/// Unknown names fall back to Info.
inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name).value_or(Level::Info));
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace pulsewire::log
