#include "pulsewire/util/log.hpp"

#include <unistd.h>

#include <chrono>
#include <functional>
#include <vector>

namespace pulsewire::log {

namespace {

auto is_terminal(FILE *out) noexcept -> bool {
  const int fd = out ? ::fileno(out) : -1;
  return fd >= 0 && ::isatty(fd) != 0;
}

// Non-blocking receive of one ready record.
template <typename Channel>
auto try_take(Channel &queue) -> std::optional<LogRecord> {
  std::optional<LogRecord> out;
  (void)queue.try_receive(
      [&](const boost::system::error_code &ec, LogRecord record) {
        if (!ec) {
          out = std::move(record);
        }
      });
  return out;
}

} // namespace

auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  stop();
  if (file_) {
    std::fclose(file_);
  }
}

auto Logger::line_prefix(Level level) const -> std::string {
  const auto now = std::chrono::floor<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  const auto tid =
      std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
  const auto &t = traits(level);
  if (colorize_.load(std::memory_order_relaxed)) {
    return std::format("[{:%F %T}] [{}{}\o{33}[0m] [{}] ", now, t.color, t.name,
                       tid);
  }
  return std::format("[{:%F %T}] [{}] [{}] ", now, t.name, tid);
}

auto Logger::current_output() const noexcept -> FILE * {
  auto *out = output_.load(std::memory_order_acquire);
  return out ? out : stdout;
}

auto Logger::use_sink(FILE *out) -> void {
  output_.store(out, std::memory_order_release);
  colorize_.store(is_terminal(out), std::memory_order_relaxed);
}

auto Logger::set_output_stderr() -> void { use_sink(stderr); }

auto Logger::start() -> void {
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  colorize_.store(is_terminal(current_output()), std::memory_order_relaxed);
  queue_ctx_.restart();
  auto channel =
      std::make_shared<LogChannel>(queue_ctx_.get_executor(), kQueueCapacity);
  queue_.store(channel, std::memory_order_release);
  accepting_.store(true, std::memory_order_release);
  writer_ = std::jthread(
      [this, channel = std::move(channel)] { writer_loop(channel); });
}

auto Logger::stop() -> void {
  accepting_.store(false, std::memory_order_release);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  if (auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel)) {
    queue->close();
  }
  if (writer_.joinable()) {
    writer_.join();
  }
}

auto Logger::open_sink(const std::string &path) -> bool {
  FILE *next = stdout;
  if (!path.empty()) {
    next = std::fopen(path.c_str(), "a");
    if (next == nullptr) {
      return false;
    }
    std::setvbuf(next, nullptr, _IOLBF, 0);
  }
  use_sink(next);
  if (file_) {
    std::fclose(file_);
  }
  file_ = path.empty() ? nullptr : next;
  return true;
}

auto Logger::set_output_file(std::string_view path) -> bool {
  auto queue = queue_.load(std::memory_order_acquire);
  if (!queue) {
    return open_sink(std::string(path));
  }
  // Routed through the writer so earlier lines land in the old sink.
  return queue->try_send(boost::system::error_code{},
                         LogRecord{RedirectOutput{std::string(path)}});
}

auto Logger::write_now(std::string_view line) -> void {
  auto *out = current_output();
  std::fwrite(line.data(), 1, line.size(), out);
  std::fflush(out);
}

auto Logger::submit(std::string line) -> void {
  if (!accepting_.load(std::memory_order_acquire)) {
    write_now(line);
    return;
  }
  if (auto queue = queue_.load(std::memory_order_acquire);
      queue && queue->try_send(boost::system::error_code{}, LogRecord{line})) {
    return;
  }
  // Queue full. Terminals get the line inline; pipes and files drop it so a
  // stalled reader cannot block shard threads.
  if (is_terminal(current_output())) {
    write_now(line);
  } else {
    dropped_messages_.fetch_add(1, std::memory_order_relaxed);
  }
}

auto Logger::writer_loop(std::shared_ptr<LogChannel> queue) -> void {
  std::vector<LogRecord> batch;
  batch.reserve(kBatchSize);

  auto write_batch = [&] {
    for (auto &record : batch) {
      if (const auto *line = std::get_if<std::string>(&record)) {
        std::fwrite(line->data(), 1, line->size(), current_output());
        continue;
      }
      const auto &redirect = std::get<RedirectOutput>(record);
      std::fflush(current_output());
      if (!open_sink(redirect.path)) {
        write_now(std::format("[pulsewire] cannot open log file '{}'\n",
                              redirect.path));
      }
    }
    std::fflush(current_output());
    batch.clear();
  };

  auto fill_batch = [&] {
    while (batch.size() < kBatchSize) {
      auto next = try_take(*queue);
      if (!next) {
        return;
      }
      batch.push_back(std::move(*next));
    }
  };

  // Every receive is run to completion, so no handler outlives this frame.
  // The loop ends once close() fails the pending receive.
  bool open = true;
  while (open) {
    queue->async_receive(
        [&](const boost::system::error_code &ec, LogRecord record) {
          if (ec) {
            open = false;
          } else {
            batch.push_back(std::move(record));
          }
        });
    queue_ctx_.restart();
    (void)queue_ctx_.run_one();
    fill_batch();
    write_batch();
  }

  // Drain what was queued before close().
  for (fill_batch(); !batch.empty(); fill_batch()) {
    write_batch();
  }
}

} // namespace pulsewire::log
