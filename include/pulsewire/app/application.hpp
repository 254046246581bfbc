#pragma once

#include "pulsewire/config/system_config.hpp"
#include "pulsewire/core/error.hpp"
#include "pulsewire/hub/admission.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace pulsewire {

class Hub;
class Runtime;

namespace http {
class HttpServer;
}

/// Demo publisher: `rounds` agent and transaction updates, `interval` apart,
/// after `initial_delay`.
struct SimulationOptions {
  std::chrono::milliseconds initial_delay{10000};
  std::chrono::milliseconds interval{5000};
  int rounds{5};
};

// Application facade - owns the runtime, hub and HTTP server
class Application {
public:
  explicit Application(SystemConfig config, TokenValidator validator = {});
  ~Application();

  Application(const Application &) = delete;
  auto operator=(const Application &) -> Application & = delete;

  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  auto start_simulation(SimulationOptions options = {}) -> void;

  [[nodiscard]] auto config() const noexcept -> const SystemConfig & {
    return config_;
  }
  [[nodiscard]] auto hub() -> Hub &;
  [[nodiscard]] auto runtime() -> Runtime &;
  /// Bound port; differs from the configured one when that was 0.
  [[nodiscard]] auto local_port() const -> std::uint16_t;

private:
  auto setup_routes() -> void;
  auto setup_websocket() -> void;

  SystemConfig config_;
  std::unique_ptr<Runtime> runtime_;
  std::unique_ptr<Hub> hub_;
  Admission admission_;
  std::unique_ptr<http::HttpServer> server_;
  std::atomic<bool> running_{false};
  std::shared_ptr<std::atomic<bool>> simulation_active_;
};

} // namespace pulsewire
