#include "pulsewire/app/application.hpp"

#include "pulsewire/core/runtime.hpp"
#include "pulsewire/http/http_server.hpp"
#include "pulsewire/http/router.hpp"
#include "pulsewire/hub/hub.hpp"
#include "pulsewire/util/json.hpp"
#include "pulsewire/util/log.hpp"

#include <string>
#include <utility>

namespace pulsewire {

namespace {

auto simulate_updates(Hub &hub, std::shared_ptr<std::atomic<bool>> active,
                      SimulationOptions options) -> spawn_task {
  co_await async_sleep(options.initial_delay);
  for (int round = 0; round < options.rounds; ++round) {
    if (!active->load(std::memory_order_acquire) || !hub.is_running()) {
      co_return;
    }
    if (auto r = hub.publish_agent_status("agent-123", "active",
                                          "Agent is processing data");
        !r) {
      log::warn("Simulated agent update failed: {}", r.error().message());
    }
    if (auto r = hub.publish_transaction_update(
            "tx-456", "confirmed", "0.5 SOL", "Solana", "addr1", "addr2");
        !r) {
      log::warn("Simulated transaction update failed: {}",
                r.error().message());
    }
    log::debug("Simulation round {}/{} published", round + 1, options.rounds);
    co_await async_sleep(options.interval);
  }
  log::info("Simulation finished after {} round(s)", options.rounds);
}

} // namespace

Application::Application(SystemConfig config, TokenValidator validator)
    : config_(std::move(config)),
      runtime_(std::make_unique<Runtime>(
          static_cast<unsigned>(config_.server.shards))),
      hub_(std::make_unique<Hub>(*runtime_, config_.hub)),
      admission_(validator ? std::move(validator)
                           : make_static_token_validator(config_.auth.tokens),
                 config_.server.ws_path),
      server_(std::make_unique<http::HttpServer>(*runtime_)) {
  setup_routes();
  setup_websocket();
}

Application::~Application() { stop(); }

auto Application::setup_routes() -> void {
  auto &router = server_->router();

  router.get("/health", [this](http::HttpRequest) -> task<http::HttpResponse> {
    const bool healthy = hub_->is_running();
    JsonValue body{
        {"status", std::string(healthy ? "healthy" : "unavailable")},
        {"sessions", static_cast<std::int64_t>(hub_->session_count())},
    };
    co_return http::HttpResponse::json(
        dump_json(body),
        healthy ? http::HttpStatus::Ok : http::HttpStatus::ServiceUnavailable);
  });

  router.get("/stats", [this](http::HttpRequest) -> task<http::HttpResponse> {
    if (!hub_->is_running()) {
      co_return http::HttpResponse::json(R"({"error":"hub not running"})",
                                         http::HttpStatus::ServiceUnavailable);
    }
    auto snapshot = co_await hub_->snapshot();
    co_return http::HttpResponse::json(dump_json(to_json(snapshot)));
  });
}

auto Application::setup_websocket() -> void {
  server_->set_websocket_handler(
      [this](std::shared_ptr<http::IWebSocketConnection> conn,
             http::HttpRequest req) -> spawn_task {
        auto ticket = admission_.admit(req);
        if (!ticket) {
          const auto status = admission_status(ticket.error());
          if (auto r = co_await conn->reject(status, ticket.error().message());
              !r) {
            log::debug("Reject of {} failed: {}", req.path,
                       r.error().message());
          }
          co_return;
        }
        if (!hub_->is_running()) {
          if (auto r = co_await conn->reject(
                  http::HttpStatus::ServiceUnavailable, "hub not running");
              !r) {
            log::debug("Reject of {} failed: {}", req.path,
                       r.error().message());
          }
          co_return;
        }

        auto session =
            hub_->make_session(std::move(conn), std::move(ticket->client_id));
        co_await session->run();
      });
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true)) {
    return ok();
  }

  if (auto r = runtime_->start(); !r) {
    running_.store(false);
    return r;
  }
  if (auto r = hub_->start(); !r) {
    log::error("Failed to start hub: {}", r.error().message());
    stop();
    return r;
  }

  const auto &server = config_.server;
  if (server.tls_enabled) {
    if (auto r = server_->set_tls_credentials(server.tls_cert_file,
                                              server.tls_key_file);
        !r) {
      log::error("Failed to load TLS credentials: {}", r.error().message());
      stop();
      return r;
    }
  }
  if (auto r = server_->start(server.host, server.port, server.reuse_port);
      !r) {
    log::error("Failed to listen on {}:{}: {}", server.host, server.port,
               r.error().message());
    stop();
    return r;
  }

  log::info("pulsewire listening on {}:{} (ws path {}, {} shards{})",
            server.host, server_->local_port(), server.ws_path,
            runtime_->shard_count(), server.tls_enabled ? ", tls" : "");
  return ok();
}

auto Application::stop() noexcept -> void {
  if (!running_.exchange(false)) {
    return;
  }
  if (simulation_active_) {
    simulation_active_->store(false, std::memory_order_release);
  }
  server_->stop();
  hub_->stop();
  runtime_->stop();
  log::info("pulsewire stopped");
}

auto Application::is_running() const noexcept -> bool {
  return running_.load();
}

auto Application::start_simulation(SimulationOptions options) -> void {
  if (simulation_active_) {
    simulation_active_->store(false, std::memory_order_release);
  }
  simulation_active_ = std::make_shared<std::atomic<bool>>(true);
  log::info("Simulated updates every {}ms ({} rounds)",
            options.interval.count(), options.rounds);
  runtime_->spawn_external(
      simulate_updates(*hub_, simulation_active_, options));
}

auto Application::hub() -> Hub & { return *hub_; }

auto Application::runtime() -> Runtime & { return *runtime_; }

auto Application::local_port() const -> std::uint16_t {
  return server_->local_port();
}

} // namespace pulsewire
