#include "pulsewire/client/websocket_transport.hpp"

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/util/log.hpp"
#include "pulsewire/util/url.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <format>
#include <string>

namespace pulsewire {

namespace {
namespace beast = boost::beast;
namespace beast_ws = beast::websocket;
using tcp = boost::asio::ip::tcp;

// cancel_after surfaces an expired deadline as operation_aborted.
auto connect_error(const boost::system::error_code &ec) -> std::error_code {
  if (ec == boost::asio::error::operation_aborted) {
    return make_error_code(Error::Timeout);
  }
  return ec;
}
} // namespace

struct WebSocketTransport::Impl {
  beast_ws::stream<tcp::socket> ws;
  beast::flat_buffer read_buffer;
  std::atomic<bool> open{false};

  explicit Impl(boost::asio::any_io_executor executor)
      : ws(std::move(executor)) {}
};

WebSocketTransport::WebSocketTransport(boost::asio::any_io_executor executor)
    : impl_(std::make_shared<Impl>(std::move(executor))) {}

WebSocketTransport::~WebSocketTransport() {
  boost::system::error_code ec;
  auto &socket = beast::get_lowest_layer(impl_->ws);
  socket.close(ec);
}

auto WebSocketTransport::connect(std::string_view url,
                                 std::chrono::milliseconds timeout)
    -> task<Result<void>> {
  auto impl = impl_;
  auto parsed = util::parse_ws_url(url);
  if (!parsed) {
    log::error("Invalid WebSocket URL '{}'", url);
    co_return fail(parsed.error());
  }

  tcp::resolver resolver(impl->ws.get_executor());
  auto [resolve_ec, endpoints] = co_await resolver.async_resolve(
      parsed->host, std::to_string(parsed->port),
      boost::asio::cancel_after(timeout, use_nothrow));
  if (resolve_ec) {
    log::debug("Failed to resolve {}:{} - {}", parsed->host, parsed->port,
               resolve_ec.message());
    co_return fail(connect_error(resolve_ec));
  }

  auto [connect_ec, endpoint] = co_await boost::asio::async_connect(
      beast::get_lowest_layer(impl->ws), endpoints,
      boost::asio::cancel_after(timeout, use_nothrow));
  (void)endpoint;
  if (connect_ec) {
    log::debug("Failed to connect to {}:{} - {}", parsed->host, parsed->port,
               connect_ec.message());
    co_return fail(connect_error(connect_ec));
  }

  impl->ws.set_option(
      beast_ws::stream_base::timeout::suggested(beast::role_type::client));
  impl->ws.set_option(
      beast_ws::stream_base::decorator([](beast_ws::request_type &req) {
        req.set(beast::http::field::user_agent, "pulsewire-client");
      }));

  const auto host = std::format("{}:{}", parsed->host, parsed->port);
  auto [handshake_ec] = co_await impl->ws.async_handshake(
      host, parsed->target, boost::asio::cancel_after(timeout, use_nothrow));
  if (handshake_ec) {
    log::debug("WebSocket handshake with {} failed: {}", host,
               handshake_ec.message());
    co_return fail(connect_error(handshake_ec));
  }

  impl->open.store(true, std::memory_order_release);
  co_return ok();
}

auto WebSocketTransport::read() -> task<Result<std::string>> {
  auto impl = impl_;
  if (!impl->open.load(std::memory_order_acquire)) {
    co_return fail(Error::NotConnected);
  }
  auto [ec, n] = co_await impl->ws.async_read(impl->read_buffer, use_nothrow);
  (void)n;
  if (ec) {
    impl->open.store(false, std::memory_order_release);
    if (ec == beast_ws::error::closed) {
      co_return fail(Error::ConnectionClosed);
    }
    co_return fail(ec);
  }
  auto text = beast::buffers_to_string(impl->read_buffer.data());
  impl->read_buffer.consume(impl->read_buffer.size());
  co_return text;
}

auto WebSocketTransport::write(std::string text) -> task<Result<void>> {
  auto impl = impl_;
  if (!impl->open.load(std::memory_order_acquire)) {
    co_return fail(Error::NotConnected);
  }
  impl->ws.text(true);
  auto [ec, n] =
      co_await impl->ws.async_write(boost::asio::buffer(text), use_nothrow);
  (void)n;
  if (ec) {
    impl->open.store(false, std::memory_order_release);
    co_return fail(ec);
  }
  co_return ok();
}

auto WebSocketTransport::close() -> task<Result<void>> {
  auto impl = impl_;
  if (!impl->open.exchange(false, std::memory_order_acq_rel)) {
    boost::system::error_code ignored;
    beast::get_lowest_layer(impl->ws).close(ignored);
    co_return ok();
  }
  auto [ec] = co_await impl->ws.async_close(beast_ws::close_code::normal,
                                            use_nothrow);
  if (ec && ec != beast_ws::error::closed) {
    boost::system::error_code ignored;
    beast::get_lowest_layer(impl->ws).close(ignored);
    co_return fail(ec);
  }
  co_return ok();
}

auto WebSocketTransport::is_open() const -> bool {
  return impl_->open.load(std::memory_order_acquire);
}

auto make_websocket_transport_factory() -> TransportFactory {
  return [](boost::asio::any_io_executor executor)
             -> std::shared_ptr<IClientTransport> {
    return std::make_shared<WebSocketTransport>(std::move(executor));
  };
}

} // namespace pulsewire
