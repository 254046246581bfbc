#include "pulsewire/http/websocket.hpp"

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <utility>

namespace pulsewire::http {

namespace {

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace beast_ws = beast::websocket;

using UpgradeRequest = beast_http::request<beast_http::string_body>;

constexpr std::size_t kDefaultReadLimit = 1024 * 1024;

auto to_upgrade_request(HttpRequest request) -> UpgradeRequest {
  UpgradeRequest out{request.method, request.target, request.version};
  for (const auto &[name, value] : request.headers) {
    out.set(name, value);
  }
  return out;
}

auto to_opcode(beast_ws::frame_type kind) -> WebSocketOpCode {
  switch (kind) {
  case beast_ws::frame_type::ping:
    return WebSocketOpCode::Ping;
  case beast_ws::frame_type::pong:
    return WebSocketOpCode::Pong;
  case beast_ws::frame_type::close:
    return WebSocketOpCode::Close;
  }
  return WebSocketOpCode::Close;
}

} // namespace

template <typename NextLayer> struct BasicWebSocketConnection<NextLayer>::Impl {
  beast_ws::stream<NextLayer> ws;
  beast::flat_buffer read_buffer;
  std::optional<UpgradeRequest> upgrade_request;
  std::atomic<bool> accepted{false};
  std::atomic<bool> closed{false};
  int fd_num{-1};
  std::function<void(WebSocketOpCode)> control_callback;

  Impl(NextLayer next_layer, std::optional<UpgradeRequest> req)
      : ws(std::move(next_layer)), upgrade_request(std::move(req)),
        fd_num(static_cast<int>(beast::get_lowest_layer(ws).native_handle())) {
    beast_ws::permessage_deflate pmd;
    pmd.client_enable = true;
    pmd.server_enable = true;
    pmd.compLevel = 3;
    ws.set_option(pmd);
    ws.auto_fragment(false);
    ws.read_message_max(kDefaultReadLimit);
    ws.set_option(
        beast_ws::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(
        beast_ws::stream_base::decorator([](beast_ws::response_type &res) {
          res.set(beast_http::field::server, "pulsewire");
        }));
    ws.control_callback(
        [this](beast_ws::frame_type kind, beast::string_view) {
          if (control_callback) {
            control_callback(to_opcode(kind));
          }
        });
  }

  auto shutdown_socket() -> void {
    boost::system::error_code ec;
    auto &socket = beast::get_lowest_layer(ws);
    socket.cancel(ec);
    socket.close(ec);
  }
};

template <typename NextLayer>
BasicWebSocketConnection<NextLayer>::BasicWebSocketConnection(
    NextLayer next_layer, HttpRequest upgrade_request)
    : impl_(std::make_shared<Impl>(
          std::move(next_layer),
          to_upgrade_request(std::move(upgrade_request)))) {}

template <typename NextLayer>
BasicWebSocketConnection<NextLayer>::BasicWebSocketConnection(
    NextLayer next_layer)
    : impl_(std::make_shared<Impl>(std::move(next_layer), std::nullopt)) {}

template <typename NextLayer>
BasicWebSocketConnection<NextLayer>::~BasicWebSocketConnection() = default;

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::accept() -> task<Result<void>> {
  auto impl = impl_;
  if (impl->accepted.load(std::memory_order_acquire)) {
    co_return ok();
  }
  Result<void> res;
  if (impl->upgrade_request.has_value()) {
    auto req = std::move(*impl->upgrade_request);
    impl->upgrade_request.reset();
    res = co_await co_as_result(impl->ws.async_accept(req, use_nothrow));
  } else {
    res = co_await co_as_result(impl->ws.async_accept(use_nothrow));
  }
  if (!res) {
    log::debug("WebSocket accept failed: fd={} err={}", impl->fd_num,
               res.error().message());
    impl->closed.store(true, std::memory_order_release);
    co_return res;
  }
  impl->accepted.store(true, std::memory_order_release);
  co_return ok();
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::reject(HttpStatus status,
                                                 std::string body)
    -> task<Result<void>> {
  auto impl = impl_;
  if (impl->accepted.load(std::memory_order_acquire) ||
      impl->closed.exchange(true, std::memory_order_acq_rel)) {
    co_return fail(Error::InvalidState);
  }

  unsigned version = 11;
  if (impl->upgrade_request.has_value()) {
    version = impl->upgrade_request->version();
  } else {
    UpgradeRequest req;
    auto [read_ec, read_n] = co_await beast_http::async_read(
        impl->ws.next_layer(), impl->read_buffer, req, use_nothrow);
    (void)read_n;
    if (read_ec) {
      impl->shutdown_socket();
      co_return fail(read_ec);
    }
    version = req.version();
  }
  impl->upgrade_request.reset();

  beast_http::response<beast_http::string_body> res{
      static_cast<beast_http::status>(status), version};
  res.set(beast_http::field::server, "pulsewire");
  res.set(beast_http::field::content_type, "text/plain; charset=utf-8");
  res.keep_alive(false);
  res.body() = std::move(body);
  res.prepare_payload();

  auto [write_ec, written] =
      co_await beast_http::async_write(impl->ws.next_layer(), res, use_nothrow);
  (void)written;
  impl->shutdown_socket();
  if (write_ec) {
    co_return fail(write_ec);
  }
  co_return ok();
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::read() -> task<Result<InboundFrame>> {
  auto impl = impl_;
  if (impl->closed.load(std::memory_order_acquire)) {
    co_return fail(Error::ConnectionClosed);
  }
  auto [ec, n] = co_await impl->ws.async_read(impl->read_buffer, use_nothrow);
  (void)n;
  if (ec) {
    impl->closed.store(true, std::memory_order_release);
    if (ec == beast_ws::error::closed) {
      co_return fail(Error::ConnectionClosed);
    }
    if (ec == beast_ws::error::message_too_big) {
      co_return fail(Error::MessageTooLarge);
    }
    co_return fail(ec);
  }

  InboundFrame frame{
      .opcode = impl->ws.got_text() ? WebSocketOpCode::Text
                                    : WebSocketOpCode::Binary,
      .payload = beast::buffers_to_string(impl->read_buffer.data())};
  impl->read_buffer.consume(impl->read_buffer.size());
  co_return frame;
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::write_text(
    std::shared_ptr<const std::string> text) -> task<Result<void>> {
  auto impl = impl_;
  if (impl->closed.load(std::memory_order_acquire)) {
    co_return fail(Error::ConnectionClosed);
  }
  impl->ws.text(true);
  auto [ec, n] = co_await impl->ws.async_write(
      boost::asio::buffer(text->data(), text->size()), use_nothrow);
  (void)n;
  if (ec) {
    log::debug("WebSocket text write failed: fd={} err={}", impl->fd_num,
               ec.message());
    impl->closed.store(true, std::memory_order_release);
    co_return fail(ec);
  }
  co_return ok();
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::ping() -> task<Result<void>> {
  auto impl = impl_;
  if (impl->closed.load(std::memory_order_acquire)) {
    co_return fail(Error::ConnectionClosed);
  }
  auto res = co_await co_as_result(
      impl->ws.async_ping(beast_ws::ping_data{}, use_nothrow));
  if (!res) {
    log::debug("WebSocket ping failed: fd={} err={}", impl->fd_num,
               res.error().message());
    impl->closed.store(true, std::memory_order_release);
  }
  co_return res;
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::close() -> task<Result<void>> {
  auto impl = impl_;
  if (!impl->accepted.load(std::memory_order_acquire) ||
      impl->closed.load(std::memory_order_acquire) || !impl->ws.is_open()) {
    co_return ok();
  }
  auto [ec] = co_await impl->ws.async_close(beast_ws::close_code::normal,
                                            use_nothrow);
  impl->closed.store(true, std::memory_order_release);
  if (ec && ec != beast_ws::error::closed) {
    log::debug("WebSocket close failed: fd={} err={}", impl->fd_num,
               ec.message());
    co_return fail(ec);
  }
  co_return ok();
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::set_control_callback(
    std::function<void(WebSocketOpCode)> callback) -> void {
  impl_->control_callback = std::move(callback);
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::set_read_limit(std::size_t bytes)
    -> void {
  impl_->ws.read_message_max(bytes);
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::is_closed() const -> bool {
  return !impl_ || impl_->closed.load(std::memory_order_acquire);
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::fd() const -> int {
  return impl_ ? impl_->fd_num : -1;
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::force_close() -> void {
  auto impl = impl_;
  if (!impl) {
    return;
  }
  impl->closed.store(true, std::memory_order_release);
  boost::asio::post(impl->ws.get_executor(),
                    [impl]() { impl->shutdown_socket(); });
}

template <typename NextLayer>
auto BasicWebSocketConnection<NextLayer>::get_executor() const
    -> boost::asio::any_io_executor {
  return impl_->ws.get_executor();
}

template class BasicWebSocketConnection<
    boost::asio::generic::stream_protocol::socket>;
template class BasicWebSocketConnection<
    boost::asio::ssl::stream<boost::asio::ip::tcp::socket>>;

} // namespace pulsewire::http
