#include "pulsewire/http/http_server.hpp"

#include "pulsewire/core/coroutine.hpp"
#include "pulsewire/core/runtime.hpp"
#include "pulsewire/http/router.hpp"
#include "pulsewire/util/log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/cancel_after.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/core/detect_ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <sys/socket.h>
#include <vector>

namespace pulsewire::http {

namespace {
constexpr auto kHttpIoTimeout = std::chrono::seconds(30);
constexpr std::uint32_t kParserHeaderLimit = 64 * 1024;
constexpr std::uint64_t kParserBodyLimit = 1024ULL * 1024ULL;

namespace beast = boost::beast;
namespace beast_http = beast::http;
namespace net = boost::asio;

using BeastRequest = beast_http::request<beast_http::string_body>;

auto to_request(const BeastRequest &msg) -> HttpRequest {
  HttpRequest out;
  out.method = msg.method();
  out.version = msg.version();
  out.target = std::string(msg.target());

  if (auto parsed = boost::urls::parse_origin_form(out.target); parsed) {
    out.path = std::string(parsed->encoded_path());
    if (auto query = parsed->encoded_query(); !query.empty()) {
      out.query_string.assign(query.data(), query.size());
    }
  } else {
    out.path = out.target;
  }

  for (const auto &field : msg.base()) {
    out.headers.emplace(field.name_string(), field.value());
  }
  out.body = msg.body();
  return out;
}

auto to_beast_response(const HttpResponse &resp, unsigned version,
                       bool keep_alive)
    -> beast_http::response<beast_http::string_body> {
  beast_http::response<beast_http::string_body> out{
      static_cast<beast_http::status>(resp.status), version};
  out.keep_alive(keep_alive);
  out.set(beast_http::field::server, "pulsewire");
  out.set(beast_http::field::content_type, resp.content_type);
  out.set(beast_http::field::cache_control, "no-store");
  out.body() = resp.body;
  out.prepare_payload();
  return out;
}

auto is_quiet_read_error(const boost::system::error_code &ec) -> bool {
  return ec == net::error::eof || ec == beast::error::timeout ||
         ec == beast_http::error::end_of_stream ||
         ec == net::error::operation_aborted ||
         ec == net::ssl::error::stream_truncated;
}
} // namespace

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
  Runtime &runtime;
  Router router_;
  WebSocketHandler ws_handler_;
  std::shared_ptr<net::ssl::context> tls_ctx;
  struct Listener {
    shard_id shard{0};
    std::shared_ptr<net::ip::tcp::acceptor> acceptor;
  };
  std::vector<Listener> listeners;
  std::atomic<bool> running{false};
  std::atomic<std::uint16_t> bound_port{0};
  std::atomic<std::uint64_t> next_shard{0};

  explicit Impl(Runtime &rt) : runtime(rt) {}

  // Answers requests on `stream` until the peer goes away, keep-alive ends or
  // an upgrade request arrives. The upgrade request is returned unanswered.
  template <typename Stream>
  auto serve_requests(Stream &stream, beast::flat_buffer &buffer,
                      std::string_view scheme)
      -> task<std::optional<HttpRequest>> {
    while (running.load(std::memory_order_acquire)) {
      beast_http::request_parser<beast_http::string_body> parser;
      parser.header_limit(kParserHeaderLimit);
      parser.body_limit(kParserBodyLimit);

      auto [read_ec, read_n] = co_await beast_http::async_read(
          stream, buffer, parser,
          net::cancel_after(kHttpIoTimeout, use_nothrow));
      (void)read_n;
      if (read_ec) {
        if (!is_quiet_read_error(read_ec)) {
          log::warn("{} read failed: {}", scheme, read_ec.message());
        }
        co_return std::nullopt;
      }

      auto msg = parser.release();
      auto req = to_request(msg);
      log::debug("{} {} {}", scheme,
                 std::string_view(beast_http::to_string(req.method)), req.path);
      if (req.is_websocket_upgrade()) {
        co_return req;
      }

      const bool keep_alive = msg.keep_alive();
      auto resp = co_await router_.route(std::move(req));
      auto out = to_beast_response(resp, msg.version(), keep_alive);
      auto [write_ec, written] = co_await beast_http::async_write(
          stream, out, net::cancel_after(kHttpIoTimeout, use_nothrow));
      (void)written;
      if (write_ec) {
        log::warn("{} write failed: {}", scheme, write_ec.message());
        co_return std::nullopt;
      }
      if (!keep_alive) {
        break;
      }
    }
    co_return std::nullopt;
  }

  auto handle_plain(net::ip::tcp::socket socket, beast::flat_buffer buffer)
      -> spawn_task {
    auto upgrade = co_await serve_requests(socket, buffer, "http");
    if (upgrade) {
      co_await hand_off_plain(std::move(socket), std::move(*upgrade));
    }
  }

  // The WebSocket layer owns the socket as a generic stream so unit tests can
  // drive it over socketpairs.
  auto hand_off_plain(net::ip::tcp::socket socket, HttpRequest req)
      -> spawn_task {
    if (!ws_handler_) {
      log::warn("Upgrade on {} ignored: no WebSocket handler", req.path);
      co_return;
    }
    boost::system::error_code ec;
    const auto family = socket.local_endpoint(ec).protocol().family();
    if (ec) {
      log::warn("Upgrade on {} dropped: {}", req.path, ec.message());
      co_return;
    }
    const int fd = socket.release(ec);
    if (ec) {
      log::warn("Upgrade on {} dropped: {}", req.path, ec.message());
      co_return;
    }
    net::generic::stream_protocol::socket ws_socket(socket.get_executor());
    ws_socket.assign(net::generic::stream_protocol(family, SOCK_STREAM), fd, ec);
    if (ec) {
      log::warn("Upgrade on {} dropped: {}", req.path, ec.message());
      co_return;
    }
    auto conn = std::make_shared<WebSocketConnection>(std::move(ws_socket), req);
    co_await ws_handler_(std::move(conn), std::move(req));
  }

  auto handle_tls(net::ip::tcp::socket socket, beast::flat_buffer buffer)
      -> spawn_task {
    net::ssl::stream<net::ip::tcp::socket> stream(std::move(socket), *tls_ctx);

    // Bytes consumed by SSL detection are the start of the ClientHello.
    auto [hs_ec, consumed] = co_await stream.async_handshake(
        net::ssl::stream_base::server, buffer.data(),
        net::cancel_after(kHttpIoTimeout, use_nothrow));
    if (hs_ec) {
      log::warn("TLS handshake failed: {}", hs_ec.message());
      co_return;
    }
    buffer.consume(consumed);

    auto upgrade = co_await serve_requests(stream, buffer, "https");
    if (!upgrade) {
      boost::system::error_code ignored;
      stream.shutdown(ignored);
      co_return;
    }
    if (!ws_handler_) {
      log::warn("Upgrade on {} ignored: no WebSocket handler", upgrade->path);
      co_return;
    }
    auto conn =
        std::make_shared<TlsWebSocketConnection>(std::move(stream), *upgrade);
    co_await ws_handler_(std::move(conn), std::move(*upgrade));
  }

  auto dispatch(net::ip::tcp::socket socket) -> spawn_task {
    auto self = shared_from_this();
    beast::flat_buffer buffer;
    if (!tls_ctx) {
      co_await handle_plain(std::move(socket), std::move(buffer));
      co_return;
    }
    auto [detect_ec, is_tls] = co_await beast::async_detect_ssl(
        socket, buffer, net::cancel_after(kHttpIoTimeout, use_nothrow));
    if (detect_ec) {
      log::debug("TLS detection failed: {}", detect_ec.message());
      co_return;
    }
    if (is_tls) {
      co_await handle_tls(std::move(socket), std::move(buffer));
    } else {
      co_await handle_plain(std::move(socket), std::move(buffer));
    }
  }

  auto accept_loop(std::shared_ptr<net::ip::tcp::acceptor> acceptor)
      -> spawn_task {
    auto self = shared_from_this();
    for (;;) {
      // Connections are spread round-robin and stay on their shard.
      const auto shard = static_cast<shard_id>(
          next_shard.fetch_add(1, std::memory_order_relaxed) %
          runtime.shard_count());
      auto [ec, socket] = co_await acceptor->async_accept(
          runtime.context_for(shard), use_nothrow);
      if (!running.load(std::memory_order_acquire)) {
        co_return;
      }
      if (ec) {
        if (ec != net::error::operation_aborted) {
          log::error("accept on port {} stopped: {}", bound_port.load(),
                     ec.message());
        }
        co_return;
      }
      boost::system::error_code opt_ec;
      socket.set_option(net::ip::tcp::no_delay(true), opt_ec);
      runtime.spawn_on(shard, dispatch(std::move(socket)));
    }
  }

  auto open_acceptor(shard_id shard, const net::ip::tcp::endpoint &endpoint,
                     bool reuse_port)
      -> Result<std::shared_ptr<net::ip::tcp::acceptor>> {
    auto acceptor =
        std::make_shared<net::ip::tcp::acceptor>(runtime.context_for(shard));
    boost::system::error_code ec;
    auto failed = [&](std::string_view step) {
      log::error("{} {} failed: {}", step, endpoint.address().to_string(),
                 ec.message());
      return ec;
    };

    if (acceptor->open(endpoint.protocol(), ec); ec) {
      return fail(failed("open"));
    }
    if (acceptor->set_option(net::socket_base::reuse_address(true), ec); ec) {
      return fail(failed("SO_REUSEADDR on"));
    }
    if (reuse_port) {
      using ReusePort = net::detail::socket_option::boolean<SOL_SOCKET,
                                                            SO_REUSEPORT>;
      if (acceptor->set_option(ReusePort(true), ec); ec) {
        return fail(failed("SO_REUSEPORT on"));
      }
    }
    if (acceptor->bind(endpoint, ec); ec) {
      return fail(failed("bind"));
    }
    if (acceptor->listen(net::socket_base::max_listen_connections, ec); ec) {
      return fail(failed("listen"));
    }
    return ok(std::move(acceptor));
  }

  auto close_listeners() -> void {
    for (auto &[shard, acceptor] : listeners) {
      net::post(runtime.executor_for(shard), [acceptor] {
        boost::system::error_code ignored;
        acceptor->close(ignored);
      });
    }
    listeners.clear();
  }
};

HttpServer::HttpServer(Runtime &runtime)
    : impl_(std::make_shared<Impl>(runtime)) {}

HttpServer::~HttpServer() { stop(); }

auto HttpServer::router() -> Router & { return impl_->router_; }

auto HttpServer::set_websocket_handler(WebSocketHandler handler) -> void {
  impl_->ws_handler_ = std::move(handler);
}

auto HttpServer::set_tls_credentials(std::string cert_chain_file,
                                     std::string private_key_file)
    -> Result<void> {
  auto ctx = std::make_shared<net::ssl::context>(net::ssl::context::tls_server);
  boost::system::error_code ec;
  ctx->set_options(net::ssl::context::default_workarounds |
                       net::ssl::context::no_sslv2 |
                       net::ssl::context::no_sslv3 |
                       net::ssl::context::no_tlsv1 |
                       net::ssl::context::no_tlsv1_1,
                   ec);
  if (!ec) {
    ctx->use_certificate_chain_file(cert_chain_file, ec);
  }
  if (!ec) {
    ctx->use_private_key_file(private_key_file, net::ssl::context::pem, ec);
  }
  if (ec) {
    log::error("TLS setup with cert '{}' and key '{}' failed: {}",
               cert_chain_file, private_key_file, ec.message());
    return fail(Error::InvalidArgument);
  }
  impl_->tls_ctx = std::move(ctx);
  return ok();
}

auto HttpServer::start(std::string_view host, std::uint16_t port,
                       bool reuse_port) -> Result<void> {
  auto &impl = *impl_;
  if (impl.running.load(std::memory_order_acquire)) {
    return fail(Error::AlreadyExists);
  }

  boost::system::error_code ec;
  const auto address = host.empty()
                           ? net::ip::address{net::ip::address_v4::any()}
                           : net::ip::make_address(host, ec);
  if (ec) {
    log::error("'{}' is not an IP address: {}", host, ec.message());
    return fail(Error::InvalidArgument);
  }

  // With SO_REUSEPORT every shard gets its own acceptor and the kernel
  // balances between them. The first bind fixes an ephemeral port.
  net::ip::tcp::endpoint endpoint{address, port};
  const unsigned count = reuse_port ? impl.runtime.shard_count() : 1U;
  for (shard_id shard = 0; shard < count; ++shard) {
    auto acceptor = impl.open_acceptor(shard, endpoint, reuse_port);
    if (!acceptor) {
      impl.close_listeners();
      return fail(acceptor.error());
    }
    if (endpoint.port() == 0) {
      endpoint.port((*acceptor)->local_endpoint(ec).port());
    }
    impl.listeners.push_back({.shard = shard, .acceptor = *acceptor});
  }

  impl.bound_port.store(endpoint.port(), std::memory_order_release);
  impl.running.store(true, std::memory_order_release);
  for (const auto &[shard, acceptor] : impl.listeners) {
    impl.runtime.spawn_on(shard, impl.accept_loop(acceptor));
  }
  log::info("HTTP listening on {}:{} ({} acceptor(s){})", host,
            endpoint.port(), count, impl.tls_ctx ? ", tls" : "");
  return ok();
}

auto HttpServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }
  impl_->close_listeners();
  log::info("HTTP server on port {} stopped", local_port());
}

auto HttpServer::is_running() const -> bool {
  return impl_->running.load(std::memory_order_acquire);
}

auto HttpServer::local_port() const -> std::uint16_t {
  return impl_->bound_port.load(std::memory_order_acquire);
}

} // namespace pulsewire::http
