#pragma once

#include "pulsewire/core/error.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace pulsewire::util {

struct WsEndpoint {
  std::string host;
  std::uint16_t port{80};
  std::string target{"/"}; // origin-form: path plus "?query"
};

/// Accepts `ws://host[:port][/path][?query]`; the scheme may be omitted.
/// Secure `wss://` endpoints are rejected.
[[nodiscard]] inline auto parse_ws_url(std::string_view text)
    -> Result<WsEndpoint> {
  const bool has_scheme = text.find("://") != std::string_view::npos;
  const std::string full = has_scheme ? std::string(text)
                                      : "ws://" + std::string(text);
  auto uri = boost::urls::parse_absolute_uri(full);
  if (!uri || uri->scheme() != "ws" || uri->host().empty()) {
    return fail(Error::InvalidUrl);
  }
  if (uri->has_port() && uri->port_number() == 0) {
    return fail(Error::InvalidUrl);
  }

  WsEndpoint out;
  out.host = uri->host();
  if (uri->has_port()) {
    out.port = uri->port_number();
  }
  const auto path = uri->encoded_path();
  out.target = path.empty() ? "/" : std::string(path.data(), path.size());
  if (uri->has_query()) {
    const auto query = uri->encoded_query();
    out.target.push_back('?');
    out.target.append(query.data(), query.size());
  }
  return out;
}

/// Sets `key` in the query of `url`; the value is percent-encoded. Text that
/// does not parse as a URL is returned unchanged.
[[nodiscard]] inline auto append_query_param(std::string url,
                                             std::string_view key,
                                             std::string_view value)
    -> std::string {
  auto parsed = boost::urls::parse_uri_reference(url);
  if (!parsed) {
    return url;
  }
  boost::urls::url out(*parsed);
  out.params().set(key, value);
  const auto buffer = out.buffer();
  return {buffer.data(), buffer.size()};
}

} // namespace pulsewire::util
