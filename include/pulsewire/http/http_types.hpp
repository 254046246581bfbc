#pragma once

#include "pulsewire/util/string_map.hpp"

#include <boost/beast/http/verb.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pulsewire::http {

using HttpMethod = boost::beast::http::verb;

enum class HttpStatus : std::uint16_t {
  Ok = 200,
  BadRequest = 400,
  Unauthorized = 401,
  NotFound = 404,
  MethodNotAllowed = 405,
  InternalServerError = 500,
  ServiceUnavailable = 503,
};

using HttpHeaders = StringMap<std::string>;

/// Percent-decoded query parameters; a repeated key keeps its last value.
/// A query that fails to parse is treated as empty.
class QueryParams {
public:
  QueryParams() = default;
  explicit QueryParams(std::string_view query_string);

  [[nodiscard]] auto get(std::string_view key) const
      -> std::optional<std::string>;
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return params_.size();
  }

private:
  StringMap<std::string> params_;
};

struct HttpRequest {
  HttpMethod method{HttpMethod::get};
  unsigned version{11};
  std::string target;
  std::string path;
  std::string query_string;
  HttpHeaders headers;
  std::string body;

  /// Case-insensitive lookup.
  [[nodiscard]] auto header(std::string_view name) const
      -> std::optional<std::string>;
  [[nodiscard]] auto is_websocket_upgrade() const -> bool;
  [[nodiscard]] auto query() const -> QueryParams {
    return QueryParams{query_string};
  }
};

struct HttpResponse {
  HttpStatus status{HttpStatus::Ok};
  std::string content_type{"application/json"};
  std::string body;

  [[nodiscard]] static auto json(std::string body,
                                 HttpStatus status = HttpStatus::Ok)
      -> HttpResponse;
  [[nodiscard]] static auto plain(HttpStatus status, std::string body)
      -> HttpResponse;
};

} // namespace pulsewire::http
