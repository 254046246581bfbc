#include "pulsewire/http/http_types.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/url/parse_query.hpp>

#include <utility>

namespace pulsewire::http {

QueryParams::QueryParams(std::string_view query_string) {
  if (query_string.empty()) {
    return;
  }
  auto parsed = boost::urls::parse_query(query_string);
  if (!parsed) {
    return;
  }
  for (auto param : *parsed) {
    params_.insert_or_assign(param.key.decode(), param.value.decode());
  }
}

auto QueryParams::get(std::string_view key) const
    -> std::optional<std::string> {
  if (auto it = params_.find(key); it != params_.end()) {
    return it->second;
  }
  return std::nullopt;
}

auto HttpRequest::header(std::string_view name) const
    -> std::optional<std::string> {
  for (const auto &[key, value] : headers) {
    if (boost::algorithm::iequals(key, name)) {
      return value;
    }
  }
  return std::nullopt;
}

auto HttpRequest::is_websocket_upgrade() const -> bool {
  const auto upgrade = header("Upgrade");
  const auto connection = header("Connection");
  return upgrade && connection &&
         boost::algorithm::iequals(*upgrade, "websocket") &&
         boost::algorithm::icontains(*connection, "upgrade");
}

auto HttpResponse::json(std::string body, HttpStatus status) -> HttpResponse {
  return HttpResponse{.status = status,
                      .content_type = "application/json",
                      .body = std::move(body)};
}

auto HttpResponse::plain(HttpStatus status, std::string body)
    -> HttpResponse {
  return HttpResponse{.status = status,
                      .content_type = "text/plain; charset=utf-8",
                      .body = std::move(body)};
}

} // namespace pulsewire::http
