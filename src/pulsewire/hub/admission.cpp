#include "pulsewire/hub/admission.hpp"

#include "pulsewire/util/log.hpp"
#include "pulsewire/util/string_map.hpp"

#include <memory>
#include <utility>

namespace pulsewire {

auto make_static_token_validator(std::vector<std::string> tokens)
    -> TokenValidator {
  auto allowed = std::make_shared<const StringSet>(
      std::make_move_iterator(tokens.begin()),
      std::make_move_iterator(tokens.end()));
  return [allowed](std::string_view token) {
    return !token.empty() && allowed->contains(token);
  };
}

Admission::Admission(TokenValidator validator, std::string ws_path)
    : validator_(std::move(validator)), ws_path_(std::move(ws_path)) {}

auto Admission::admit(const http::HttpRequest &request) const
    -> Result<AdmissionTicket> {
  if (request.path != ws_path_) {
    return fail(Error::NotFound);
  }

  const auto query = request.query();
  auto token = query.get("token");
  if (!token || !validator_ || !validator_(*token)) {
    log::warn("Rejected upgrade on {}: {} token", request.path,
              token ? "invalid" : "missing");
    return fail(Error::Unauthorized);
  }

  auto client_id = query.get("client_id");
  if (!client_id || !ClientId::is_valid(*client_id)) {
    log::warn("Rejected upgrade on {}: missing or invalid client_id",
              request.path);
    return fail(Error::MissingClientId);
  }

  return AdmissionTicket{ClientId{std::move(*client_id)}};
}

auto admission_status(std::error_code ec) -> http::HttpStatus {
  if (ec == make_error_code(Error::NotFound)) {
    return http::HttpStatus::NotFound;
  }
  if (ec == make_error_code(Error::Unauthorized)) {
    return http::HttpStatus::Unauthorized;
  }
  if (ec == make_error_code(Error::MissingClientId)) {
    return http::HttpStatus::BadRequest;
  }
  return http::HttpStatus::InternalServerError;
}

} // namespace pulsewire
