#pragma once

#include "pulsewire/core/error.hpp"
#include "pulsewire/http/http_types.hpp"
#include "pulsewire/util/id.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace pulsewire {

/// Yes/no decision on a bearer token; issuing tokens happens elsewhere.
using TokenValidator = std::function<bool(std::string_view token)>;

[[nodiscard]] auto make_static_token_validator(std::vector<std::string> tokens)
    -> TokenValidator;

struct AdmissionTicket {
  ClientId client_id;
};

/// Gatekeeper for WebSocket upgrades, run before any Session exists.
///   wrong path                   -> Error::NotFound        (404)
///   missing or rejected token    -> Error::Unauthorized    (401)
///   missing or invalid client_id -> Error::MissingClientId (400)
class Admission {
public:
  explicit Admission(TokenValidator validator, std::string ws_path = "/ws");

  [[nodiscard]] auto admit(const http::HttpRequest &request) const
      -> Result<AdmissionTicket>;

  [[nodiscard]] auto ws_path() const noexcept -> const std::string & {
    return ws_path_;
  }

private:
  TokenValidator validator_;
  std::string ws_path_;
};

[[nodiscard]] auto admission_status(std::error_code ec) -> http::HttpStatus;

} // namespace pulsewire
