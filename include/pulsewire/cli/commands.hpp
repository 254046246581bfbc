#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pulsewire::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  std::optional<std::string> log_level;
  std::optional<int> shards;
  std::optional<int> port;
  bool simulate{false};
};

struct ListenOptions {
  std::string config_file;
  std::optional<std::string> url;
  std::vector<std::string> topics;
  std::optional<std::string> client_id;
  std::string token{"valid-token"};
  std::optional<std::string> log_level;
  bool no_reconnect{false};
  bool json{false};
};

[[nodiscard]] auto cmd_serve(const ServeOptions &opts) -> int;
[[nodiscard]] auto cmd_listen(const ListenOptions &opts) -> int;

} // namespace pulsewire::cli
