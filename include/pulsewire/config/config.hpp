#pragma once

#include "pulsewire/config/system_config.hpp"
#include "pulsewire/core/error.hpp"

#include <string_view>

namespace pulsewire {

class ConfigLoader {
public:
  /// Missing sections keep their defaults; PULSEWIRE_* environment variables
  /// override file values.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  /// Defaults plus environment overrides, for running without a file.
  [[nodiscard]] static auto load_defaults() -> Result<SystemConfig>;
  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
  [[nodiscard]] static auto validate(const ClientConfig &client)
      -> Result<void>;
};

} // namespace pulsewire
