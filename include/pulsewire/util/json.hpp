#pragma once

#include "pulsewire/core/error.hpp"

#include <glaze/json.hpp>

#include <string>
#include <string_view>

namespace pulsewire {

using JsonValue = glz::generic_json<glz::num_mode::i64>;

[[nodiscard]] inline auto dump_json(const JsonValue &value) -> std::string {
  auto out = glz::write_json(value);
  return out ? *out : "null";
}

[[nodiscard]] inline auto parse_json(std::string_view input)
    -> Result<JsonValue> {
  JsonValue value{};
  constexpr auto kOpts = glz::opts{.null_terminated = false};
  if (auto ec = glz::read<kOpts>(value, input); ec) {
    return fail(Error::ParseError);
  }
  return ok(std::move(value));
}

/// String member of a JSON object, or nullptr if absent or not a string.
[[nodiscard]] inline auto find_string(const JsonValue &object,
                                      std::string_view key)
    -> const std::string * {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto &members = object.get_object();
  auto it = members.find(key);
  if (it == members.end()) {
    return nullptr;
  }
  return it->second.get_if<std::string>();
}

} // namespace pulsewire
