#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pulsewire::util {

// "TransactionUpdate" -> "transaction_update"
[[nodiscard]] inline auto to_snake_case(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 4);
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isupper(uch) != 0 && !out.empty()) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

/// Wire names of a described enum, built once per type.
template <typename E> [[nodiscard]] auto enum_names() -> const auto & {
  using Enumerators = boost::describe::describe_enumerators<E>;
  static const auto names = [] {
    std::array<std::pair<E, std::string>,
               boost::mp11::mp_size<Enumerators>::value>
        table{};
    auto *slot = table.data();
    boost::mp11::mp_for_each<Enumerators>([&](auto e) {
      *slot++ = {e.value, to_snake_case(e.name)};
    });
    return table;
  }();
  return names;
}

template <typename E>
[[nodiscard]] auto enum_to_string(E value) -> std::string_view {
  const auto &names = enum_names<E>();
  auto it =
      std::ranges::find(names, value, &std::pair<E, std::string>::first);
  return it == names.end() ? std::string_view{"unknown"}
                           : std::string_view{it->second};
}

/// Exact match against the wire names; no case folding.
template <typename E>
[[nodiscard]] auto enum_from_string(std::string_view text) -> std::optional<E> {
  for (const auto &[value, name] : enum_names<E>()) {
    if (name == text) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace pulsewire::util

/// Declares to_string_view() for a BOOST_DESCRIBE_ENUM type in the
/// enclosing namespace.
#define PULSEWIRE_ENUM_TO_STRING(EnumType)                                     \
  [[nodiscard]] inline auto to_string_view(EnumType value)                     \
      -> std::string_view {                                                    \
    return ::pulsewire::util::enum_to_string(value);                           \
  }
