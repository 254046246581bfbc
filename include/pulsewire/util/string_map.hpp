#pragma once

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace pulsewire {

/// Hashes anything viewable as a string_view so that std::string keyed
/// containers can be searched without building a temporary key.
struct TransparentStringHash {
  using is_transparent = void;
  using is_avalanching = void;

  [[nodiscard]] auto operator()(std::string_view text) const noexcept
      -> std::uint64_t {
    return ankerl::unordered_dense::hash<std::string_view>{}(text);
  }
};

template <typename V>
using StringMap = ankerl::unordered_dense::map<std::string, V,
                                               TransparentStringHash,
                                               std::equal_to<>>;

using StringSet =
    ankerl::unordered_dense::set<std::string, TransparentStringHash,
                                 std::equal_to<>>;

} // namespace pulsewire
