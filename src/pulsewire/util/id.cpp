#include "pulsewire/util/id.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace pulsewire {

auto ClientId::is_valid(std::string_view text) noexcept -> bool {
  return !text.empty() && std::ranges::none_of(text, [](unsigned char ch) {
    return std::iscntrl(ch) != 0;
  });
}

auto generate_client_id(std::string_view prefix) -> ClientId {
  thread_local std::mt19937 rng{std::random_device{}()};
  return ClientId{std::format("{}-{:08x}", prefix, rng())};
}

} // namespace pulsewire
