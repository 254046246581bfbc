#include "pulsewire/util/time.hpp"

#include <charconv>

namespace pulsewire::util {

namespace {

// Reads exactly `width` digits at `pos` and advances it.
[[nodiscard]] auto read_digits(std::string_view text, std::size_t &pos,
                               std::size_t width) -> std::optional<int> {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  const auto *first = text.data() + pos;
  const auto *last = first + width;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  pos += width;
  return value;
}

[[nodiscard]] auto expect(std::string_view text, std::size_t &pos,
                          char ch) -> bool {
  if (pos < text.size() && text[pos] == ch) {
    ++pos;
    return true;
  }
  return false;
}

} // namespace

auto parse_iso8601(std::string_view text) -> std::optional<Timestamp> {
  std::size_t pos = 0;
  auto year = read_digits(text, pos, 4);
  if (!year || !expect(text, pos, '-')) {
    return std::nullopt;
  }
  auto month = read_digits(text, pos, 2);
  if (!month || !expect(text, pos, '-')) {
    return std::nullopt;
  }
  auto day = read_digits(text, pos, 2);
  if (!day) {
    return std::nullopt;
  }
  if (!expect(text, pos, 'T') && !expect(text, pos, 't') &&
      !expect(text, pos, ' ')) {
    return std::nullopt;
  }
  auto hour = read_digits(text, pos, 2);
  if (!hour || !expect(text, pos, ':')) {
    return std::nullopt;
  }
  auto minute = read_digits(text, pos, 2);
  if (!minute || !expect(text, pos, ':')) {
    return std::nullopt;
  }
  auto second = read_digits(text, pos, 2);
  if (!second || *hour > 23 || *minute > 59 || *second > 60) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{
      std::chrono::year{*year}, std::chrono::month{static_cast<unsigned>(*month)},
      std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  std::chrono::nanoseconds fraction{0};
  if (expect(text, pos, '.')) {
    std::int64_t scale = 100'000'000;
    bool any = false;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      fraction += std::chrono::nanoseconds{(text[pos] - '0') * scale};
      scale /= 10;
      any = true;
      ++pos;
    }
    if (!any) {
      return std::nullopt;
    }
  }

  std::chrono::minutes offset{0};
  if (pos < text.size()) {
    const char zone = text[pos++];
    if (zone == 'Z' || zone == 'z') {
      // UTC
    } else if (zone == '+' || zone == '-') {
      auto oh = read_digits(text, pos, 2);
      if (!oh || !expect(text, pos, ':')) {
        return std::nullopt;
      }
      auto om = read_digits(text, pos, 2);
      if (!om) {
        return std::nullopt;
      }
      offset = std::chrono::hours{*oh} + std::chrono::minutes{*om};
      if (zone == '-') {
        offset = -offset;
      }
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{*hour} +
            std::chrono::minutes{*minute} + std::chrono::seconds{*second} -
            offset;
  return std::chrono::time_point_cast<Clock::duration>(tp + fraction);
}

} // namespace pulsewire::util
