#include "TimeUtils.hpp"

#include <charconv>

namespace {

// Reads exactly `count` decimal digits at `pos`, advancing it on success.
bool read_digits(std::string_view text, std::size_t& pos, std::size_t count,
                 int& out) {
  if (pos + count > text.size()) return false;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (text[i] < '0' || text[i] > '9') return false;
  }
  auto [ptr, ec] =
      std::from_chars(text.data() + pos, text.data() + pos + count, out);
  if (ec != std::errc() || ptr != text.data() + pos + count) return false;
  pos += count;
  return true;
}

bool consume(std::string_view text, std::size_t& pos, char expected) {
  if (pos < text.size() && text[pos] == expected) {
    ++pos;
    return true;
  }
  return false;
}

}  // namespace

std::optional<TimePoint> parse_iso8601(std::string_view text) {
  using namespace std::chrono;

  std::size_t pos = 0;
  int y = 0, mo = 0, d = 0;
  if (!read_digits(text, pos, 4, y) || !consume(text, pos, '-') ||
      !read_digits(text, pos, 2, mo) || !consume(text, pos, '-') ||
      !read_digits(text, pos, 2, d)) {
    return std::nullopt;
  }
  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)},
                           day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) return std::nullopt;

  int hh = 0, mm = 0, ss = 0;
  long long micros = 0;
  minutes offset{0};

  if (pos < text.size()) {
    if (text[pos] != 'T' && text[pos] != ' ') return std::nullopt;
    ++pos;
    if (!read_digits(text, pos, 2, hh)) return std::nullopt;
    if (consume(text, pos, ':')) {
      if (!read_digits(text, pos, 2, mm)) return std::nullopt;
      if (consume(text, pos, ':')) {
        if (!read_digits(text, pos, 2, ss)) return std::nullopt;
        if (consume(text, pos, '.')) {
          std::size_t digits = 0;
          while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits == 6) return std::nullopt;
            micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
          }
          if (digits == 0) return std::nullopt;
          for (; digits < 6; ++digits) micros *= 10;
        }
      }
    }
    if (hh > 23 || mm > 59 || ss > 59) return std::nullopt;

    if (consume(text, pos, 'Z')) {
      // UTC, nothing to adjust.
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      const int sign = text[pos] == '-' ? -1 : 1;
      ++pos;
      int oh = 0, om = 0;
      if (!read_digits(text, pos, 2, oh) || !consume(text, pos, ':') ||
          !read_digits(text, pos, 2, om) || oh > 23 || om > 59) {
        return std::nullopt;
      }
      offset = minutes{sign * (oh * 60 + om)};
    }
  }
  if (pos != text.size()) return std::nullopt;

  TimePoint tp = sys_days{ymd} + hours{hh} + minutes{mm} + seconds{ss} +
                 microseconds{micros};
  return tp - offset;
}
