#include "TimeFormat.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace tw {

namespace {
bool readFixed(const std::string_view text, const std::size_t pos,
               const std::size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  const auto field = text.substr(pos, width);
  if (!std::all_of(field.begin(), field.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
      })) {
    return false;
  }
  const auto [ptr, ec] =
      std::from_chars(field.data(), field.data() + field.size(), out);
  return ec == std::errc{} && ptr == field.data() + field.size();
}

bool expectChar(const std::string_view text, const std::size_t pos,
                const char c) {
  return pos < text.size() && text[pos] == c;
}

struct DateFields {
  std::chrono::year_month_day date;
  int hour{0};
  int minute{0};
};

// Reads "YYYY-MM-DD<sep>HH:MM" starting at position 0.
std::expected<DateFields, std::string> readDateAndMinutes(
    const std::string_view text, const char separator) {
  int y = 0;
  int mo = 0;
  int d = 0;
  int h = 0;
  int mi = 0;
  if (!readFixed(text, 0, 4, y) || !expectChar(text, 4, '-') ||
      !readFixed(text, 5, 2, mo) || !expectChar(text, 7, '-') ||
      !readFixed(text, 8, 2, d) || !expectChar(text, 10, separator) ||
      !readFixed(text, 11, 2, h) || !expectChar(text, 13, ':') ||
      !readFixed(text, 14, 2, mi)) {
    return std::unexpected(std::format("'{}' does not match layout", text));
  }
  const std::chrono::year_month_day date{
      std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(mo)},
      std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return std::unexpected(std::format("'{}' has an invalid date", text));
  }
  if (h > 23 || mi > 59) {
    return std::unexpected(
        std::format("'{}' has an invalid time of day", text));
  }
  return DateFields{date, h, mi};
}
}  // namespace

TimeFormatResult<const std::chrono::time_zone*> resolveTimeZone(
    const std::string_view name) {
  try {
    if (name.empty() || name == "UTC") {
      return std::chrono::locate_zone("UTC");
    }
    if (name == "Local") {
      return std::chrono::current_zone();
    }
    return std::chrono::locate_zone(name);
  } catch (const std::runtime_error& e) {
    return std::unexpected(
        std::format("unknown time zone '{}': {}", name, e.what()));
  }
}

TimeFormatResult<LocalMinutes> parseLocalDateTime(const std::string_view text) {
  constexpr std::size_t kLayoutLength = 16;  // "YYYY-MM-DD HH:MM"
  if (text.size() != kLayoutLength) {
    return std::unexpected(
        std::format("'{}' does not match layout YYYY-MM-DD HH:MM", text));
  }
  const auto fields = readDateAndMinutes(text, ' ');
  if (!fields) {
    return std::unexpected(fields.error());
  }
  return LocalMinutes{std::chrono::local_days{fields->date}.time_since_epoch() +
                      std::chrono::hours{fields->hour} +
                      std::chrono::minutes{fields->minute}};
}

SysTime toSysTime(const LocalMinutes local, const std::chrono::time_zone& zone) {
  return std::chrono::time_point_cast<std::chrono::nanoseconds>(
      zone.to_sys(local, std::chrono::choose::earliest));
}

TimeFormatResult<SysTime> parseRfc3339(const std::string_view text) {
  const auto fields = readDateAndMinutes(text, 'T');
  if (!fields) {
    return std::unexpected(std::format("'{}' is not RFC3339", text));
  }
  int sec = 0;
  if (!expectChar(text, 16, ':') || !readFixed(text, 17, 2, sec) || sec > 59) {
    return std::unexpected(std::format("'{}' has invalid seconds", text));
  }

  std::size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (expectChar(text, pos, '.')) {
    ++pos;
    const auto start = pos;
    // Digits past nanosecond precision are truncated.
    std::int64_t value = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      if (pos - start < 9) {
        value = value * 10 + (text[pos] - '0');
      }
      ++pos;
    }
    const auto digits = pos - start;
    if (digits == 0) {
      return std::unexpected(
          std::format("'{}' has an invalid fractional second", text));
    }
    for (auto i = digits; i < 9; ++i) {
      value *= 10;
    }
    fraction = std::chrono::nanoseconds{value};
  }

  std::chrono::minutes offset{0};
  if (expectChar(text, pos, 'Z')) {
    ++pos;
  } else if (expectChar(text, pos, '+') || expectChar(text, pos, '-')) {
    const bool negative = text[pos] == '-';
    int oh = 0;
    int om = 0;
    if (!readFixed(text, pos + 1, 2, oh) || !expectChar(text, pos + 3, ':') ||
        !readFixed(text, pos + 4, 2, om) || oh > 23 || om > 59) {
      return std::unexpected(std::format("'{}' has an invalid offset", text));
    }
    offset = std::chrono::hours{oh} + std::chrono::minutes{om};
    if (negative) {
      offset = -offset;
    }
    pos += 6;
  } else {
    return std::unexpected(std::format("'{}' is missing a zone offset", text));
  }
  if (pos != text.size()) {
    return std::unexpected(std::format("'{}' has trailing characters", text));
  }

  const auto wallClock = std::chrono::sys_days{fields->date} +
                         std::chrono::hours{fields->hour} +
                         std::chrono::minutes{fields->minute} +
                         std::chrono::seconds{sec} + fraction;
  return SysTime{wallClock - offset};
}

std::string formatRfc3339(const SysTime instant,
                          const std::chrono::time_zone* zone) {
  const auto seconds = std::chrono::floor<std::chrono::seconds>(instant);
  std::chrono::seconds offset{0};
  if (zone != nullptr) {
    offset = zone->get_info(seconds).offset;
  }
  // Shifted sys_time used only as a wall-clock reading for formatting.
  auto text = std::format("{:%FT%T}", seconds + offset);
  if (offset == std::chrono::seconds{0}) {
    return text + "Z";
  }
  const auto minutesTotal =
      std::abs(std::chrono::duration_cast<std::chrono::minutes>(offset).count());
  return text + std::format("{}{:02}:{:02}", offset.count() < 0 ? '-' : '+',
                            minutesTotal / 60, minutesTotal % 60);
}

}  // namespace tw
