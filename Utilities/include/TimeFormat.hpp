#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>

namespace tw {

using SysTime = std::chrono::sys_time<std::chrono::nanoseconds>;
using LocalMinutes = std::chrono::local_time<std::chrono::minutes>;

template <typename T>
using TimeFormatResult = std::expected<T, std::string>;

// "" and "UTC" resolve to UTC, "Local" to the host's current zone, anything
// else is looked up in the tz database.
TimeFormatResult<const std::chrono::time_zone*> resolveTimeZone(
    std::string_view name);

// Strict "YYYY-MM-DD HH:MM": fixed widths, no seconds, no offset.
TimeFormatResult<LocalMinutes> parseLocalDateTime(std::string_view text);

// Ambiguous local times map to the earlier instant, skipped ones to the
// transition instant.
SysTime toSysTime(LocalMinutes local, const std::chrono::time_zone& zone);

// YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM), fraction up to 9 digits.
TimeFormatResult<SysTime> parseRfc3339(std::string_view text);

// Whole seconds, offset of `zone` at `instant` (UTC when zone is null).
std::string formatRfc3339(SysTime instant,
                          const std::chrono::time_zone* zone = nullptr);

}  // namespace tw
