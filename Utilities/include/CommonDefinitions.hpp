#pragma once

#include <string>

namespace tw {
enum class ESimClockError {
  InvalidLocation,
  InvalidTimestamp,
  FetchError,
  TimeFormatError,
  ParseError
};

// Payload served by a time authority: {"simulated_time": "<RFC3339>"}
struct SyncResponse {
  std::string simulatedTime;
};
}  // namespace tw
