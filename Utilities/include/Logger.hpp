#pragma once
#include "spdlog/spdlog.h"

namespace tw {
// To be called in each top level executable, including test runners
inline void configureLogger() {
  spdlog::set_level(
      static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
}
}  // namespace tw
