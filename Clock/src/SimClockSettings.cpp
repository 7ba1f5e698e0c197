#include "SimClockSettings.hpp"

#include <Config.hpp>

#include <format>
#include <stdexcept>

namespace {
constexpr auto kClassName = "SimClock";
}

SimClockSettings loadSimClockSettings() {
  const auto& config = tw::Config::instance();
  SimClockSettings settings;
  settings.startDate = config.getRequired<std::string>(kClassName, "startDate");
  settings.startTime = config.getRequired<std::string>(kClassName, "startTime");
  settings.timeZone =
      config.getOptional<std::string>(kClassName, "timeZone", settings.timeZone);
  settings.multiplier =
      config.getOptional<double>(kClassName, "multiplier", settings.multiplier);

  const auto timeoutMs = config.getOptional<int>(
      kClassName, "syncTimeoutMS",
      static_cast<int>(settings.syncTimeout.count()));
  if (timeoutMs <= 0) {
    throw std::runtime_error(std::format(
        "'{}.syncTimeoutMS' must be positive, got {}", kClassName, timeoutMs));
  }
  settings.syncTimeout = std::chrono::milliseconds{timeoutMs};
  return settings;
}
