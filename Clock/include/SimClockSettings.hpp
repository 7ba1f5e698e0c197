#pragma once

#include <chrono>
#include <string>

struct SimClockSettings {
  std::string startDate{};
  std::string startTime{};
  std::string timeZone{"UTC"};
  double multiplier{1.0};
  std::chrono::milliseconds syncTimeout{5000};
};

// Reads `classes.SimClock` from tw::Config. Throws std::runtime_error when the
// section or a required key is missing or has the wrong type.
SimClockSettings loadSimClockSettings();
