#pragma once

#include <TimeFormat.hpp>

#include <string_view>

#include "SimClockError.hpp"

// Authority for the simulated timeline. Implementations may block.
class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual SimClockResult<tw::SysTime> fetchSimulatedTime(
      std::string_view address) = 0;
};
