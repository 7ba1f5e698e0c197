#pragma once

#include "IClock.hpp"

class SystemClockAdapter final : public IClock {
 public:
  [[nodiscard]] time_point now() const override {
    return std::chrono::system_clock::now();
  }
};
