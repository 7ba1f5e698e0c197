#pragma once

#include <chrono>

class IClock {
 public:
  using duration = std::chrono::system_clock::duration;
  using time_point = std::chrono::system_clock::time_point;

  virtual ~IClock() = default;
  [[nodiscard]] virtual time_point now() const = 0;
};
