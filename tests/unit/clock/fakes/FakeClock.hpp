#pragma once

#include <atomic>

#include <IClock.hpp>

// Safe to read from many threads while one thread advances it.
class FakeClock final : public IClock {
 public:
  FakeClock() = default;
  explicit FakeClock(const time_point start) : _now(start) {}

  [[nodiscard]] time_point now() const override {
    return _now.load(std::memory_order_acquire);
  }

  void advanceBy(const duration delta) {
    auto current = _now.load(std::memory_order_acquire);
    while (!_now.compare_exchange_weak(current, current + delta,
                                       std::memory_order_acq_rel)) {
    }
  }

 private:
  std::atomic<time_point> _now{};
};
