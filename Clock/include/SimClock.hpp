#pragma once

#include <TimeFormat.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>

#include "IClock.hpp"
#include "ITimeSource.hpp"
#include "SimClockError.hpp"
#include "SimClockSettings.hpp"

/**
 * Simulated timeline driven by real time.
 *
 * now() = simAnchor + (realNow - realAnchor) * multiplier
 *
 * The anchor pair and the multiplier are guarded by one mutex, so a reader
 * never observes a half-applied update. setMultiplier() and reset() re-base
 * the anchor pair on the present, keeping simulated time continuous.
 * synchronize() jumps to the value published by the time source.
 *
 * Scaled durations saturate at the nanosecond representation limits.
 */
class SimClock {
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  using time_point = tw::SysTime;
  using duration = std::chrono::nanoseconds;

  // Owns a SystemClockAdapter and an HttpTimeSource.
  static SimClockResult<std::unique_ptr<SimClock>> create(
      const SimClockSettings& settings);
  // Collaborators must outlive the clock.
  static SimClockResult<std::unique_ptr<SimClock>> create(
      const SimClockSettings& settings, IClock& realClock,
      ITimeSource& timeSource);

  // Reachable only through create().
  SimClock(ConstructionKey, IClock& realClock, ITimeSource& timeSource,
           const std::chrono::time_zone* zone, time_point start,
           double multiplier);

  SimClock(const SimClock&) = delete;
  SimClock& operator=(const SimClock&) = delete;

  [[nodiscard]] time_point now() const;
  [[nodiscard]] std::chrono::zoned_time<duration> nowZoned() const;

  // Simulated equivalent of the real interval [from, to].
  [[nodiscard]] duration simulatedDuration(IClock::time_point from,
                                           IClock::time_point to) const;

  [[nodiscard]] double multiplier() const;
  [[nodiscard]] const std::chrono::time_zone* zone() const noexcept {
    return _zone;
  }

  void setMultiplier(double multiplier);
  void reset();

  // Fetches outside the lock; on failure the clock state is untouched.
  SimClockResult<void> synchronize(std::string_view address);

 private:
  struct Anchor {
    IClock::time_point real{};
    time_point simulated{};
  };

  // _mutex must be held.
  [[nodiscard]] time_point extrapolateLocked(IClock::time_point realNow) const;
  void rebaseLocked();

  std::unique_ptr<IClock> _ownedClock;
  std::unique_ptr<ITimeSource> _ownedTimeSource;
  IClock& _realClock;
  ITimeSource& _timeSource;
  const std::chrono::time_zone* _zone;

  mutable std::mutex _mutex;
  Anchor _anchor;
  double _multiplier;
};
