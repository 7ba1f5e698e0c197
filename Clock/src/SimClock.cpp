#include "SimClock.hpp"

#include <JsonExtensions.hpp>
#include <Logger.hpp>

#include <cmath>
#include <limits>
#include <utility>

#include "HttpTimeSource.hpp"
#include "SystemClockAdapter.hpp"

using tw::ESimClockError;

namespace {
// Truncates toward zero; out-of-range products saturate, NaN maps to zero.
SimClock::duration scaleDuration(const std::chrono::nanoseconds elapsed,
                                 const double multiplier) {
  const double scaled = static_cast<double>(elapsed.count()) * multiplier;
  if (std::isnan(scaled)) {
    return SimClock::duration::zero();
  }
  constexpr double kLimit = 9223372036854775808.0;  // 2^63
  if (scaled >= kLimit) {
    return SimClock::duration::max();
  }
  if (scaled <= -kLimit) {
    return SimClock::duration::min();
  }
  return SimClock::duration{static_cast<SimClock::duration::rep>(scaled)};
}

SimClock::time_point saturatingAdd(const SimClock::time_point base,
                                   const SimClock::duration delta) {
  using rep = SimClock::duration::rep;
  constexpr auto kMax = std::numeric_limits<rep>::max();
  constexpr auto kMin = std::numeric_limits<rep>::min();
  const auto b = base.time_since_epoch().count();
  const auto d = delta.count();
  if (d > 0 && b > kMax - d) {
    return SimClock::time_point::max();
  }
  if (d < 0 && b < kMin - d) {
    return SimClock::time_point::min();
  }
  return base + delta;
}

// to - from, saturated at the nanosecond representation limits.
std::chrono::nanoseconds elapsedBetween(const IClock::time_point from,
                                        const IClock::time_point to) {
  using rep = IClock::time_point::rep;
  constexpr auto kMax = std::numeric_limits<rep>::max();
  constexpr auto kMin = std::numeric_limits<rep>::min();
  const auto f = from.time_since_epoch().count();
  const auto t = to.time_since_epoch().count();
  if (f < 0 && t > kMax + f) {
    return std::chrono::nanoseconds::max();
  }
  if (f > 0 && t < kMin + f) {
    return std::chrono::nanoseconds::min();
  }
  return std::chrono::duration_cast<std::chrono::nanoseconds>(to - from);
}
}  // namespace

SimClockResult<std::unique_ptr<SimClock>> SimClock::create(
    const SimClockSettings& settings) {
  auto ownedClock = std::make_unique<SystemClockAdapter>();
  auto ownedTimeSource = std::make_unique<HttpTimeSource>(
      HttpTransport::Options{.timeout = settings.syncTimeout});
  auto clock = create(settings, *ownedClock, *ownedTimeSource);
  if (!clock) {
    return std::unexpected(clock.error());
  }
  (*clock)->_ownedClock = std::move(ownedClock);
  (*clock)->_ownedTimeSource = std::move(ownedTimeSource);
  return clock;
}

SimClockResult<std::unique_ptr<SimClock>> SimClock::create(
    const SimClockSettings& settings, IClock& realClock,
    ITimeSource& timeSource) {
  const auto zone = tw::resolveTimeZone(settings.timeZone);
  if (!zone) {
    return std::unexpected(
        SimClockError{ESimClockError::InvalidLocation, zone.error()});
  }

  const auto local =
      tw::parseLocalDateTime(settings.startDate + " " + settings.startTime);
  if (!local) {
    return std::unexpected(
        SimClockError{ESimClockError::InvalidTimestamp, local.error()});
  }

  const auto start = tw::toSysTime(*local, **zone);
  SPDLOG_INFO("SimClock starting at {} ({}) with multiplier {}",
              tw::formatRfc3339(start, *zone), (*zone)->name(),
              settings.multiplier);
  return std::make_unique<SimClock>(ConstructionKey{}, realClock, timeSource,
                                    *zone, start, settings.multiplier);
}

SimClock::SimClock(ConstructionKey, IClock& realClock, ITimeSource& timeSource,
                   const std::chrono::time_zone* zone, const time_point start,
                   const double multiplier)
    : _realClock(realClock),
      _timeSource(timeSource),
      _zone(zone),
      _anchor{realClock.now(), start},
      _multiplier(multiplier) {}

SimClock::time_point SimClock::now() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return extrapolateLocked(_realClock.now());
}

std::chrono::zoned_time<SimClock::duration> SimClock::nowZoned() const {
  return std::chrono::zoned_time<duration>{_zone, now()};
}

SimClock::duration SimClock::simulatedDuration(
    const IClock::time_point from, const IClock::time_point to) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return scaleDuration(elapsedBetween(from, to), _multiplier);
}

double SimClock::multiplier() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _multiplier;
}

void SimClock::setMultiplier(const double multiplier) {
  std::lock_guard<std::mutex> lock(_mutex);
  rebaseLocked();
  const auto previous = std::exchange(_multiplier, multiplier);
  SPDLOG_INFO("SimClock multiplier {} -> {} at {}", previous, multiplier,
              tw::formatRfc3339(_anchor.simulated, _zone));
}

void SimClock::reset() {
  std::lock_guard<std::mutex> lock(_mutex);
  rebaseLocked();
  SPDLOG_INFO("SimClock re-anchored at {}",
              tw::formatRfc3339(_anchor.simulated, _zone));
}

SimClockResult<void> SimClock::synchronize(const std::string_view address) {
  const auto fetched = _timeSource.fetchSimulatedTime(address);
  if (!fetched) {
    SPDLOG_WARN("SimClock synchronization with '{}' failed ({}): {}", address,
                tw::enumToString(fetched.error().code),
                fetched.error().message);
    return std::unexpected(fetched.error());
  }

  time_point previous;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    const auto realNow = _realClock.now();
    previous = extrapolateLocked(realNow);
    _anchor = Anchor{realNow, *fetched};
  }
  SPDLOG_INFO("SimClock synchronized with '{}': {} -> {}", address,
              tw::formatRfc3339(previous, _zone),
              tw::formatRfc3339(*fetched, _zone));
  return {};
}

SimClock::time_point SimClock::extrapolateLocked(
    const IClock::time_point realNow) const {
  return saturatingAdd(
      _anchor.simulated,
      scaleDuration(elapsedBetween(_anchor.real, realNow), _multiplier));
}

void SimClock::rebaseLocked() {
  const auto realNow = _realClock.now();
  _anchor = Anchor{realNow, extrapolateLocked(realNow)};
}
