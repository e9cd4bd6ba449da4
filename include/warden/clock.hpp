/**
 * @file clock.hpp
 * @brief Injectable time source
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace warden {

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;
  virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
 public:
  TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// Seconds since the Unix epoch, as carried in token bodies
inline int64_t toUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(
             tp.time_since_epoch())
      .count();
}

inline TimePoint fromUnixSeconds(int64_t seconds) {
  return TimePoint(std::chrono::seconds(seconds));
}

}  // namespace warden
