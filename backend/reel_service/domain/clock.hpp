#pragma once
#include <chrono>

namespace reel_service {

class Clock {
public:
  using time_point = std::chrono::steady_clock::time_point;

  virtual ~Clock() = default;
  virtual time_point now() const = 0;
  virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

} // namespace reel_service
