#pragma once
#include <chrono>
#include <thread>
#include "domain/clock.hpp"

namespace reel_service {
class SteadyClock : public Clock {
public:
  time_point now() const override { return std::chrono::steady_clock::now(); }

  void sleepFor(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};
}
