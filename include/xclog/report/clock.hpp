#pragma once

#include <chrono>

namespace xclog::report {

// Time source for build-time measurement. Injected so tests can make the
// elapsed time deterministic.
class Clock {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  Clock() = default;
  virtual ~Clock() = default;

  Clock(const Clock&) = delete;
  Clock& operator=(const Clock&) = delete;
  Clock(Clock&&) = delete;
  Clock& operator=(Clock&&) = delete;

  virtual auto Now() -> TimePoint = 0;
};

class SteadyClock final : public Clock {
 public:
  auto Now() -> TimePoint override {
    return std::chrono::steady_clock::now();
  }
};

}  // namespace xclog::report
