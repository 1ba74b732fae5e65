#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <stop_token>
#include <thread>

namespace xclog::driver {

// Route the default spdlog logger to stderr (stdout carries the report) and
// map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace.
void ConfigureLogging(int verbosity);

// RAII helper for timing phases. Logs begin on construction, done on
// destruction, both at info level.
//
// With a heartbeat enabled, a background thread logs "still running" every
// 10 seconds; used while waiting on a piped xcodebuild that may run for
// minutes.
class PhaseTimer {
 public:
  explicit PhaseTimer(std::string phase_name, bool enable_heartbeat = false);
  ~PhaseTimer();

  // Non-copyable, non-movable (RAII resource)
  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  void HeartbeatLoop(std::stop_token stop_token);

  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
  bool enabled_;

  // Heartbeat thread state
  bool heartbeat_enabled_;
  std::mutex heartbeat_mutex_;
  std::condition_variable_any heartbeat_cv_;
  std::jthread heartbeat_thread_;
};

}  // namespace xclog::driver
