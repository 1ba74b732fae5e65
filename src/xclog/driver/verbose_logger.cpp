#include "verbose_logger.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace xclog::driver {

void ConfigureLogging(int verbosity) {
  auto logger = spdlog::stderr_color_mt("xclog");
  logger->set_pattern("[xclog][%H:%M:%S][%^%l%$] %v");
  spdlog::set_default_logger(std::move(logger));

  if (verbosity >= 3) {
    spdlog::set_level(spdlog::level::trace);
  } else if (verbosity == 2) {
    spdlog::set_level(spdlog::level::debug);
  } else if (verbosity == 1) {
    spdlog::set_level(spdlog::level::info);
  } else {
    spdlog::set_level(spdlog::level::warn);
  }
}

PhaseTimer::PhaseTimer(std::string phase_name, bool enable_heartbeat)
    : phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()),
      enabled_(spdlog::should_log(spdlog::level::info)),
      heartbeat_enabled_(enable_heartbeat && enabled_) {
  if (enabled_) {
    spdlog::info("{}: begin", phase_name_);
  }
  if (heartbeat_enabled_) {
    heartbeat_thread_ = std::jthread(
        [this](std::stop_token st) { HeartbeatLoop(std::move(st)); });
  }
}

PhaseTimer::~PhaseTimer() {
  if (heartbeat_enabled_) {
    heartbeat_thread_.request_stop();
    heartbeat_cv_.notify_all();
    heartbeat_thread_.join();
  }

  if (enabled_) {
    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start_;
    spdlog::info("{}: done ({:.2f}s)", phase_name_, elapsed.count());
  }
}

void PhaseTimer::HeartbeatLoop(std::stop_token stop_token) {
  constexpr auto kThreshold = std::chrono::seconds(10);
  constexpr auto kInterval = std::chrono::seconds(10);

  // Wait for initial threshold
  {
    std::unique_lock lock(heartbeat_mutex_);
    if (heartbeat_cv_.wait_for(lock, stop_token, kThreshold, [&] {
          return stop_token.stop_requested();
        })) {
      return;
    }
  }

  while (!stop_token.stop_requested()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_);
    spdlog::info("{}: still running ({}s)...", phase_name_, elapsed.count());

    std::unique_lock lock(heartbeat_mutex_);
    if (heartbeat_cv_.wait_for(lock, stop_token, kInterval, [&] {
          return stop_token.stop_requested();
        })) {
      return;
    }
  }
}

}  // namespace xclog::driver
