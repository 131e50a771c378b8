#pragma once

#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>

namespace grail::driver {

// Central logger for verbose output of the driver.
// All output goes to stderr to preserve stdout for the lowered IR.
class VerboseLogger {
 public:
  explicit VerboseLogger(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  // Check if logging at the given level is enabled.
  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  // Log a phase begin event (level 1).
  void PhaseBegin(std::string_view phase_name);

  // Log a phase done event with duration (level 1).
  void PhaseDone(std::string_view phase_name, double seconds);

  // Free-form detail line (level 2).
  void Detail(std::string_view phase_name, std::string_view message);

  auto level() const -> int {
    return level_;
  }

 private:
  int level_;
  FILE* sink_;
};

// RAII helper for timing phases. Logs begin on construction, done on
// destruction.
class PhaseTimer {
 public:
  PhaseTimer(VerboseLogger& logger, std::string phase_name);
  ~PhaseTimer();

  // Non-copyable, non-movable (RAII resource)
  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  VerboseLogger& logger_;
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
  bool enabled_;
};

}  // namespace grail::driver
