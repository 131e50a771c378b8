#include "verbose_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace grail::driver {

namespace {

// Format current time as HH:MM:SS
auto FormatTime() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time_t_now, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%H:%M:%S");
  return oss.str();
}

}  // namespace

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) return;
  fmt::print(sink_, "[grail][{}][phase] {}: begin\n", FormatTime(), phase_name);
  std::fflush(sink_);
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double seconds) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[grail][{}][phase] {}: done ({:.3f}s)\n", FormatTime(),
      phase_name, seconds);
  std::fflush(sink_);
}

void VerboseLogger::Detail(
    std::string_view phase_name, std::string_view message) {
  if (!Enabled(2)) return;
  fmt::print(
      sink_, "[grail][{}][{}] {}\n", FormatTime(), phase_name, message);
  std::fflush(sink_);
}

PhaseTimer::PhaseTimer(VerboseLogger& logger, std::string phase_name)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()),
      enabled_(logger.Enabled(1)) {
  if (enabled_) {
    logger_.PhaseBegin(phase_name_);
  }
}

PhaseTimer::~PhaseTimer() {
  if (!enabled_) {
    return;
  }
  auto end = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  logger_.PhaseDone(phase_name_, duration.count() / 1e6);
}

}  // namespace grail::driver
