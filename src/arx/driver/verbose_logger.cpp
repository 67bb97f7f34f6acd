#include "verbose_logger.hpp"

#include <chrono>
#include <ctime>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace arx::driver {

namespace {

// HH:MM:SS, local time
auto FormatTime() -> std::string {
  auto now = std::chrono::system_clock::now();
  auto time_t_now = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&time_t_now, &tm_buf);
  return fmt::format(
      "{:02}:{:02}:{:02}", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec);
}

}  // namespace

void VerboseLogger::PhaseBegin(std::string_view phase_name) {
  if (!Enabled(1)) return;
  fmt::print(sink_, "[arx][{}][phase] {}: begin\n", FormatTime(), phase_name);
  std::fflush(sink_);
}

void VerboseLogger::PhaseDone(std::string_view phase_name, double seconds) {
  if (!Enabled(1)) return;
  fmt::print(
      sink_, "[arx][{}][phase] {}: done ({:.2f}s)\n", FormatTime(), phase_name,
      seconds);
  std::fflush(sink_);
}

void VerboseLogger::Detail(
    std::string_view phase_name, std::string_view message) {
  if (!Enabled(2)) return;
  fmt::print(
      sink_, "[arx][{}][{}] {}\n", FormatTime(), phase_name, message);
  std::fflush(sink_);
}

void VerboseLogger::RecordPhaseDuration(std::string_view name, double seconds) {
  phase_durations_[std::string(name)] += seconds;
}

void VerboseLogger::PrintPhaseSummary() const {
  if (!Enabled(1)) return;
  std::string line = "[arx][stats][phase]";
  for (std::string_view phase : kPhaseOrder) {
    auto it = phase_durations_.find(std::string(phase));
    if (it != phase_durations_.end()) {
      line += fmt::format(" {}={:.2f}s", phase, it->second);
    }
  }
  fmt::print(sink_, "{}\n", line);
  std::fflush(sink_);
}

PhaseTimer::PhaseTimer(VerboseLogger& logger, std::string phase_name)
    : logger_(logger),
      phase_name_(std::move(phase_name)),
      start_(std::chrono::steady_clock::now()) {
  logger_.PhaseBegin(phase_name_);
}

PhaseTimer::~PhaseTimer() {
  auto end = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
  double seconds = static_cast<double>(duration.count()) / 1000.0;

  logger_.RecordPhaseDuration(phase_name_, seconds);
  logger_.PhaseDone(phase_name_, seconds);
}

}  // namespace arx::driver
