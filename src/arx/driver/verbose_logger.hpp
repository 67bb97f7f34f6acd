#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <string>
#include <string_view>
#include <unordered_map>

namespace arx::driver {

// Central logger for verbose output during a build.
// All output goes to stderr to keep stdout for progress lines and IR dumps.
//   level 1: phase begin/done with timings
//   level 2: external commands as they are run
class VerboseLogger {
 public:
  explicit VerboseLogger(int level, FILE* sink = stderr)
      : level_(level), sink_(sink) {
  }

  auto Enabled(int required_level) const -> bool {
    return level_ >= required_level;
  }

  void PhaseBegin(std::string_view phase_name);
  void PhaseDone(std::string_view phase_name, double seconds);

  // Log a detail line (level 2).
  void Detail(std::string_view phase_name, std::string_view message);

  // Called by PhaseTimer on destruction, regardless of level.
  void RecordPhaseDuration(std::string_view name, double seconds);

  // One-line summary of recorded phase durations (level 1).
  void PrintPhaseSummary() const;

  auto level() const -> int {
    return level_;
  }

 private:
  static constexpr std::array<std::string_view, 5> kPhaseOrder = {
      "load_ast", "resolve", "lower", "llc", "link"};

  int level_;
  FILE* sink_;
  std::unordered_map<std::string, double> phase_durations_;
};

// RAII helper for timing phases. Logs begin on construction, done on
// destruction.
class PhaseTimer {
 public:
  PhaseTimer(VerboseLogger& logger, std::string phase_name);
  ~PhaseTimer();

  PhaseTimer(const PhaseTimer&) = delete;
  PhaseTimer& operator=(const PhaseTimer&) = delete;
  PhaseTimer(PhaseTimer&&) = delete;
  PhaseTimer& operator=(PhaseTimer&&) = delete;

 private:
  VerboseLogger& logger_;
  std::string phase_name_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace arx::driver
