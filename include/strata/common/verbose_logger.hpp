#pragma once

#include <array>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace strata::common {

// Central logger for verbose output during a pipeline run.
// All output goes to stderr to preserve stdout for command results.
// Level 1 reports phase begin/done, level 2 adds per-phase detail lines.
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

  // Log a detail line attributed to a phase (level 2).
  void Detail(std::string_view phase_name, std::string_view message);

  // Record phase duration (always, regardless of verbosity level).
  // Called by PhaseTimer destructor.
  void RecordPhaseDuration(std::string_view name, double seconds);

  // Print phase summary line for --stats output.
  void PrintPhaseSummary(FILE* sink = stderr) const;

  // Duration recorded for a phase, or a negative value if it never ran.
  auto PhaseDuration(std::string_view name) const -> double;

  auto level() const -> int {
    return level_;
  }

 private:
  // Fixed phase order for deterministic output.
  static constexpr std::array<std::string_view, 5> kPhaseOrder = {
      "bind", "analyze", "compile_methods", "finalize", "serialize"};

  int level_;
  FILE* sink_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> phase_durations_;
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

}  // namespace strata::common
