/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "keyframe/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace keyframe {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, TimingStats> TimingCollector::stats;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  TimingStats &entry = stats[name];
  entry.count++;
  entry.total_us += us;
  entry.max_us = std::max(entry.max_us, us);
}

std::map<std::string, TimingStats> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return stats;
}

void TimingCollector::print_summary() {
  /// Print from a copy so recorders are not blocked on terminal output
  const auto current = snapshot();
  if (current.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "======================= TIMING SUMMARY =======================\n");
  fmt::print("{:<22} {:>8} {:>14} {:>14}\n", "Phase", "Count", "Avg (ms)",
             "Max (ms)");
  fmt::print("{:-<22} {:-<8} {:-<14} {:-<14}\n", "", "", "", "");

  for (const auto &kv : current) {
    const TimingStats &s = kv.second;
    double avg_ms = s.count ? (s.total_us / 1000.0) / s.count : 0.0;
    fmt::print("{:<22} {:>8} {:>14.2f} {:>14.2f}\n", kv.first, s.count, avg_ms,
               s.max_us / 1000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "==============================================================\n");
  std::fflush(stdout);
}

} // namespace keyframe
