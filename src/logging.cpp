/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "video_relay/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace video_relay {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, TimingStats> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  TimingStats &stats = entries[name];
  ++stats.count;
  stats.total_us += us;
  stats.max_us = std::max(stats.max_us, us);
}

TimingStats TimingCollector::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = entries.find(name);
  return it == entries.end() ? TimingStats{} : it->second;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Hold the log mutex too so worker logs don't split the table
  std::lock_guard<std::mutex> log_lock(log_mutex);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<20} {:>6} {:>11} {:>11}\n", "Stage", "Runs", "Avg [s]",
             "Max [s]");
  fmt::print("{:-<20} {:-<6} {:-<11} {:-<11}\n", "", "", "", "");

  for (const auto &e : entries) {
    const TimingStats &s = e.second;
    double avg = s.count > 0 ? (s.total_us / s.count) / 1000000.0 : 0.0;
    fmt::print("{:<20} {:>6} {:>11.2f} {:>11.2f}\n", e.first, s.count, avg,
               s.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace video_relay
