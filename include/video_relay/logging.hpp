/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector aggregating stage durations
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so interleaved worker output stays readable.
 *
 */

#ifndef VIDEO_RELAY_LOGGING_HPP
#define VIDEO_RELAY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace video_relay {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by VIDEO_RELAY_ENABLE_LOGGING at compile time.
 */
#ifndef VIDEO_RELAY_ENABLE_LOGGING
#define VIDEO_RELAY_ENABLE_LOGGING 1
#endif

#ifndef VIDEO_RELAY_ENABLE_TIMING
#define VIDEO_RELAY_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if VIDEO_RELAY_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(video_relay::log_mutex);                  \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(video_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(video_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(video_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(video_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingStats: Aggregate of all measurements recorded under one name.
 */
struct TimingStats {
  long count = 0;          //< Number of measurements
  long total_us = 0;       //< Sum of durations in microseconds
  long max_us = 0;         //< Longest single measurement
};

/**
 * @class TimingCollector
 * @brief Thread-safe aggregator for timing measurements.
 * @note Worker threads record here; entries are folded per name so a
 *       long-running process keeps a bounded table.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, TimingStats> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Snapshot of the aggregate for @p name (zeroed if never recorded).
   */
  static TimingStats get(const std::string &name);

  /**
   * @brief Print all collected timings as a formatted table.
   *        Called at shutdown.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if VIDEO_RELAY_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    video_relay::TimingCollector::record(#name, timer_duration_##name);        \
  } while (0)

/// Like TIMER_END but records under a runtime label.
#define TIMER_END_AS(name, label)                                              \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    video_relay::TimingCollector::record(label, timer_duration_##name);        \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#define TIMER_END_AS(name, label) ((void)0)
#endif

} // namespace video_relay

#endif // VIDEO_RELAY_LOGGING_HPP
