/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Malformed numeric values throw std::invalid_argument (from
 *          std::stoi / std::stod) on first access, as do non-positive
 *          intervals and limits; main() reports them.
 *
 */

#ifndef VIDEO_RELAY_CONFIG_HPP
#define VIDEO_RELAY_CONFIG_HPP

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace video_relay {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get a strictly positive integer from environment variable.
 * @throws std::invalid_argument if the value is zero or negative
 */
inline int get_env_positive_int(const char *name, int default_val) {
  int val = get_env_int(name, default_val);
  if (val <= 0)
    throw std::invalid_argument(std::string(name) + " must be positive");
  return val;
}

/// Any non-zero integer is true.
inline bool get_env_bool(const char *name, bool default_val) {
  return get_env_int(name, default_val ? 1 : 0) != 0;
}

// **---- PIPELINE ----**

/**
 * @brief Maximum concurrent downloads
 * @note 0 = auto-detect from the container CPU limit
 */
inline int download_concurrency() {
  static int val = get_env_int("DOWNLOAD_CONCURRENCY", 1);
  return val;
}

/**
 * @brief Maximum concurrent uploads
 * @note 0 = auto-detect from the container CPU limit
 */
inline int upload_concurrency() {
  static int val = get_env_int("UPLOAD_CONCURRENCY", 1);
  return val;
}

/// Attempts per stage before an item is failed for good
inline int max_retries() {
  static int val = get_env_int("MAX_RETRIES", 3);
  return val;
}

/// Controller dispatch tick
inline int tick_interval_ms() {
  static int val = get_env_positive_int("TICK_INTERVAL_MS", 2000);
  return val;
}

/// Bounded wait for in-flight workers during shutdown
inline double shutdown_timeout_sec() {
  static double val = get_env_double("SHUTDOWN_TIMEOUT_SEC", 10.0);
  return val;
}

/// Size of the event history ring kept for diagnostics
inline int event_history_limit() {
  static int val = get_env_positive_int("EVENT_HISTORY_LIMIT", 1000);
  return val;
}

// **---- DETECTION ----**

/// Inbox poll interval
inline double watch_interval_sec() {
  static double val = get_env_double("WATCH_INTERVAL_SEC", 2.0);
  return val;
}

/**
 * @brief Delay between the two size samples of the stability check
 * @note A file whose size changes across the delay is still being written
 *       and is skipped until a later poll.
 */
inline int stability_delay_ms() {
  static int val = get_env_int("STABILITY_DELAY_MS", 500);
  return val;
}

/**
 * @brief Drain the inbox once and exit instead of watching it
 */
inline bool run_once() {
  static bool val = get_env_bool("RUN_ONCE", false);
  return val;
}

// **---- STAGES ----**

/// Where downloads are staged (empty = <outbox>/.staging)
inline std::string staging_dir() {
  static std::string val = get_env_string("STAGING_DIR", "");
  return val;
}

/// Status transition log (empty = <outbox>/status.log)
inline std::string status_log() {
  static std::string val = get_env_string("STATUS_LOG", "");
  return val;
}

/// Probe staged files with libavformat before accepting them
inline bool verify_media() {
  static bool val = get_env_bool("VERIFY_MEDIA", true);
  return val;
}

/// FFmpeg binary used by the publisher
inline std::string ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

} // namespace Config
} // namespace video_relay

#endif // VIDEO_RELAY_CONFIG_HPP
