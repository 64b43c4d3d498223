/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Video file recognition and stability checks
 *
 *          - Time and size formatting utilities
 */

#include "video_relay/system.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <thread>

#include <fmt/core.h>

namespace video_relay {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Read a number from a file (-1 if absent or unparsable)
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f ? val : -1;
}

/// Cgroup v2 "cpu.max" holds "<quota> <period>" or "max <period>"
int read_cgroup_v2_limit() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max" || period_str.empty())
    return -1;

  long quota = std::strtol(quota_str.c_str(), nullptr, 10);
  long period = std::strtol(period_str.c_str(), nullptr, 10);
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = read_cgroup_v2_limit();

  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  return std::min(limit, 64);
}

int resolve_concurrency(int configured) {
  return configured > 0 ? configured : detect_cpu_limit();
}

// **---- Files ----**

bool is_video_file(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
         ext == ".avi" || ext == ".webm";
}

bool is_file_stable(const fs::path &path, std::chrono::milliseconds delay) {
  std::error_code ec;
  auto size1 = fs::file_size(path, ec);
  if (ec)
    return false;

  std::this_thread::sleep_for(delay);

  auto size2 = fs::file_size(path, ec);
  if (ec)
    return false;
  return size1 == size2;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(std::uintmax_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

} // namespace video_relay
