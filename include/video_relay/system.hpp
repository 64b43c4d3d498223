/**
 * @file system.hpp
 * @brief System utilities: CPU detection, file inspection, formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Concurrency resolution for the "0 = auto" settings
 *
 *          - Video file recognition and write-stability checks
 *
 *          - Time and size formatting utilities
 */

#ifndef VIDEO_RELAY_SYSTEM_HPP
#define VIDEO_RELAY_SYSTEM_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace video_relay {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 * @return Detected CPU limit (>= 1)
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured worker count.
 * @param configured Value from configuration (<= 0 = auto)
 * @return @p configured when positive, otherwise detect_cpu_limit()
 */
int resolve_concurrency(int configured);

// **---- Files ----**

/**
 * @brief Whether the path carries a known video container extension.
 * @note Case-insensitive: .mp4 .mkv .ts .mov .avi .webm
 */
bool is_video_file(const std::filesystem::path &path);

/**
 * @brief Check that a file is not being written to.
 *
 * @note Samples the size twice, @p delay apart. A missing file or a size
 *       change means "not stable yet".
 */
bool is_file_stable(const std::filesystem::path &path,
                    std::chrono::milliseconds delay);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count with a binary unit suffix ("12.3 MiB").
 */
std::string format_bytes(std::uintmax_t bytes);

} // namespace video_relay

#endif // VIDEO_RELAY_SYSTEM_HPP
