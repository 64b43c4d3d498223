/**
 * @file directory_watcher.hpp
 * @brief Inbox polling detector
 *
 * @details Polls one directory and publishes VIDEO_DETECTED for every new,
 *          fully written video file. The Controller subscribes to that event;
 *          the watcher knows nothing about queues.
 *
 * @note A file is reported once per process lifetime. Files that were still
 *       growing are retried on the next poll.
 */

#ifndef VIDEO_RELAY_DIRECTORY_WATCHER_HPP
#define VIDEO_RELAY_DIRECTORY_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "event_bus.hpp"

namespace video_relay {

/**
 * @brief Detection payload for a file: item_id, title, source_path,
 *        size_bytes.
 */
Attributes make_item_payload(const std::filesystem::path &path);

/**
 * @class DirectoryWatcher
 * @brief Background poller publishing VIDEO_DETECTED.
 */
class DirectoryWatcher {
public:
  DirectoryWatcher(EventBus &bus, std::filesystem::path inbox,
                   std::chrono::milliseconds interval,
                   std::chrono::milliseconds stability_delay);
  ~DirectoryWatcher();

  DirectoryWatcher(const DirectoryWatcher &) = delete;
  DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

  void start();
  void stop();
  void pause();
  void resume();

  /**
   * @brief Run one poll on the calling thread ("check now").
   * @return Number of files published as VIDEO_DETECTED
   * @note Runs while paused too.
   */
  size_t scan_once();

  /**
   * @brief Take the stable video files currently in the inbox without
   *        publishing them, and mark them seen.
   * @return Payloads sorted by file name (startup backlog)
   */
  std::vector<Attributes> collect_backlog();

  /// Never report @p path.
  void mark_seen(const std::filesystem::path &path);
  size_t seen_count() const;

  bool is_running() const { return running_.load(); }
  bool is_paused() const { return paused_.load(); }

private:
  /// Unseen, stable video files of the inbox (throws on scan errors)
  std::vector<std::filesystem::path> find_new_files();
  void report_scan_error(const std::string &message);
  void watch_loop();

  EventBus &bus_;
  std::filesystem::path inbox_;
  std::chrono::milliseconds interval_;
  std::chrono::milliseconds stability_delay_;

  mutable std::mutex seen_mutex_;
  std::set<std::string> seen_; //< Normalised absolute paths

  std::mutex scan_mutex_; //< One scan at a time

  std::atomic<bool> running_{false};
  std::atomic<bool> paused_{false};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  bool stop_{false};
  std::thread thread_;
};

} // namespace video_relay

#endif // VIDEO_RELAY_DIRECTORY_WATCHER_HPP
