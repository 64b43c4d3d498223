/**
 * @file directory_watcher.cpp
 * @brief DirectoryWatcher implementation
 */

#include "video_relay/directory_watcher.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>

#include "video_relay/logging.hpp"
#include "video_relay/system.hpp"

namespace fs = std::filesystem;

namespace video_relay {

namespace {

std::string seen_key(const fs::path &path) {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec)
    return path.lexically_normal().string();
  return absolute.lexically_normal().string();
}

} // anonymous namespace

Attributes make_item_payload(const fs::path &path) {
  Attributes payload;
  payload[ITEM_ID_KEY] = path.filename().string();
  payload["title"] = path.stem().string();

  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  payload["source_path"] = ec ? path.string() : absolute.string();

  auto size = fs::file_size(path, ec);
  payload["size_bytes"] = ec ? "0" : std::to_string(size);
  return payload;
}

// **----- Lifecycle -----**

DirectoryWatcher::DirectoryWatcher(EventBus &bus, fs::path inbox,
                                   std::chrono::milliseconds interval,
                                   std::chrono::milliseconds stability_delay)
    : bus_(bus), inbox_(std::move(inbox)), interval_(interval),
      stability_delay_(stability_delay) {}

DirectoryWatcher::~DirectoryWatcher() { stop(); }

void DirectoryWatcher::start() {
  if (running_.exchange(true))
    return;

  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_ = false;
  }
  thread_ = std::thread(&DirectoryWatcher::watch_loop, this);

  LOG_INFO("[Watch] Monitoring {} every {}ms", inbox_.string(),
           interval_.count());
  EventData data;
  data.attributes["path"] = inbox_.string();
  bus_.publish(EventType::MonitoringStarted, std::move(data),
               "directory_watcher");
}

void DirectoryWatcher::stop() {
  if (!running_.exchange(false))
    return;

  {
    std::lock_guard<std::mutex> lock(wake_mutex_);
    stop_ = true;
  }
  wake_cv_.notify_all();
  if (thread_.joinable())
    thread_.join();

  LOG_INFO("[Watch] Stopped");
  EventData data;
  data.attributes["path"] = inbox_.string();
  bus_.publish(EventType::MonitoringStopped, std::move(data),
               "directory_watcher");
}

void DirectoryWatcher::pause() {
  if (paused_.exchange(true))
    return;
  LOG_INFO("[Watch] Paused");
  bus_.publish(EventType::MonitoringPaused, {}, "directory_watcher");
}

void DirectoryWatcher::resume() {
  if (!paused_.exchange(false))
    return;
  LOG_INFO("[Watch] Resumed");
  bus_.publish(EventType::MonitoringResumed, {}, "directory_watcher");
  wake_cv_.notify_all();
}

// **----- Seen Set -----**

void DirectoryWatcher::mark_seen(const fs::path &path) {
  std::lock_guard<std::mutex> lock(seen_mutex_);
  seen_.insert(seen_key(path));
}

size_t DirectoryWatcher::seen_count() const {
  std::lock_guard<std::mutex> lock(seen_mutex_);
  return seen_.size();
}

// **----- Scanning -----**

std::vector<fs::path> DirectoryWatcher::find_new_files() {
  std::vector<fs::path> candidates;
  for (const auto &entry : fs::directory_iterator(inbox_)) {
    if (!entry.is_regular_file() || !is_video_file(entry.path()))
      continue;

    std::lock_guard<std::mutex> lock(seen_mutex_);
    if (seen_.find(seen_key(entry.path())) == seen_.end())
      candidates.push_back(entry.path());
  }
  std::sort(candidates.begin(), candidates.end());

  std::vector<fs::path> stable;
  for (const auto &path : candidates) {
    /// Still being written: pick it up on a later poll
    if (!is_file_stable(path, stability_delay_)) {
      LOG_INFO("[Watch] {} is still growing", path.filename().string());
      continue;
    }
    stable.push_back(path);
  }
  return stable;
}

void DirectoryWatcher::report_scan_error(const std::string &message) {
  LOG_ERROR("[Watch] Error scanning directory: {}", message);

  EventData data;
  data.error = message;
  data.attributes["component"] = "directory_watcher";
  data.attributes["path"] = inbox_.string();
  bus_.publish(EventType::ErrorOccurred, std::move(data), "directory_watcher");
}

size_t DirectoryWatcher::scan_once() {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);

  std::vector<fs::path> found;
  try {
    found = find_new_files();
  } catch (const std::exception &e) {
    report_scan_error(e.what());
    return 0;
  }

  for (const auto &path : found) {
    mark_seen(path);
    LOG_INFO("[Watch] New file detected: {}", path.filename().string());

    EventData data;
    data.attributes = make_item_payload(path);
    data.item_id = data.attributes[ITEM_ID_KEY];
    bus_.publish(EventType::VideoDetected, std::move(data),
                 "directory_watcher");
  }
  return found.size();
}

std::vector<Attributes> DirectoryWatcher::collect_backlog() {
  std::lock_guard<std::mutex> scan_lock(scan_mutex_);

  std::vector<Attributes> backlog;
  try {
    for (const auto &path : find_new_files()) {
      mark_seen(path);
      backlog.push_back(make_item_payload(path));
    }
  } catch (const std::exception &e) {
    report_scan_error(e.what());
  }
  return backlog;
}

void DirectoryWatcher::watch_loop() {
  int poll_count = 0;
  std::unique_lock<std::mutex> lock(wake_mutex_);
  while (!stop_) {
    if (!paused_.load()) {
      lock.unlock();
      if (poll_count++ % 15 == 0) {
        LOG_INFO("[Watch] Monitoring directory: {} (Waiting for new files...)",
                 inbox_.string());
      }
      scan_once();
      lock.lock();
    }
    wake_cv_.wait_for(lock, interval_, [this] { return stop_; });
  }
}

} // namespace video_relay
