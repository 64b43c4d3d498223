/**
 * @file status_sink.cpp
 * @brief StatusLog implementation
 */

#include "video_relay/status_sink.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>

#include <fmt/core.h>

#include "video_relay/logging.hpp"

namespace video_relay {

const char *to_string(ItemStatus status) {
  switch (status) {
  case ItemStatus::Detected:
    return "detected";
  case ItemStatus::Downloading:
    return "downloading";
  case ItemStatus::Downloaded:
    return "downloaded";
  case ItemStatus::Uploading:
    return "uploading";
  case ItemStatus::Completed:
    return "completed";
  case ItemStatus::Failed:
    return "failed";
  case ItemStatus::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

namespace {

std::string local_timestamp() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return buf;
}

/// Tabs and newlines would break the line format
std::string sanitize(std::string text) {
  for (char &c : text) {
    if (c == '\t' || c == '\n' || c == '\r')
      c = ' ';
  }
  return text;
}

} // anonymous namespace

StatusLog::StatusLog(const std::string &path)
    : path_(path), out_(path, std::ios::app) {
  if (!out_) {
    throw std::runtime_error(
        fmt::format("cannot open status log for writing: {}", path));
  }
}

void StatusLog::record(const std::string &item_id, ItemStatus status,
                       const std::string &detail) {
  std::string line = fmt::format("{}\t{}\t{}\t{}\n", local_timestamp(),
                                 sanitize(item_id), to_string(status),
                                 sanitize(detail));

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line;
  out_.flush();
  if (!out_) {
    LOG_ERROR("[StatusLog] Write to {} failed for {}", path_, item_id);
    out_.clear();
  }
}

} // namespace video_relay
