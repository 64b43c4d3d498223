/**
 * @file types.cpp
 * @brief Name tables for the core enumerations
 */

#include "video_relay/types.hpp"

#include "video_relay/events.hpp"
#include "video_relay/operations.hpp"

namespace video_relay {

const char *to_string(Priority priority) {
  switch (priority) {
  case Priority::High:
    return "high";
  case Priority::Normal:
    return "normal";
  case Priority::Low:
    return "low";
  }
  return "unknown";
}

const char *to_string(TaskState state) {
  switch (state) {
  case TaskState::Pending:
    return "pending";
  case TaskState::Processing:
    return "processing";
  case TaskState::Completed:
    return "completed";
  case TaskState::Failed:
    return "failed";
  }
  return "unknown";
}

const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "none";
  case FailureKind::Transient:
    return "transient";
  case FailureKind::Permanent:
    return "permanent";
  }
  return "unknown";
}

Priority parse_priority(const std::string &text, Priority fallback) {
  if (text == "1")
    return Priority::High;
  if (text == "2")
    return Priority::Normal;
  if (text == "3")
    return Priority::Low;
  return fallback;
}

const char *to_string(EventType type) {
  switch (type) {
  case EventType::MonitoringStarted:
    return "monitoring_started";
  case EventType::MonitoringStopped:
    return "monitoring_stopped";
  case EventType::MonitoringPaused:
    return "monitoring_paused";
  case EventType::MonitoringResumed:
    return "monitoring_resumed";
  case EventType::VideoDetected:
    return "video_detected";
  case EventType::VideoQueued:
    return "video_queued";
  case EventType::DownloadStarted:
    return "download_started";
  case EventType::DownloadProgress:
    return "download_progress";
  case EventType::DownloadCompleted:
    return "download_completed";
  case EventType::DownloadFailed:
    return "download_failed";
  case EventType::DownloadCancelled:
    return "download_cancelled";
  case EventType::UploadStarted:
    return "upload_started";
  case EventType::UploadProgress:
    return "upload_progress";
  case EventType::UploadCompleted:
    return "upload_completed";
  case EventType::UploadFailed:
    return "upload_failed";
  case EventType::UploadCancelled:
    return "upload_cancelled";
  case EventType::StatusChanged:
    return "status_changed";
  case EventType::StatisticsUpdated:
    return "statistics_updated";
  case EventType::ErrorOccurred:
    return "error_occurred";
  case EventType::WarningOccurred:
    return "warning_occurred";
  case EventType::ConfigChanged:
    return "config_changed";
  case EventType::SettingsSaved:
    return "settings_saved";
  case EventType::AppStarted:
    return "app_started";
  case EventType::AppShutdown:
    return "app_shutdown";
  }
  return "unknown";
}

} // namespace video_relay
