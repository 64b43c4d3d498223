/**
 * @file events.hpp
 * @brief Event types and payloads carried by the EventBus
 *
 * @details Events are immutable once published. The payload is a small typed
 *          struct for the fields every lifecycle event shares (item id, error,
 *          progress) plus a string map for the genuinely heterogeneous rest.
 */

#ifndef VIDEO_RELAY_EVENTS_HPP
#define VIDEO_RELAY_EVENTS_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace video_relay {

/**
 * @enum EventType
 * @brief Closed set of notifications exchanged inside the process.
 */
enum class EventType {
  // Monitoring lifecycle
  MonitoringStarted,
  MonitoringStopped,
  MonitoringPaused,
  MonitoringResumed,

  // Item lifecycle
  VideoDetected,
  VideoQueued,

  // Download stage
  DownloadStarted,
  DownloadProgress,
  DownloadCompleted,
  DownloadFailed,
  DownloadCancelled,

  // Upload stage
  UploadStarted,
  UploadProgress,
  UploadCompleted,
  UploadFailed,
  UploadCancelled,

  // Status
  StatusChanged,
  StatisticsUpdated,

  // Errors
  ErrorOccurred,
  WarningOccurred,

  // Configuration
  ConfigChanged,
  SettingsSaved,

  // Application
  AppStarted,
  AppShutdown
};

/// Stable snake_case name, e.g. "download_completed".
const char *to_string(EventType type);

/**
 * @struct EventData
 * @brief Payload of an event.
 */
struct EventData {
  std::string item_id;              //< Subject item (empty for app-level events)
  std::string error;                //< Failure description, if any
  std::optional<Progress> progress; //< Set on *_PROGRESS events
  Attributes attributes;            //< Everything else
};

/**
 * @struct Event
 * @brief A published notification.
 */
struct Event {
  EventType type;
  TimePoint timestamp;
  EventData data;
  std::string source; //< Publishing component
};

} // namespace video_relay

#endif // VIDEO_RELAY_EVENTS_HPP
