/**
 * @file status_sink.hpp
 * @brief Persistence hook for item state transitions
 *
 * @details The pipeline does not own storage. It reports every transition of
 *          an item to a StatusSink; StatusLog is the file-backed sink used by
 *          the command-line relay.
 */

#ifndef VIDEO_RELAY_STATUS_SINK_HPP
#define VIDEO_RELAY_STATUS_SINK_HPP

#include <fstream>
#include <mutex>
#include <string>

namespace video_relay {

/**
 * @enum ItemStatus
 * @brief Externally visible lifecycle of an item.
 */
enum class ItemStatus {
  Detected,
  Downloading,
  Downloaded,
  Uploading,
  Completed,
  Failed,
  Cancelled
};

const char *to_string(ItemStatus status);

/**
 * @class StatusSink
 * @brief Receives item transitions. Implementations must be thread-safe:
 *        workers of both stages report concurrently.
 */
class StatusSink {
public:
  virtual ~StatusSink() = default;

  virtual void record(const std::string &item_id, ItemStatus status,
                      const std::string &detail) = 0;
};

/**
 * @class StatusLog
 * @brief Appends one tab-separated line per transition to a file.
 *
 * @note Line format: `<ISO-8601 local time>\t<item_id>\t<status>\t<detail>`.
 *       Every line is flushed so the log survives a crash.
 */
class StatusLog : public StatusSink {
public:
  /**
   * @brief Open (append) the log file.
   * @throws std::runtime_error if the file cannot be opened
   */
  explicit StatusLog(const std::string &path);

  void record(const std::string &item_id, ItemStatus status,
              const std::string &detail) override;

  const std::string &path() const { return path_; }

private:
  std::string path_;
  std::mutex mutex_;
  std::ofstream out_;
};

} // namespace video_relay

#endif // VIDEO_RELAY_STATUS_SINK_HPP
