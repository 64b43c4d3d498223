/**
 * @file types.hpp
 * @brief Core data types shared by the relay pipeline
 *
 * @details Contains the fundamental data structures used throughout the
 * application:
 *          - Task priority bands and queue views
 *
 *          - Task, the unit of work moving through download and upload
 *
 *          - Progress tuples reported by stage operations
 *
 *          - Queue statistics snapshots
 */

#ifndef VIDEO_RELAY_TYPES_HPP
#define VIDEO_RELAY_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace video_relay {

// **----- CONSTANTS -----**

/// Payload key every detected item must carry.
constexpr const char *ITEM_ID_KEY = "item_id";

/// Payload key under which the download stage hands its artifact to upload.
constexpr const char *ARTIFACT_REF_KEY = "artifact_ref";

/// Payload key under which the upload stage reports the published output.
constexpr const char *PUBLISHED_REF_KEY = "published_ref";

/// Payload key carrying the priority an item entered the pipeline with.
constexpr const char *PRIORITY_KEY = "priority";

/// Default attempt budget per stage.
constexpr int DEFAULT_MAX_RETRIES = 3;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Heterogeneous item metadata (title, paths, sizes, ...).
 * @note Values are kept as strings; consumers parse what they need.
 */
using Attributes = std::map<std::string, std::string>;

// **----- ENUMERATIONS -----**

/**
 * @enum Priority
 * @brief Ordinal priority bands. Lower value is served first.
 */
enum class Priority : int {
  High = 1,   //< Freshly detected items
  Normal = 2, //< Backlog loaded at startup
  Low = 3     //< Retries
};

/**
 * @enum TaskState
 * @brief The four disjoint queue views a task can live in.
 */
enum class TaskState { Pending, Processing, Completed, Failed };

const char *to_string(Priority priority);
const char *to_string(TaskState state);

/**
 * @brief Parse a priority from its ordinal string ("1", "2", "3").
 * @return The parsed priority, or @p fallback when the text is not an ordinal.
 */
Priority parse_priority(const std::string &text, Priority fallback);

// **----- DATA STRUCTURES -----**

/**
 * @struct Task
 * @brief A unit of work: one item moving through a pipeline stage.
 *
 * @note Ordering is priority ascending, then sequence ascending. The
 *       sequence number is assigned by the queue on every (re)insertion, so
 *       equal-priority tasks stay FIFO even if the wall clock steps back.
 *       enqueued_at is informational only.
 */
struct Task {
  Priority priority = Priority::Normal;
  TimePoint enqueued_at{};
  std::uint64_t sequence = 0;
  std::string item_id;
  Attributes payload;
  int retry_count = 0;
  int max_retries = DEFAULT_MAX_RETRIES;
  std::string last_error;

  bool can_retry() const { return retry_count < max_retries; }
};

/**
 * @struct TaskOrder
 * @brief Strict weak ordering used by the pending view.
 */
struct TaskOrder {
  bool operator()(const Task &a, const Task &b) const {
    if (a.priority != b.priority)
      return static_cast<int>(a.priority) < static_cast<int>(b.priority);
    return a.sequence < b.sequence;
  }
};

/**
 * @struct Progress
 * @brief A progress tuple emitted by a running stage operation.
 */
struct Progress {
  double percent = 0.0; //< 0..100
  double rate = 0.0;    //< Bytes per second
  double eta_sec = 0.0; //< Estimated seconds remaining (<0 = unknown)
};

/**
 * @struct QueueStatistics
 * @brief Point-in-time view sizes of a PriorityTaskQueue.
 */
struct QueueStatistics {
  size_t pending = 0;
  size_t processing = 0;
  size_t completed = 0;
  size_t failed = 0;

  bool operator==(const QueueStatistics &other) const {
    return pending == other.pending && processing == other.processing &&
           completed == other.completed && failed == other.failed;
  }
  bool operator!=(const QueueStatistics &other) const {
    return !(*this == other);
  }
};

} // namespace video_relay

#endif // VIDEO_RELAY_TYPES_HPP
