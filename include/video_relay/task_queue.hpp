/**
 * @file task_queue.hpp
 * @brief Thread-safe priority task queue with retry bookkeeping
 *
 * @details Single source of truth for task lifecycle and bounded concurrency
 *          admission of one pipeline stage. A task lives in exactly one of
 *          four views:
 *
 *          - pending:    ordered by (priority, enqueued_at), not yet claimed
 *
 *          - processing: claimed by a worker, at most concurrency_limit
 *
 *          - completed:  terminal success
 *
 *          - failed:     terminal failure, retry budget exhausted
 */

#ifndef VIDEO_RELAY_TASK_QUEUE_HPP
#define VIDEO_RELAY_TASK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace video_relay {

/**
 * @struct AddResult
 * @brief Outcome of PriorityTaskQueue::add_task.
 */
struct AddResult {
  std::string item_id; //< Id of the new or already present task
  bool added = false;  //< false for duplicates and payloads without an id
};

/**
 * @enum FailOutcome
 * @brief What mark_failed did with the task.
 */
enum class FailOutcome {
  Requeued,     //< Back in pending at LOW priority
  Exhausted,    //< Moved to failed; no further automatic attempts
  NotProcessing //< Late or duplicate callback; nothing changed
};

/**
 * @struct TaskSnapshot
 * @brief Copy of a task together with the view holding it.
 */
struct TaskSnapshot {
  Task task;
  TaskState state;
};

/**
 * @class PriorityTaskQueue
 * @brief Priority-ordered task store for one stage.
 *
 * @attention DESIGN:
 *
 * - Every operation runs under one mutex guarding all four views, so a
 *   transition is atomic with respect to every other caller
 *
 * - get_next_task() performs the concurrency check and the claim in the same
 *   critical section; this is what caps |processing| and prevents the same
 *   item being dispatched twice
 *
 * - get_next_task() is the only call that may block (bounded by its timeout)
 *
 * @note Transitions for items not in the expected view are logged and
 *       treated as no-ops. Late callbacks are expected under concurrency.
 */
class PriorityTaskQueue {
public:
  /**
   * @param concurrency_limit Maximum size of the processing view (>= 1)
   * @param max_retries Attempt budget given to every new task
   * @param name Stage name used as log prefix
   */
  explicit PriorityTaskQueue(size_t concurrency_limit = 1,
                             int max_retries = DEFAULT_MAX_RETRIES,
                             std::string name = "queue");

  PriorityTaskQueue(const PriorityTaskQueue &) = delete;
  PriorityTaskQueue &operator=(const PriorityTaskQueue &) = delete;

  /**
   * @brief Insert a new task into pending.
   * @param payload Item metadata; must contain "item_id"
   * @note Duplicate ids (in any view) are a logged no-op.
   */
  AddResult add_task(const Attributes &payload,
                     Priority priority = Priority::Normal);

  /**
   * @brief Claim the best pending task.
   * @param timeout How long to wait for a claimable task (0 = don't block)
   * @return The claimed task, or nullopt if the concurrency limit is reached,
   *         nothing is pending, or the queue was closed
   */
  std::optional<Task> get_next_task(
      std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

  /**
   * @brief Move a task from processing to completed.
   * @return false if the task was not in processing
   */
  bool mark_completed(const std::string &item_id);

  /**
   * @brief Record a failed attempt.
   *
   * @note The attempt is counted first. While retry_count < max_retries the
   *       task is requeued at LOW priority behind everything already pending
   *       at LOW; otherwise it moves to failed with @p error recorded.
   */
  FailOutcome mark_failed(const std::string &item_id,
                          const std::string &error);

  /**
   * @brief Remove a task from whichever view holds it.
   * @return true if something was removed
   */
  bool cancel_task(const std::string &item_id);

  QueueStatistics get_statistics() const;
  std::vector<std::string> get_processing_tasks() const;

  std::optional<TaskSnapshot> find_task(const std::string &item_id) const;
  bool contains(const std::string &item_id) const;

  /// Drop the completed ledger. Returns the number of tasks removed.
  size_t clear_completed();

  /// Drop the failed ledger. Returns the number of tasks removed.
  size_t clear_failed();

  /// Drop every view. Returns the number of tasks removed.
  size_t clear_all();

  void set_concurrency_limit(size_t limit);
  size_t concurrency_limit() const;

  /**
   * @brief Wake all waiters and refuse further claims.
   * @note add_task and the mark_* transitions keep working so in-flight
   *       workers can still report.
   */
  void close();
  bool is_closed() const;

  const std::string &name() const { return name_; }

private:
  using PendingSet = std::set<Task, TaskOrder>;

  /// Insert into pending with a fresh timestamp and sequence number
  void push_pending_locked(Task task);
  bool can_claim_locked() const;

  mutable std::mutex mutex_;
  std::condition_variable cv_;

  PendingSet pending_;
  std::unordered_map<std::string, PendingSet::iterator> pending_index_;
  std::unordered_map<std::string, Task> processing_;
  std::unordered_map<std::string, Task> completed_;
  std::unordered_map<std::string, Task> failed_;

  size_t concurrency_limit_;
  int max_retries_;
  std::uint64_t next_sequence_{0};
  bool closed_{false};
  std::string name_;
};

} // namespace video_relay

#endif // VIDEO_RELAY_TASK_QUEUE_HPP
