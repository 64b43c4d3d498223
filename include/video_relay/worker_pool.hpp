/**
 * @file worker_pool.hpp
 * @brief Bounded executors for one pipeline stage
 *
 * @details A WorkerPool runs exactly one stage operation per claimed task on
 *          its own thread, republishes progress, and reports the outcome to
 *          the stage queue and the EventBus:
 *
 *          CLAIMED -> RUNNING -> { SUCCEEDED | FAILED | CANCELLED }
 *
 *          - SUCCEEDED: mark_completed + *_COMPLETED
 *
 *          - FAILED:    mark_failed + *_FAILED (retry decided by the queue)
 *
 *          - CANCELLED: cancel_task + *_CANCELLED (no retry consumed)
 *
 * @note The concurrency cap lives in the queue: a pool only ever receives
 *       tasks that get_next_task() admitted.
 */

#ifndef VIDEO_RELAY_WORKER_POOL_HPP
#define VIDEO_RELAY_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "event_bus.hpp"
#include "operations.hpp"
#include "task_queue.hpp"

namespace video_relay {

/**
 * @enum Stage
 * @brief Pipeline stage a pool serves; selects the event family.
 */
enum class Stage { Download, Upload };

const char *to_string(Stage stage);

/**
 * @enum WorkerState
 * @brief Per-invocation worker state.
 */
enum class WorkerState { Claimed, Running, Succeeded, Failed, Cancelled };

const char *to_string(WorkerState state);

namespace detail {

/// Shared between the pool, the worker thread and every handle
struct Worker {
  std::uint64_t serial = 0;
  std::string item_id;
  CancellationToken token;
  std::atomic<WorkerState> state{WorkerState::Claimed};
};

} // namespace detail

/**
 * @class WorkerHandle
 * @brief Cancellable reference to a dispatched worker.
 */
class WorkerHandle {
public:
  WorkerHandle() = default;

  bool valid() const { return static_cast<bool>(worker_); }
  const std::string &item_id() const { return worker_->item_id; }
  std::uint64_t serial() const { return worker_->serial; }
  WorkerState state() const { return worker_->state.load(); }

private:
  friend class WorkerPool;
  explicit WorkerHandle(std::shared_ptr<detail::Worker> worker)
      : worker_(std::move(worker)) {}

  std::shared_ptr<detail::Worker> worker_;
};

/**
 * @class WorkerPool
 * @brief Spawns, tracks and cancels stage workers.
 *
 * @attention DISCARD AFTER CANCEL:
 *
 *   The terminal transition is a compare-and-swap on the worker state. Once
 *   cancel() won that race, a late result from the operation is dropped: no
 *   mark_completed / mark_failed, no event. This keeps a stale attempt from
 *   racing a fresh retry of the same item.
 */
class WorkerPool {
public:
  using Operation = std::function<OperationResult(
      const Task &, const ProgressCallback &, const CancellationToken &)>;

  WorkerPool(Stage stage, PriorityTaskQueue &queue, EventBus &bus,
             Operation operation);

  /// Cancels whatever is still running and joins every thread.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Start a worker for a task claimed from the stage queue.
   * @note Non-blocking; the returned handle is immediately cancellable.
   */
  WorkerHandle dispatch(Task task);

  /**
   * @brief Request cooperative cancellation.
   * @return true if this call moved the worker to CANCELLED, false if it
   *         had already reached a terminal state
   */
  bool cancel(const WorkerHandle &handle);

  /// Cancel the live worker bound to @p item_id, if any.
  bool cancel_item(const std::string &item_id);

  /// Cancel every live worker. Returns how many were cancelled.
  size_t cancel_all();

  /// Threads that have not returned yet (including cancelled stragglers).
  size_t active_count() const;

  /// Join threads that already returned. Returns how many were joined.
  size_t reap();

  /**
   * @brief Wait until every worker thread returned.
   * @return false if @p timeout expired first
   */
  bool wait_idle(std::chrono::milliseconds timeout);

  Stage stage() const { return stage_; }

private:
  struct Entry {
    std::shared_ptr<detail::Worker> worker;
    std::thread thread;
    bool exited = false;
  };

  void run(std::shared_ptr<detail::Worker> worker, Task task);
  void finish(const detail::Worker &worker);
  void publish(EventType type, EventData data);

  Stage stage_;
  PriorityTaskQueue &queue_;
  EventBus &bus_;
  Operation operation_;
  std::string source_; //< Event source name, e.g. "download_worker"

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::vector<Entry> workers_;
  size_t running_{0};
  std::uint64_t next_serial_{1};
};

} // namespace video_relay

#endif // VIDEO_RELAY_WORKER_POOL_HPP
