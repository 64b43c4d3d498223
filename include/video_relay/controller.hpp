/**
 * @file controller.hpp
 * @brief Two-stage pipeline orchestration (download -> upload)
 *
 * @details The Controller wires the EventBus, one PriorityTaskQueue and one
 *          WorkerPool per stage into an end-to-end relay:
 *
 *          1. VIDEO_DETECTED -> download queue at HIGH priority
 *
 *          2. A periodic tick claims admitted tasks and dispatches workers
 *
 *          3. DOWNLOAD_COMPLETED -> upload queue (separate stage, so one item
 *             is never held by a download and an upload worker at once)
 *
 *          4. Exhausted retries -> user-facing ERROR_OCCURRED
 *
 *          5. Every transition is reported to the StatusSink
 */

#ifndef VIDEO_RELAY_CONTROLLER_HPP
#define VIDEO_RELAY_CONTROLLER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "event_bus.hpp"
#include "operations.hpp"
#include "status_sink.hpp"
#include "task_queue.hpp"
#include "worker_pool.hpp"

namespace video_relay {

/**
 * @struct ControllerOptions
 * @brief Tuning knobs, normally filled from Config by main().
 */
struct ControllerOptions {
  size_t download_concurrency = 1;
  size_t upload_concurrency = 1;
  int max_retries = DEFAULT_MAX_RETRIES;
  std::chrono::milliseconds tick_interval{2000};
  std::chrono::milliseconds shutdown_timeout{10000};
};

/**
 * @struct PipelineStatistics
 * @brief View sizes of both stage queues.
 */
struct PipelineStatistics {
  QueueStatistics download;
  QueueStatistics upload;
};

/**
 * @brief Process exit status for a finished run.
 * @return Number of items failed in either stage, capped at 255 so a
 *         multiple of 256 failures never reads as success.
 */
int exit_status(const PipelineStatistics &stats);

/**
 * @class Controller
 * @brief Owns the stage queues and pools and reacts to their events.
 *
 * @attention LIFETIME:
 *
 *   - The bus, the operations and the sink must outlive the Controller
 *
 *   - The destructor performs shutdown() if it was not called
 */
class Controller {
public:
  /**
   * @param sink Optional persistence sink (nullptr = transitions are only
   *        logged)
   */
  Controller(EventBus &bus, Downloader &downloader, Uploader &uploader,
             StatusSink *sink = nullptr, ControllerOptions options = {});
  ~Controller();

  Controller(const Controller &) = delete;
  Controller &operator=(const Controller &) = delete;

  /**
   * @brief Subscribe to pipeline events and start the tick thread.
   */
  void start();

  /**
   * @brief Detector entry point: enqueue a new item at HIGH priority.
   * @return true if the item was queued (false for duplicates, items already
   *         in the upload stage, or after shutdown began)
   */
  bool on_item_detected(const Attributes &payload);

  /**
   * @brief Enqueue items found at startup at NORMAL priority.
   * @return Number of items actually queued
   */
  size_t enqueue_backlog(const std::vector<Attributes> &payloads);

  /**
   * @brief One dispatch round over both stages.
   * @note Runs from the tick thread; callable directly for a manual kick.
   */
  void tick();

  /**
   * @brief Cancel an item in whichever stage holds it.
   * @return true if a worker, pending task or ledger entry was removed
   */
  bool cancel_item(const std::string &item_id);

  /**
   * @brief Stop intake, cancel in-flight workers and wait for them.
   * @param timeout Bounded wait for the worker threads
   * @return true if every worker returned within @p timeout
   * @note Idempotent.
   */
  bool shutdown(std::chrono::milliseconds timeout);
  bool shutdown() { return shutdown(options_.shutdown_timeout); }

  PipelineStatistics statistics() const;

  /// Nothing pending or processing in either stage, and no live worker.
  bool is_idle() const;

  bool is_running() const { return running_.load(); }

  PriorityTaskQueue &download_queue() { return download_queue_; }
  PriorityTaskQueue &upload_queue() { return upload_queue_; }

private:
  bool enqueue_detected(Attributes payload, Priority priority);
  void dispatch_stage(PriorityTaskQueue &queue, WorkerPool &pool);
  void tick_loop();
  void request_tick();
  void record(const std::string &item_id, ItemStatus status,
              const std::string &detail = {});
  void subscribe(EventType type, EventBus::Callback callback);

  // Event reactions
  void handle_download_completed(const Event &event);
  void handle_failure(Stage stage, const Event &event);

  EventBus &bus_;
  Downloader &downloader_;
  Uploader &uploader_;
  StatusSink *sink_;
  ControllerOptions options_;

  PriorityTaskQueue download_queue_;
  PriorityTaskQueue upload_queue_;
  /// Declared after the queues: pools join their threads first on teardown
  WorkerPool download_pool_;
  WorkerPool upload_pool_;

  std::vector<std::pair<EventType, EventBus::SubscriptionId>> subscriptions_;

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> stopped_{false};

  std::mutex dispatch_mutex_; //< Serialises tick() against intake
  PipelineStatistics last_published_;

  std::mutex tick_mutex_;
  std::condition_variable tick_cv_;
  bool stop_tick_{false};
  bool tick_requested_{false};
  std::thread tick_thread_;
};

} // namespace video_relay

#endif // VIDEO_RELAY_CONTROLLER_HPP
