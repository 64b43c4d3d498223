/**
 * @file controller.cpp
 * @brief Controller implementation
 */

#include "video_relay/controller.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "video_relay/logging.hpp"

namespace video_relay {

// **----- Lifecycle -----**

Controller::Controller(EventBus &bus, Downloader &downloader,
                       Uploader &uploader, StatusSink *sink,
                       ControllerOptions options)
    : bus_(bus), downloader_(downloader), uploader_(uploader), sink_(sink),
      options_(options),
      download_queue_(options.download_concurrency, options.max_retries,
                      "download"),
      upload_queue_(options.upload_concurrency, options.max_retries, "upload"),
      download_pool_(Stage::Download, download_queue_, bus,
                     [this](const Task &task, const ProgressCallback &progress,
                            const CancellationToken &token) {
                       return downloader_.download(task.item_id, task.payload,
                                                   progress, token);
                     }),
      upload_pool_(Stage::Upload, upload_queue_, bus,
                   [this](const Task &task, const ProgressCallback &progress,
                          const CancellationToken &token) {
                     auto ref = task.payload.find(ARTIFACT_REF_KEY);
                     if (ref == task.payload.end() || ref->second.empty()) {
                       return OperationResult::failure(
                           "upload task carries no artifact reference",
                           FailureKind::Permanent);
                     }
                     return uploader_.upload(task.item_id, ref->second,
                                             task.payload, progress, token);
                   }) {}

Controller::~Controller() {
  if (running_.load())
    shutdown();
}

void Controller::subscribe(EventType type, EventBus::Callback callback) {
  subscriptions_.emplace_back(type, bus_.subscribe(type, std::move(callback)));
}

void Controller::start() {
  if (stopped_.load()) {
    LOG_WARN("[Controller] Cannot restart after shutdown");
    return;
  }
  if (running_.exchange(true)) {
    LOG_WARN("[Controller] start() called twice, ignoring");
    return;
  }

  subscribe(EventType::VideoDetected,
            [this](const Event &e) { on_item_detected(e.data.attributes); });

  subscribe(EventType::DownloadStarted, [this](const Event &e) {
    record(e.data.item_id, ItemStatus::Downloading);
  });
  subscribe(EventType::DownloadCompleted,
            [this](const Event &e) { handle_download_completed(e); });
  subscribe(EventType::DownloadFailed,
            [this](const Event &e) { handle_failure(Stage::Download, e); });
  subscribe(EventType::DownloadCancelled, [this](const Event &e) {
    record(e.data.item_id, ItemStatus::Cancelled, "download");
  });

  subscribe(EventType::UploadStarted, [this](const Event &e) {
    record(e.data.item_id, ItemStatus::Uploading);
  });
  subscribe(EventType::UploadCompleted, [this](const Event &e) {
    auto ref = e.data.attributes.find(PUBLISHED_REF_KEY);
    record(e.data.item_id, ItemStatus::Completed,
           ref != e.data.attributes.end() ? ref->second : std::string());
    request_tick();
  });
  subscribe(EventType::UploadFailed,
            [this](const Event &e) { handle_failure(Stage::Upload, e); });
  subscribe(EventType::UploadCancelled, [this](const Event &e) {
    record(e.data.item_id, ItemStatus::Cancelled, "upload");
  });

  accepting_ = true;
  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    stop_tick_ = false;
  }
  tick_thread_ = std::thread(&Controller::tick_loop, this);

  LOG_PHASE("[Controller] Started (download={} upload={} retries={} "
            "tick={}ms)",
            options_.download_concurrency, options_.upload_concurrency,
            options_.max_retries, options_.tick_interval.count());

  EventData data;
  data.attributes["download_concurrency"] =
      std::to_string(options_.download_concurrency);
  data.attributes["upload_concurrency"] =
      std::to_string(options_.upload_concurrency);
  bus_.publish(EventType::AppStarted, std::move(data), "controller");
}

// **----- Intake -----**

bool Controller::enqueue_detected(Attributes payload, Priority priority) {
  if (!accepting_.load()) {
    LOG_WARN("[Controller] Not accepting items, dropping detection");
    return false;
  }

  auto id = payload.find(ITEM_ID_KEY);
  if (id != payload.end() && upload_queue_.contains(id->second)) {
    LOG_WARN("[Controller] {} is already in the upload stage", id->second);
    return false;
  }

  /// The priority travels with the payload so the upload stage can reuse it
  if (payload.find(PRIORITY_KEY) == payload.end()) {
    payload[PRIORITY_KEY] = std::to_string(static_cast<int>(priority));
  }

  AddResult result;
  {
    /// A tick must not dispatch the task before "detected" is recorded
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    result = download_queue_.add_task(payload, priority);
    if (!result.added)
      return false;
    record(result.item_id, ItemStatus::Detected, to_string(priority));
  }

  EventData data;
  data.item_id = result.item_id;
  data.attributes = payload;
  bus_.publish(EventType::VideoQueued, std::move(data), "controller");

  request_tick();
  return true;
}

bool Controller::on_item_detected(const Attributes &payload) {
  return enqueue_detected(payload, Priority::High);
}

size_t Controller::enqueue_backlog(const std::vector<Attributes> &payloads) {
  size_t added = 0;
  for (const auto &payload : payloads) {
    if (enqueue_detected(payload, Priority::Normal))
      ++added;
  }
  if (!payloads.empty()) {
    LOG_INFO("[Controller] Backlog: {}/{} items queued", added,
             payloads.size());
  }
  return added;
}

// **----- Tick -----**

void Controller::dispatch_stage(PriorityTaskQueue &queue, WorkerPool &pool) {
  while (auto task = queue.get_next_task()) {
    pool.dispatch(std::move(*task));
  }
}

void Controller::tick() {
  PipelineStatistics stats;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(dispatch_mutex_);
    download_pool_.reap();
    upload_pool_.reap();

    dispatch_stage(download_queue_, download_pool_);
    dispatch_stage(upload_queue_, upload_pool_);

    stats = statistics();
    changed = stats.download != last_published_.download ||
              stats.upload != last_published_.upload;
    if (changed)
      last_published_ = stats;
  }

  if (!changed)
    return;

  EventData data;
  auto put = [&data](const char *stage, const QueueStatistics &s) {
    data.attributes[fmt::format("{}_pending", stage)] =
        std::to_string(s.pending);
    data.attributes[fmt::format("{}_processing", stage)] =
        std::to_string(s.processing);
    data.attributes[fmt::format("{}_completed", stage)] =
        std::to_string(s.completed);
    data.attributes[fmt::format("{}_failed", stage)] =
        std::to_string(s.failed);
  };
  put("download", stats.download);
  put("upload", stats.upload);
  bus_.publish(EventType::StatisticsUpdated, std::move(data), "controller");
}

void Controller::tick_loop() {
  std::unique_lock<std::mutex> lock(tick_mutex_);
  while (!stop_tick_) {
    tick_requested_ = false;
    lock.unlock();
    tick();
    lock.lock();
    tick_cv_.wait_for(lock, options_.tick_interval,
                      [this] { return stop_tick_ || tick_requested_; });
  }
}

void Controller::request_tick() {
  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    tick_requested_ = true;
  }
  tick_cv_.notify_one();
}

// **----- Event Reactions -----**

void Controller::handle_download_completed(const Event &event) {
  const std::string &item_id = event.data.item_id;
  auto ref = event.data.attributes.find(ARTIFACT_REF_KEY);
  record(item_id, ItemStatus::Downloaded,
         ref != event.data.attributes.end() ? ref->second : std::string());

  Priority priority = Priority::Normal;
  auto p = event.data.attributes.find(PRIORITY_KEY);
  if (p != event.data.attributes.end())
    priority = parse_priority(p->second, Priority::Normal);

  AddResult result = upload_queue_.add_task(event.data.attributes, priority);
  if (!result.added) {
    LOG_WARN("[Controller] Upload of {} was not queued", item_id);
    return;
  }
  request_tick();
}

void Controller::handle_failure(Stage stage, const Event &event) {
  const std::string &item_id = event.data.item_id;
  auto exhausted = event.data.attributes.find("exhausted");
  if (exhausted == event.data.attributes.end() ||
      exhausted->second != "true") {
    LOG_WARN("[Controller] {} of {} failed, retry scheduled: {}",
             to_string(stage), item_id, event.data.error);
    request_tick();
    return;
  }

  LOG_ERROR("[Controller] {} of {} exhausted its retries: {}",
            to_string(stage), item_id, event.data.error);

  EventData data;
  data.item_id = item_id;
  data.error = event.data.error;
  data.attributes["component"] = fmt::format("{}_stage", to_string(stage));
  data.attributes["error_kind"] = "exhausted_retries";
  data.attributes["stage"] = to_string(stage);
  bus_.publish(EventType::ErrorOccurred, std::move(data), "controller");

  record(item_id, ItemStatus::Failed,
         fmt::format("{}: {}", to_string(stage), event.data.error));
  request_tick();
}

void Controller::record(const std::string &item_id, ItemStatus status,
                        const std::string &detail) {
  if (!sink_)
    return;
  sink_->record(item_id, status, detail);
}

// **----- Control -----**

bool Controller::cancel_item(const std::string &item_id) {
  /// A live worker publishes *_CANCELLED itself
  if (download_pool_.cancel_item(item_id) || upload_pool_.cancel_item(item_id))
    return true;

  bool removed = false;
  if (download_queue_.cancel_task(item_id)) {
    removed = true;
    EventData data;
    data.item_id = item_id;
    bus_.publish(EventType::DownloadCancelled, std::move(data), "controller");
  }
  if (upload_queue_.cancel_task(item_id)) {
    removed = true;
    EventData data;
    data.item_id = item_id;
    bus_.publish(EventType::UploadCancelled, std::move(data), "controller");
  }
  if (!removed)
    LOG_WARN("[Controller] cancel_item: {} not found", item_id);
  return removed;
}

int exit_status(const PipelineStatistics &stats) {
  size_t failed = stats.download.failed + stats.upload.failed;
  return static_cast<int>(std::min<size_t>(failed, 255));
}

PipelineStatistics Controller::statistics() const {
  return {download_queue_.get_statistics(), upload_queue_.get_statistics()};
}

bool Controller::is_idle() const {
  PipelineStatistics s = statistics();
  return s.download.pending == 0 && s.download.processing == 0 &&
         s.upload.pending == 0 && s.upload.processing == 0 &&
         download_pool_.active_count() == 0 &&
         upload_pool_.active_count() == 0;
}

bool Controller::shutdown(std::chrono::milliseconds timeout) {
  if (stopped_.exchange(true))
    return true;

  LOG_PHASE("[Controller] Shutting down (timeout {}ms)", timeout.count());
  accepting_ = false;

  {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    stop_tick_ = true;
  }
  tick_cv_.notify_all();
  if (tick_thread_.joinable())
    tick_thread_.join();

  download_queue_.close();
  upload_queue_.close();

  size_t cancelled = download_pool_.cancel_all() + upload_pool_.cancel_all();
  if (cancelled > 0)
    LOG_WARN("[Controller] Cancelled {} in-flight workers", cancelled);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool idle = download_pool_.wait_idle(timeout);
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (remaining.count() < 0)
    remaining = std::chrono::milliseconds(0);
  idle = upload_pool_.wait_idle(remaining) && idle;

  if (!idle) {
    LOG_WARN("[Controller] Workers still running after {}ms; they are "
             "detached from the pipeline and joined on destruction",
             timeout.count());
  }

  for (const auto &sub : subscriptions_) {
    bus_.unsubscribe(sub.first, sub.second);
  }
  subscriptions_.clear();

  PipelineStatistics stats = statistics();
  EventData data;
  data.attributes["clean"] = idle ? "true" : "false";
  data.attributes["download_pending"] = std::to_string(stats.download.pending);
  data.attributes["upload_pending"] = std::to_string(stats.upload.pending);
  bus_.publish(EventType::AppShutdown, std::move(data), "controller");

  running_ = false;
  LOG_SUCCESS("[Controller] Shutdown complete");
  return idle;
}

} // namespace video_relay
