/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation
 *
 * @details Each dispatched task gets its own thread. The thread walks the
 *          worker state machine, calls the stage operation, and performs the
 *          terminal queue transition only if it still owns the task.
 */

#include "video_relay/worker_pool.hpp"

#include <exception>
#include <utility>

#include <fmt/core.h>

#include "video_relay/logging.hpp"

namespace video_relay {

// **----- Names -----**

const char *to_string(Stage stage) {
  return stage == Stage::Download ? "download" : "upload";
}

const char *to_string(WorkerState state) {
  switch (state) {
  case WorkerState::Claimed:
    return "claimed";
  case WorkerState::Running:
    return "running";
  case WorkerState::Succeeded:
    return "succeeded";
  case WorkerState::Failed:
    return "failed";
  case WorkerState::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

namespace {

/// Event family of a stage
struct StageEvents {
  EventType started;
  EventType progress;
  EventType completed;
  EventType failed;
  EventType cancelled;
  const char *ref_key;
};

StageEvents events_for(Stage stage) {
  if (stage == Stage::Download) {
    return {EventType::DownloadStarted,   EventType::DownloadProgress,
            EventType::DownloadCompleted, EventType::DownloadFailed,
            EventType::DownloadCancelled, ARTIFACT_REF_KEY};
  }
  return {EventType::UploadStarted,   EventType::UploadProgress,
          EventType::UploadCompleted, EventType::UploadFailed,
          EventType::UploadCancelled, PUBLISHED_REF_KEY};
}

} // anonymous namespace

// **----- Lifecycle -----**

WorkerPool::WorkerPool(Stage stage, PriorityTaskQueue &queue, EventBus &bus,
                       Operation operation)
    : stage_(stage), queue_(queue), bus_(bus),
      operation_(std::move(operation)),
      source_(fmt::format("{}_worker", to_string(stage))) {}

WorkerPool::~WorkerPool() {
  cancel_all();

  /// Threads are joined outside the lock; they take it on their way out
  std::vector<Entry> remaining;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining.swap(workers_);
  }
  for (auto &entry : remaining) {
    if (entry.thread.joinable())
      entry.thread.join();
  }
}

WorkerHandle WorkerPool::dispatch(Task task) {
  auto worker = std::make_shared<detail::Worker>();
  worker->item_id = task.item_id;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    worker->serial = next_serial_++;
    /// The thread's finish() needs this lock, so the entry exists before it
    /// can report
    workers_.push_back(
        {worker, std::thread(&WorkerPool::run, this, worker, std::move(task)),
         false});
    ++running_;
  }

  LOG_INFO("[{}] Dispatched worker #{} for {}", source_, worker->serial,
           worker->item_id);
  return WorkerHandle(worker);
}

void WorkerPool::finish(const detail::Worker &worker) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : workers_) {
      if (entry.worker.get() == &worker) {
        entry.exited = true;
        break;
      }
    }
    --running_;
  }
  idle_cv_.notify_all();
}

void WorkerPool::publish(EventType type, EventData data) {
  bus_.publish(type, std::move(data), source_);
}

// **----- Worker Body -----**

void WorkerPool::run(std::shared_ptr<detail::Worker> worker, Task task) {
  const StageEvents events = events_for(stage_);

  WorkerState expected = WorkerState::Claimed;
  if (!worker->state.compare_exchange_strong(expected, WorkerState::Running)) {
    /// Cancelled before it started
    finish(*worker);
    return;
  }

  {
    EventData started;
    started.item_id = task.item_id;
    started.attributes = task.payload;
    started.attributes["attempt"] = std::to_string(task.retry_count + 1);
    publish(events.started, std::move(started));
  }

  ProgressCallback on_progress = [this, worker,
                                  events](const Progress &progress) {
    if (worker->state.load() != WorkerState::Running)
      return;
    EventData data;
    data.item_id = worker->item_id;
    data.progress = progress;
    publish(events.progress, std::move(data));
  };

  OperationResult result;
  TIMER_START(operation);
  try {
    result = operation_(task, on_progress, worker->token);
  } catch (const std::exception &e) {
    result = OperationResult::failure(
        fmt::format("{} raised: {}", to_string(stage_), e.what()));
  } catch (...) {
    result = OperationResult::failure(
        fmt::format("{} raised a non-standard exception", to_string(stage_)));
  }
  TIMER_END_AS(operation, to_string(stage_));

  /// No-false-success: a success flag without a reference is a failure
  const bool succeeded = result.is_definite_success();
  if (!succeeded && result.error.empty()) {
    result.error = result.success ? "operation returned no result reference"
                                  : "operation failed without an error";
  }

  expected = WorkerState::Running;
  if (!worker->state.compare_exchange_strong(
          expected, succeeded ? WorkerState::Succeeded : WorkerState::Failed)) {
    LOG_INFO("[{}] Discarding late result for cancelled {}", source_,
             task.item_id);
    finish(*worker);
    return;
  }

  if (succeeded) {
    if (!queue_.mark_completed(task.item_id)) {
      LOG_WARN("[{}] {} left processing while running, discarding result",
               source_, task.item_id);
      finish(*worker);
      return;
    }

    EventData done;
    done.item_id = task.item_id;
    done.attributes = task.payload;
    for (const auto &kv : result.metadata) {
      done.attributes[kv.first] = kv.second;
    }
    done.attributes[events.ref_key] = result.ref;
    publish(events.completed, std::move(done));
  } else {
    FailOutcome outcome = queue_.mark_failed(task.item_id, result.error);
    if (outcome == FailOutcome::NotProcessing) {
      LOG_WARN("[{}] {} left processing while running, discarding: {}",
               source_, task.item_id, result.error);
      finish(*worker);
      return;
    }

    EventData failed;
    failed.item_id = task.item_id;
    failed.error = result.error;
    failed.attributes = task.payload;
    failed.attributes["retry_count"] = std::to_string(task.retry_count + 1);
    failed.attributes["max_retries"] = std::to_string(task.max_retries);
    failed.attributes["failure_kind"] = to_string(result.kind);
    failed.attributes["exhausted"] =
        outcome == FailOutcome::Exhausted ? "true" : "false";
    publish(events.failed, std::move(failed));
  }

  finish(*worker);
}

// **----- Cancellation -----**

bool WorkerPool::cancel(const WorkerHandle &handle) {
  if (!handle.valid())
    return false;

  detail::Worker &worker = *handle.worker_;
  WorkerState state = worker.state.load();
  while (state == WorkerState::Claimed || state == WorkerState::Running) {
    if (worker.state.compare_exchange_weak(state, WorkerState::Cancelled)) {
      worker.token.request_cancel();
      queue_.cancel_task(worker.item_id);

      EventData data;
      data.item_id = worker.item_id;
      publish(events_for(stage_).cancelled, std::move(data));

      LOG_WARN("[{}] Cancelled worker #{} for {}", source_, worker.serial,
               worker.item_id);
      return true;
    }
  }
  return false;
}

bool WorkerPool::cancel_item(const std::string &item_id) {
  std::vector<WorkerHandle> matches;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : workers_) {
      if (entry.worker->item_id == item_id) {
        matches.push_back(WorkerHandle(entry.worker));
      }
    }
  }

  bool cancelled = false;
  for (const auto &handle : matches) {
    cancelled = cancel(handle) || cancelled;
  }
  return cancelled;
}

size_t WorkerPool::cancel_all() {
  std::vector<WorkerHandle> handles;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &entry : workers_) {
      handles.push_back(WorkerHandle(entry.worker));
    }
  }

  size_t count = 0;
  for (const auto &handle : handles) {
    if (cancel(handle))
      ++count;
  }
  return count;
}

// **----- Housekeeping -----**

size_t WorkerPool::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

size_t WorkerPool::reap() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
      if (it->exited) {
        finished.push_back(std::move(it->thread));
        it = workers_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &t : finished) {
    t.join();
  }
  return finished.size();
}

bool WorkerPool::wait_idle(std::chrono::milliseconds timeout) {
  bool idle;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    idle = idle_cv_.wait_for(lock, timeout, [this] { return running_ == 0; });
  }
  reap();
  return idle;
}

} // namespace video_relay
