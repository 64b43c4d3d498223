/**
 * @file task_queue.cpp
 * @brief PriorityTaskQueue implementation
 */

#include "video_relay/task_queue.hpp"

#include <algorithm>
#include <utility>

#include "video_relay/logging.hpp"

namespace video_relay {

PriorityTaskQueue::PriorityTaskQueue(size_t concurrency_limit, int max_retries,
                                     std::string name)
    : concurrency_limit_(std::max<size_t>(1, concurrency_limit)),
      max_retries_(std::max(1, max_retries)), name_(std::move(name)) {}

// **----- Internal Helpers -----**

void PriorityTaskQueue::push_pending_locked(Task task) {
  task.enqueued_at = Clock::now();
  task.sequence = next_sequence_++;
  std::string id = task.item_id;
  auto inserted = pending_.insert(std::move(task));
  pending_index_[id] = inserted.first;
}

bool PriorityTaskQueue::can_claim_locked() const {
  return !closed_ && !pending_.empty() &&
         processing_.size() < concurrency_limit_;
}

// **----- Admission -----**

AddResult PriorityTaskQueue::add_task(const Attributes &payload,
                                      Priority priority) {
  AddResult result;
  auto id_it = payload.find(ITEM_ID_KEY);
  if (id_it == payload.end() || id_it->second.empty()) {
    LOG_ERROR("[{}] Cannot add task without item_id", name_);
    return result;
  }
  result.item_id = id_it->second;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_index_.count(result.item_id) ||
        processing_.count(result.item_id) || completed_.count(result.item_id) ||
        failed_.count(result.item_id)) {
      LOG_WARN("[{}] Item {} is already tracked, ignoring duplicate", name_,
               result.item_id);
      return result;
    }

    Task task;
    task.priority = priority;
    task.item_id = result.item_id;
    task.payload = payload;
    task.max_retries = max_retries_;
    push_pending_locked(std::move(task));
    result.added = true;
  }
  cv_.notify_one();

  LOG_INFO("[{}] Queued {} (priority {})", name_, result.item_id,
           to_string(priority));
  return result;
}

std::optional<Task> PriorityTaskQueue::get_next_task(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (timeout.count() > 0) {
    cv_.wait_for(lock, timeout,
                 [this] { return closed_ || can_claim_locked(); });
  }
  if (!can_claim_locked())
    return std::nullopt;

  /// Check-and-move in the same critical section as the limit check
  auto first = pending_.begin();
  Task task = *first;
  pending_index_.erase(task.item_id);
  pending_.erase(first);
  processing_.emplace(task.item_id, task);
  return task;
}

// **----- Transitions -----**

bool PriorityTaskQueue::mark_completed(const std::string &item_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processing_.find(item_id);
    if (it == processing_.end()) {
      LOG_WARN("[{}] Cannot mark {} as completed - not in processing", name_,
               item_id);
      return false;
    }
    completed_.emplace(item_id, std::move(it->second));
    processing_.erase(it);
  }
  /// A processing slot was freed
  cv_.notify_one();
  LOG_INFO("[{}] Completed {}", name_, item_id);
  return true;
}

FailOutcome PriorityTaskQueue::mark_failed(const std::string &item_id,
                                           const std::string &error) {
  FailOutcome outcome = FailOutcome::NotProcessing;
  int attempts = 0;
  int budget = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processing_.find(item_id);
    if (it == processing_.end()) {
      LOG_WARN("[{}] Cannot mark {} as failed - not in processing", name_,
               item_id);
      return FailOutcome::NotProcessing;
    }

    Task task = std::move(it->second);
    processing_.erase(it);

    ++task.retry_count;
    task.last_error = error;
    attempts = task.retry_count;
    budget = task.max_retries;

    if (task.can_retry()) {
      task.priority = Priority::Low;
      push_pending_locked(std::move(task));
      outcome = FailOutcome::Requeued;
    } else {
      failed_.emplace(item_id, std::move(task));
      outcome = FailOutcome::Exhausted;
    }
  }
  cv_.notify_one();

  if (outcome == FailOutcome::Requeued) {
    LOG_WARN("[{}] Re-queued {} for retry ({}/{}): {}", name_, item_id,
             attempts, budget, error);
  } else {
    LOG_ERROR("[{}] {} failed permanently after {} attempts: {}", name_,
              item_id, attempts, error);
  }
  return outcome;
}

bool PriorityTaskQueue::cancel_task(const std::string &item_id) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto idx = pending_index_.find(item_id);
    if (idx != pending_index_.end()) {
      pending_.erase(idx->second);
      pending_index_.erase(idx);
      removed = true;
    }
    removed = processing_.erase(item_id) > 0 || removed;
    removed = completed_.erase(item_id) > 0 || removed;
    removed = failed_.erase(item_id) > 0 || removed;
  }
  if (removed) {
    cv_.notify_one();
    LOG_INFO("[{}] Cancelled {}", name_, item_id);
  }
  return removed;
}

// **----- Inspection -----**

QueueStatistics PriorityTaskQueue::get_statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  QueueStatistics stats;
  stats.pending = pending_.size();
  stats.processing = processing_.size();
  stats.completed = completed_.size();
  stats.failed = failed_.size();
  return stats;
}

std::vector<std::string> PriorityTaskQueue::get_processing_tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(processing_.size());
  for (const auto &entry : processing_) {
    ids.push_back(entry.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::optional<TaskSnapshot>
PriorityTaskQueue::find_task(const std::string &item_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto idx = pending_index_.find(item_id);
  if (idx != pending_index_.end())
    return TaskSnapshot{*idx->second, TaskState::Pending};

  auto it = processing_.find(item_id);
  if (it != processing_.end())
    return TaskSnapshot{it->second, TaskState::Processing};

  it = completed_.find(item_id);
  if (it != completed_.end())
    return TaskSnapshot{it->second, TaskState::Completed};

  it = failed_.find(item_id);
  if (it != failed_.end())
    return TaskSnapshot{it->second, TaskState::Failed};

  return std::nullopt;
}

bool PriorityTaskQueue::contains(const std::string &item_id) const {
  return find_task(item_id).has_value();
}

// **----- Housekeeping -----**

size_t PriorityTaskQueue::clear_completed() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = completed_.size();
  completed_.clear();
  LOG_INFO("[{}] Cleared {} completed tasks", name_, count);
  return count;
}

size_t PriorityTaskQueue::clear_failed() {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = failed_.size();
  failed_.clear();
  LOG_INFO("[{}] Cleared {} failed tasks", name_, count);
  return count;
}

size_t PriorityTaskQueue::clear_all() {
  size_t count;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    count = pending_.size() + processing_.size() + completed_.size() +
            failed_.size();
    pending_index_.clear();
    pending_.clear();
    processing_.clear();
    completed_.clear();
    failed_.clear();
  }
  cv_.notify_all();
  LOG_WARN("[{}] Cleared all views ({} tasks)", name_, count);
  return count;
}

void PriorityTaskQueue::set_concurrency_limit(size_t limit) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    concurrency_limit_ = std::max<size_t>(1, limit);
  }
  cv_.notify_all();
}

size_t PriorityTaskQueue::concurrency_limit() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return concurrency_limit_;
}

void PriorityTaskQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool PriorityTaskQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

} // namespace video_relay
