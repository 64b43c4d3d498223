/**
 * @file event_bus.cpp
 * @brief EventBus implementation
 */

#include "video_relay/event_bus.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "video_relay/logging.hpp"

namespace video_relay {

EventBus::EventBus(size_t history_limit)
    : history_limit_(std::max<size_t>(1, history_limit)) {}

EventBus::SubscriptionId EventBus::subscribe(EventType type,
                                             Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_[type].push_back({id, std::move(callback)});
  return id;
}

void EventBus::unsubscribe(EventType type, SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(type);
  if (it == subscribers_.end())
    return;

  auto &subs = it->second;
  subs.erase(std::remove_if(subs.begin(), subs.end(),
                            [id](const Subscription &s) { return s.id == id; }),
             subs.end());
}

void EventBus::publish(EventType type, EventData data,
                       const std::string &source) {
  Event event{type, Clock::now(), std::move(data), source};

  /// Record and snapshot under one lock; callbacks run unlocked
  std::vector<Subscription> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(event);
    while (history_.size() > history_limit_) {
      history_.pop_front();
    }

    auto it = subscribers_.find(type);
    if (it != subscribers_.end()) {
      targets = it->second;
    }
  }

  std::vector<std::string> failures;
  for (const auto &sub : targets) {
    try {
      sub.callback(event);
    } catch (const std::exception &e) {
      LOG_ERROR("[EventBus] Subscriber {} for {} threw: {}", sub.id,
                to_string(type), e.what());
      failures.push_back(e.what());
    } catch (...) {
      LOG_ERROR("[EventBus] Subscriber {} for {} threw a non-standard "
                "exception",
                sub.id, to_string(type));
      failures.push_back("non-standard exception");
    }
  }

  /// An ERROR_OCCURRED handler failing again must not loop forever
  if (type == EventType::ErrorOccurred)
    return;

  for (auto &message : failures) {
    EventData error;
    error.item_id = event.data.item_id;
    error.error = std::move(message);
    error.attributes["component"] = "event_bus";
    error.attributes["event_type"] = to_string(type);
    publish(EventType::ErrorOccurred, std::move(error), "event_bus");
  }
}

std::vector<Event> EventBus::get_event_history(std::optional<EventType> type,
                                               size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Event> out;
  for (auto it = history_.rbegin(); it != history_.rend() && out.size() < limit;
       ++it) {
    if (!type || it->type == *type) {
      out.push_back(*it);
    }
  }
  return out;
}

size_t EventBus::subscriber_count(EventType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(type);
  return it == subscribers_.end() ? 0 : it->second.size();
}

void EventBus::clear_history() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
}

void EventBus::clear_all_subscribers() {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.clear();
}

} // namespace video_relay
