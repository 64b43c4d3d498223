/**
 * @file event_bus.hpp
 * @brief In-process publish/subscribe hub
 *
 * @details Decouples producers (workers, controller, watcher) from consumers
 *          (status sink, UI, controller reactions). Delivery is synchronous:
 *          publish() returns after every current subscriber of the type ran.
 */

#ifndef VIDEO_RELAY_EVENT_BUS_HPP
#define VIDEO_RELAY_EVENT_BUS_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "events.hpp"

namespace video_relay {

/// Default size of the diagnostic history ring.
constexpr size_t DEFAULT_EVENT_HISTORY = 1000;

/**
 * @class EventBus
 * @brief Thread-safe pub/sub with a bounded history ring.
 *
 * @attention CONCURRENCY:
 *
 *   - One mutex guards the subscriber table and the history
 *
 *   - The mutex is released before callbacks run, so a callback may itself
 *     subscribe, unsubscribe or publish
 *
 *   - Ordering across different publishing threads is not defined; a single
 *     publish() delivers to its snapshot of subscribers in registration order
 */
class EventBus {
public:
  using Callback = std::function<void(const Event &)>;
  using SubscriptionId = std::uint64_t;

  explicit EventBus(size_t history_limit = DEFAULT_EVENT_HISTORY);

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  /**
   * @brief Register a callback for an event type.
   * @return Handle for unsubscribe(); never 0.
   */
  SubscriptionId subscribe(EventType type, Callback callback);

  /**
   * @brief Remove a registration. Unknown handles are ignored.
   */
  void unsubscribe(EventType type, SubscriptionId id);

  /**
   * @brief Build an event, record it and deliver it synchronously.
   *
   * @note A throwing subscriber does not stop delivery to the others. Each
   *       failure is logged and republished as ERROR_OCCURRED once delivery
   *       finished (failures of ERROR_OCCURRED subscribers are only logged).
   */
  void publish(EventType type, EventData data = {},
               const std::string &source = "unknown");

  /**
   * @brief Most-recent-first snapshot of the history.
   * @param type Restrict to one type (nullopt = all)
   * @param limit Maximum number of events returned
   */
  std::vector<Event> get_event_history(std::optional<EventType> type = {},
                                       size_t limit = 100) const;

  size_t subscriber_count(EventType type) const;

  void clear_history();

  /// Drop every registration (shutdown helper).
  void clear_all_subscribers();

private:
  struct Subscription {
    SubscriptionId id;
    Callback callback;
  };

  mutable std::mutex mutex_;
  std::map<EventType, std::vector<Subscription>> subscribers_;
  std::deque<Event> history_;
  size_t history_limit_;
  SubscriptionId next_id_{1};
};

} // namespace video_relay

#endif // VIDEO_RELAY_EVENT_BUS_HPP
