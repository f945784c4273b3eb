#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/util/json.h"

namespace idlecore {

class SimulationContext;

struct EventEnvelope {
  // Channel index (registration order).
  int channel{0};
  std::string type;
  std::int64_t tick{0};
  // Bus-wide publish counter, reset every tick.
  std::int64_t dispatch_order{0};
  json::Value payload;
};

enum class PublishState { Accepted, SoftLimited, Overflow };

struct PublishResult {
  bool accepted{false};
  PublishState state{PublishState::Accepted};
  std::string type;
  int channel{0};
  std::int64_t tick{0};
  std::int64_t dispatch_order{-1};
  int buffer_size{0};
  int remaining_capacity{0};
  bool soft_limit_active{false};
};

// Soft-limit breach logging. Once a breach is logged, the channel stays quiet
// for cooldown_ticks; every consecutive breach doubles that (up to
// max_cooldown_ticks) until a tick passes without one.
struct ChannelDiagnostics {
  bool enabled{true};
  int cooldown_ticks{1};
  int max_cooldown_ticks{64};
};

struct ChannelOptions {
  std::optional<int> capacity;
  std::optional<int> soft_limit;
  ChannelDiagnostics diagnostics;
};

struct EventBusCounters {
  int published{0};
  int soft_limited{0};
  int overflowed{0};
  int subscribers{0};
};

using EventHandler = std::function<void(const EventEnvelope&)>;

namespace detail {
struct SubscriptionRecord {
  int channel{0};
  EventHandler handler;
  bool active{true};
};
} // namespace detail

// Handle returned by EventBus::on(). Copies share the same registration.
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::shared_ptr<detail::SubscriptionRecord> rec) : rec_(std::move(rec)) {}

  // Idempotent. Takes effect after the dispatch currently in progress.
  void unsubscribe();
  bool active() const;

 private:
  std::shared_ptr<detail::SubscriptionRecord> rec_;
};

// Bounded, per-tick event channels with backpressure reporting.
//
// Publishing never throws for capacity reasons: a full channel drops the event
// and reports Overflow. Programming errors (unknown type, publish outside a
// tick) do throw.
class EventBus {
 public:
  explicit EventBus(SimulationContext& ctx);

  // Throws std::invalid_argument on a duplicate type or a bad capacity/soft limit.
  void register_event_type(const std::string& type, const ChannelOptions& options = {});

  bool has_event_type(const std::string& type) const { return channel_by_type_.count(type) != 0; }

  // Registered types in channel order.
  std::vector<std::string> event_types() const;

  int capacity(const std::string& type) const;
  int soft_limit(const std::string& type) const;

  void begin_tick(std::int64_t tick);

  PublishResult publish(const std::string& type, json::Value payload);

  // Throws std::runtime_error for an unknown type.
  Subscription on(const std::string& type, EventHandler handler);

  // Delivers every undelivered event of the current tick, including events
  // published by handlers while this call runs.
  void dispatch();

  EventBusCounters counters() const;

  // Events buffered for the current tick, in (channel, dispatch_order) order.
  std::vector<EventEnvelope> buffered_events() const;

 private:
  struct Channel {
    std::string type;
    int capacity{0};
    int soft_limit{0};
    ChannelDiagnostics diagnostics;
    std::vector<EventEnvelope> buffer;
    std::size_t delivered{0};
    bool overflow_reported{false};

    std::int64_t next_log_tick{0};
    int current_cooldown{1};
  };

  int channel_index(const std::string& type) const;
  void note_soft_limit(Channel& ch, int channel, const PublishResult& r);
  void deliver_pending();
  void report_handler_failure(const EventEnvelope& ev, const std::string& error);
  void prune_subscriptions();

  SimulationContext& ctx_;
  std::vector<Channel> channels_;
  std::unordered_map<std::string, int> channel_by_type_;
  std::vector<std::shared_ptr<detail::SubscriptionRecord>> subscriptions_;

  std::optional<std::int64_t> active_tick_;
  std::int64_t next_dispatch_order_{0};
  int dispatch_depth_{0};

  int published_{0};
  int soft_limited_{0};
  int overflowed_{0};
};

} // namespace idlecore
