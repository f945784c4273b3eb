#include "idlecore/core/event_bus.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "idlecore/core/sim_context.h"

namespace idlecore {
namespace {

constexpr double kDefaultSoftLimitRatio = 0.8;

// Handlers that keep publishing into earlier channels could otherwise spin
// forever inside one dispatch() call.
constexpr int kMaxDispatchPasses = 64;

int default_soft_limit(int capacity) {
  if (capacity <= 1) return 1;
  const int scaled = static_cast<int>(std::floor(capacity * kDefaultSoftLimitRatio));
  return std::min(capacity - 1, std::max(1, scaled));
}

// Keeps the depth counter balanced when a handler or telemetry sink throws.
class DepthGuard {
 public:
  explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
  ~DepthGuard() { --depth_; }
  DepthGuard(const DepthGuard&) = delete;
  DepthGuard& operator=(const DepthGuard&) = delete;

 private:
  int& depth_;
};

} // namespace

void Subscription::unsubscribe() {
  if (rec_) rec_->active = false;
}

bool Subscription::active() const { return rec_ && rec_->active; }

EventBus::EventBus(SimulationContext& ctx) : ctx_(ctx) {}

void EventBus::register_event_type(const std::string& type, const ChannelOptions& options) {
  if (type.empty()) throw std::invalid_argument("Event type must be a non-empty string");
  if (channel_by_type_.count(type)) {
    throw std::invalid_argument("Event type \"" + type + "\" is already registered");
  }

  const int capacity = options.capacity.value_or(ctx_.config().limits.event_bus_default_channel_capacity);
  if (capacity < 1) {
    throw std::invalid_argument("Event channel capacity for \"" + type + "\" must be a positive integer");
  }

  int soft_limit = default_soft_limit(capacity);
  if (options.soft_limit) {
    if (*options.soft_limit < 1 || *options.soft_limit > capacity) {
      throw std::invalid_argument("Event channel soft limit for \"" + type + "\" must be in [1, " +
                                  std::to_string(capacity) + "]");
    }
    soft_limit = *options.soft_limit;
  }

  Channel ch;
  ch.type = type;
  ch.capacity = capacity;
  ch.soft_limit = soft_limit;
  ch.diagnostics = options.diagnostics;
  ch.diagnostics.cooldown_ticks = std::max(1, ch.diagnostics.cooldown_ticks);
  ch.diagnostics.max_cooldown_ticks = std::max(ch.diagnostics.cooldown_ticks, ch.diagnostics.max_cooldown_ticks);
  ch.current_cooldown = ch.diagnostics.cooldown_ticks;

  channel_by_type_.emplace(type, static_cast<int>(channels_.size()));
  channels_.push_back(std::move(ch));
}

std::vector<std::string> EventBus::event_types() const {
  std::vector<std::string> out;
  out.reserve(channels_.size());
  for (const auto& ch : channels_) out.push_back(ch.type);
  return out;
}

int EventBus::channel_index(const std::string& type) const {
  auto it = channel_by_type_.find(type);
  if (it == channel_by_type_.end()) throw std::runtime_error("Unknown runtime event type \"" + type + "\"");
  return it->second;
}

int EventBus::capacity(const std::string& type) const { return channels_[channel_index(type)].capacity; }

int EventBus::soft_limit(const std::string& type) const { return channels_[channel_index(type)].soft_limit; }

void EventBus::begin_tick(std::int64_t tick) {
  active_tick_ = tick;
  next_dispatch_order_ = 0;
  published_ = 0;
  soft_limited_ = 0;
  overflowed_ = 0;
  for (auto& ch : channels_) {
    ch.buffer.clear();
    ch.delivered = 0;
    ch.overflow_reported = false;
    if (tick > ch.next_log_tick) ch.current_cooldown = ch.diagnostics.cooldown_ticks;
  }
  prune_subscriptions();
}

PublishResult EventBus::publish(const std::string& type, json::Value payload) {
  if (!active_tick_) throw std::runtime_error("EventBus::publish invoked before begin_tick");
  const int idx = channel_index(type);
  Channel& ch = channels_[static_cast<std::size_t>(idx)];

  PublishResult r;
  r.type = type;
  r.channel = idx;
  r.tick = *active_tick_;

  const int size_before = static_cast<int>(ch.buffer.size());
  if (size_before >= ch.capacity) {
    ++overflowed_;
    r.accepted = false;
    r.state = PublishState::Overflow;
    r.buffer_size = size_before;
    r.remaining_capacity = 0;
    r.soft_limit_active = true;
    if (!ch.overflow_reported) {
      ch.overflow_reported = true;
      json::Object details;
      details["eventType"] = std::string(type);
      details["channel"] = static_cast<double>(idx);
      details["capacity"] = static_cast<double>(ch.capacity);
      details["tick"] = static_cast<double>(*active_tick_);
      ctx_.telemetry().record_warning("EventBufferOverflow", details);
    }
    return r;
  }

  EventEnvelope env;
  env.channel = idx;
  env.type = type;
  env.tick = *active_tick_;
  env.dispatch_order = next_dispatch_order_++;
  env.payload = std::move(payload);
  ch.buffer.push_back(std::move(env));
  ++published_;

  const int size = static_cast<int>(ch.buffer.size());
  r.accepted = true;
  r.state = PublishState::Accepted;
  r.dispatch_order = ch.buffer.back().dispatch_order;
  r.buffer_size = size;
  r.remaining_capacity = ch.capacity - size;
  if (size >= ch.soft_limit) {
    r.state = PublishState::SoftLimited;
    r.soft_limit_active = true;
    ++soft_limited_;
    note_soft_limit(ch, idx, r);
  }
  return r;
}

void EventBus::note_soft_limit(Channel& ch, int channel, const PublishResult& r) {
  if (!ch.diagnostics.enabled) return;
  if (r.tick < ch.next_log_tick) return;

  json::Object details;
  details["channel"] = static_cast<double>(channel);
  details["tick"] = static_cast<double>(r.tick);
  details["reason"] = std::string("soft-limit");
  details["eventType"] = std::string(ch.type);
  details["bufferSize"] = static_cast<double>(r.buffer_size);
  details["capacity"] = static_cast<double>(ch.capacity);
  details["softLimit"] = static_cast<double>(ch.soft_limit);
  details["remainingCapacity"] = static_cast<double>(r.remaining_capacity);
  details["cooldownTicks"] = static_cast<double>(ch.current_cooldown);
  ctx_.telemetry().record_warning("EventSoftLimitBreach", details);

  json::Object counters;
  counters["channel:" + std::to_string(channel)] = 1.0;
  ctx_.telemetry().record_counters("events.soft_limit_breaches", counters);

  ch.next_log_tick = r.tick + ch.current_cooldown;
  ch.current_cooldown = std::min(ch.current_cooldown * 2, ch.diagnostics.max_cooldown_ticks);
}

Subscription EventBus::on(const std::string& type, EventHandler handler) {
  const int idx = channel_index(type);
  if (!handler) throw std::invalid_argument("Event handler for \"" + type + "\" must be callable");
  auto rec = std::make_shared<detail::SubscriptionRecord>();
  rec->channel = idx;
  rec->handler = std::move(handler);
  subscriptions_.push_back(rec);
  return Subscription(std::move(rec));
}

void EventBus::dispatch() {
  if (!active_tick_ || dispatch_depth_ > 0) return;
  {
    DepthGuard guard(dispatch_depth_);
    deliver_pending();
  }
  prune_subscriptions();
}

void EventBus::report_handler_failure(const EventEnvelope& ev, const std::string& error) {
  json::Object details;
  details["eventType"] = std::string(ev.type);
  details["channel"] = static_cast<double>(ev.channel);
  details["tick"] = static_cast<double>(ev.tick);
  details["dispatchOrder"] = static_cast<double>(ev.dispatch_order);
  details["error"] = error;
  ctx_.telemetry().record_error("EventHandlerFailed", details);
}

void EventBus::deliver_pending() {
  const double budget_ms = ctx_.config().runtime.slow_handler_budget_ms;
  for (int pass = 0;; ++pass) {
    if (pass >= kMaxDispatchPasses) {
      json::Object details;
      details["tick"] = static_cast<double>(*active_tick_);
      details["passes"] = static_cast<double>(kMaxDispatchPasses);
      ctx_.telemetry().record_warning("EventDispatchPassLimit", details);
      break;
    }

    bool delivered_any = false;
    for (std::size_t c = 0; c < channels_.size(); ++c) {
      while (channels_[c].delivered < channels_[c].buffer.size()) {
        // Copy: handlers may publish and reallocate the buffer.
        const EventEnvelope ev = channels_[c].buffer[channels_[c].delivered++];
        delivered_any = true;

        std::vector<std::shared_ptr<detail::SubscriptionRecord>> targets;
        for (const auto& rec : subscriptions_) {
          if (rec->active && rec->channel == static_cast<int>(c)) targets.push_back(rec);
        }

        for (const auto& rec : targets) {
          if (!rec->active) continue;
          const auto start = std::chrono::steady_clock::now();
          try {
            rec->handler(ev);
          } catch (const std::exception& e) {
            report_handler_failure(ev, e.what());
          } catch (...) {
            report_handler_failure(ev, "non-standard exception");
          }
          if (budget_ms > 0.0) {
            const double elapsed_ms =
                std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            if (elapsed_ms > budget_ms) {
              json::Object details;
              details["eventType"] = std::string(ev.type);
              details["channel"] = static_cast<double>(ev.channel);
              details["tick"] = static_cast<double>(ev.tick);
              details["durationMs"] = elapsed_ms;
              details["budgetMs"] = budget_ms;
              ctx_.telemetry().record_warning("EventHandlerSlow", details);
            }
          }
        }
      }
    }
    if (!delivered_any) break;
  }
}

void EventBus::prune_subscriptions() {
  if (dispatch_depth_ > 0) return;
  subscriptions_.erase(std::remove_if(subscriptions_.begin(), subscriptions_.end(),
                                      [](const auto& rec) { return !rec->active; }),
                       subscriptions_.end());
}

EventBusCounters EventBus::counters() const {
  EventBusCounters c;
  c.published = published_;
  c.soft_limited = soft_limited_;
  c.overflowed = overflowed_;
  for (const auto& rec : subscriptions_) {
    if (rec->active) ++c.subscribers;
  }
  return c;
}

std::vector<EventEnvelope> EventBus::buffered_events() const {
  std::vector<EventEnvelope> out;
  for (const auto& ch : channels_) out.insert(out.end(), ch.buffer.begin(), ch.buffer.end());
  return out;
}

} // namespace idlecore
