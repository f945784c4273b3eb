#include "idlecore/core/runtime.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "idlecore/core/command_handlers.h"
#include "idlecore/core/offline.h"
#include "idlecore/core/sim_context.h"

namespace idlecore {

const char* const kBuiltinEventTypes[] = {
    "automation:toggled", "automation:fired",    "generator:purchased", "upgrade:purchased",
    "upgrade:event",      "transform:completed", "prestige:reset",      "achievement:completed",
};
const std::size_t kBuiltinEventTypeCount = sizeof(kBuiltinEventTypes) / sizeof(kBuiltinEventTypes[0]);

namespace {

double checked_step_size(const SimulationContext& ctx) {
  const double ms = ctx.config().runtime.step_size_ms;
  if (!std::isfinite(ms) || ms <= 0.0) throw std::invalid_argument("Runtime step size must be a positive finite number");
  return ms;
}

// tick() can unwind through telemetry sinks or a nested catch-up; these keep
// ticking() and the catch-up reentrancy flag truthful when it does.
class TickDepthGuard {
 public:
  explicit TickDepthGuard(int& depth) : depth_(depth) { ++depth_; }
  ~TickDepthGuard() { --depth_; }
  TickDepthGuard(const TickDepthGuard&) = delete;
  TickDepthGuard& operator=(const TickDepthGuard&) = delete;

 private:
  int& depth_;
};

class OfflineFlagGuard {
 public:
  explicit OfflineFlagGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~OfflineFlagGuard() { flag_ = false; }
  OfflineFlagGuard(const OfflineFlagGuard&) = delete;
  OfflineFlagGuard& operator=(const OfflineFlagGuard&) = delete;

 private:
  bool& flag_;
};

} // namespace

Runtime::Runtime(SimulationContext& ctx, const ContentPack& content, RuntimeOptions options)
    : ctx_(ctx),
      content_(content),
      step_ms_(checked_step_size(ctx)),
      max_steps_per_frame_(std::max(1, ctx.config().runtime.max_steps_per_frame)),
      resources_(ctx, content.resource_definitions()),
      events_(ctx),
      queue_(ctx, ctx.config().limits.max_command_queue_size),
      dispatcher_(ctx),
      progression_(ctx, content, resources_),
      prd_([&ctx]() { return ctx.rng().next(); }),
      current_step_(options.initial_step),
      next_executable_step_(options.initial_step) {
  if (options.initial_step < 0) throw std::invalid_argument("Runtime initial step must be non-negative");
  if (options.seed) ctx_.rng().set_seed(*options.seed);

  register_event_types();
  automation_ = std::make_unique<AutomationSystem>(ctx_, content_, progression_, resources_, queue_, events_, step_ms_);
  transforms_ = std::make_unique<TransformSystem>(ctx_, content_, progression_, resources_, events_, step_ms_);
  prestige_ = std::make_unique<PrestigeSystem>(ctx_, content_, progression_, resources_, step_ms_);
  achievements_ = std::make_unique<AchievementTracker>(ctx_, content_, progression_, resources_, *automation_);

  progression_.set_automation_grant_listener([this](const std::string& id) { automation_->grant(id); });
  progression_.set_automation_lookup([this](const std::string& id) -> std::optional<double> {
    const AutomationState* s = automation_->state(id);
    if (!s) return std::nullopt;
    return s->unlocked ? 1.0 : 0.0;
  });

  dispatcher_.set_event_bus(&events_);
  CoreCommandHooks hooks;
  hooks.offline_catchup = [this](double elapsed_ms, const json::Value& deltas) {
    pending_offline_.push_back(PendingOffline{elapsed_ms, deltas});
  };
  register_core_command_handlers(dispatcher_, ctx_, progression_, resources_, *automation_, *transforms_,
                                 *prestige_, std::move(hooks));

  systems_.push_back(TickSystem{"progression", [this](const TickContext& tc) {
                                  progression_.update_unlocks();
                                  prestige_->update_unlocks();
                                  progression_.run_production(tc);
                                }});
  systems_.push_back(TickSystem{"automation", [this](const TickContext& tc) { automation_->tick(tc); }});
  systems_.push_back(TickSystem{"transforms", [this](const TickContext& tc) { transforms_->tick(tc); }});
  systems_.push_back(TickSystem{"achievements", [this](const TickContext& tc) { achievements_->tick(tc); }});
}

Runtime::~Runtime() = default;

void Runtime::register_event_types() {
  for (std::size_t i = 0; i < kBuiltinEventTypeCount; ++i) events_.register_event_type(kBuiltinEventTypes[i]);
  for (const auto& type : content_.event_types) {
    if (!events_.has_event_type(type)) events_.register_event_type(type);
  }
}

void Runtime::set_current_step(std::int64_t step) {
  if (step < 0) throw std::invalid_argument("Runtime step must be non-negative");
  current_step_ = step;
  next_executable_step_ = step;
  accumulator_ms_ = 0.0;
}

bool Runtime::enqueue(Command cmd) { return queue_.enqueue(std::move(cmd)); }

void Runtime::add_system(TickSystem system) {
  if (!system.tick) throw std::invalid_argument("System \"" + system.id + "\" has no tick function");
  systems_.push_back(std::move(system));
}

void Runtime::tick() {
  TickDepthGuard depth(tick_depth_);
  last_failures_.clear();
  const std::int64_t step = current_step_;

  events_.begin_tick(step);
  resources_.reset_tick_deltas();

  next_executable_step_ = step;
  const std::vector<Command> commands = queue_.dequeue_up_to_step(step);
  // Commands issued from here on target the next step.
  next_executable_step_ = step + 1;

  DispatchOptions dispatch;
  dispatch.phase = phase_;
  for (const auto& cmd : commands) {
    if (cmd.step != step) {
      json::Object details;
      details["expectedStep"] = static_cast<double>(step);
      details["commandStep"] = static_cast<double>(cmd.step);
      details["type"] = std::string(cmd.type);
      ctx_.telemetry().record_error("CommandStepMismatch", details);
      continue;
    }
    dispatcher_.execute(cmd, dispatch);
  }
  dispatcher_.drain_completions();
  events_.dispatch();

  TickContext tc;
  tc.step = step;
  tc.delta_ms = step_ms_;
  tc.time_ms = static_cast<double>(step) * step_ms_;
  tc.events = &events_;

  for (const auto& system : systems_) {
    try {
      system.tick(tc);
    } catch (const std::exception& e) {
      report_system_failure(system.id, step, e.what());
    } catch (...) {
      report_system_failure(system.id, step, "non-standard exception");
    }
    events_.dispatch();
  }

  resources_.finalize_tick(step_ms_);

  const EventBusCounters counters = events_.counters();
  json::Object c;
  c["published"] = static_cast<double>(counters.published);
  c["softLimited"] = static_cast<double>(counters.soft_limited);
  c["overflowed"] = static_cast<double>(counters.overflowed);
  c["subscribers"] = static_cast<double>(counters.subscribers);
  ctx_.telemetry().record_counters("events", c);

  ++current_step_;
  next_executable_step_ = current_step_;
  ctx_.telemetry().record_tick(step);

  run_pending_offline();
}

void Runtime::report_system_failure(const std::string& id, std::int64_t step, const std::string& error) {
  json::Object details;
  details["systemId"] = std::string(id);
  details["step"] = static_cast<double>(step);
  details["error"] = error;
  ctx_.telemetry().record_error("SystemExecutionFailed", details);
  last_failures_.push_back(id);
}

int Runtime::advance(double elapsed_ms) {
  if (!std::isfinite(elapsed_ms) || elapsed_ms <= 0.0) return 0;
  accumulator_ms_ += elapsed_ms;
  const std::int64_t available = floor_to_step_count(accumulator_ms_ / step_ms_);
  const int steps = static_cast<int>(std::min<std::int64_t>(available, max_steps_per_frame_));
  accumulator_ms_ -= static_cast<double>(steps) * step_ms_;
  for (int i = 0; i < steps; ++i) tick();
  return steps;
}

void Runtime::run_pending_offline() {
  if (in_offline_ || pending_offline_.empty()) return;

  // Requests raised during this catch-up wait for the next step.
  std::vector<PendingOffline> batch;
  batch.swap(pending_offline_);
  OfflineFlagGuard offline(in_offline_);
  for (auto& p : batch) {
    OfflineProgressRequest req;
    req.elapsed_ms = p.elapsed_ms;
    req.resource_deltas = std::move(p.resource_deltas);
    const OfflineProgressResult r = apply_offline_progress(*this, req);

    json::Object details;
    details["processedSteps"] = static_cast<double>(r.processed_steps);
    details["processedMs"] = r.processed_ms;
    details["step"] = static_cast<double>(current_step_);
    ctx_.telemetry().record_progress("OfflineCatchupApplied", details);
  }
}

} // namespace idlecore
