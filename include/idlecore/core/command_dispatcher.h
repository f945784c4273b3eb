#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <unordered_map>

#include "idlecore/core/command.h"
#include "idlecore/util/json.h"

namespace idlecore {

class EventBus;
class SimulationContext;

struct CommandError {
  std::string code;
  std::string message;
  json::Object details;
};

struct CommandResult {
  bool success{true};
  CommandError error;

  static CommandResult ok() { return CommandResult{}; }
  static CommandResult failure(std::string code, std::string message, json::Object details = {}) {
    CommandResult r;
    r.success = false;
    r.error = CommandError{std::move(code), std::move(message), std::move(details)};
    return r;
  }
};

struct ExecutionContext {
  std::int64_t step{0};
  double timestamp{0.0};
  CommandPriority priority{CommandPriority::Player};
  // May be null when the dispatcher runs without a bus (tests).
  EventBus* events{nullptr};
  std::string phase{"live"};
};

// Work a handler hands back to finish later in the tick.
using DeferredTask = std::function<CommandResult(const ExecutionContext&)>;

// A handler either finishes synchronously or defers the rest of its work to
// the dispatcher's completion queue.
class Outcome {
 public:
  Outcome() = default;
  // Implicit so handlers can simply return a CommandResult.
  Outcome(CommandResult r) : result_(std::move(r)) {}

  static Outcome immediate(CommandResult r) { return Outcome(std::move(r)); }
  static Outcome deferred(DeferredTask task) {
    Outcome o;
    o.task_ = std::move(task);
    return o;
  }

  bool is_deferred() const { return static_cast<bool>(task_); }
  const CommandResult& result() const { return result_; }
  DeferredTask& task() { return task_; }

 private:
  CommandResult result_;
  DeferredTask task_;
};

using CommandHandler = std::function<Outcome(const json::Value& payload, const ExecutionContext& ctx)>;

struct DispatchOptions {
  std::string phase{"live"};
};

class CommandDispatcher {
 public:
  explicit CommandDispatcher(SimulationContext& ctx);

  // Built-in kinds go to the fixed table; any other string goes to the open
  // registry. Re-registering replaces the previous handler.
  void register_handler(CommandKind kind, CommandHandler handler);
  void register_handler(const std::string& type, CommandHandler handler);

  bool has_handler(const std::string& type) const;

  void set_event_bus(EventBus* events) { events_ = events; }

  // Never throws. Failures are returned and reported through telemetry.
  CommandResult execute(const Command& cmd, const DispatchOptions& options = {});

  // Runs deferred tasks queued by earlier execute() calls. Returns how many ran.
  int drain_completions();

  std::size_t pending_completions() const { return completions_.size(); }

 private:
  struct PendingCompletion {
    Command command;
    ExecutionContext context;
    DeferredTask task;
  };

  const CommandHandler* find_handler(const std::string& type) const;
  CommandResult normalize(const Command& cmd, CommandResult r) const;
  CommandResult execution_failed(const Command& cmd, const std::string& error);

  SimulationContext& ctx_;
  EventBus* events_{nullptr};
  std::array<CommandHandler, static_cast<std::size_t>(CommandKind::Count)> builtin_;
  std::unordered_map<std::string, CommandHandler> custom_;
  std::deque<PendingCompletion> completions_;
};

} // namespace idlecore
