#include "idlecore/core/command_dispatcher.h"

#include "idlecore/core/sim_context.h"

namespace idlecore {

CommandDispatcher::CommandDispatcher(SimulationContext& ctx) : ctx_(ctx) {}

void CommandDispatcher::register_handler(CommandKind kind, CommandHandler handler) {
  builtin_.at(static_cast<std::size_t>(kind)) = std::move(handler);
}

void CommandDispatcher::register_handler(const std::string& type, CommandHandler handler) {
  if (const auto kind = command_kind_from_type(type)) {
    register_handler(*kind, std::move(handler));
    return;
  }
  custom_[type] = std::move(handler);
}

const CommandHandler* CommandDispatcher::find_handler(const std::string& type) const {
  if (const auto kind = command_kind_from_type(type)) {
    const CommandHandler& h = builtin_[static_cast<std::size_t>(*kind)];
    return h ? &h : nullptr;
  }
  auto it = custom_.find(type);
  if (it == custom_.end() || !it->second) return nullptr;
  return &it->second;
}

bool CommandDispatcher::has_handler(const std::string& type) const { return find_handler(type) != nullptr; }

CommandResult CommandDispatcher::normalize(const Command& cmd, CommandResult r) const {
  if (r.success) return CommandResult::ok();
  if (r.error.code.empty() || r.error.message.empty()) {
    json::Object details;
    details["type"] = std::string(cmd.type);
    return CommandResult::failure("COMMAND_RESULT_INVALID", "Command handler returned an invalid failure result.",
                                  std::move(details));
  }
  return r;
}

CommandResult CommandDispatcher::execution_failed(const Command& cmd, const std::string& error) {
  json::Object details;
  details["type"] = std::string(cmd.type);
  details["error"] = error;
  ctx_.telemetry().record_error("CommandExecutionFailed", details);
  return CommandResult::failure("COMMAND_EXECUTION_FAILED", "Command execution failed.", std::move(details));
}

CommandResult CommandDispatcher::execute(const Command& cmd, const DispatchOptions& options) {
  const CommandHandler* handler = find_handler(cmd.type);
  if (!handler) {
    json::Object details;
    details["type"] = std::string(cmd.type);
    ctx_.telemetry().record_error("UnknownCommandType", details);
    return CommandResult::failure("UNKNOWN_COMMAND_TYPE", "Unknown command type.", std::move(details));
  }

  if (!authorize_command(cmd, ctx_.telemetry(), AuthorizationOptions{options.phase, "dispatcher"})) {
    json::Object details;
    details["type"] = std::string(cmd.type);
    details["priority"] = std::string(command_priority_name(cmd.priority));
    return CommandResult::failure("COMMAND_UNAUTHORIZED", "Command priority is not authorized for this command.",
                                  std::move(details));
  }

  ExecutionContext ectx;
  ectx.step = cmd.step;
  ectx.timestamp = cmd.timestamp;
  ectx.priority = cmd.priority;
  ectx.events = events_;
  ectx.phase = options.phase;

  try {
    Outcome outcome = (*handler)(cmd.payload, ectx);
    if (outcome.is_deferred()) {
      completions_.push_back(PendingCompletion{cmd, ectx, std::move(outcome.task())});
      return CommandResult::ok();
    }
    return normalize(cmd, outcome.result());
  } catch (const std::exception& e) {
    return execution_failed(cmd, e.what());
  } catch (...) {
    return execution_failed(cmd, "non-standard exception");
  }
}

int CommandDispatcher::drain_completions() {
  int ran = 0;
  // Tasks queued while draining wait for the next drain.
  std::deque<PendingCompletion> batch;
  batch.swap(completions_);
  for (auto& pending : batch) {
    ++ran;
    CommandResult result;
    try {
      result = normalize(pending.command, pending.task(pending.context));
    } catch (const std::exception& e) {
      result = CommandResult::failure("COMMAND_EXECUTION_FAILED", "Command execution failed.");
      result.error.details["error"] = std::string(e.what());
    } catch (...) {
      result = CommandResult::failure("COMMAND_EXECUTION_FAILED", "Command execution failed.");
      result.error.details["error"] = std::string("non-standard exception");
    }
    if (result.success) continue;

    json::Object details;
    details["type"] = std::string(pending.command.type);
    details["step"] = static_cast<double>(pending.command.step);
    details["code"] = std::string(result.error.code);
    details["message"] = std::string(result.error.message);
    if (!result.error.details.empty()) details["details"] = json::object(result.error.details);
    ctx_.telemetry().record_warning("CommandDeferredFailed", details);
  }
  return ran;
}

} // namespace idlecore
