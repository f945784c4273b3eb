#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "idlecore/core/command.h"
#include "idlecore/core/command_dispatcher.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/telemetry.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_command_dispatcher() {
  using namespace idlecore;

  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext ctx(EngineConfig{}, mem);

  // --- Wire format ---
  {
    IC_ASSERT(std::string(command_type_name(CommandKind::OfflineCatchup)) == "OFFLINE_CATCHUP");
    IC_ASSERT(command_kind_from_type("RUN_TRANSFORM") == CommandKind::RunTransform);
    IC_ASSERT(!command_kind_from_type("run_transform"));

    Command c;
    std::string err;
    IC_ASSERT(command_from_json(json::parse(R"({"type":"X","priority":2,"timestamp":5,"step":3})"), &c, &err));
    IC_ASSERT(c.priority == CommandPriority::Automation && c.step == 3 && c.payload.is_null());
    IC_ASSERT(!command_from_json(json::parse(R"({"type":"X","priority":1,"timestamp":5,"step":-1})"), &c, &err));
    IC_ASSERT(!err.empty());
    IC_ASSERT(!command_from_json(json::parse(R"({"type":"X","priority":1,"timestamp":5,"step":2.5})"), &c));
    IC_ASSERT(!command_from_json(json::parse(R"({"type":"","priority":1,"timestamp":5,"step":2})"), &c));
    IC_ASSERT(!command_from_json(json::parse(R"({"type":"X","priority":1,"step":2})"), &c));
  }

  CommandDispatcher d(ctx);
  int collects = 0;
  d.register_handler(CommandKind::CollectResource, [&](const json::Value& payload, const ExecutionContext& ec) {
    ++collects;
    if (payload.at("amount").number_value() < 0) {
      return Outcome(CommandResult::failure("INVALID_AMOUNT", "negative", {}));
    }
    if (ec.step != 4) return Outcome(CommandResult::failure("WRONG_STEP", "bad step"));
    return Outcome(CommandResult::ok());
  });

  Command collect;
  collect.type = "COLLECT_RESOURCE";
  collect.step = 4;
  json::Object p;
  p["amount"] = 2.0;
  collect.payload = json::object(p);
  IC_ASSERT(d.execute(collect).success);
  IC_ASSERT(collects == 1);

  p["amount"] = -1.0;
  collect.payload = json::object(p);
  CommandResult r = d.execute(collect);
  IC_ASSERT(!r.success && r.error.code == "INVALID_AMOUNT");

  // --- Unknown types ---
  Command unknown;
  unknown.type = "SUMMON_DRAGON";
  r = d.execute(unknown);
  IC_ASSERT(!r.success && r.error.code == "UNKNOWN_COMMAND_TYPE");
  IC_ASSERT(mem->count(TelemetryKind::Error, "UnknownCommandType") == 1);

  // Built-in type without a handler is unknown too.
  Command migration;
  migration.type = "APPLY_MIGRATION";
  migration.priority = CommandPriority::System;
  r = d.execute(migration);
  IC_ASSERT(r.error.code == "UNKNOWN_COMMAND_TYPE");

  // --- Authorization ---
  d.register_handler(CommandKind::OfflineCatchup, [](const json::Value&, const ExecutionContext&) {
    return Outcome(CommandResult::ok());
  });
  d.register_handler(CommandKind::ApplyMigration, [](const json::Value&, const ExecutionContext&) {
    return Outcome(CommandResult::ok());
  });

  Command offline;
  offline.type = "OFFLINE_CATCHUP";
  offline.priority = CommandPriority::Player;
  r = d.execute(offline);
  IC_ASSERT(!r.success && r.error.code == "COMMAND_UNAUTHORIZED");
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandPriorityViolation") == 1);
  offline.priority = CommandPriority::Automation;
  IC_ASSERT(d.execute(offline).success);
  offline.priority = CommandPriority::System;
  IC_ASSERT(d.execute(offline).success);

  migration.priority = CommandPriority::Automation;
  r = d.execute(migration);
  IC_ASSERT(r.error.code == "COMMAND_UNAUTHORIZED");
  IC_ASSERT(mem->count(TelemetryKind::Warning, "UnauthorizedSystemCommand") == 1);
  migration.priority = CommandPriority::System;
  IC_ASSERT(d.execute(migration).success);

  Command prestige;
  prestige.type = "PRESTIGE_RESET";
  prestige.priority = CommandPriority::Automation;
  IC_ASSERT(!authorize_command(prestige, ctx.telemetry()));
  IC_ASSERT(mem->count(TelemetryKind::Warning, "AutomationPrestigeBlocked") == 1);

  // Custom types have no policy.
  Command custom;
  custom.type = "sample:ping";
  custom.priority = CommandPriority::Automation;
  IC_ASSERT(authorize_command(custom, ctx.telemetry()));

  // --- Malformed results and throwing handlers ---
  d.register_handler("sample:ping", [](const json::Value&, const ExecutionContext&) {
    return Outcome(CommandResult::failure("", "no code"));
  });
  IC_ASSERT(d.has_handler("sample:ping"));
  r = d.execute(custom);
  IC_ASSERT(r.error.code == "COMMAND_RESULT_INVALID");

  d.register_handler("sample:ping", [](const json::Value&, const ExecutionContext&) -> Outcome {
    throw std::runtime_error("kaboom");
  });
  r = d.execute(custom);
  IC_ASSERT(r.error.code == "COMMAND_EXECUTION_FAILED");
  IC_ASSERT(r.error.details.at("error").string_value() == "kaboom");
  IC_ASSERT(mem->count(TelemetryKind::Error, "CommandExecutionFailed") == 1);

  // Anything thrown, not only std::exception, becomes a failed result.
  d.register_handler("sample:ping", [](const json::Value&, const ExecutionContext&) -> Outcome {
    throw 42;
  });
  r = d.execute(custom);
  IC_ASSERT(!r.success);
  IC_ASSERT(r.error.code == "COMMAND_EXECUTION_FAILED");
  IC_ASSERT(r.error.details.at("error").string_value() == "non-standard exception");
  IC_ASSERT(mem->count(TelemetryKind::Error, "CommandExecutionFailed") == 2);

  // --- Deferred completions ---
  int finished = 0;
  d.register_handler("sample:slow", [&](const json::Value&, const ExecutionContext&) {
    return Outcome::deferred([&](const ExecutionContext& ec) {
      ++finished;
      if (ec.step == 9) return CommandResult::failure("LATE_FAILURE", "failed after deferral");
      return CommandResult::ok();
    });
  });
  Command slow;
  slow.type = "sample:slow";
  slow.step = 8;
  IC_ASSERT(d.execute(slow).success);
  slow.step = 9;
  IC_ASSERT(d.execute(slow).success);
  IC_ASSERT(finished == 0);
  IC_ASSERT(d.pending_completions() == 2);
  IC_ASSERT(d.drain_completions() == 2);
  IC_ASSERT(finished == 2);
  IC_ASSERT(d.pending_completions() == 0);
  const TelemetryEntry* deferred = mem->last(TelemetryKind::Warning, "CommandDeferredFailed");
  IC_ASSERT(deferred != nullptr);
  IC_ASSERT(deferred->details.at("code").string_value() == "LATE_FAILURE");
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandDeferredFailed") == 1);
  return 0;
}
