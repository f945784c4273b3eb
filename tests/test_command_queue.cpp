#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "idlecore/core/command_queue.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/telemetry.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

idlecore::Command make_cmd(const std::string& type, std::int64_t step, idlecore::CommandPriority prio) {
  idlecore::Command c;
  c.type = type;
  c.step = step;
  c.priority = prio;
  c.timestamp = static_cast<double>(step) * 100.0;
  return c;
}

} // namespace

int test_command_queue() {
  using namespace idlecore;

  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext ctx(EngineConfig{}, mem);

  {
    bool threw = false;
    try {
      CommandQueue bad(ctx, 0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Ordering: step, then priority, then insertion ---
  CommandQueue q(ctx, 8);
  std::vector<std::string> seen;
  q.set_enqueue_listener([&](const Command& c) { seen.push_back(c.type); });

  IC_ASSERT(q.enqueue(make_cmd("late", 5, CommandPriority::System)));
  IC_ASSERT(q.enqueue(make_cmd("auto", 2, CommandPriority::Automation)));
  IC_ASSERT(q.enqueue(make_cmd("player-a", 2, CommandPriority::Player)));
  IC_ASSERT(q.enqueue(make_cmd("system", 2, CommandPriority::System)));
  IC_ASSERT(q.enqueue(make_cmd("player-b", 2, CommandPriority::Player)));
  IC_ASSERT(seen.size() == 5);
  IC_ASSERT(q.peek_next_step() && *q.peek_next_step() == 2);

  auto due = q.dequeue_up_to_step(1);
  IC_ASSERT(due.empty());
  due = q.dequeue_up_to_step(3);
  IC_ASSERT(due.size() == 4);
  IC_ASSERT(due[0].type == "system");
  IC_ASSERT(due[1].type == "player-a");
  IC_ASSERT(due[2].type == "player-b");
  IC_ASSERT(due[3].type == "auto");
  IC_ASSERT(q.size() == 1);

  // --- Capacity ---
  CommandQueue tiny(ctx, 2);
  IC_ASSERT(tiny.enqueue(make_cmd("a", 0, CommandPriority::Player)));
  IC_ASSERT(tiny.enqueue(make_cmd("b", 0, CommandPriority::Player)));
  IC_ASSERT(!tiny.enqueue(make_cmd("c", 0, CommandPriority::Player)));
  IC_ASSERT(tiny.size() == 2);
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandQueueOverflow") == 1);
  const TelemetryEntry* rej = mem->last(TelemetryKind::Warning, "CommandRejected");
  IC_ASSERT(rej != nullptr);
  IC_ASSERT(rej->details.at("type").string_value() == "c");

  // --- Save / restore ---
  Command with_payload = make_cmd("PURCHASE_GENERATOR", 7, CommandPriority::Player);
  json::Object p;
  p["generatorId"] = std::string("reactor");
  p["count"] = 3.0;
  with_payload.payload = json::object(p);
  IC_ASSERT(q.enqueue(with_payload));

  const json::Value saved = q.export_for_save();
  IC_ASSERT(saved.at("schemaVersion").int_value() == kCommandQueueSchemaVersion);
  IC_ASSERT(saved.at("entries").array().size() == 2);

  CommandQueue restored(ctx, 8);
  CommandQueueRestoreResult rr = restored.restore_from_save(json::parse(json::stringify(saved, 0)));
  IC_ASSERT(rr.restored == 2 && rr.skipped == 0);
  IC_ASSERT(restored.entries()[0].command.type == "late");
  IC_ASSERT(restored.entries()[1].command.payload.at("generatorId").string_value() == "reactor");
  IC_ASSERT(restored.entries()[1].command.timestamp == 700.0);

  // Rebase shifts steps relative to the new clock and never goes negative.
  CommandQueueRestoreOptions opts;
  opts.rebase_step = CommandQueueRebase{10, 4};
  rr = restored.restore_from_save(saved, opts);
  IC_ASSERT(rr.restored == 2);
  IC_ASSERT(restored.entries()[0].command.step == 0);
  IC_ASSERT(restored.entries()[1].command.step == 1);

  // Bad entries and unsupported types are skipped individually.
  json::Value mixed = json::parse(R"({
    "schemaVersion": 1,
    "entries": [
      {"type": "COLLECT_RESOURCE", "priority": 1, "timestamp": 0, "step": 1, "payload": {}},
      {"type": "COLLECT_RESOURCE", "priority": 1, "timestamp": 0, "step": 1.5},
      {"type": "COLLECT_RESOURCE", "priority": 7, "timestamp": 0, "step": 1},
      {"type": "LEGACY_THING", "priority": 0, "timestamp": 0, "step": 2},
      "garbage"
    ]
  })");
  mem->clear();
  CommandQueueRestoreOptions filter;
  filter.is_command_type_supported = [](const std::string& t) { return t != "LEGACY_THING"; };
  rr = restored.restore_from_save(mixed, filter);
  IC_ASSERT(rr.restored == 1);
  IC_ASSERT(rr.skipped == 4);
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandQueueRestoreInvalidEntry") == 3);
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandQueueRestoreUnsupportedType") == 1);

  // A save holding more than max_size entries keeps the first max_size.
  json::Array many;
  for (int i = 0; i < 5; ++i) {
    json::Object e;
    e["type"] = std::string("COLLECT_RESOURCE");
    e["priority"] = 1.0;
    e["timestamp"] = 0.0;
    e["step"] = static_cast<double>(i);
    e["payload"] = json::object(json::Object{});
    many.push_back(json::object(std::move(e)));
  }
  json::Object big;
  big["schemaVersion"] = 1.0;
  big["entries"] = std::move(many);
  CommandQueue tight(ctx, 3);
  mem->clear();
  rr = tight.restore_from_save(json::object(std::move(big)));
  IC_ASSERT(rr.restored == 3 && rr.skipped == 2);
  IC_ASSERT(tight.size() == 3);
  IC_ASSERT(tight.entries()[2].command.step == 2);
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandQueueRestoreOverflow") == 2);

  // Unknown schema leaves the queue empty.
  rr = restored.restore_from_save(json::parse(R"({"schemaVersion": 2, "entries": []})"));
  IC_ASSERT(rr.restored == 0);
  IC_ASSERT(restored.empty());
  IC_ASSERT(mem->count(TelemetryKind::Warning, "CommandQueueRestoreUnsupportedSchema") == 1);

  IC_ASSERT(q.dequeue_all().size() == 2);
  IC_ASSERT(q.empty());
  IC_ASSERT(!q.peek_next_step());
  return 0;
}
