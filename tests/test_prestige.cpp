#include <cmath>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "idlecore/core/content.h"
#include "idlecore/core/prestige.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/snapshot.h"
#include "idlecore/core/telemetry.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const char* kPack = R"({
  "id": "test.ascend",
  "resources": [
    {"id": "gold", "unlocked": true},
    {"id": "dust", "unlocked": true},
    {"id": "keep", "startAmount": 5, "unlocked": true},
    {"id": "gem", "unlocked": true},
    {"id": "ascend-prestige-count", "unlocked": true}
  ],
  "generators": [
    {"id": "mine", "initialLevel": 1, "purchase": {"currencyId": "gold", "baseCost": 10},
     "produces": [{"resourceId": "dust", "rate": 1}]}
  ],
  "upgrades": [
    {"id": "boost", "cost": {"currencyId": "gold", "costMultiplier": 10},
     "effects": [{"kind": "modifyGeneratorRate", "generatorId": "mine", "operation": "multiply", "value": 2}]}
  ],
  "prestigeLayers": [
    {"id": "ascend",
     "unlockCondition": {"kind": "resourceThreshold", "resourceId": "gold", "comparator": "gte", "amount": 100},
     "resetTargets": ["gold", "keep", "dust"],
     "resetGenerators": ["mine"],
     "resetUpgrades": ["boost"],
     "retention": [{"kind": "resource", "resourceId": "keep", "amount": 3}],
     "reward": {"resourceId": "gem", "baseReward": 5, "multiplierCurve": {"kind": "constant", "value": 1.5}}}
  ]
})";

idlecore::Command command(const std::string& type, std::int64_t step, const char* payload) {
  idlecore::Command c;
  c.type = type;
  c.step = step;
  c.timestamp = static_cast<double>(step) * 100.0;
  c.payload = idlecore::json::parse(payload);
  return c;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

int test_prestige() {
  using namespace idlecore;

  const ContentPack pack = content_pack_from_json(json::parse(kPack));
  IC_ASSERT(pack.prestige_layers.size() == 1);
  IC_ASSERT(pack.find_prestige_layer("ascend") != nullptr);
  IC_ASSERT(pack.find_prestige_layer("ascend")->count_resource_id() == "ascend-prestige-count");

  // --- Content validation ---
  {
    bool threw = false;
    try {
      // No count resource.
      content_pack_from_json(json::parse(R"({"id":"x","resources":[{"id":"gold"}],
        "prestigeLayers":[{"id":"p","reward":{"resourceId":"gold","baseReward":1}}]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    threw = false;
    try {
      content_pack_from_json(json::parse(R"({"id":"x","resources":[{"id":"gold"},{"id":"p-prestige-count"}],
        "prestigeLayers":[{"id":"p","resetGenerators":["ghost"],"reward":{"resourceId":"gold","baseReward":1}}]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    threw = false;
    try {
      content_pack_from_json(json::parse(R"({"id":"x","resources":[{"id":"gold"},{"id":"p-prestige-count"}],
        "prestigeLayers":[{"id":"p","retention":[{"kind":"planet","resourceId":"gold"}],
                           "reward":{"resourceId":"gold","baseReward":1}}]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Reset semantics ---
  {
    auto mem = std::make_shared<MemoryTelemetry>();
    SimulationContext ctx(EngineConfig{}, mem);
    ResourceState rs(ctx, pack.resource_definitions());
    ProgressionCoordinator pc(ctx, pack, rs);
    PrestigeSystem ps(ctx, pack, pc, rs, 100.0);

    const std::size_t gold = rs.require_index("gold");
    const std::size_t dust = rs.require_index("dust");
    const std::size_t keep = rs.require_index("keep");
    const std::size_t gem = rs.require_index("gem");
    const std::size_t count = rs.require_index("ascend-prestige-count");

    IC_ASSERT(!ps.state("ascend")->unlocked);
    IC_ASSERT(ps.state("ghost") == nullptr);
    IC_ASSERT(ps.quote("ascend", 0)->status == PrestigeStatus::Locked);
    IC_ASSERT(!ps.quote("ghost", 0));

    bool threw = false;
    try {
      ps.apply("ascend", "t0", 0, nullptr);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    threw = false;
    try {
      ps.apply("ascend", "", 0, nullptr);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    rs.add_amount(gold, 150.0);
    rs.add_amount(keep, 10.0);
    rs.add_amount(dust, 40.0);
    pc.add_generator_units("mine", 2);
    pc.record_upgrade_purchase("boost", nullptr);
    IC_ASSERT(pc.generator("mine")->owned == 3);
    IC_ASSERT(near(pc.generator_rate_multiplier("mine"), 2.0));

    ps.update_unlocks();
    IC_ASSERT(ps.state("ascend")->unlocked);
    const auto quote = ps.quote("ascend", 10);
    IC_ASSERT(quote.has_value());
    IC_ASSERT(quote->status == PrestigeStatus::Available);
    IC_ASSERT(near(quote->reward_amount, 7.0));
    IC_ASSERT(quote->retained.size() == 1 && quote->retained[0] == "keep");

    ps.apply("ascend", "t1", 10, nullptr);
    IC_ASSERT(near(rs.amount(gold), 0.0));
    IC_ASSERT(near(rs.amount(dust), 0.0));
    IC_ASSERT(near(rs.amount(keep), 3.0));
    IC_ASSERT(near(rs.amount(gem), 7.0));
    IC_ASSERT(near(rs.amount(count), 1.0));
    IC_ASSERT(pc.generator("mine")->owned == 1);
    IC_ASSERT(pc.upgrade("boost")->purchases == 0);
    IC_ASSERT(near(pc.generator_rate_multiplier("mine"), 1.0));
    IC_ASSERT(mem->count(TelemetryKind::Progress, "PrestigeResetApplied") == 1);
    IC_ASSERT(mem->last(TelemetryKind::Progress, "PrestigeResetApplied")->details.at("resetCount").number_value() ==
              2.0);

    // Gold went back to zero, so the layer locks again.
    IC_ASSERT(!ps.state("ascend")->unlocked);

    rs.add_amount(gold, 120.0);
    ps.update_unlocks();
    IC_ASSERT(ps.quote("ascend", 11)->status == PrestigeStatus::Completed);

    // A token is good once per prestige_token_ttl_ms (600 steps at 100 ms).
    threw = false;
    try {
      ps.apply("ascend", "t1", 12, nullptr);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
    IC_ASSERT(mem->count(TelemetryKind::Warning, "PrestigeResetDuplicateToken") == 1);
    IC_ASSERT(near(rs.amount(count), 1.0));

    ps.apply("ascend", "t1", 611, nullptr);
    IC_ASSERT(near(rs.amount(count), 2.0));
    IC_ASSERT(near(rs.amount(gem), 14.0));

    // Used tokens survive export/restore.
    PrestigeSystem restored(ctx, pack, pc, rs, 100.0);
    restored.restore_state(ps.export_state());
    rs.add_amount(gold, 120.0);
    restored.update_unlocks();
    threw = false;
    try {
      restored.apply("ascend", "t1", 700, nullptr);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);

    // Rebasing shifts the recorded steps; 611 -> 11 puts the token out of range at 700.
    PrestigeSystem rebased(ctx, pack, pc, rs, 100.0);
    rebased.restore_state(ps.export_state(), CommandQueueRebase{611, 11});
    rebased.update_unlocks();
    rebased.apply("ascend", "t1", 700, nullptr);
    IC_ASSERT(near(rs.amount(count), 3.0));
  }

  // --- PRESTIGE_RESET through the runtime ---
  {
    auto mem = std::make_shared<MemoryTelemetry>();
    SimulationContext ctx(EngineConfig{}, mem);
    Runtime rt(ctx, pack);

    int resets = 0;
    double reward = 0.0;
    Subscription sub = rt.events().on("prestige:reset", [&](const EventEnvelope& e) {
      ++resets;
      reward = e.payload.at("rewardAmount").number_value();
    });

    IC_ASSERT(rt.enqueue(command("PRESTIGE_RESET", 0, R"({"confirmationToken":"a"})")));
    IC_ASSERT(rt.enqueue(command("PRESTIGE_RESET", 0, R"({"layerId":"ghost","confirmationToken":"a"})")));
    IC_ASSERT(rt.enqueue(command("PRESTIGE_RESET", 0, R"({"layerId":"ascend","confirmationToken":"a"})")));
    rt.tick();
    IC_ASSERT(mem->count(TelemetryKind::Error, "PrestigeResetInvalidLayer") == 1);
    IC_ASSERT(mem->count(TelemetryKind::Error, "PrestigeResetUnknown") == 1);
    IC_ASSERT(mem->count(TelemetryKind::Warning, "PrestigeResetLocked") == 1);

    IC_ASSERT(rt.enqueue(command("COLLECT_RESOURCE", 1, R"({"resourceId":"gold","amount":150})")));
    rt.tick();
    IC_ASSERT(rt.prestige().state("ascend")->unlocked);

    IC_ASSERT(rt.enqueue(command("PRESTIGE_RESET", 2, R"({"layerId":"ascend"})")));
    rt.tick();
    IC_ASSERT(mem->count(TelemetryKind::Error, "PrestigeResetApplyFailed") == 1);
    IC_ASSERT(resets == 0);

    IC_ASSERT(rt.enqueue(command("PRESTIGE_RESET", 3, R"({"layerId":"ascend","confirmationToken":"b"})")));
    rt.tick();
    IC_ASSERT(mem->count(TelemetryKind::Progress, "PrestigeResetConfirmed") == 1);
    IC_ASSERT(resets == 1);
    IC_ASSERT(near(reward, 7.0));
    IC_ASSERT(near(rt.resources().amount(rt.resources().require_index("gem")), 7.0));
    IC_ASSERT(near(rt.resources().amount(rt.resources().require_index("gold")), 0.0));

    // Automations may not prestige.
    Command automated = command("PRESTIGE_RESET", 4, R"({"layerId":"ascend","confirmationToken":"c"})");
    automated.priority = CommandPriority::Automation;
    rt.enqueue(automated);
    rt.tick();
    IC_ASSERT(resets == 1);

    // Saves carry the used tokens.
    const GameSnapshot snap = capture_snapshot(rt);
    IC_ASSERT(snap.prestige.at("tokens").find("b") != nullptr);
    SimulationContext ctx2(EngineConfig{}, std::make_shared<MemoryTelemetry>());
    Runtime rt2(ctx2, pack);
    restore_snapshot(rt2, snapshot_from_json(snapshot_to_json(snap)));
    IC_ASSERT(compute_state_checksum(capture_snapshot(rt2)) == compute_state_checksum(snap));
  }

  return 0;
}
