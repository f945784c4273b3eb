#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "idlecore/core/content.h"
#include "idlecore/core/migration.h"
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
  "id": "test.snapshot",
  "resources": [
    {"id": "gold", "startAmount": 50, "capacity": 500, "unlocked": true},
    {"id": "gem", "unlocked": true}
  ],
  "generators": [{"id": "mine", "purchase": {"currencyId": "gold", "baseCost": 10}, "initialLevel": 1,
                  "produces": [{"resourceId": "gold", "rate": 1}]}],
  "upgrades": [{"id": "boost", "cost": {"currencyId": "gold", "costMultiplier": 20},
                "effects": [{"kind": "modifyGeneratorRate", "generatorId": "mine", "operation": "multiply", "value": 2}]}],
  "automations": [{"id": "collect", "targetType": "collectResource", "targetId": "gold", "targetAmount": 0.5,
                   "trigger": {"kind": "interval", "intervalMs": 500}, "enabledByDefault": true}],
  "transforms": [{"id": "mint", "mode": "batch", "durationMs": 300,
                  "inputs": [{"resourceId": "gold", "amount": 5}], "outputs": [{"resourceId": "gem", "amount": 1}]}]
})";

// Same layout with gold renamed to coin.
const char* kRenamedPack = R"({
  "id": "test.snapshot",
  "version": "2.0.0",
  "resources": [
    {"id": "coin", "startAmount": 50, "capacity": 500, "unlocked": true},
    {"id": "gem", "unlocked": true}
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

} // namespace

int test_snapshot() {
  using namespace idlecore;
  namespace fs = std::filesystem;

  const ContentPack pack = content_pack_from_json(json::parse(kPack));
  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext ctx(EngineConfig{}, mem);
  RuntimeOptions opts;
  opts.seed = 42;
  Runtime rt(ctx, pack, opts);

  IC_ASSERT(rt.enqueue(command("PURCHASE_GENERATOR", 0, R"({"generatorId":"mine","count":1})")));
  IC_ASSERT(rt.enqueue(command("RUN_TRANSFORM", 3, R"({"transformId":"mint"})")));
  IC_ASSERT(rt.enqueue(command("PURCHASE_UPGRADE", 10, R"({"upgradeId":"boost"})")));
  for (int i = 0; i < 4; ++i) rt.tick();
  rt.prd().get_or_create("crit", 0.25).roll();

  IC_ASSERT(rt.current_step() == 4);
  IC_ASSERT(rt.progression().generator("mine")->owned == 2);
  IC_ASSERT(rt.transforms().state("mint")->batches.size() == 1);
  IC_ASSERT(rt.queue().size() == 1);

  const GameSnapshot snap = capture_snapshot(rt);
  const std::string checksum = compute_state_checksum(snap);
  IC_ASSERT(checksum.size() == 8);
  IC_ASSERT(snap.step == 4);
  IC_ASSERT(snap.rng_seed && *snap.rng_seed == 42u);

  // --- JSON round trip ---
  const GameSnapshot parsed = snapshot_from_json(json::parse(json::stringify(snapshot_to_json(snap), 0)));
  IC_ASSERT(compute_state_checksum(parsed) == checksum);

  // --- Restore into a fresh runtime and keep going in lockstep ---
  SimulationContext ctx2(EngineConfig{}, std::make_shared<MemoryTelemetry>());
  Runtime rt2(ctx2, pack);
  restore_snapshot(rt2, parsed);
  IC_ASSERT(rt2.current_step() == 4);
  IC_ASSERT(compute_state_checksum(capture_snapshot(rt2)) == checksum);
  IC_ASSERT(rt2.prd().contains("crit"));

  for (int i = 0; i < 8; ++i) {
    rt.tick();
    rt2.tick();
  }
  IC_ASSERT(rt.progression().upgrade("boost")->purchases == 1);
  IC_ASSERT(rt2.progression().upgrade("boost")->purchases == 1);
  IC_ASSERT(rt2.resources().amount(rt2.resources().require_index("gem")) == 1.0);
  IC_ASSERT(compute_state_checksum(capture_snapshot(rt)) == compute_state_checksum(capture_snapshot(rt2)));
  IC_ASSERT(ctx.rng().next() == ctx2.rng().next());

  // --- Validation ---
  {
    json::Value bad = snapshot_to_json(snap);
    (*bad.as_object())["version"] = 9.0;
    bool threw = false;
    try {
      snapshot_from_json(bad);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }
  {
    EngineConfig fast;
    fast.runtime.step_size_ms = 50.0;
    SimulationContext ctx3(fast, std::make_shared<MemoryTelemetry>());
    Runtime rt3(ctx3, pack);
    bool threw = false;
    try {
      restore_snapshot(rt3, snap);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Save files and migrations ---
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");
  dir /= "idlecore_test_snapshot";
  dir /= std::to_string(static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));
  const std::string save_path = (dir / "save.json").string();

  write_save_file(save_path, snap);
  IC_ASSERT(compute_state_checksum(read_save_file(save_path, pack.digest())) == checksum);

  const ContentPack renamed = content_pack_from_json(json::parse(kRenamedPack));
  MigrationRegistry registry;
  {
    // No chain: the save still loads and is reconciled by id.
    auto mem = std::make_shared<MemoryTelemetry>();
    const GameSnapshot unmigrated = read_save_file(save_path, renamed.digest(), &registry, mem.get());
    IC_ASSERT(mem->count(TelemetryKind::Warning, "SaveMigrationUnavailable") == 1);
    const TelemetryEntry* w = mem->last(TelemetryKind::Warning, "SaveMigrationUnavailable");
    IC_ASSERT(w->details.at("fromHash").string_value() == pack.digest().hash);
    IC_ASSERT(w->details.at("toHash").string_value() == renamed.digest().hash);
    IC_ASSERT(unmigrated.resources.ids.size() == 2 && unmigrated.resources.ids[0] == "gold");

    SimulationContext ctx5(EngineConfig{}, mem);
    Runtime rt5(ctx5, renamed);
    restore_snapshot(rt5, unmigrated);
    IC_ASSERT(rt5.current_step() == 4);
    IC_ASSERT(rt5.resources().amount(rt5.resources().require_index("gem")) == snap.resources.amounts[1]);
    IC_ASSERT(rt5.resources().amount(rt5.resources().require_index("coin")) == 50.0);
  }

  const ResourceDigest target = renamed.digest();
  registry.register_migration(MigrationDescriptor{
      "rename-gold", pack.digest(), target, [target](const json::Value& in) {
        json::Object root = in.object();
        json::Object res = root.at("resources").object();
        json::Array ids;
        for (const auto& id : res.at("ids").array()) {
          ids.push_back(id.string_value() == "gold" ? std::string("coin") : id.string_value());
        }
        res["ids"] = std::move(ids);
        res["definitionDigest"] = resource_digest_to_json(target);
        root["resources"] = json::object(std::move(res));
        return json::object(std::move(root));
      }});

  const GameSnapshot migrated = read_save_file(save_path, target, &registry);
  SimulationContext ctx4(EngineConfig{}, std::make_shared<MemoryTelemetry>());
  Runtime rt4(ctx4, renamed);
  restore_snapshot(rt4, migrated);
  IC_ASSERT(rt4.resources().amount(rt4.resources().require_index("coin")) ==
            snap.resources.amounts[0]);
  IC_ASSERT(rt4.current_step() == 4);

  fs::remove_all(dir.parent_path(), ec);
  return 0;
}
