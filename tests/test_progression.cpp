#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "idlecore/core/content.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
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

const char* kPack = R"({
  "id": "test.mine",
  "resources": [
    {"id": "gold", "startAmount": 100, "capacity": 1000, "unlocked": true},
    {"id": "gem", "unlockCondition": {"kind": "resourceThreshold", "resourceId": "gold", "comparator": "gte", "amount": 110}}
  ],
  "generators": [
    {"id": "mine", "purchase": {"currencyId": "gold", "baseCost": 10, "costCurve": {"kind": "linear", "base": 1, "slope": 1}},
     "produces": [{"resourceId": "gold", "rate": 2}], "maxBulk": 5, "maxLevel": 6, "order": 0},
    {"id": "drill", "purchase": {"currencyId": "gold", "baseCost": 5},
     "produces": [{"resourceId": "gem", "rate": 1}], "consumes": [{"resourceId": "gold", "rate": 1}],
     "baseUnlock": {"kind": "generatorLevel", "generatorId": "mine", "comparator": "gte", "level": 2}, "order": 1}
  ],
  "upgrades": [
    {"id": "boost", "cost": {"currencyId": "gold", "costMultiplier": 50},
     "effects": [{"kind": "modifyGeneratorRate", "generatorId": "mine", "operation": "multiply", "value": 3},
                 {"kind": "grantFlag", "flagId": "boosted"}]},
    {"id": "cheaper", "cost": {"currencyId": "gold", "costMultiplier": 20}, "prerequisites": ["boost"],
     "effects": [{"kind": "modifyGeneratorCost", "generatorId": "mine", "operation": "multiply", "value": 0.5}]},
    {"id": "vault", "cost": {"currencyId": "gold", "costMultiplier": 10, "costCurve": {"kind": "exponential", "base": 1, "growth": 2}},
     "effects": [{"kind": "modifyResourceCapacity", "resourceId": "gold", "operation": "add", "value": 100}],
     "repeatable": {"maxPurchases": 3}}
  ]
})";

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

double total_cost(const std::optional<idlecore::GeneratorQuote>& q) {
  return (q && q->costs.size() == 1) ? q->costs[0].amount : -1.0;
}

} // namespace

int test_progression() {
  using namespace idlecore;

  auto mem = std::make_shared<MemoryTelemetry>();
  SimulationContext ctx(EngineConfig{}, mem);
  const ContentPack pack = content_pack_from_json(json::parse(kPack));
  ResourceState rs(ctx, pack.resource_definitions());
  ProgressionCoordinator pc(ctx, pack, rs);

  const std::size_t gold = rs.require_index("gold");
  const std::size_t gem = rs.require_index("gem");

  // --- Initial unlocks ---
  IC_ASSERT(pc.generator("mine")->unlocked && pc.generator("mine")->visible);
  IC_ASSERT(!pc.generator("drill")->unlocked);
  IC_ASSERT(pc.upgrade("boost")->unlocked);
  IC_ASSERT(!pc.upgrade("cheaper")->unlocked);
  IC_ASSERT(!rs.is_unlocked(gem));
  IC_ASSERT(pc.generator("nope") == nullptr);

  // --- Generator pricing: unit n costs curve(owned + n) * baseCost ---
  IC_ASSERT(near(total_cost(pc.generator_quote("mine", 1)), 10.0));
  IC_ASSERT(near(total_cost(pc.generator_quote("mine", 3)), 60.0));
  IC_ASSERT(!pc.generator_quote("mine", 0));
  IC_ASSERT(!pc.generator_quote("mine", 6));
  IC_ASSERT(!pc.generator_quote("drill", 1));
  IC_ASSERT(!pc.generator_quote("nope", 1));

  pc.add_generator_units("mine", 2);
  IC_ASSERT(pc.generator("mine")->owned == 2);
  IC_ASSERT(near(total_cost(pc.generator_quote("mine", 4)), 180.0));
  IC_ASSERT(!pc.generator_quote("mine", 5));

  pc.update_unlocks();
  IC_ASSERT(pc.generator("drill")->unlocked);
  IC_ASSERT(near(total_cost(pc.generator_quote("drill", 1)), 5.0));

  // --- Production ---
  TickContext tick;
  tick.delta_ms = 1000.0;
  pc.run_production(tick);
  rs.finalize_tick(tick.delta_ms);
  IC_ASSERT(near(rs.amount(gold), 104.0));

  // --- Upgrades ---
  auto boost = pc.upgrade_quote("boost");
  IC_ASSERT(boost && boost->status == UpgradeStatus::Available);
  IC_ASSERT(boost->costs.size() == 1 && near(boost->costs[0].amount, 50.0));
  IC_ASSERT(pc.upgrade_quote("cheaper")->status == UpgradeStatus::Locked);
  IC_ASSERT(!pc.upgrade_quote("nope"));

  pc.record_upgrade_purchase("boost", nullptr);
  IC_ASSERT(near(pc.generator_rate_multiplier("mine"), 3.0));
  IC_ASSERT(pc.flag("boosted"));
  IC_ASSERT(pc.upgrade_quote("boost")->status == UpgradeStatus::Purchased);

  pc.run_production(tick);
  rs.finalize_tick(tick.delta_ms);
  IC_ASSERT(near(rs.amount(gold), 116.0));

  pc.update_unlocks();
  IC_ASSERT(rs.is_unlocked(gem) && rs.is_visible(gem));
  IC_ASSERT(pc.upgrade("cheaper")->unlocked);
  pc.record_upgrade_purchase("cheaper", nullptr);
  IC_ASSERT(near(total_cost(pc.generator_quote("mine", 1)), 15.0));

  // Repeatable upgrades price by purchase count and stack their effects.
  IC_ASSERT(near(pc.upgrade_quote("vault")->costs[0].amount, 10.0));
  pc.record_upgrade_purchase("vault", nullptr);
  pc.record_upgrade_purchase("vault", nullptr);
  IC_ASSERT(near(pc.upgrade_quote("vault")->costs[0].amount, 40.0));
  IC_ASSERT(near(rs.capacity(gold), 1200.0));
  pc.record_upgrade_purchase("vault", nullptr);
  IC_ASSERT(near(rs.capacity(gold), 1300.0));
  IC_ASSERT(pc.upgrade_quote("vault")->status == UpgradeStatus::Purchased);

  // Consumers draw their inputs before producing.
  pc.add_generator_units("drill", 1);
  pc.run_production(tick);
  rs.finalize_tick(tick.delta_ms);
  IC_ASSERT(near(rs.amount(gold), 127.0));
  IC_ASSERT(near(rs.amount(gem), 1.0));

  // Disabled generators do nothing.
  IC_ASSERT(pc.set_generator_enabled("mine", false));
  IC_ASSERT(!pc.set_generator_enabled("nope", false));
  IC_ASSERT(pc.set_generator_enabled("drill", false));
  pc.run_production(tick);
  rs.finalize_tick(tick.delta_ms);
  IC_ASSERT(near(rs.amount(gold), 127.0));
  IC_ASSERT(pc.set_generator_enabled("mine", true));

  // --- Formula refs ---
  {
    const Formula f = formula_from_json(json::parse(
        R"({"kind":"expression","expression":{"kind":"binary","op":"add",
            "left":{"kind":"ref","target":{"type":"automation","id":"auto"}},
            "right":{"kind":"ref","target":{"type":"upgrade","id":"vault"}}}})"));
    pc.set_automation_lookup([](const std::string& id) -> std::optional<double> {
      if (id == "auto") return 1.0;
      return std::nullopt;
    });
    IC_ASSERT(near(evaluate_formula(f, pc.formula_context(0.0, 0.0, 0.0)), 4.0));
  }

  // --- Save / restore ---
  const json::Value saved = json::parse(json::stringify(pc.export_state(), 0));
  ResourceState rs2(ctx, pack.resource_definitions());
  ProgressionCoordinator pc2(ctx, pack, rs2);
  pc2.restore_state(saved);
  IC_ASSERT(pc2.generator("mine")->owned == 2);
  IC_ASSERT(pc2.generator("drill")->owned == 1 && !pc2.generator("drill")->enabled);
  IC_ASSERT(pc2.upgrade("vault")->purchases == 3);
  IC_ASSERT(near(pc2.generator_rate_multiplier("mine"), 3.0));
  IC_ASSERT(near(rs2.capacity(rs2.require_index("gold")), 1300.0));
  IC_ASSERT(pc2.flag("boosted"));
  IC_ASSERT(json::stringify(pc2.export_state(), 0) == json::stringify(saved, 0));

  // Counts that do not fit an int are rejected, not narrowed.
  for (const char* bad : {
           R"({"generators":[{"id":"mine","owned":-1}]})",
           R"({"generators":[{"id":"mine","owned":4294967298}]})",
           R"({"generators":[{"id":"mine","owned":1e300}]})",
           R"({"upgrades":[{"id":"vault","purchases":-2}]})",
           R"({"upgrades":[{"id":"vault","purchases":2147483648}]})",
       }) {
    bool threw = false;
    try {
      pc2.restore_state(json::parse(bad));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }
  IC_ASSERT(pc2.generator("mine")->owned == 2);
  IC_ASSERT(pc2.upgrade("vault")->purchases == 3);
  {
    bool threw = false;
    try {
      pc2.add_generator_units("nope", 1);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  // --- Content validation ---
  for (const char* bad : {
           R"({"id":"x","resources":[{"id":"a"},{"id":"a"}]})",
           R"({"id":"x","generators":[{"id":"g","purchase":{"currencyId":"missing"}}]})",
           R"({"id":"x","resources":[{"id":"a"}],"upgrades":[{"id":"u","prerequisites":["ghost"]}]})",
           R"({"resources":[]})",
       }) {
    bool threw = false;
    try {
      content_pack_from_json(json::parse(bad));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }
  return 0;
}
