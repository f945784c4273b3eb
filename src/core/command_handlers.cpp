#include "idlecore/core/command_handlers.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "idlecore/core/automation.h"
#include "idlecore/core/command_dispatcher.h"
#include "idlecore/core/event_bus.h"
#include "idlecore/core/prestige.h"
#include "idlecore/core/progression.h"
#include "idlecore/core/resource_state.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/transforms.h"

namespace idlecore {
namespace {

// Non-empty string field, or nullptr.
const std::string* string_field(const json::Value& payload, const char* key) {
  const json::Value* v = payload.find(key);
  if (!v) return nullptr;
  const std::string* s = v->as_string();
  return (s && !s->empty()) ? s : nullptr;
}

bool positive_integer(const json::Value* v, int* out) {
  if (!v || !v->is_number()) return false;
  const double d = *v->as_number();
  if (!std::isfinite(d) || d < 1.0 || std::floor(d) != d || d > 1e9) return false;
  *out = static_cast<int>(d);
  return true;
}

json::Object base_details(const ExecutionContext& ectx) {
  json::Object d;
  d["step"] = static_cast<double>(ectx.step);
  d["priority"] = std::string(command_priority_name(ectx.priority));
  return d;
}

void publish_if_registered(EventBus* events, const std::string& type, json::Object payload) {
  if (!events || !events->has_event_type(type)) return;
  events->publish(type, json::object(std::move(payload)));
}

// Spends every cost or none. On a shortfall records InsufficientResources and
// returns the failure to hand back to the dispatcher.
std::optional<CommandResult> spend_all(SimulationContext& ctx, ResourceState& resources,
                                       const std::vector<ResourceCost>& costs, const char* command_type,
                                       const std::string& target_key, const std::string& target_id,
                                       const ExecutionContext& ectx) {
  for (const auto& c : costs) {
    const std::size_t idx = resources.require_index(c.resource_id);
    const double available = resources.amount(idx);
    if (available < c.amount) {
      json::Object details = base_details(ectx);
      details[target_key] = std::string(target_id);
      details["resourceId"] = std::string(c.resource_id);
      details["required"] = c.amount;
      details["available"] = available;
      ctx.telemetry().record_warning("InsufficientResources", details);
      return CommandResult::failure("INSUFFICIENT_RESOURCES", "Not enough " + c.resource_id + ".",
                                    std::move(details));
    }
  }

  std::vector<std::pair<std::size_t, double>> spent;
  for (const auto& c : costs) {
    const std::size_t idx = resources.require_index(c.resource_id);
    const double before = resources.amount(idx);
    if (c.amount > 0.0 && !resources.spend_amount(idx, c.amount, ResourceSpendContext{command_type, ""})) {
      for (const auto& [refund_idx, refund] : spent) {
        if (refund > 0.0) resources.add_amount(refund_idx, refund);
      }
      json::Object details = base_details(ectx);
      details[target_key] = std::string(target_id);
      details["resourceId"] = std::string(c.resource_id);
      details["required"] = c.amount;
      ctx.telemetry().record_warning("InsufficientResources", details);
      return CommandResult::failure("INSUFFICIENT_RESOURCES", "Not enough " + c.resource_id + ".",
                                    std::move(details));
    }
    spent.emplace_back(idx, before - resources.amount(idx));
  }
  return std::nullopt;
}

} // namespace

void register_core_command_handlers(CommandDispatcher& dispatcher, SimulationContext& ctx,
                                    ProgressionCoordinator& progression, ResourceState& resources,
                                    AutomationSystem& automation, TransformSystem& transforms,
                                    PrestigeSystem& prestige, CoreCommandHooks hooks) {
  dispatcher.register_handler(CommandKind::CollectResource, [&ctx, &resources](const json::Value& payload,
                                                                               const ExecutionContext& ectx) -> Outcome {
    const std::string* resource_id = string_field(payload, "resourceId");
    const json::Value* amount_v = payload.find("amount");
    if (!resource_id || !amount_v || !amount_v->is_number() || !std::isfinite(*amount_v->as_number()) ||
        *amount_v->as_number() < 0.0) {
      json::Object details = base_details(ectx);
      ctx.telemetry().record_error("ResourceCollectInvalidPayload", details);
      return CommandResult::failure("INVALID_COLLECT_PAYLOAD",
                                    "Collect requires a resourceId and a non-negative amount.", std::move(details));
    }
    const auto idx = resources.find_index(*resource_id);
    if (!idx) {
      json::Object details = base_details(ectx);
      details["resourceId"] = std::string(*resource_id);
      ctx.telemetry().record_error("ResourceCollectUnknown", details);
      return CommandResult::failure("UNKNOWN_RESOURCE", "Unknown resource \"" + *resource_id + "\".",
                                    std::move(details));
    }

    const double requested = *amount_v->as_number();
    const double applied = resources.add_amount(*idx, requested);
    if (applied < requested && !resources.epsilon_equals(*idx, applied, requested)) {
      json::Object details = base_details(ectx);
      details["resourceId"] = std::string(*resource_id);
      details["requested"] = requested;
      details["applied"] = applied;
      ctx.telemetry().record_warning("ResourceCollectClamped", details);
    }
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::PurchaseGenerator, [&ctx, &progression, &resources](
                                                                  const json::Value& payload,
                                                                  const ExecutionContext& ectx) -> Outcome {
    const std::string* generator_id = string_field(payload, "generatorId");
    int count = 0;
    if (!generator_id || !positive_integer(payload.find("count"), &count)) {
      json::Object details = base_details(ectx);
      if (generator_id) details["generatorId"] = std::string(*generator_id);
      ctx.telemetry().record_error("GeneratorPurchaseInvalidCount", details);
      return CommandResult::failure("INVALID_PURCHASE_COUNT", "Purchase count must be a positive integer.",
                                    std::move(details));
    }
    if (!progression.generator(*generator_id)) {
      json::Object details = base_details(ectx);
      details["generatorId"] = std::string(*generator_id);
      ctx.telemetry().record_error("GeneratorPurchaseUnknown", details);
      return CommandResult::failure("UNKNOWN_GENERATOR", "Unknown generator \"" + *generator_id + "\".",
                                    std::move(details));
    }

    const auto quote = progression.generator_quote(*generator_id, count);
    if (!quote) {
      json::Object details = base_details(ectx);
      details["generatorId"] = std::string(*generator_id);
      details["count"] = static_cast<double>(count);
      ctx.telemetry().record_warning("GeneratorPurchaseUnavailable", details);
      return CommandResult::failure("GENERATOR_PURCHASE_UNAVAILABLE",
                                    "Generator \"" + *generator_id + "\" cannot be purchased.", std::move(details));
    }
    if (auto failure = spend_all(ctx, resources, quote->costs, "PURCHASE_GENERATOR", "generatorId", *generator_id,
                                 ectx)) {
      return *failure;
    }

    progression.add_generator_units(*generator_id, count);

    json::Object payload_out;
    payload_out["generatorId"] = std::string(*generator_id);
    payload_out["count"] = static_cast<double>(count);
    payload_out["owned"] = static_cast<double>(progression.generator(*generator_id)->owned);
    publish_if_registered(ectx.events, "generator:purchased", std::move(payload_out));
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::PurchaseUpgrade, [&ctx, &progression, &resources](
                                                                const json::Value& payload,
                                                                const ExecutionContext& ectx) -> Outcome {
    const std::string* upgrade_id = string_field(payload, "upgradeId");
    const auto quote = upgrade_id ? progression.upgrade_quote(*upgrade_id) : std::nullopt;
    if (!quote) {
      json::Object details = base_details(ectx);
      if (upgrade_id) details["upgradeId"] = std::string(*upgrade_id);
      ctx.telemetry().record_error("UpgradePurchaseUnknown", details);
      return CommandResult::failure("UNKNOWN_UPGRADE", "Unknown upgrade.", std::move(details));
    }

    if (quote->status != UpgradeStatus::Available) {
      const bool owned = quote->status == UpgradeStatus::Purchased;
      json::Object details = base_details(ectx);
      details["upgradeId"] = std::string(*upgrade_id);
      details["status"] = std::string(upgrade_status_name(quote->status));
      ctx.telemetry().record_warning(owned ? "UpgradePurchaseAlreadyOwned" : "UpgradePurchaseLocked", details);
      return CommandResult::failure(owned ? "UPGRADE_ALREADY_OWNED" : "UPGRADE_LOCKED",
                                    "Upgrade \"" + *upgrade_id + "\" is not available.", std::move(details));
    }
    if (auto failure = spend_all(ctx, resources, quote->costs, "PURCHASE_UPGRADE", "upgradeId", *upgrade_id, ectx)) {
      return *failure;
    }

    progression.record_upgrade_purchase(*upgrade_id, ectx.events);
    const int purchases = progression.upgrade(*upgrade_id)->purchases;

    json::Object payload_out;
    payload_out["upgradeId"] = std::string(*upgrade_id);
    payload_out["purchases"] = static_cast<double>(purchases);
    publish_if_registered(ectx.events, "upgrade:purchased", payload_out);

    json::Object details = base_details(ectx);
    details["upgradeId"] = std::string(*upgrade_id);
    details["purchases"] = static_cast<double>(purchases);
    ctx.telemetry().record_progress("UpgradePurchaseConfirmed", details);
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::ToggleGenerator, [&ctx, &progression](const json::Value& payload,
                                                                                  const ExecutionContext& ectx) -> Outcome {
    const std::string* generator_id = string_field(payload, "generatorId");
    const json::Value* enabled = payload.find("enabled");
    if (!generator_id || !enabled || !enabled->is_bool()) {
      json::Object details = base_details(ectx);
      ctx.telemetry().record_error("ToggleGeneratorInvalidPayload", details);
      return CommandResult::failure("INVALID_TOGGLE_PAYLOAD", "Toggle requires a generatorId and an enabled flag.",
                                    std::move(details));
    }
    if (!progression.set_generator_enabled(*generator_id, enabled->bool_value())) {
      json::Object details = base_details(ectx);
      details["generatorId"] = std::string(*generator_id);
      ctx.telemetry().record_warning("ToggleGeneratorUnknown", details);
      return CommandResult::failure("UNKNOWN_GENERATOR", "Unknown generator \"" + *generator_id + "\".",
                                    std::move(details));
    }
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::ToggleAutomation, [&ctx, &automation](const json::Value& payload,
                                                                                 const ExecutionContext& ectx) -> Outcome {
    const std::string* automation_id = string_field(payload, "automationId");
    const json::Value* enabled = payload.find("enabled");
    if (!automation_id || !enabled || !enabled->is_bool()) {
      json::Object details = base_details(ectx);
      ctx.telemetry().record_error("ToggleAutomationInvalidPayload", details);
      return CommandResult::failure("INVALID_TOGGLE_PAYLOAD", "Toggle requires an automationId and an enabled flag.",
                                    std::move(details));
    }
    if (!automation.set_enabled(*automation_id, enabled->bool_value(), ectx.events)) {
      json::Object details = base_details(ectx);
      details["automationId"] = std::string(*automation_id);
      ctx.telemetry().record_warning("ToggleAutomationUnknown", details);
      return CommandResult::failure("UNKNOWN_AUTOMATION", "Unknown automation \"" + *automation_id + "\".",
                                    std::move(details));
    }
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::RunTransform, [&ctx, &transforms](const json::Value& payload,
                                                                             const ExecutionContext& ectx) -> Outcome {
    const std::string* transform_id = string_field(payload, "transformId");
    if (!transform_id) {
      json::Object details = base_details(ectx);
      ctx.telemetry().record_error("RunTransformInvalidId", details);
      return CommandResult::failure("INVALID_TRANSFORM_ID", "Transform id must be a non-empty string.",
                                    std::move(details));
    }
    int runs = 1;
    if (const json::Value* r = payload.find("runs"); r && !r->is_null() && !positive_integer(r, &runs)) {
      json::Object details = base_details(ectx);
      details["transformId"] = std::string(*transform_id);
      ctx.telemetry().record_error("RunTransformInvalidRuns", details);
      return CommandResult::failure("INVALID_RUNS", "Runs must be a positive integer.", std::move(details));
    }

    const TransformRunResult result = transforms.run(*transform_id, ectx.step, runs, ectx.events);
    if (!result.success) {
      json::Object details = base_details(ectx);
      details["transformId"] = std::string(*transform_id);
      details["errorCode"] = std::string(result.code);
      details["errorMessage"] = std::string(result.message);
      ctx.telemetry().record_warning("RunTransformFailed", details);
      return CommandResult::failure(result.code, result.message, std::move(details));
    }
    return CommandResult::ok();
  });

  dispatcher.register_handler(CommandKind::PrestigeReset, [&ctx, &prestige](const json::Value& payload,
                                                                          const ExecutionContext& ectx) -> Outcome {
    const std::string* layer_id = string_field(payload, "layerId");
    if (!layer_id) {
      json::Object details = base_details(ectx);
      ctx.telemetry().record_error("PrestigeResetInvalidLayer", details);
      return CommandResult::failure("INVALID_PRESTIGE_LAYER", "Prestige layer id must be a non-empty string.",
                                    std::move(details));
    }
    const std::optional<PrestigeQuote> quote = prestige.quote(*layer_id, ectx.step);
    if (!quote) {
      json::Object details = base_details(ectx);
      details["layerId"] = std::string(*layer_id);
      ctx.telemetry().record_error("PrestigeResetUnknown", details);
      return CommandResult::failure("UNKNOWN_PRESTIGE_LAYER", "Unknown prestige layer \"" + *layer_id + "\".",
                                    std::move(details));
    }
    if (quote->status == PrestigeStatus::Locked) {
      json::Object details = base_details(ectx);
      details["layerId"] = std::string(*layer_id);
      ctx.telemetry().record_warning("PrestigeResetLocked", details);
      return CommandResult::failure("PRESTIGE_LOCKED", "Prestige layer \"" + *layer_id + "\" is locked.",
                                    std::move(details));
    }

    const json::Value* token_v = payload.find("confirmationToken");
    const std::string token = token_v ? token_v->string_value() : std::string();
    try {
      prestige.apply(*layer_id, token, ectx.step, ectx.events);
    } catch (const std::exception& e) {
      json::Object details = base_details(ectx);
      details["layerId"] = std::string(*layer_id);
      details["error"] = std::string(e.what());
      ctx.telemetry().record_error("PrestigeResetApplyFailed", details);
      return CommandResult::failure("PRESTIGE_RESET_FAILED", e.what(), std::move(details));
    }

    json::Object details = base_details(ectx);
    details["layerId"] = std::string(*layer_id);
    details["rewardAmount"] = quote->reward_amount;
    ctx.telemetry().record_progress("PrestigeResetConfirmed", details);
    return CommandResult::ok();
  });

  if (hooks.offline_catchup) {
    dispatcher.register_handler(CommandKind::OfflineCatchup, [&ctx, hook = std::move(hooks.offline_catchup)](
                                                                 const json::Value& payload,
                                                                 const ExecutionContext& ectx) -> Outcome {
      const json::Value* elapsed = payload.find("elapsedMs");
      if (!elapsed || !elapsed->is_number() || !std::isfinite(*elapsed->as_number()) || *elapsed->as_number() < 0.0) {
        json::Object details = base_details(ectx);
        ctx.telemetry().record_error("OfflineCatchupInvalidPayload", details);
        return CommandResult::failure("INVALID_OFFLINE_PAYLOAD", "elapsedMs must be a non-negative number.",
                                      std::move(details));
      }
      const json::Value* deltas = payload.find("resourceDeltas");
      if (deltas && !deltas->is_null() && !deltas->is_object()) {
        json::Object details = base_details(ectx);
        ctx.telemetry().record_error("OfflineCatchupInvalidPayload", details);
        return CommandResult::failure("INVALID_OFFLINE_PAYLOAD", "resourceDeltas must be an object.",
                                      std::move(details));
      }
      hook(*elapsed->as_number(), deltas ? *deltas : json::Value(nullptr));
      return CommandResult::ok();
    });
  }
}

} // namespace idlecore
