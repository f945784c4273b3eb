#include "idlecore/core/command.h"

#include <algorithm>
#include <array>
#include <cmath>

#include "idlecore/core/telemetry.h"

namespace idlecore {
namespace {

constexpr std::array<const char*, static_cast<std::size_t>(CommandKind::Count)> kTypeNames = {
    "COLLECT_RESOURCE", "PURCHASE_GENERATOR", "PURCHASE_UPGRADE", "TOGGLE_GENERATOR", "TOGGLE_AUTOMATION",
    "RUN_TRANSFORM",    "OFFLINE_CATCHUP",    "APPLY_MIGRATION",  "PRESTIGE_RESET",
};

const std::vector<CommandPriority> kAllPriorities = {CommandPriority::System, CommandPriority::Player,
                                                     CommandPriority::Automation};

std::vector<CommandAuthorizationPolicy> build_policies() {
  std::vector<CommandAuthorizationPolicy> p(static_cast<std::size_t>(CommandKind::Count));
  auto set = [&](CommandKind k, std::vector<CommandPriority> allowed, std::string event, std::string why) {
    auto& e = p[static_cast<std::size_t>(k)];
    e.kind = k;
    e.allowed_priorities = std::move(allowed);
    e.unauthorized_event = std::move(event);
    e.rationale = std::move(why);
  };
  set(CommandKind::CollectResource, kAllPriorities, "CommandPriorityViolation",
      "Manual collection is available to players, automations and the host.");
  set(CommandKind::PurchaseGenerator, kAllPriorities, "CommandPriorityViolation",
      "Generator purchases are issued by players and purchase automations.");
  set(CommandKind::PurchaseUpgrade, kAllPriorities, "CommandPriorityViolation",
      "Upgrade purchases are issued by players and upgrade automations.");
  set(CommandKind::ToggleGenerator, kAllPriorities, "CommandPriorityViolation",
      "Generator toggles are issued by players and generator automations.");
  set(CommandKind::ToggleAutomation, kAllPriorities, "CommandPriorityViolation",
      "Automations may be toggled by the player or the host.");
  set(CommandKind::RunTransform, kAllPriorities, "UnauthorizedTransformCommand",
      "Manual transforms may be triggered from any source.");
  set(CommandKind::OfflineCatchup, {CommandPriority::System, CommandPriority::Automation}, "CommandPriorityViolation",
      "Offline catch-up replays elapsed time; players cannot fabricate it.");
  set(CommandKind::ApplyMigration, {CommandPriority::System}, "UnauthorizedSystemCommand",
      "Save migrations rewrite persisted state and are host-only.");
  set(CommandKind::PrestigeReset, {CommandPriority::System, CommandPriority::Player}, "AutomationPrestigeBlocked",
      "Prestige is destructive and must be confirmed by a player.");
  return p;
}

} // namespace

const char* command_priority_name(CommandPriority p) {
  switch (p) {
    case CommandPriority::System: return "SYSTEM";
    case CommandPriority::Player: return "PLAYER";
    case CommandPriority::Automation: return "AUTOMATION";
  }
  return "UNKNOWN";
}

bool command_priority_from_number(double v, CommandPriority* out) {
  if (v == 0.0) {
    *out = CommandPriority::System;
  } else if (v == 1.0) {
    *out = CommandPriority::Player;
  } else if (v == 2.0) {
    *out = CommandPriority::Automation;
  } else {
    return false;
  }
  return true;
}

const char* command_type_name(CommandKind kind) {
  const auto i = static_cast<std::size_t>(kind);
  if (i >= kTypeNames.size()) return "";
  return kTypeNames[i];
}

std::optional<CommandKind> command_kind_from_type(const std::string& type) {
  for (std::size_t i = 0; i < kTypeNames.size(); ++i) {
    if (type == kTypeNames[i]) return static_cast<CommandKind>(i);
  }
  return std::nullopt;
}

json::Value command_to_json(const Command& cmd) {
  json::Object o;
  o["type"] = std::string(cmd.type);
  o["priority"] = static_cast<double>(static_cast<int>(cmd.priority));
  o["payload"] = cmd.payload;
  o["timestamp"] = cmd.timestamp;
  o["step"] = static_cast<double>(cmd.step);
  return json::object(std::move(o));
}

bool command_from_json(const json::Value& v, Command* out, std::string* error) {
  auto fail = [&](const std::string& msg) {
    if (error) *error = msg;
    return false;
  };
  const json::Object* o = v.as_object();
  if (!o) return fail("command must be an object");

  Command cmd;
  if (auto it = o->find("type"); it != o->end() && it->second.is_string()) {
    cmd.type = *it->second.as_string();
  }
  if (cmd.type.empty()) return fail("command type must be a non-empty string");

  auto pit = o->find("priority");
  if (pit == o->end() || !pit->second.is_number() || !command_priority_from_number(*pit->second.as_number(), &cmd.priority)) {
    return fail("command priority is invalid");
  }

  auto tit = o->find("timestamp");
  if (tit == o->end() || !tit->second.is_number() || !std::isfinite(*tit->second.as_number())) {
    return fail("command timestamp must be a finite number");
  }
  cmd.timestamp = *tit->second.as_number();

  auto sit = o->find("step");
  if (sit == o->end() || !sit->second.is_number()) return fail("command step must be a number");
  const double step = *sit->second.as_number();
  if (!std::isfinite(step) || step < 0.0 || std::floor(step) != step || step > 9007199254740991.0) {
    return fail("command step must be a non-negative integer");
  }
  cmd.step = static_cast<std::int64_t>(step);

  if (auto it = o->find("payload"); it != o->end()) cmd.payload = it->second;

  *out = std::move(cmd);
  return true;
}

const CommandAuthorizationPolicy& command_authorization_policy(CommandKind kind) {
  static const std::vector<CommandAuthorizationPolicy> policies = build_policies();
  return policies.at(static_cast<std::size_t>(kind));
}

bool authorize_command(const Command& cmd, Telemetry& telemetry, const AuthorizationOptions& options) {
  const auto kind = command_kind_from_type(cmd.type);
  if (!kind) return true;
  const CommandAuthorizationPolicy& policy = command_authorization_policy(*kind);
  const auto& allowed = policy.allowed_priorities;
  if (std::find(allowed.begin(), allowed.end(), cmd.priority) != allowed.end()) return true;

  json::Object details;
  details["type"] = std::string(cmd.type);
  details["attemptedPriority"] = std::string(command_priority_name(cmd.priority));
  json::Array allowed_names;
  for (CommandPriority p : allowed) allowed_names.push_back(std::string(command_priority_name(p)));
  details["allowedPriorities"] = std::move(allowed_names);
  details["phase"] = std::string(options.phase);
  details["step"] = static_cast<double>(cmd.step);
  if (!options.reason.empty()) details["reason"] = std::string(options.reason);
  telemetry.record_warning(policy.unauthorized_event, details);
  return false;
}

} // namespace idlecore
