#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "idlecore/util/json.h"

namespace idlecore {

class Telemetry;

// Lower values execute first within a step.
enum class CommandPriority : int {
  System = 0,
  Player = 1,
  Automation = 2,
};

const char* command_priority_name(CommandPriority p);

// Accepts 0, 1, 2 only.
bool command_priority_from_number(double v, CommandPriority* out);

// Built-in command types. Content may register further string types; those
// route through the dispatcher's open registry.
enum class CommandKind : int {
  CollectResource = 0,
  PurchaseGenerator,
  PurchaseUpgrade,
  ToggleGenerator,
  ToggleAutomation,
  RunTransform,
  OfflineCatchup,
  ApplyMigration,
  PrestigeReset,
  Count,
};

// Wire name, e.g. "PURCHASE_GENERATOR".
const char* command_type_name(CommandKind kind);
std::optional<CommandKind> command_kind_from_type(const std::string& type);

struct Command {
  std::string type;
  CommandPriority priority{CommandPriority::Player};
  json::Value payload;
  // Milliseconds of simulated time at issue.
  double timestamp{0.0};
  // Step the command executes on.
  std::int64_t step{0};
};

json::Value command_to_json(const Command& cmd);

// Returns false (and fills *error when given) for anything malformed: empty
// type, unknown priority, non-finite timestamp, negative or fractional step.
bool command_from_json(const json::Value& v, Command* out, std::string* error = nullptr);

struct CommandAuthorizationPolicy {
  CommandKind kind{CommandKind::CollectResource};
  std::vector<CommandPriority> allowed_priorities;
  // Telemetry warning recorded on rejection.
  std::string unauthorized_event;
  std::string rationale;
};

const CommandAuthorizationPolicy& command_authorization_policy(CommandKind kind);

struct AuthorizationOptions {
  // "live" or "replay".
  std::string phase{"live"};
  std::string reason;
};

// Consults the policy table. Types without a policy are authorized. A
// rejection records the policy's warning and returns false.
bool authorize_command(const Command& cmd, Telemetry& telemetry, const AuthorizationOptions& options = {});

} // namespace idlecore
