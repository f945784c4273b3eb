#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/core/command_queue.h"
#include "idlecore/core/content.h"
#include "idlecore/util/json.h"

namespace idlecore {

class EventBus;
class ProgressionCoordinator;
class ResourceState;
class SimulationContext;

enum class PrestigeStatus { Locked, Available, Completed };

const char* prestige_status_name(PrestigeStatus s);

struct PrestigeLayerState {
  std::string id;
  bool unlocked{false};
  bool visible{false};
};

struct PrestigeQuote {
  std::string layer_id;
  // Completed once the layer has been reset at least once; it stays usable.
  PrestigeStatus status{PrestigeStatus::Locked};
  std::string reward_resource_id;
  double reward_amount{0.0};
  std::vector<std::string> reset_targets;
  std::vector<std::string> reset_generators;
  std::vector<std::string> reset_upgrades;
  // Retained resource, generator and upgrade ids, in content order.
  std::vector<std::string> retained;
};

// Prestige layers: unlock tracking, reward quotes and the reset itself.
class PrestigeSystem {
 public:
  PrestigeSystem(SimulationContext& ctx, const ContentPack& content, ProgressionCoordinator& progression,
                 ResourceState& resources, double step_ms);

  // Layers follow their unlock condition every step; they can lock again.
  void update_unlocks();

  std::optional<PrestigeQuote> quote(const std::string& layer_id, std::int64_t step) const;

  // Grants the reward, resets the layer's targets (minus retention) and bumps
  // its count resource. Throws std::runtime_error when the token is missing
  // or was used within prestige_token_ttl_ms, and when the layer is unknown
  // or locked.
  void apply(const std::string& layer_id, const std::string& token, std::int64_t step, EventBus* events);

  const PrestigeLayerState* state(const std::string& layer_id) const;
  const std::vector<PrestigeLayerState>& states() const { return layers_; }

  // {layers: [{id, unlocked, visible}], tokens: {token: step}}
  json::Value export_state() const;
  void restore_state(const json::Value& data, const std::optional<CommandQueueRebase>& rebase = std::nullopt);

 private:
  double reward_for(const PrestigeLayerDefinition& def, std::int64_t step) const;
  void expire_tokens(std::int64_t step);

  SimulationContext& ctx_;
  const ContentPack& content_;
  ProgressionCoordinator& progression_;
  ResourceState& resources_;
  double step_ms_;
  std::int64_t token_ttl_steps_;

  std::vector<PrestigeLayerState> layers_;
  std::unordered_map<std::string, std::size_t> layer_index_;
  // Confirmation token -> step it was used.
  std::map<std::string, std::int64_t> used_tokens_;
};

} // namespace idlecore
