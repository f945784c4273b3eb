#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "idlecore/util/json.h"

namespace idlecore {

class SimulationContext;

struct ResourceDefinition {
  std::string id;
  double start_amount{0.0};

  // Unset means unbounded.
  std::optional<double> capacity;

  bool unlocked{false};
  bool visible{false};

  // Per-resource dirty tolerance override (clamped by PrecisionConfig).
  std::optional<double> dirty_tolerance;
};

// Identity of an ordered resource id list: "fnv1a-" + 8 hex digits.
// version is the id count.
struct ResourceDigest {
  std::string hash;
  int version{0};
  std::vector<std::string> ids;

  bool operator==(const ResourceDigest& o) const { return hash == o.hash && version == o.version; }
  bool operator!=(const ResourceDigest& o) const { return !(*this == o); }
};

ResourceDigest compute_resource_digest(const std::vector<std::string>& ids);

json::Value resource_digest_to_json(const ResourceDigest& d);

// Throws std::runtime_error when the hash or version disagrees with the ids.
ResourceDigest resource_digest_from_json(const json::Value& v);

// Bit flags kept per resource.
enum ResourceFlag : std::uint8_t {
  kResourceVisible = 1u << 0,
  kResourceUnlocked = 1u << 1,
  kResourceDirty = 1u << 2,
};

// Who is spending (for ResourceSpendFailed diagnostics).
struct ResourceSpendContext {
  std::string command_id;
  std::string system_id;
};

struct SerializedResourceState {
  std::vector<std::string> ids;
  std::vector<double> amounts;
  // Unbounded capacities are stored as nullopt (JSON null).
  std::vector<std::optional<double>> capacities;
  std::vector<bool> unlocked;
  std::vector<bool> visible;
  std::vector<int> flags;
  std::optional<ResourceDigest> definition_digest;
};

json::Value serialized_resources_to_json(const SerializedResourceState& s);
// Structural parse only; value validation happens in ResourceState::reconcile.
SerializedResourceState serialized_resources_from_json(const json::Value& v);

struct ResourcePublishSnapshot {
  std::vector<std::string> ids;
  std::vector<double> amounts;
  std::vector<double> capacities;
  std::vector<double> net_per_second;
  std::vector<double> tick_delta;
  std::vector<std::uint8_t> flags;
  // Indices whose published values changed since the previous snapshot, ascending.
  std::vector<std::size_t> dirty_indices;
};

struct ResourceReconciliation {
  std::vector<std::string> added_ids;
  std::vector<std::string> removed_ids;
  bool digests_match{true};
};

// Authoritative resource economy, stored as parallel arrays by stable index.
//
// Invariants: 0 <= amount <= capacity; unlock/visibility only ever turn on.
// Every mutation goes through the methods below.
class ResourceState {
 public:
  ResourceState(SimulationContext& ctx, const std::vector<ResourceDefinition>& definitions);

  std::size_t size() const { return ids_.size(); }
  const std::vector<std::string>& ids() const { return ids_; }

  std::optional<std::size_t> find_index(const std::string& id) const;
  // Throws std::out_of_range ("ResourceUnknownId: ...").
  std::size_t require_index(const std::string& id) const;
  const std::string& id_at(std::size_t index) const;

  double amount(std::size_t index) const;
  double capacity(std::size_t index) const;
  double net_per_second(std::size_t index) const;
  double tick_delta(std::size_t index) const;
  bool is_unlocked(std::size_t index) const;
  bool is_visible(std::size_t index) const;
  bool is_dirty(std::size_t index) const;

  // Returns the amount actually added after clamping to capacity.
  // Throws std::invalid_argument on negative or non-finite input.
  double add_amount(std::size_t index, double amount);

  // All-or-nothing. Returns false (and records ResourceSpendFailed) when the
  // balance is short. Throws std::invalid_argument on negative or non-finite input.
  bool spend_amount(std::size_t index, double amount, const ResourceSpendContext& ctx = {});

  // Overwrites the balance, clamped to [0, capacity]; non-finite values become
  // 0. Only prestige resets bypass add/spend this way. Returns the new amount.
  double reset_amount(std::size_t index, double value);

  // +inf is allowed. Clamps the current amount down. Returns the new capacity.
  double set_capacity(std::size_t index, double capacity);

  void unlock(std::size_t index);
  void grant_visibility(std::size_t index);

  void apply_income(std::size_t index, double per_second);
  void apply_expense(std::size_t index, double per_second);

  // Applies accumulated (income - expense) over delta_ms and resets the rates.
  void finalize_tick(double delta_ms);

  // Clears tick_delta for every resource. Called at the start of each step.
  void reset_tick_deltas();

  // Tolerance-aware comparison used for dirty tracking.
  bool epsilon_equals(std::size_t index, double a, double b) const;

  // Changes the per-resource override. nullopt restores the global ceiling.
  void set_dirty_tolerance(std::size_t index, std::optional<double> tolerance);

  // Current values plus every index that changed since the previous call.
  ResourcePublishSnapshot snapshot_for_publish();

  SerializedResourceState export_for_save() const;

  // Applies a save by id. Throws on malformed data (std::runtime_error);
  // ids unknown to the live definitions are dropped.
  ResourceReconciliation reconcile(const SerializedResourceState& saved);

  const ResourceDigest& digest() const { return digest_; }

 private:
  void check_index(std::size_t index) const;
  double tolerance(std::size_t index, double a, double b) const;
  void write_amount(std::size_t index, double value);
  // Sets or clears the dirty bit by comparing against the published baseline.
  void refresh_dirty(std::size_t index);

  SimulationContext& ctx_;
  std::vector<std::string> ids_;
  std::unordered_map<std::string, std::size_t> index_by_id_;
  ResourceDigest digest_;

  std::vector<double> amounts_;
  std::vector<double> capacities_;
  std::vector<double> income_per_second_;
  std::vector<double> expense_per_second_;
  std::vector<double> net_per_second_;
  std::vector<double> tick_delta_;
  std::vector<std::uint8_t> flags_;
  std::vector<std::optional<double>> dirty_tolerance_;

  // Values as of the last snapshot_for_publish().
  std::vector<double> published_amounts_;
  std::vector<double> published_capacities_;
  std::vector<double> published_net_;
  std::vector<std::uint8_t> published_flags_;
};

} // namespace idlecore
