#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "idlecore/core/resource_state.h"
#include "idlecore/util/json.h"

namespace idlecore {

class MigrationRegistry;
class Runtime;
class Telemetry;

inline constexpr int kGameSnapshotVersion = 1;

// Complete, self-contained state of a runtime between steps. Sub-states stay
// JSON so each system owns its own layout.
struct GameSnapshot {
  int version{kGameSnapshotVersion};

  std::int64_t step{0};
  double step_size_ms{0.0};
  std::optional<std::uint32_t> rng_seed;
  double rng_state{0.0};

  SerializedResourceState resources;
  json::Value progression;
  json::Value automation;
  json::Value transforms;
  json::Value prestige;
  json::Value achievements;
  json::Value command_queue;
  json::Value prd;
};

json::Value snapshot_to_json(const GameSnapshot& s);

// Throws std::runtime_error for an unsupported version or malformed data.
GameSnapshot snapshot_from_json(const json::Value& v);

GameSnapshot capture_snapshot(Runtime& runtime);

// Resumes exactly where the snapshot left off: step, RNG, resources and every
// system sub-state. Throws std::runtime_error when the step size differs or
// the resource data is malformed.
void restore_snapshot(Runtime& runtime, const GameSnapshot& snapshot);

// fnv1a32 over the canonical single-line JSON of the snapshot, as 8 hex digits.
std::string compute_state_checksum(const GameSnapshot& snapshot);

// Save files: {"snapshot": {...}} written atomically.
void write_save_file(const std::string& path, const GameSnapshot& snapshot);

// Reads a save and, when its resource digest differs from target and a
// registry is given, runs the migration chain over the snapshot JSON first.
// Without a chain the snapshot comes back unmigrated for restore_snapshot to
// reconcile by id, and a SaveMigrationUnavailable warning is recorded.
GameSnapshot read_save_file(const std::string& path, const ResourceDigest& target,
                            const MigrationRegistry* migrations = nullptr, Telemetry* telemetry = nullptr);

} // namespace idlecore
