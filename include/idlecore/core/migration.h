#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "idlecore/core/resource_state.h"
#include "idlecore/util/json.h"

namespace idlecore {

using MigrationTransform = std::function<json::Value(const json::Value&)>;

// One edge of the save-migration graph: rewrites a saved state laid out for
// from_digest into one laid out for to_digest.
struct MigrationDescriptor {
  std::string id;
  ResourceDigest from_digest;
  ResourceDigest to_digest;
  MigrationTransform transform;
};

struct MigrationPath {
  bool found{false};
  std::vector<MigrationDescriptor> migrations;
};

class MigrationRegistry {
 public:
  // Throws std::invalid_argument for an empty or duplicate id, a digest whose
  // hash/version disagree with its ids, identical from/to digests, a missing
  // transform, or a second edge between the same two digests.
  void register_migration(MigrationDescriptor desc);

  // Shortest chain (breadth-first, registration order breaks ties). Equal
  // digests give found == true with an empty path.
  MigrationPath find_migration_path(const ResourceDigest& from, const ResourceDigest& to) const;

  std::size_t size() const { return migrations_.size(); }

 private:
  using DigestId = std::size_t;

  DigestId intern(const ResourceDigest& d);
  bool lookup(const ResourceDigest& d, DigestId* out) const;

  // Interned composite keys ("<version>:<hash>"), indexed by DigestId.
  std::vector<std::string> digest_keys_;
  std::unordered_map<std::string, DigestId> digest_index_;

  // DigestId -> outgoing migration indices.
  std::vector<std::vector<std::size_t>> edges_;
  std::vector<MigrationDescriptor> migrations_;
  std::vector<DigestId> migration_to_;
  std::unordered_set<std::string> ids_;
};

// Applies each transform in order. A throwing transform is rethrown as
// std::runtime_error: Migration "<id>" failed: <message>
json::Value apply_migrations(json::Value state, const MigrationPath& path);

} // namespace idlecore
