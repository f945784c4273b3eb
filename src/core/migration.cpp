#include "idlecore/core/migration.h"

#include <deque>
#include <optional>
#include <stdexcept>

namespace idlecore {
namespace {

std::string composite_key(const ResourceDigest& d) { return std::to_string(d.version) + ":" + d.hash; }

void validate_digest(const MigrationDescriptor& desc, const ResourceDigest& d, const char* which) {
  const ResourceDigest computed = compute_resource_digest(d.ids);
  if (d.version != static_cast<int>(d.ids.size())) {
    throw std::invalid_argument("Migration \"" + desc.id + "\" " + which + " digest " + d.hash + " has version " +
                                std::to_string(d.version) + " but lists " + std::to_string(d.ids.size()) + " ids");
  }
  if (computed.hash != d.hash) {
    throw std::invalid_argument("Migration \"" + desc.id + "\" " + which + " digest " + d.hash +
                                " does not match its ids (expected " + computed.hash + ")");
  }
}

} // namespace

MigrationRegistry::DigestId MigrationRegistry::intern(const ResourceDigest& d) {
  const std::string key = composite_key(d);
  if (auto it = digest_index_.find(key); it != digest_index_.end()) return it->second;
  const DigestId id = digest_keys_.size();
  digest_keys_.push_back(key);
  digest_index_.emplace(key, id);
  edges_.emplace_back();
  return id;
}

bool MigrationRegistry::lookup(const ResourceDigest& d, DigestId* out) const {
  auto it = digest_index_.find(composite_key(d));
  if (it == digest_index_.end()) return false;
  *out = it->second;
  return true;
}

void MigrationRegistry::register_migration(MigrationDescriptor desc) {
  if (desc.id.empty()) throw std::invalid_argument("Migration id must not be empty");
  if (ids_.count(desc.id)) throw std::invalid_argument("Migration \"" + desc.id + "\" is already registered");
  if (!desc.transform) throw std::invalid_argument("Migration \"" + desc.id + "\" has no transform");

  validate_digest(desc, desc.from_digest, "from");
  validate_digest(desc, desc.to_digest, "to");

  const std::string from_key = composite_key(desc.from_digest);
  const std::string to_key = composite_key(desc.to_digest);
  if (from_key == to_key) {
    throw std::invalid_argument("Migration \"" + desc.id + "\" maps digest " + from_key + " onto itself");
  }

  DigestId from_id = 0;
  DigestId to_id = 0;
  if (lookup(desc.from_digest, &from_id) && lookup(desc.to_digest, &to_id)) {
    for (std::size_t m : edges_[from_id]) {
      if (migration_to_[m] == to_id) {
        throw std::invalid_argument("Migration \"" + desc.id + "\" duplicates edge " + from_key + " -> " + to_key +
                                    " already registered by \"" + migrations_[m].id + "\"");
      }
    }
  }

  from_id = intern(desc.from_digest);
  to_id = intern(desc.to_digest);
  edges_[from_id].push_back(migrations_.size());
  migration_to_.push_back(to_id);
  ids_.insert(desc.id);
  migrations_.push_back(std::move(desc));
}

MigrationPath MigrationRegistry::find_migration_path(const ResourceDigest& from, const ResourceDigest& to) const {
  MigrationPath path;
  if (composite_key(from) == composite_key(to)) {
    path.found = true;
    return path;
  }

  DigestId start = 0;
  DigestId goal = 0;
  if (!lookup(from, &start) || !lookup(to, &goal)) return path;

  // via[n] = migration index used to reach digest n.
  std::vector<std::optional<std::size_t>> via(digest_keys_.size());
  std::vector<bool> seen(digest_keys_.size(), false);
  std::deque<DigestId> frontier;
  frontier.push_back(start);
  seen[start] = true;

  while (!frontier.empty()) {
    const DigestId node = frontier.front();
    frontier.pop_front();
    if (node == goal) break;
    for (std::size_t m : edges_[node]) {
      const DigestId next = migration_to_[m];
      if (seen[next]) continue;
      seen[next] = true;
      via[next] = m;
      frontier.push_back(next);
    }
  }
  if (!seen[goal]) return path;

  std::vector<std::size_t> chain;
  for (DigestId n = goal; n != start;) {
    const std::size_t m = *via[n];
    chain.push_back(m);
    DigestId prev = 0;
    lookup(migrations_[m].from_digest, &prev);
    n = prev;
  }
  path.found = true;
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) path.migrations.push_back(migrations_[*it]);
  return path;
}

json::Value apply_migrations(json::Value state, const MigrationPath& path) {
  for (const auto& m : path.migrations) {
    try {
      state = m.transform(state);
    } catch (const std::exception& e) {
      throw std::runtime_error("Migration \"" + m.id + "\" failed: " + e.what());
    }
  }
  return state;
}

} // namespace idlecore
