#include "idlecore/core/resource_state.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "idlecore/core/sim_context.h"
#include "idlecore/util/digest.h"
#include "idlecore/util/log.h"

namespace idlecore {
namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

void require_finite_non_negative(const char* what, double v) {
  if (!std::isfinite(v) || v < 0.0) {
    std::ostringstream ss;
    ss << what << " must be a finite, non-negative number (got " << v << ")";
    throw std::invalid_argument(ss.str());
  }
}

void check_length(const char* field, std::size_t got, std::size_t expected) {
  if (got == expected) return;
  throw std::runtime_error(std::string("Serialized resource field \"") + field + "\" has length " +
                           std::to_string(got) + "; expected " + std::to_string(expected) + ".");
}

json::Array to_json_strings(const std::vector<std::string>& v) {
  json::Array out;
  out.reserve(v.size());
  for (const auto& s : v) out.push_back(std::string(s));
  return out;
}

} // namespace

ResourceDigest compute_resource_digest(const std::vector<std::string>& ids) {
  ResourceDigest d;
  d.ids = ids;
  d.version = static_cast<int>(ids.size());
  d.hash = "fnv1a-" + digest32_to_hex(fnv1a32_ids(ids));
  return d;
}

json::Value resource_digest_to_json(const ResourceDigest& d) {
  json::Object o;
  o["hash"] = std::string(d.hash);
  o["version"] = static_cast<double>(d.version);
  o["ids"] = to_json_strings(d.ids);
  return json::object(std::move(o));
}

ResourceDigest resource_digest_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Resource digest must be an object.");
  std::vector<std::string> ids;
  for (const auto& id : v.at("ids").array()) {
    const std::string* s = id.as_string();
    if (!s) throw std::runtime_error("Resource digest ids must be strings.");
    ids.push_back(*s);
  }
  ResourceDigest expected = compute_resource_digest(ids);
  const std::string hash = v.at("hash").string_value();
  const std::int64_t version = v.at("version").int_value(-1);
  if (hash != expected.hash || version != expected.version) {
    throw std::runtime_error("Resource digest " + hash + " (version " + std::to_string(version) +
                             ") does not match its ids (expected " + expected.hash + ", version " +
                             std::to_string(expected.version) + ").");
  }
  return expected;
}

json::Value serialized_resources_to_json(const SerializedResourceState& s) {
  json::Object o;
  o["ids"] = to_json_strings(s.ids);

  json::Array amounts;
  for (double a : s.amounts) amounts.push_back(a);
  o["amounts"] = std::move(amounts);

  json::Array caps;
  for (const auto& c : s.capacities) {
    if (c && std::isfinite(*c)) {
      caps.push_back(*c);
    } else {
      caps.push_back(nullptr);
    }
  }
  o["capacities"] = std::move(caps);

  json::Array unlocked;
  for (bool b : s.unlocked) unlocked.push_back(b);
  o["unlocked"] = std::move(unlocked);

  json::Array visible;
  for (bool b : s.visible) visible.push_back(b);
  o["visible"] = std::move(visible);

  json::Array flags;
  for (int f : s.flags) flags.push_back(static_cast<double>(f));
  o["flags"] = std::move(flags);

  if (s.definition_digest) o["definitionDigest"] = resource_digest_to_json(*s.definition_digest);
  return json::object(std::move(o));
}

SerializedResourceState serialized_resources_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Serialized resource state must be an object.");
  SerializedResourceState s;
  for (const auto& id : v.at("ids").array()) s.ids.push_back(id.string_value());
  for (const auto& a : v.at("amounts").array()) {
    const double* n = a.as_number();
    s.amounts.push_back(n ? *n : std::numeric_limits<double>::quiet_NaN());
  }
  for (const auto& c : v.at("capacities").array()) {
    if (c.is_null()) {
      s.capacities.push_back(std::nullopt);
    } else {
      const double* n = c.as_number();
      s.capacities.push_back(n ? *n : std::numeric_limits<double>::quiet_NaN());
    }
  }
  if (const json::Value* u = v.find("unlocked")) {
    for (const auto& b : u->array()) s.unlocked.push_back(b.bool_value());
  }
  if (const json::Value* vis = v.find("visible")) {
    for (const auto& b : vis->array()) s.visible.push_back(b.bool_value());
  }
  for (const auto& f : v.at("flags").array()) {
    const double* n = f.as_number();
    s.flags.push_back(n && std::isfinite(*n) && std::floor(*n) == *n && std::fabs(*n) < 1e9 ? static_cast<int>(*n) : -1);
  }
  if (const json::Value* d = v.find("definitionDigest"); d && !d->is_null()) {
    s.definition_digest = resource_digest_from_json(*d);
  }
  return s;
}

ResourceState::ResourceState(SimulationContext& ctx, const std::vector<ResourceDefinition>& definitions)
    : ctx_(ctx) {
  const std::size_t n = definitions.size();
  ids_.reserve(n);
  amounts_.assign(n, 0.0);
  capacities_.assign(n, kInf);
  income_per_second_.assign(n, 0.0);
  expense_per_second_.assign(n, 0.0);
  net_per_second_.assign(n, 0.0);
  tick_delta_.assign(n, 0.0);
  flags_.assign(n, 0);
  dirty_tolerance_.assign(n, std::nullopt);

  for (std::size_t i = 0; i < n; ++i) {
    const ResourceDefinition& def = definitions[i];
    if (def.id.empty()) throw std::invalid_argument("Resource definition id must be non-empty");
    if (!index_by_id_.emplace(def.id, i).second) {
      throw std::invalid_argument("Duplicate resource definition id: " + def.id);
    }
    ids_.push_back(def.id);

    double cap = kInf;
    if (def.capacity) {
      if (std::isnan(*def.capacity) || *def.capacity < 0.0) {
        throw std::invalid_argument("Resource " + def.id + " has an invalid capacity");
      }
      cap = *def.capacity;
    }
    require_finite_non_negative("Resource start amount", def.start_amount);
    capacities_[i] = cap;
    amounts_[i] = std::min(def.start_amount, cap);

    std::uint8_t f = 0;
    if (def.unlocked) f |= kResourceUnlocked;
    if (def.visible) f |= kResourceVisible;
    flags_[i] = f;

    if (def.dirty_tolerance) {
      if (!std::isfinite(*def.dirty_tolerance) || *def.dirty_tolerance < 0.0) {
        throw std::invalid_argument("Resource " + def.id + " has an invalid dirty tolerance");
      }
      dirty_tolerance_[i] = def.dirty_tolerance;
    }
  }

  digest_ = compute_resource_digest(ids_);

  // The initial state counts as published; the first snapshot reports only
  // what changed afterwards.
  published_amounts_ = amounts_;
  published_capacities_ = capacities_;
  published_net_ = net_per_second_;
  published_flags_ = flags_;
}

std::optional<std::size_t> ResourceState::find_index(const std::string& id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) return std::nullopt;
  return it->second;
}

std::size_t ResourceState::require_index(const std::string& id) const {
  auto it = index_by_id_.find(id);
  if (it == index_by_id_.end()) throw std::out_of_range("ResourceUnknownId: " + id);
  return it->second;
}

const std::string& ResourceState::id_at(std::size_t index) const {
  check_index(index);
  return ids_[index];
}

void ResourceState::check_index(std::size_t index) const {
  if (index >= ids_.size()) {
    throw std::out_of_range("ResourceIndexViolation: index " + std::to_string(index) + " (size " +
                            std::to_string(ids_.size()) + ")");
  }
}

double ResourceState::amount(std::size_t index) const {
  check_index(index);
  return amounts_[index];
}

double ResourceState::capacity(std::size_t index) const {
  check_index(index);
  return capacities_[index];
}

double ResourceState::net_per_second(std::size_t index) const {
  check_index(index);
  return net_per_second_[index];
}

double ResourceState::tick_delta(std::size_t index) const {
  check_index(index);
  return tick_delta_[index];
}

bool ResourceState::is_unlocked(std::size_t index) const {
  check_index(index);
  return (flags_[index] & kResourceUnlocked) != 0;
}

bool ResourceState::is_visible(std::size_t index) const {
  check_index(index);
  return (flags_[index] & kResourceVisible) != 0;
}

bool ResourceState::is_dirty(std::size_t index) const {
  check_index(index);
  return (flags_[index] & kResourceDirty) != 0;
}

double ResourceState::tolerance(std::size_t index, double a, double b) const {
  const PrecisionConfig& p = ctx_.config().precision;
  const auto& override_tol = dirty_tolerance_[index];
  const double ceiling = override_tol
                             ? std::clamp(*override_tol, p.dirty_epsilon_absolute, p.dirty_epsilon_override_max)
                             : p.dirty_epsilon_ceiling;
  const double scale = std::max(std::fabs(a), std::fabs(b));
  double tol = std::max(p.dirty_epsilon_absolute, std::min(ceiling, p.dirty_epsilon_relative * scale));
  if (override_tol) tol = std::max(tol, ceiling);
  return tol;
}

bool ResourceState::epsilon_equals(std::size_t index, double a, double b) const {
  check_index(index);
  if (a == b) return true;
  const double diff = std::fabs(a - b);
  if (std::isnan(diff)) return false;
  return diff <= tolerance(index, a, b);
}

void ResourceState::refresh_dirty(std::size_t i) {
  const std::uint8_t visible_flags = flags_[i] & static_cast<std::uint8_t>(~kResourceDirty);
  const bool clean = epsilon_equals(i, amounts_[i], published_amounts_[i]) &&
                     epsilon_equals(i, capacities_[i], published_capacities_[i]) &&
                     epsilon_equals(i, net_per_second_[i], published_net_[i]) &&
                     visible_flags == published_flags_[i];
  if (clean) {
    flags_[i] = visible_flags;
  } else {
    flags_[i] = visible_flags | kResourceDirty;
  }
}

void ResourceState::write_amount(std::size_t index, double value) {
  const double clamped = std::clamp(value, 0.0, capacities_[index]);
  tick_delta_[index] += clamped - amounts_[index];
  amounts_[index] = clamped;
  refresh_dirty(index);
}

double ResourceState::add_amount(std::size_t index, double amount) {
  check_index(index);
  require_finite_non_negative("Resource add amount", amount);
  if (amount == 0.0) return 0.0;
  const double before = amounts_[index];
  write_amount(index, before + amount);
  return amounts_[index] - before;
}

double ResourceState::reset_amount(std::size_t index, double value) {
  check_index(index);
  write_amount(index, std::isfinite(value) ? value : 0.0);
  return amounts_[index];
}

bool ResourceState::spend_amount(std::size_t index, double amount, const ResourceSpendContext& ctx) {
  check_index(index);
  require_finite_non_negative("Resource spend amount", amount);
  if (amount == 0.0) return true;

  // Strict: the dirty tolerance only decides what gets republished.
  const double available = amounts_[index];
  if (available < amount) {
    json::Object details;
    details["resourceId"] = std::string(ids_[index]);
    details["requested"] = amount;
    details["available"] = available;
    if (!ctx.command_id.empty()) details["commandId"] = std::string(ctx.command_id);
    if (!ctx.system_id.empty()) details["systemId"] = std::string(ctx.system_id);
    ctx_.telemetry().record_warning("ResourceSpendFailed", details);
    return false;
  }
  write_amount(index, available - amount);
  return true;
}

double ResourceState::set_capacity(std::size_t index, double capacity) {
  check_index(index);
  if (std::isnan(capacity) || capacity < 0.0) {
    throw std::invalid_argument("Resource capacity must be non-negative (got " + std::to_string(capacity) + ")");
  }
  capacities_[index] = capacity;
  if (amounts_[index] > capacity) {
    write_amount(index, capacity);
  } else {
    refresh_dirty(index);
  }
  return capacity;
}

void ResourceState::unlock(std::size_t index) {
  check_index(index);
  if (flags_[index] & kResourceUnlocked) return;
  flags_[index] |= kResourceUnlocked;
  refresh_dirty(index);
}

void ResourceState::grant_visibility(std::size_t index) {
  check_index(index);
  if (flags_[index] & kResourceVisible) return;
  flags_[index] |= kResourceVisible;
  refresh_dirty(index);
}

void ResourceState::apply_income(std::size_t index, double per_second) {
  check_index(index);
  require_finite_non_negative("Resource income", per_second);
  income_per_second_[index] += per_second;
}

void ResourceState::apply_expense(std::size_t index, double per_second) {
  check_index(index);
  require_finite_non_negative("Resource expense", per_second);
  expense_per_second_[index] += per_second;
}

void ResourceState::finalize_tick(double delta_ms) {
  if (!std::isfinite(delta_ms) || delta_ms < 0.0) {
    throw std::invalid_argument("finalize_tick delta must be finite and non-negative");
  }
  const double seconds = delta_ms / 1000.0;
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    const double net = income_per_second_[i] - expense_per_second_[i];
    net_per_second_[i] = net;
    income_per_second_[i] = 0.0;
    expense_per_second_[i] = 0.0;
    if (net != 0.0 && seconds > 0.0) {
      write_amount(i, amounts_[i] + net * seconds);
    } else {
      refresh_dirty(i);
    }
  }
}

void ResourceState::reset_tick_deltas() {
  std::fill(tick_delta_.begin(), tick_delta_.end(), 0.0);
}

void ResourceState::set_dirty_tolerance(std::size_t index, std::optional<double> tolerance) {
  check_index(index);
  if (tolerance && (!std::isfinite(*tolerance) || *tolerance < 0.0)) {
    throw std::invalid_argument("Dirty tolerance must be finite and non-negative");
  }
  dirty_tolerance_[index] = tolerance;
}

ResourcePublishSnapshot ResourceState::snapshot_for_publish() {
  ResourcePublishSnapshot snap;
  snap.ids = ids_;
  snap.amounts = amounts_;
  snap.capacities = capacities_;
  snap.net_per_second = net_per_second_;
  snap.tick_delta = tick_delta_;
  snap.flags.reserve(flags_.size());

  for (std::size_t i = 0; i < ids_.size(); ++i) {
    if (flags_[i] & kResourceDirty) snap.dirty_indices.push_back(i);
    flags_[i] &= static_cast<std::uint8_t>(~kResourceDirty);
    snap.flags.push_back(flags_[i]);
  }

  published_amounts_ = amounts_;
  published_capacities_ = capacities_;
  published_net_ = net_per_second_;
  published_flags_ = flags_;
  return snap;
}

SerializedResourceState ResourceState::export_for_save() const {
  SerializedResourceState s;
  s.ids = ids_;
  s.amounts = amounts_;
  for (std::size_t i = 0; i < ids_.size(); ++i) {
    if (std::isfinite(capacities_[i])) {
      s.capacities.push_back(capacities_[i]);
    } else {
      s.capacities.push_back(std::nullopt);
    }
    s.unlocked.push_back((flags_[i] & kResourceUnlocked) != 0);
    s.visible.push_back((flags_[i] & kResourceVisible) != 0);
    s.flags.push_back(flags_[i] & ~kResourceDirty);
  }
  s.definition_digest = digest_;
  return s;
}

ResourceReconciliation ResourceState::reconcile(const SerializedResourceState& saved) {
  const std::size_t n = saved.ids.size();
  check_length("amounts", saved.amounts.size(), n);
  check_length("capacities", saved.capacities.size(), n);
  check_length("flags", saved.flags.size(), n);
  if (!saved.unlocked.empty()) check_length("unlocked", saved.unlocked.size(), n);
  if (!saved.visible.empty()) check_length("visible", saved.visible.size(), n);

  std::unordered_set<std::string> seen;
  for (const auto& id : saved.ids) {
    if (id.empty()) throw std::runtime_error("Serialized resource ids must be non-empty strings.");
    if (!seen.insert(id).second) {
      throw std::runtime_error("Serialized resource id \"" + id + "\" appears multiple times.");
    }
  }

  for (std::size_t i = 0; i < n; ++i) {
    const double a = saved.amounts[i];
    if (!std::isfinite(a) || a < 0.0) {
      throw std::runtime_error("Serialized amount for \"" + saved.ids[i] + "\" must be finite and non-negative.");
    }
    if (saved.capacities[i]) {
      const double c = *saved.capacities[i];
      if (std::isnan(c) || c < 0.0) {
        throw std::runtime_error("Serialized capacity for \"" + saved.ids[i] + "\" must be null or non-negative.");
      }
    }
    if (saved.flags[i] < 0 || saved.flags[i] > 255) {
      throw std::runtime_error("Serialized flags for \"" + saved.ids[i] + "\" must be an integer in [0, 255].");
    }
  }

  const ResourceDigest received = saved.definition_digest ? *saved.definition_digest : compute_resource_digest(saved.ids);

  ResourceReconciliation result;
  for (std::size_t i = 0; i < n; ++i) {
    const auto live = find_index(saved.ids[i]);
    if (!live) {
      result.removed_ids.push_back(saved.ids[i]);
      continue;
    }
    const std::size_t li = *live;
    capacities_[li] = saved.capacities[i] ? *saved.capacities[i] : kInf;

    const std::uint8_t f = static_cast<std::uint8_t>(saved.flags[i]);
    const bool unlocked = saved.unlocked.empty() ? (f & kResourceUnlocked) != 0 : saved.unlocked[i];
    const bool visible = saved.visible.empty() ? (f & kResourceVisible) != 0 : saved.visible[i];
    if (unlocked) flags_[li] |= kResourceUnlocked;
    if (visible) flags_[li] |= kResourceVisible;

    const double target = std::min(saved.amounts[i], capacities_[li]);
    amounts_[li] = target;
    refresh_dirty(li);
  }

  for (const auto& id : ids_) {
    if (!seen.count(id)) result.added_ids.push_back(id);
  }
  result.digests_match = received == digest_;
  if (!result.digests_match) {
    log::debug("Resource digest mismatch on load: saved " + received.hash + " (" + std::to_string(received.version) +
               " ids), live " + digest_.hash + " (" + std::to_string(digest_.version) + " ids); " +
               std::to_string(result.added_ids.size()) + " added, " + std::to_string(result.removed_ids.size()) +
               " dropped");
  }
  return result;
}

} // namespace idlecore
