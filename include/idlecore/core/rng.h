#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "idlecore/util/json.h"

namespace idlecore {

// mulberry32 generator. Deterministic across platforms: the full state is a
// single uint32 that round-trips exactly through a JSON number.
class SeededRng {
 public:
  explicit SeededRng(std::uint32_t fallback_seed = 0x1D1E5EEDu);

  // Only the low 32 bits are kept. A zero seed starts from state 1.
  void set_seed(std::int64_t seed);
  std::optional<std::uint32_t> seed() const { return seed_; }

  // Exact resume. set_state() throws std::invalid_argument on non-finite values.
  double state() const { return static_cast<double>(state_); }
  void set_state(double state);

  // Uniform draw in [0, 1). Drawing before any seed applies the fallback seed
  // and notifies the fallback listener.
  double next();

  // Forgets the seed; the next draw falls back again.
  void reset();

  void set_fallback_listener(std::function<void(std::uint32_t)> fn) { on_fallback_ = std::move(fn); }

 private:
  std::uint32_t fallback_seed_;
  std::optional<std::uint32_t> seed_;
  std::uint32_t state_{0};
  bool seeded_{false};
  std::function<void(std::uint32_t)> on_fallback_;
};

// Constant C such that rolling with probability min(1, C * n) on the n-th
// attempt since the last success averages out to p.
double prd_constant(double p);

// Inverse of prd_constant: the long-run success rate produced by C.
double prd_average_probability(double constant);

struct PrdState {
  int attempts{0};
  double constant{0.0};
};

// Pseudo-random distribution: each failure raises the next roll's chance, so
// long droughts are impossible while the average rate stays at p.
class PseudoRandomDistribution {
 public:
  using Draw = std::function<double()>;

  PseudoRandomDistribution(double base_probability, Draw draw);

  static PseudoRandomDistribution from_state(const PrdState& state, Draw draw);

  bool roll();

  // Changes smaller than a millionth (relative) keep the attempt counter.
  void update_base_probability(double p);

  void reset() { state_.attempts = 0; }

  double current_probability() const;
  double base_probability() const;
  const PrdState& state() const { return state_; }

 private:
  PrdState state_;
  Draw draw_;
};

// Per-id PRDs for a simulation, persisted in the snapshot.
class PrdRegistry {
 public:
  explicit PrdRegistry(PseudoRandomDistribution::Draw draw);

  // Creates the entry, or retunes an existing one to base_probability.
  PseudoRandomDistribution& get_or_create(const std::string& id, double base_probability);

  bool contains(const std::string& id) const { return entries_.count(id) != 0; }

  // {id: {attempts, constant}} in id order.
  json::Value capture_state() const;

  // Replaces all entries. A null value clears the registry.
  void restore_state(const json::Value& state);

 private:
  PseudoRandomDistribution::Draw draw_;
  std::map<std::string, std::unique_ptr<PseudoRandomDistribution>> entries_;
};

} // namespace idlecore
