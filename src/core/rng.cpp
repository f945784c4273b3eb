#include "idlecore/core/rng.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace idlecore {
namespace {

constexpr double kTwoPow32 = 4294967296.0;
constexpr double kPi = 3.14159265358979323846;

// Below this the exact series needs too many terms; PRD behaves like a
// Rayleigh process there and C ~= pi * p^2 / 2.
constexpr double kTinyProbability = 1e-6;
const double kTinyConstant = kPi * kTinyProbability * kTinyProbability / 2.0;

double sanitize_probability(double p) {
  if (!std::isfinite(p)) return 0.0;
  return std::clamp(p, 0.0, 1.0);
}

} // namespace

SeededRng::SeededRng(std::uint32_t fallback_seed) : fallback_seed_(fallback_seed) {}

void SeededRng::set_seed(std::int64_t seed) {
  const auto s = static_cast<std::uint32_t>(static_cast<std::uint64_t>(seed) & 0xFFFFFFFFull);
  seed_ = s;
  state_ = s == 0 ? 1u : s;
  seeded_ = true;
}

void SeededRng::set_state(double state) {
  if (!std::isfinite(state)) throw std::invalid_argument("RNG state must be a finite number.");
  double m = std::fmod(std::trunc(state), kTwoPow32);
  if (m < 0) m += kTwoPow32;
  state_ = static_cast<std::uint32_t>(m);
  seeded_ = true;
}

double SeededRng::next() {
  if (!seeded_) {
    set_seed(fallback_seed_);
    if (on_fallback_) on_fallback_(fallback_seed_);
  }
  state_ += 0x6D2B79F5u;
  std::uint32_t t = state_;
  t = (t ^ (t >> 15)) * (t | 1u);
  t ^= t + (t ^ (t >> 7)) * (t | 61u);
  return static_cast<double>(t ^ (t >> 14)) / kTwoPow32;
}

void SeededRng::reset() {
  seed_.reset();
  state_ = 0;
  seeded_ = false;
}

double prd_average_probability(double constant) {
  if (!std::isfinite(constant) || constant <= 0.0) return 0.0;
  if (constant >= 1.0) return 1.0;
  if (constant < kTinyConstant) return std::sqrt(2.0 * constant / kPi);

  const double max_attempts = std::ceil(1.0 / constant);
  double expected_attempts = 0.0;
  double not_yet = 1.0;
  for (double n = 1.0; n <= max_attempts; n += 1.0) {
    const double p = std::min(1.0, n * constant);
    expected_attempts += n * not_yet * p;
    not_yet *= 1.0 - p;
    if (not_yet < 1e-18) break;
  }
  if (expected_attempts <= 0.0) return 0.0;
  return 1.0 / expected_attempts;
}

double prd_constant(double p) {
  if (!std::isfinite(p) || p <= 0.0) return 0.0;
  if (p >= 1.0) return 1.0;
  if (p < kTinyProbability) return kPi * p * p / 2.0;

  double lo = 0.0;
  double hi = p;
  for (int i = 0; i < 100; ++i) {
    const double mid = 0.5 * (lo + hi);
    if (mid <= lo || mid >= hi) break;
    if (prd_average_probability(mid) < p) {
      lo = mid;
    } else {
      hi = mid;
    }
  }
  return 0.5 * (lo + hi);
}

PseudoRandomDistribution::PseudoRandomDistribution(double base_probability, Draw draw)
    : draw_(std::move(draw)) {
  state_.constant = prd_constant(sanitize_probability(base_probability));
}

PseudoRandomDistribution PseudoRandomDistribution::from_state(const PrdState& state, Draw draw) {
  PseudoRandomDistribution prd(0.0, std::move(draw));
  prd.state_.attempts = state.attempts < 0 ? 0 : state.attempts;
  prd.state_.constant = std::isfinite(state.constant) ? std::clamp(state.constant, 0.0, 1.0) : 0.0;
  return prd;
}

bool PseudoRandomDistribution::roll() {
  const double p = current_probability();
  if (draw_() < p) {
    state_.attempts = 0;
    return true;
  }
  ++state_.attempts;
  return false;
}

void PseudoRandomDistribution::update_base_probability(double p) {
  p = sanitize_probability(p);
  const double current = base_probability();
  if (std::fabs(p - current) <= 1e-6 * std::max(std::fabs(p), std::fabs(current))) return;
  state_.constant = prd_constant(p);
  state_.attempts = 0;
}

double PseudoRandomDistribution::current_probability() const {
  return std::min(1.0, state_.constant * (state_.attempts + 1));
}

double PseudoRandomDistribution::base_probability() const {
  return prd_average_probability(state_.constant);
}

PrdRegistry::PrdRegistry(PseudoRandomDistribution::Draw draw) : draw_(std::move(draw)) {}

PseudoRandomDistribution& PrdRegistry::get_or_create(const std::string& id, double base_probability) {
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    auto prd = std::make_unique<PseudoRandomDistribution>(base_probability, draw_);
    it = entries_.emplace(id, std::move(prd)).first;
  } else {
    it->second->update_base_probability(base_probability);
  }
  return *it->second;
}

json::Value PrdRegistry::capture_state() const {
  json::Object out;
  for (const auto& [id, prd] : entries_) {
    json::Object s;
    s["attempts"] = static_cast<double>(prd->state().attempts);
    s["constant"] = prd->state().constant;
    out[id] = json::object(std::move(s));
  }
  return json::object(std::move(out));
}

void PrdRegistry::restore_state(const json::Value& state) {
  entries_.clear();
  const json::Object* o = state.as_object();
  if (!o) return;
  for (const auto& [id, v] : *o) {
    PrdState s;
    const double attempts = v.find("attempts") ? v.at("attempts").number_value(0.0) : 0.0;
    s.attempts = std::isfinite(attempts) && attempts > 0 ? static_cast<int>(attempts) : 0;
    s.constant = v.find("constant") ? v.at("constant").number_value(0.0) : 0.0;
    entries_.emplace(id, std::make_unique<PseudoRandomDistribution>(
                             PseudoRandomDistribution::from_state(s, draw_)));
  }
}

} // namespace idlecore
