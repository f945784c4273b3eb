#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace idlecore {

class EventBus;

struct TickContext {
  std::int64_t step{0};
  double delta_ms{0.0};
  // Simulated time at the start of this step.
  double time_ms{0.0};
  EventBus* events{nullptr};
};

// A per-step pass registered with the Runtime. Systems run in registration
// order; a throwing system is reported and the others still run.
struct TickSystem {
  std::string id;
  std::function<void(const TickContext&)> tick;
};

} // namespace idlecore
