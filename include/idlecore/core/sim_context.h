#pragma once

#include <memory>

#include "idlecore/core/config.h"
#include "idlecore/core/rng.h"
#include "idlecore/core/telemetry.h"

namespace idlecore {

// Per-simulation services. Everything that used to be process-wide (RNG,
// telemetry sink, tuning constants) hangs off one of these, so two runtimes
// in one process never share state.
class SimulationContext {
 public:
  explicit SimulationContext(EngineConfig config = {}, std::shared_ptr<Telemetry> telemetry = nullptr);

  SimulationContext(const SimulationContext&) = delete;
  SimulationContext& operator=(const SimulationContext&) = delete;

  const EngineConfig& config() const { return config_; }

  Telemetry& telemetry() { return *telemetry_; }
  const std::shared_ptr<Telemetry>& telemetry_ptr() const { return telemetry_; }

  // A null sink falls back to LogTelemetry.
  void set_telemetry(std::shared_ptr<Telemetry> telemetry);

  SeededRng& rng() { return rng_; }
  const SeededRng& rng() const { return rng_; }

 private:
  EngineConfig config_;
  std::shared_ptr<Telemetry> telemetry_;
  SeededRng rng_;
};

} // namespace idlecore
