#include "idlecore/core/sim_context.h"

namespace idlecore {

SimulationContext::SimulationContext(EngineConfig config, std::shared_ptr<Telemetry> telemetry)
    : config_(std::move(config)), rng_(config_.runtime.fallback_seed) {
  set_telemetry(std::move(telemetry));
  rng_.set_fallback_listener([this](std::uint32_t seed) {
    json::Object details;
    details["seed"] = static_cast<double>(seed);
    telemetry_->record_warning("RngFallbackSeed", details);
  });
}

void SimulationContext::set_telemetry(std::shared_ptr<Telemetry> telemetry) {
  telemetry_ = telemetry ? std::move(telemetry) : std::make_shared<LogTelemetry>();
}

} // namespace idlecore
