#include "idlecore/core/telemetry.h"

#include "idlecore/util/log.h"

namespace idlecore {
namespace {

std::string render(const std::string& event, const json::Object& details) {
  if (details.empty()) return event;
  return event + " " + json::stringify(json::object(details), 0);
}

} // namespace

void LogTelemetry::record_error(const std::string& event, const json::Object& details) {
  log::error(render(event, details));
}

void LogTelemetry::record_warning(const std::string& event, const json::Object& details) {
  log::warn(render(event, details));
}

void LogTelemetry::record_progress(const std::string& event, const json::Object& details) {
  log::info(render(event, details));
}

void LogTelemetry::record_counters(const std::string& group, const json::Object& counters) {
  if (log::level() > log::Level::Debug) return;
  log::debug("counters " + render(group, counters));
}

void LogTelemetry::record_tick(std::int64_t step) {
  if (log::level() > log::Level::Debug) return;
  log::debug("tick " + std::to_string(step));
}

void MemoryTelemetry::record_error(const std::string& event, const json::Object& details) {
  entries_.push_back(TelemetryEntry{TelemetryKind::Error, event, details, 0});
}

void MemoryTelemetry::record_warning(const std::string& event, const json::Object& details) {
  entries_.push_back(TelemetryEntry{TelemetryKind::Warning, event, details, 0});
}

void MemoryTelemetry::record_progress(const std::string& event, const json::Object& details) {
  entries_.push_back(TelemetryEntry{TelemetryKind::Progress, event, details, 0});
}

void MemoryTelemetry::record_counters(const std::string& group, const json::Object& counters) {
  entries_.push_back(TelemetryEntry{TelemetryKind::Counters, group, counters, 0});
}

void MemoryTelemetry::record_tick(std::int64_t step) {
  entries_.push_back(TelemetryEntry{TelemetryKind::Tick, std::string(), json::Object{}, step});
}

int MemoryTelemetry::count(TelemetryKind kind, const std::string& event) const {
  int n = 0;
  for (const auto& e : entries_) {
    if (e.kind == kind && e.event == event) ++n;
  }
  return n;
}

const TelemetryEntry* MemoryTelemetry::last(TelemetryKind kind, const std::string& event) const {
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->kind == kind && it->event == event) return &*it;
  }
  return nullptr;
}

} // namespace idlecore
