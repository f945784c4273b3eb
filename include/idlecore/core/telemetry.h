#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "idlecore/util/json.h"

namespace idlecore {

// Sink for engine diagnostics. The engine never throws for recoverable
// problems; it reports them here and keeps ticking.
class Telemetry {
 public:
  virtual ~Telemetry() = default;

  virtual void record_error(const std::string& event, const json::Object& details) = 0;
  virtual void record_warning(const std::string& event, const json::Object& details) = 0;
  virtual void record_progress(const std::string& event, const json::Object& details) = 0;
  virtual void record_counters(const std::string& group, const json::Object& counters) = 0;
  virtual void record_tick(std::int64_t step) = 0;
};

// Default sink: routes everything to idlecore::log.
class LogTelemetry : public Telemetry {
 public:
  void record_error(const std::string& event, const json::Object& details) override;
  void record_warning(const std::string& event, const json::Object& details) override;
  void record_progress(const std::string& event, const json::Object& details) override;
  void record_counters(const std::string& group, const json::Object& counters) override;
  void record_tick(std::int64_t step) override;
};

class NullTelemetry : public Telemetry {
 public:
  void record_error(const std::string&, const json::Object&) override {}
  void record_warning(const std::string&, const json::Object&) override {}
  void record_progress(const std::string&, const json::Object&) override {}
  void record_counters(const std::string&, const json::Object&) override {}
  void record_tick(std::int64_t) override {}
};

enum class TelemetryKind { Error, Warning, Progress, Counters, Tick };

struct TelemetryEntry {
  TelemetryKind kind{TelemetryKind::Warning};
  std::string event;
  json::Object details;
  std::int64_t step{0};
};

// Captures everything in memory. Used by tests and by the CLI summary.
class MemoryTelemetry : public Telemetry {
 public:
  void record_error(const std::string& event, const json::Object& details) override;
  void record_warning(const std::string& event, const json::Object& details) override;
  void record_progress(const std::string& event, const json::Object& details) override;
  void record_counters(const std::string& group, const json::Object& counters) override;
  void record_tick(std::int64_t step) override;

  const std::vector<TelemetryEntry>& entries() const { return entries_; }

  // Number of entries of the given kind whose event/group name matches.
  int count(TelemetryKind kind, const std::string& event) const;

  // Most recent entry matching kind and event, or nullptr.
  const TelemetryEntry* last(TelemetryKind kind, const std::string& event) const;

  void clear() { entries_.clear(); }

 private:
  std::vector<TelemetryEntry> entries_;
};

} // namespace idlecore
