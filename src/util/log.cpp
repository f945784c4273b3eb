#include "idlecore/util/log.h"

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "idlecore/util/strings.h"

namespace idlecore::log {
namespace {

std::mutex g_mu;
std::atomic<Level> g_level{Level::Info};

const char* label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: break;
  }
  return "";
}

void emit(Level l, const std::string& msg) {
  const Level threshold = g_level.load();
  if (threshold == Level::Off || l < threshold) return;
  std::lock_guard<std::mutex> lock(g_mu);
  std::cerr << "[" << label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level.store(lvl); }
Level level() { return g_level.load(); }

Level parse_level(const std::string& name) {
  const std::string s = to_lower(name);
  if (s == "debug") return Level::Debug;
  if (s == "info") return Level::Info;
  if (s == "warn" || s == "warning") return Level::Warn;
  if (s == "error") return Level::Error;
  if (s == "off" || s == "none") return Level::Off;
  throw std::invalid_argument("Unknown log level: " + name);
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace idlecore::log
