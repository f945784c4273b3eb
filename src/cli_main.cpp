#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "idlecore/core/config.h"
#include "idlecore/core/content.h"
#include "idlecore/core/replay.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/snapshot.h"
#include "idlecore/util/json.h"
#include "idlecore/util/log.h"

namespace {

#ifndef IDLECORE_VERSION
#define IDLECORE_VERSION "unknown"
#endif

long long get_int_arg(int argc, char** argv, const std::string& key, long long def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoll(argv[i + 1]);
  }
  return def;
}

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "idlecore CLI v" << IDLECORE_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "idlecore_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --content PATH    Content pack JSON (default: data/sample_pack.json)\n";
  std::cout << "  --config PATH     Engine config JSON (precision/limits/runtime overrides)\n";
  std::cout << "  --steps N         Run N fixed steps (default: 100)\n";
  std::cout << "  --seed N          Seed the simulation RNG\n";
  std::cout << "  --offline-ms N    Issue an OFFLINE_CATCHUP for N ms before stepping\n";
  std::cout << "  --load PATH       Resume from a save file before stepping\n";
  std::cout << "  --save PATH       Write a save file after stepping\n";
  std::cout << "  --record PATH     Record the session as a replay (JSON lines)\n";
  std::cout << "  --verify PATH     Replay a recording against --content and check its checksum, then exit\n";
  std::cout << "  --validate-content  Load the content pack and exit\n";
  std::cout << "  --dump            Print the final snapshot JSON to stdout\n";
  std::cout << "  --log-level L     debug|info|warn|error|off (default: warn)\n";
  std::cout << "  --quiet           Suppress the summary output\n";
  std::cout << "  -h, --help        Show this help\n";
  std::cout << "  --version         Print version and exit\n";
}

void print_summary(idlecore::Runtime& runtime, const std::string& checksum) {
  const auto& res = runtime.resources();
  std::cout << "Step: " << runtime.current_step() << " (" << runtime.step_size_ms() << " ms/step)\n";
  std::cout << "Resources:\n";
  for (std::size_t i = 0; i < res.size(); ++i) {
    if (!res.is_visible(i)) continue;
    std::cout << "  " << std::left << std::setw(16) << res.id_at(i) << std::right << std::setw(14) << std::fixed
              << std::setprecision(2) << res.amount(i);
    if (std::isfinite(res.capacity(i))) std::cout << " / " << res.capacity(i);
    std::cout << "  (" << res.net_per_second(i) << "/s)\n";
  }
  std::cout.unsetf(std::ios::floatfield);

  const auto& content = runtime.content();
  bool header = false;
  for (const auto& g : content.generators) {
    const auto* st = runtime.progression().generator(g.id);
    if (!st || st->owned == 0) continue;
    if (!header) {
      std::cout << "Generators:\n";
      header = true;
    }
    std::cout << "  " << g.id << " x" << st->owned << (st->enabled ? "" : " (disabled)") << "\n";
  }

  header = false;
  for (const auto& a : runtime.achievements().states()) {
    if (a.completions == 0) continue;
    if (!header) {
      std::cout << "Achievements:\n";
      header = true;
    }
    std::cout << "  " << a.id;
    if (a.completions > 1) std::cout << " x" << a.completions;
    std::cout << "\n";
  }
  for (const auto& p : runtime.prestige().states()) {
    if (p.unlocked) std::cout << "Prestige available: " << p.id << "\n";
  }
  std::cout << "Checksum: " << checksum << "\n";
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << IDLECORE_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    idlecore::log::set_level(idlecore::log::parse_level(get_str_arg(argc, argv, "--log-level", "warn")));

    const std::string content_path = get_str_arg(argc, argv, "--content", "data/sample_pack.json");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const long long steps = get_int_arg(argc, argv, "--steps", 100);
    const std::string load_path = get_str_arg(argc, argv, "--load", "");
    const std::string save_path = get_str_arg(argc, argv, "--save", "");
    const std::string record_path = get_str_arg(argc, argv, "--record", "");
    const std::string verify_path = get_str_arg(argc, argv, "--verify", "");
    const double offline_ms = get_double_arg(argc, argv, "--offline-ms", 0.0);

    const bool quiet = has_flag(argc, argv, "--quiet");
    const bool dump = has_flag(argc, argv, "--dump");

    if (steps < 0) {
      std::cerr << "--steps must be non-negative\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const idlecore::EngineConfig config =
        config_path.empty() ? idlecore::EngineConfig{} : idlecore::load_engine_config(config_path);
    const idlecore::ContentPack content = idlecore::load_content_pack(content_path);

    if (has_flag(argc, argv, "--validate-content")) {
      if (!quiet) std::cout << "Content OK: " << content.id << " " << content.version << "\n";
      return 0;
    }

    if (!verify_path.empty()) {
      const idlecore::ReplayFile file = idlecore::read_replay_file(verify_path);
      idlecore::ReplayOptions opts;
      opts.config = config;
      const idlecore::ReplayResult r = idlecore::run_replay(file, content, opts);
      if (!quiet) {
        std::cout << "Replay OK: " << r.commands_replayed << " commands, end step " << r.end_step << ", checksum "
                  << r.end_state_checksum << "\n";
      }
      return 0;
    }

    idlecore::SimulationContext ctx(config);
    idlecore::RuntimeOptions options;
    if (has_kv_arg(argc, argv, "--seed")) options.seed = get_int_arg(argc, argv, "--seed", 0);
    idlecore::Runtime runtime(ctx, content, options);

    if (!load_path.empty()) {
      idlecore::restore_snapshot(runtime, idlecore::read_save_file(load_path, content.digest()));
    }

    idlecore::ReplayRecorder recorder;
    if (!record_path.empty()) {
      idlecore::ReplayRecorderOptions ropts;
      ropts.runtime_version = IDLECORE_VERSION;
      recorder.begin(runtime, content, ropts);
    }

    if (offline_ms > 0.0) {
      idlecore::Command cmd;
      cmd.type = idlecore::command_type_name(idlecore::CommandKind::OfflineCatchup);
      cmd.priority = idlecore::CommandPriority::System;
      cmd.step = runtime.next_executable_step();
      cmd.timestamp = static_cast<double>(cmd.step) * runtime.step_size_ms();
      idlecore::json::Object payload;
      payload["elapsedMs"] = offline_ms;
      payload["resourceDeltas"] = idlecore::json::object({});
      cmd.payload = idlecore::json::object(std::move(payload));
      if (!runtime.enqueue(std::move(cmd))) {
        std::cerr << "Offline catch-up command was rejected\n";
        return 1;
      }
    }

    for (long long i = 0; i < steps; ++i) runtime.tick();

    if (recorder.recording()) {
      recorder.finish(runtime);
      idlecore::write_replay_file(record_path, recorder.file());
      if (!quiet) std::cout << "Replay written to " << record_path << "\n";
    }

    const idlecore::GameSnapshot snapshot = idlecore::capture_snapshot(runtime);
    if (!save_path.empty()) {
      idlecore::write_save_file(save_path, snapshot);
      if (!quiet) std::cout << "Saved to " << save_path << "\n";
    }

    if (dump) std::cout << idlecore::json::stringify(idlecore::snapshot_to_json(snapshot), 2) << "\n";
    if (!quiet) print_summary(runtime, idlecore::compute_state_checksum(snapshot));
    return 0;
  } catch (const std::exception& e) {
    idlecore::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
