#include "idlecore/core/snapshot.h"

#include <cmath>
#include <stdexcept>

#include "idlecore/core/migration.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/telemetry.h"
#include "idlecore/util/digest.h"
#include "idlecore/util/file_io.h"
#include "idlecore/util/log.h"

namespace idlecore {
namespace {

json::Value or_null(const json::Value* v) { return v ? *v : json::Value(nullptr); }

} // namespace

json::Value snapshot_to_json(const GameSnapshot& s) {
  json::Object rt;
  rt["step"] = static_cast<double>(s.step);
  rt["stepSizeMs"] = s.step_size_ms;
  if (s.rng_seed) {
    rt["rngSeed"] = static_cast<double>(*s.rng_seed);
  } else {
    rt["rngSeed"] = nullptr;
  }
  rt["rngState"] = s.rng_state;

  json::Object o;
  o["version"] = static_cast<double>(s.version);
  o["runtime"] = json::object(std::move(rt));
  o["resources"] = serialized_resources_to_json(s.resources);
  o["progression"] = s.progression;
  o["automation"] = s.automation;
  o["transforms"] = s.transforms;
  o["prestige"] = s.prestige;
  o["achievements"] = s.achievements;
  o["commandQueue"] = s.command_queue;
  o["prd"] = s.prd;
  return json::object(std::move(o));
}

GameSnapshot snapshot_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Snapshot must be a JSON object.");
  GameSnapshot s;
  s.version = static_cast<int>(v.at("version").int_value(-1));
  if (s.version != kGameSnapshotVersion) {
    throw std::runtime_error("Snapshot version " + std::to_string(s.version) + " is not supported.");
  }

  const json::Value& rt = v.at("runtime");
  const double step = rt.at("step").number_value(-1.0);
  if (!std::isfinite(step) || step < 0.0 || std::floor(step) != step || step > 9007199254740991.0) {
    throw std::runtime_error("Snapshot step must be a non-negative integer.");
  }
  s.step = static_cast<std::int64_t>(step);
  s.step_size_ms = rt.at("stepSizeMs").number_value();
  if (const json::Value* seed = rt.find("rngSeed"); seed && seed->is_number()) {
    s.rng_seed = static_cast<std::uint32_t>(seed->int_value());
  }
  s.rng_state = rt.at("rngState").number_value();

  s.resources = serialized_resources_from_json(v.at("resources"));
  s.progression = or_null(v.find("progression"));
  s.automation = or_null(v.find("automation"));
  s.transforms = or_null(v.find("transforms"));
  s.prestige = or_null(v.find("prestige"));
  s.achievements = or_null(v.find("achievements"));
  s.command_queue = or_null(v.find("commandQueue"));
  s.prd = or_null(v.find("prd"));
  return s;
}

GameSnapshot capture_snapshot(Runtime& runtime) {
  SimulationContext& ctx = runtime.context();
  GameSnapshot s;
  s.step = runtime.current_step();
  s.step_size_ms = runtime.step_size_ms();
  s.rng_seed = ctx.rng().seed();
  s.rng_state = ctx.rng().state();
  s.resources = runtime.resources().export_for_save();
  s.progression = runtime.progression().export_state();
  s.automation = runtime.automation().export_state();
  s.transforms = runtime.transforms().export_state();
  s.prestige = runtime.prestige().export_state();
  s.achievements = runtime.achievements().export_state();
  s.command_queue = runtime.queue().export_for_save();
  s.prd = runtime.prd().capture_state();
  return s;
}

void restore_snapshot(Runtime& runtime, const GameSnapshot& snapshot) {
  if (snapshot.step_size_ms != runtime.step_size_ms()) {
    throw std::runtime_error("Snapshot step size " + std::to_string(snapshot.step_size_ms) +
                             " ms does not match the runtime step size " + std::to_string(runtime.step_size_ms()) +
                             " ms.");
  }
  SimulationContext& ctx = runtime.context();

  runtime.set_current_step(snapshot.step);
  if (snapshot.rng_seed) {
    ctx.rng().set_seed(*snapshot.rng_seed);
  } else {
    ctx.rng().reset();
  }
  if (snapshot.rng_seed || snapshot.rng_state != 0.0) ctx.rng().set_state(snapshot.rng_state);

  const ResourceReconciliation rec = runtime.resources().reconcile(snapshot.resources);
  if (!rec.digests_match) {
    log::info("Snapshot resources reconciled by id: " + std::to_string(rec.added_ids.size()) + " added, " +
              std::to_string(rec.removed_ids.size()) + " dropped");
  }

  if (!snapshot.progression.is_null()) runtime.progression().restore_state(snapshot.progression);
  runtime.automation().restore_state(snapshot.automation);
  runtime.transforms().restore_state(snapshot.transforms);
  runtime.prestige().restore_state(snapshot.prestige);
  runtime.achievements().restore_state(snapshot.achievements);
  runtime.prd().restore_state(snapshot.prd);

  runtime.queue().clear();
  if (!snapshot.command_queue.is_null()) {
    CommandQueueRestoreOptions opts;
    CommandDispatcher& dispatcher = runtime.dispatcher();
    opts.is_command_type_supported = [&dispatcher](const std::string& type) { return dispatcher.has_handler(type); };
    runtime.queue().restore_from_save(snapshot.command_queue, opts);
  }
}

std::string compute_state_checksum(const GameSnapshot& snapshot) {
  return digest32_to_hex(fnv1a32(json::stringify(snapshot_to_json(snapshot), 0)));
}

void write_save_file(const std::string& path, const GameSnapshot& snapshot) {
  json::Object root;
  root["snapshot"] = snapshot_to_json(snapshot);
  write_text_file(path, json::stringify(json::object(std::move(root)), 2) + "\n");
}

GameSnapshot read_save_file(const std::string& path, const ResourceDigest& target,
                            const MigrationRegistry* migrations, Telemetry* telemetry) {
  const json::Value doc = json::parse(read_text_file(path));
  json::Value snap = doc.at("snapshot");

  const json::Value* digest_v = snap.at("resources").find("definitionDigest");
  if (migrations && digest_v && !digest_v->is_null()) {
    const ResourceDigest saved = resource_digest_from_json(*digest_v);
    if (saved != target) {
      const MigrationPath path_found = migrations->find_migration_path(saved, target);
      if (path_found.found) {
        snap = apply_migrations(std::move(snap), path_found);
        log::info("Applied " + std::to_string(path_found.migrations.size()) + " migration(s) to " + path);
      } else {
        log::warn("No migration path from " + saved.hash + " to " + target.hash + "; " + path +
                  " will be reconciled by resource id");
        if (telemetry) {
          json::Object details;
          details["path"] = path;
          details["fromHash"] = saved.hash;
          details["toHash"] = target.hash;
          telemetry->record_warning("SaveMigrationUnavailable", details);
        }
      }
    }
  }
  return snapshot_from_json(snap);
}

} // namespace idlecore
