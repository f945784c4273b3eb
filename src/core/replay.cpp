#include "idlecore/core/replay.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

#include "idlecore/core/content.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/snapshot.h"
#include "idlecore/util/file_io.h"
#include "idlecore/util/strings.h"
#include "idlecore/util/time.h"

namespace idlecore {
namespace {

template <class>
inline constexpr bool kAlwaysFalse = false;

std::int64_t integer_field(const json::Value& v, const char* key, const char* record) {
  const double d = v.at(key).number_value(std::nan(""));
  if (!std::isfinite(d) || std::floor(d) != d || std::fabs(d) > 9007199254740991.0) {
    throw std::runtime_error(std::string("Replay ") + record + " record has an invalid " + key + ".");
  }
  return static_cast<std::int64_t>(d);
}

} // namespace

json::Value replay_record_to_json(const ReplayRecord& record) {
  return std::visit(
      [](const auto& r) -> json::Value {
        using T = std::decay_t<decltype(r)>;
        json::Object o;
        if constexpr (std::is_same_v<T, ReplayHeader>) {
          o["type"] = std::string("header");
          o["fileType"] = std::string(r.file_type);
          o["schemaVersion"] = static_cast<double>(r.schema_version);
          o["recordedAt"] = std::string(r.recorded_at);
          o["runtimeVersion"] = std::string(r.runtime_version);
        } else if constexpr (std::is_same_v<T, ReplayContent>) {
          json::Object digest;
          digest["version"] = static_cast<double>(r.digest_version);
          digest["hash"] = std::string(r.digest_hash);
          o["type"] = std::string("content");
          o["packId"] = std::string(r.pack_id);
          o["packVersion"] = std::string(r.pack_version);
          o["digest"] = json::object(std::move(digest));
        } else if constexpr (std::is_same_v<T, ReplayAssets>) {
          o["type"] = std::string("assets");
          if (r.manifest_hash) o["manifestHash"] = std::string(*r.manifest_hash);
        } else if constexpr (std::is_same_v<T, ReplaySim>) {
          o["type"] = std::string("sim");
          o["wiring"] = r.wiring;
          o["stepSizeMs"] = r.step_size_ms;
          o["startStep"] = static_cast<double>(r.start_step);
          o["initialSnapshot"] = r.initial_snapshot;
        } else if constexpr (std::is_same_v<T, ReplayCommandChunk>) {
          json::Array cmds;
          for (const auto& c : r.commands) cmds.push_back(command_to_json(c));
          o["type"] = std::string("commands");
          o["chunkIndex"] = static_cast<double>(r.chunk_index);
          o["commands"] = std::move(cmds);
        } else if constexpr (std::is_same_v<T, ReplayEnd>) {
          o["type"] = std::string("end");
          o["endStep"] = static_cast<double>(r.end_step);
          o["endStateChecksum"] = std::string(r.end_state_checksum);
          o["commandCount"] = static_cast<double>(r.command_count);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled replay record");
        }
        return json::object(std::move(o));
      },
      record);
}

ReplayRecord replay_record_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Replay record must be a JSON object.");
  const std::string type = v.at("type").string_value();

  if (type == "header") {
    ReplayHeader h;
    h.file_type = v.at("fileType").string_value();
    h.schema_version = static_cast<int>(integer_field(v, "schemaVersion", "header"));
    if (const json::Value* at = v.find("recordedAt")) h.recorded_at = at->string_value();
    if (const json::Value* rv = v.find("runtimeVersion")) h.runtime_version = rv->string_value();
    return h;
  }
  if (type == "content") {
    ReplayContent c;
    c.pack_id = v.at("packId").string_value();
    c.pack_version = v.at("packVersion").string_value();
    const json::Value& digest = v.at("digest");
    c.digest_version = static_cast<int>(integer_field(digest, "version", "content"));
    c.digest_hash = digest.at("hash").string_value();
    return c;
  }
  if (type == "assets") {
    ReplayAssets a;
    if (const json::Value* m = v.find("manifestHash"); m && m->is_string()) a.manifest_hash = m->string_value();
    return a;
  }
  if (type == "sim") {
    ReplaySim s;
    if (const json::Value* w = v.find("wiring")) s.wiring = *w;
    s.step_size_ms = v.at("stepSizeMs").number_value();
    s.start_step = integer_field(v, "startStep", "sim");
    s.initial_snapshot = v.at("initialSnapshot");
    return s;
  }
  if (type == "commands") {
    ReplayCommandChunk chunk;
    chunk.chunk_index = static_cast<int>(integer_field(v, "chunkIndex", "commands"));
    const json::Array& list = v.at("commands").array();
    if (list.size() > kReplayChunkSize) throw std::runtime_error("Replay command chunk exceeds the chunk size.");
    for (const auto& entry : list) {
      Command cmd;
      std::string error;
      if (!command_from_json(entry, &cmd, &error)) throw std::runtime_error("Replay command is invalid: " + error);
      chunk.commands.push_back(std::move(cmd));
    }
    return chunk;
  }
  if (type == "end") {
    ReplayEnd e;
    e.end_step = integer_field(v, "endStep", "end");
    e.end_state_checksum = v.at("endStateChecksum").string_value();
    e.command_count = integer_field(v, "commandCount", "end");
    return e;
  }
  throw std::runtime_error("Replay record type \"" + type + "\" is not supported.");
}

std::string encode_replay(const ReplayFile& file) {
  std::vector<ReplayRecord> records;
  records.emplace_back(file.header);
  records.emplace_back(file.content);
  records.emplace_back(file.assets);
  records.emplace_back(file.sim);
  for (std::size_t start = 0, index = 0; start < file.commands.size(); start += kReplayChunkSize, ++index) {
    ReplayCommandChunk chunk;
    chunk.chunk_index = static_cast<int>(index);
    const std::size_t stop = std::min(file.commands.size(), start + kReplayChunkSize);
    chunk.commands.assign(file.commands.begin() + static_cast<std::ptrdiff_t>(start),
                          file.commands.begin() + static_cast<std::ptrdiff_t>(stop));
    records.emplace_back(std::move(chunk));
  }
  records.emplace_back(file.end);

  std::string out;
  for (const auto& r : records) {
    out += json::stringify(replay_record_to_json(r), 0);
    out += '\n';
  }
  return out;
}

ReplayFile decode_replay(const std::string& text) {
  const std::vector<std::string> lines = split_lines(text);
  if (lines.size() > kReplayMaxLines) throw std::runtime_error("Replay exceeds the maximum line count.");
  if (lines.empty()) throw std::runtime_error("Replay header record must appear first.");

  ReplayFile file;
  bool have_content = false;
  bool have_sim = false;
  bool have_end = false;
  std::vector<ReplayCommandChunk> chunks;
  std::size_t command_total = 0;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const ReplayRecord record = replay_record_from_json(json::parse(lines[i]));
    if (i == 0) {
      const ReplayHeader* header = std::get_if<ReplayHeader>(&record);
      if (!header) throw std::runtime_error("Replay header record must appear first.");
      if (header->file_type != kReplayFileType) throw std::runtime_error("Replay fileType is not supported.");
      if (header->schema_version != 1 && header->schema_version != 2) {
        throw std::runtime_error("Replay schemaVersion is not supported.");
      }
      file.header = *header;
      continue;
    }

    std::visit(
        [&](const auto& r) {
          using T = std::decay_t<decltype(r)>;
          if constexpr (std::is_same_v<T, ReplayHeader>) {
            throw std::runtime_error("Replay contains more than one header record.");
          } else if constexpr (std::is_same_v<T, ReplayContent>) {
            file.content = r;
            have_content = true;
          } else if constexpr (std::is_same_v<T, ReplayAssets>) {
            file.assets = r;
          } else if constexpr (std::is_same_v<T, ReplaySim>) {
            file.sim = r;
            have_sim = true;
          } else if constexpr (std::is_same_v<T, ReplayCommandChunk>) {
            command_total += r.commands.size();
            if (command_total > kReplayMaxCommands) {
              throw std::runtime_error("Replay exceeds the maximum command count.");
            }
            chunks.push_back(r);
          } else if constexpr (std::is_same_v<T, ReplayEnd>) {
            file.end = r;
            have_end = true;
          } else {
            static_assert(kAlwaysFalse<T>, "unhandled replay record");
          }
        },
        record);
  }

  if (!have_content) throw std::runtime_error("Replay is missing content record.");
  if (!have_sim) throw std::runtime_error("Replay is missing sim record.");
  if (!have_end) throw std::runtime_error("Replay is missing end record.");

  std::stable_sort(chunks.begin(), chunks.end(),
                   [](const ReplayCommandChunk& a, const ReplayCommandChunk& b) { return a.chunk_index < b.chunk_index; });
  for (auto& chunk : chunks) {
    for (auto& cmd : chunk.commands) file.commands.push_back(std::move(cmd));
  }
  if (static_cast<std::int64_t>(file.commands.size()) != file.end.command_count) {
    throw std::runtime_error("Replay command count does not match footer.");
  }
  return file;
}

void write_replay_file(const std::string& path, const ReplayFile& file) { write_text_file(path, encode_replay(file)); }

ReplayFile read_replay_file(const std::string& path) { return decode_replay(read_text_file(path)); }

ReplayRecorder::~ReplayRecorder() {
  if (runtime_) runtime_->queue().set_enqueue_listener(nullptr);
}

void ReplayRecorder::begin(Runtime& runtime, const ContentPack& content, const ReplayRecorderOptions& options) {
  if (runtime_) throw std::logic_error("ReplayRecorder is already recording");

  file_ = ReplayFile{};
  file_.header.recorded_at = utc_now_iso8601();
  file_.header.runtime_version = options.runtime_version;

  const ResourceDigest digest = content.digest();
  file_.content.pack_id = content.id;
  file_.content.pack_version = content.version;
  file_.content.digest_version = digest.version;
  file_.content.digest_hash = digest.hash;

  file_.assets.manifest_hash = options.manifest_hash;

  json::Array systems;
  for (const char* id : {"progression", "automation", "transforms"}) systems.push_back(std::string(id));
  json::Object wiring;
  wiring["systems"] = std::move(systems);
  wiring["offlineCatchup"] = true;
  file_.sim.wiring = json::object(std::move(wiring));
  file_.sim.step_size_ms = runtime.step_size_ms();
  file_.sim.start_step = runtime.current_step();
  file_.sim.initial_snapshot = snapshot_to_json(capture_snapshot(runtime));

  runtime_ = &runtime;
  runtime.queue().set_enqueue_listener([this](const Command& cmd) {
    if (!runtime_->ticking()) record(cmd);
  });
}

void ReplayRecorder::record(const Command& cmd) { file_.commands.push_back(cmd); }

void ReplayRecorder::finish(Runtime& runtime) {
  if (runtime_ != &runtime) throw std::logic_error("ReplayRecorder::finish called without a matching begin");
  runtime.queue().set_enqueue_listener(nullptr);
  runtime_ = nullptr;

  file_.end.end_step = runtime.current_step();
  file_.end.end_state_checksum = compute_state_checksum(capture_snapshot(runtime));
  file_.end.command_count = static_cast<std::int64_t>(file_.commands.size());
}

ReplayResult run_replay(const ReplayFile& file, const ContentPack& content, const ReplayOptions& options) {
  const ResourceDigest digest = content.digest();
  if (digest.hash != file.content.digest_hash || digest.version != file.content.digest_version) {
    throw std::runtime_error("Content digest mismatch. Replay is not compatible with the provided content pack.");
  }

  EngineConfig config = options.config;
  config.runtime.step_size_ms = file.sim.step_size_ms;
  SimulationContext ctx(config, options.telemetry);

  Runtime runtime(ctx, content);
  restore_snapshot(runtime, snapshot_from_json(file.sim.initial_snapshot));
  runtime.set_dispatch_phase("replay");

  // Commands go back into the queue when the recording issued them: once
  // their timestamp is reached, in file order. A command already due to
  // execute is never held back.
  const std::vector<Command>& commands = file.commands;
  std::vector<bool> issued(commands.size(), false);
  std::size_t cursor = 0;

  ReplayResult result;
  auto issue = [&](std::size_t i) {
    runtime.enqueue(commands[i]);
    issued[i] = true;
    ++result.commands_replayed;
  };
  auto issue_due = [&](std::int64_t step, bool all) {
    const double now_ms = static_cast<double>(step) * runtime.step_size_ms();
    for (; cursor < commands.size(); ++cursor) {
      if (issued[cursor]) continue;
      const Command& cmd = commands[cursor];
      if (!all && cmd.step > step && cmd.timestamp > now_ms) break;
      issue(cursor);
    }
    for (std::size_t i = cursor; i < commands.size(); ++i) {
      if (!issued[i] && commands[i].step <= step) issue(i);
    }
  };

  while (runtime.current_step() < file.end.end_step) {
    issue_due(runtime.current_step(), false);
    runtime.tick();
  }
  // Anything issued for later steps was still waiting in the queue.
  issue_due(runtime.current_step(), true);

  result.end_step = runtime.current_step();
  result.end_state_checksum = compute_state_checksum(capture_snapshot(runtime));
  if (result.end_state_checksum != file.end.end_state_checksum) {
    json::Object details;
    details["expected"] = std::string(file.end.end_state_checksum);
    details["actual"] = std::string(result.end_state_checksum);
    details["endStep"] = static_cast<double>(result.end_step);
    ctx.telemetry().record_error("SimReplayChecksumMismatch", details);
    throw std::runtime_error("Replay end-state checksum mismatch.");
  }
  return result;
}

} // namespace idlecore
