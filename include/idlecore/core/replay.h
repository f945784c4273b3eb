#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "idlecore/core/command.h"
#include "idlecore/core/config.h"
#include "idlecore/util/json.h"

namespace idlecore {

struct ContentPack;
class Runtime;
class Telemetry;

inline constexpr const char* kReplayFileType = "idle-engine-sim-replay";
inline constexpr int kReplaySchemaVersion = 2;
inline constexpr std::size_t kReplayMaxCommands = 1000000;
inline constexpr std::size_t kReplayMaxLines = 2000000;
inline constexpr std::size_t kReplayChunkSize = 1000;

struct ReplayHeader {
  std::string file_type{kReplayFileType};
  int schema_version{kReplaySchemaVersion};
  std::string recorded_at;
  std::string runtime_version;
};

struct ReplayContent {
  std::string pack_id;
  std::string pack_version;
  int digest_version{0};
  std::string digest_hash;
};

struct ReplayAssets {
  std::optional<std::string> manifest_hash;
};

struct ReplaySim {
  // Which systems the recording runtime ran. Informational.
  json::Value wiring;
  double step_size_ms{0.0};
  std::int64_t start_step{0};
  // snapshot_to_json() of the state recording started from.
  json::Value initial_snapshot;
};

struct ReplayCommandChunk {
  int chunk_index{0};
  std::vector<Command> commands;
};

struct ReplayEnd {
  std::int64_t end_step{0};
  std::string end_state_checksum;
  std::int64_t command_count{0};
};

// One JSON line of a replay file.
using ReplayRecord = std::variant<ReplayHeader, ReplayContent, ReplayAssets, ReplaySim, ReplayCommandChunk, ReplayEnd>;

json::Value replay_record_to_json(const ReplayRecord& record);

// Throws std::runtime_error for an unknown or malformed record.
ReplayRecord replay_record_from_json(const json::Value& v);

struct ReplayFile {
  ReplayHeader header;
  ReplayContent content;
  ReplayAssets assets;
  ReplaySim sim;
  // Every externally issued command, in issue order.
  std::vector<Command> commands;
  ReplayEnd end;
};

// JSON lines: header, content, assets, sim, command chunks, end.
std::string encode_replay(const ReplayFile& file);

// Throws std::runtime_error on structural problems (see the messages in
// replay.cpp); chunks are reassembled in chunkIndex order.
ReplayFile decode_replay(const std::string& text);

void write_replay_file(const std::string& path, const ReplayFile& file);
ReplayFile read_replay_file(const std::string& path);

struct ReplayRecorderOptions {
  std::string runtime_version;
  std::optional<std::string> manifest_hash;
};

// Captures a session: the initial snapshot, every command enqueued from
// outside the simulation, and the checksum of the final state.
class ReplayRecorder {
 public:
  ReplayRecorder() = default;
  ~ReplayRecorder();

  ReplayRecorder(const ReplayRecorder&) = delete;
  ReplayRecorder& operator=(const ReplayRecorder&) = delete;

  // Hooks the runtime's queue. Throws std::logic_error when already recording.
  void begin(Runtime& runtime, const ContentPack& content, const ReplayRecorderOptions& options = {});

  void record(const Command& cmd);

  // Unhooks and seals the file with the end step and state checksum.
  void finish(Runtime& runtime);

  bool recording() const { return runtime_ != nullptr; }
  const ReplayFile& file() const { return file_; }
  std::string encode() const { return encode_replay(file_); }

 private:
  Runtime* runtime_{nullptr};
  ReplayFile file_;
};

struct ReplayOptions {
  // Step size is taken from the replay; everything else from here.
  EngineConfig config;
  std::shared_ptr<Telemetry> telemetry;
};

struct ReplayResult {
  std::int64_t end_step{0};
  std::string end_state_checksum;
  std::size_t commands_replayed{0};
};

// Rebuilds the recorded session and checks it ends in the same state.
// Throws std::runtime_error on a content digest mismatch or when the final
// checksum differs (after recording SimReplayChecksumMismatch).
ReplayResult run_replay(const ReplayFile& file, const ContentPack& content, const ReplayOptions& options = {});

} // namespace idlecore
