#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "idlecore/core/content.h"
#include "idlecore/core/replay.h"
#include "idlecore/core/runtime.h"
#include "idlecore/core/sim_context.h"
#include "idlecore/core/snapshot.h"
#include "idlecore/core/telemetry.h"
#include "idlecore/util/strings.h"

#define IC_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

const char* kPack = R"({
  "id": "test.replay",
  "version": "0.3.0",
  "resources": [
    {"id": "ore", "startAmount": 40, "unlocked": true},
    {"id": "bar", "unlocked": true}
  ],
  "generators": [{"id": "pit", "purchase": {"currencyId": "ore", "baseCost": 5}, "initialLevel": 1,
                  "produces": [{"resourceId": "ore", "rate": 2}]}],
  "automations": [{"id": "sweep", "targetType": "collectResource", "targetId": "ore", "targetAmount": 1,
                   "trigger": {"kind": "interval", "intervalMs": 300}, "enabledByDefault": true}],
  "transforms": [{"id": "smelt", "mode": "batch", "durationMs": 200,
                  "inputs": [{"resourceId": "ore", "amount": 4}], "outputs": [{"resourceId": "bar", "amount": 1}]}]
})";

const char* kOtherPack = R"({
  "id": "test.replay",
  "version": "0.4.0",
  "resources": [{"id": "ore", "startAmount": 40, "unlocked": true}]
})";

idlecore::Command command(const std::string& type, std::int64_t step, const char* payload) {
  idlecore::Command c;
  c.type = type;
  c.step = step;
  c.timestamp = static_cast<double>(step) * 100.0;
  c.payload = idlecore::json::parse(payload);
  return c;
}

bool decode_throws(const std::string& text) {
  try {
    idlecore::decode_replay(text);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

} // namespace

int test_replay() {
  using namespace idlecore;

  const ContentPack pack = content_pack_from_json(json::parse(kPack));

  // --- Record a session ---
  SimulationContext ctx(EngineConfig{}, std::make_shared<MemoryTelemetry>());
  RuntimeOptions opts;
  opts.seed = 7;
  Runtime rt(ctx, pack, opts);

  ReplayRecorder recorder;
  ReplayRecorderOptions ropts;
  ropts.runtime_version = "test";
  recorder.begin(rt, pack, ropts);
  IC_ASSERT(recorder.recording());
  {
    bool threw = false;
    try {
      recorder.begin(rt, pack);
    } catch (const std::logic_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
  }

  IC_ASSERT(rt.enqueue(command("PURCHASE_GENERATOR", 0, R"({"generatorId":"pit","count":1})")));
  for (int i = 0; i < 3; ++i) rt.tick();
  IC_ASSERT(rt.enqueue(command("RUN_TRANSFORM", 3, R"({"transformId":"smelt"})")));
  for (int i = 0; i < 5; ++i) rt.tick();
  IC_ASSERT(rt.enqueue(command("PURCHASE_GENERATOR", 20, R"({"generatorId":"pit","count":1})")));
  recorder.finish(rt);
  IC_ASSERT(!recorder.recording());

  // Automation commands issued during ticks are not part of the recording.
  const ReplayFile& recorded = recorder.file();
  IC_ASSERT(recorded.commands.size() == 3);
  IC_ASSERT(recorded.end.end_step == 8);
  IC_ASSERT(recorded.end.command_count == 3);
  IC_ASSERT(recorded.end.end_state_checksum == compute_state_checksum(capture_snapshot(rt)));
  IC_ASSERT(recorded.content.pack_id == "test.replay");
  IC_ASSERT(recorded.content.digest_hash == pack.digest().hash);
  IC_ASSERT(rt.resources().amount(rt.resources().require_index("bar")) == 1.0);

  // --- Encode / decode ---
  const std::string text = recorder.encode();
  const auto lines = split_lines(text);
  IC_ASSERT(lines.size() == 6);
  IC_ASSERT(json::parse(lines[0]).at("type").string_value() == "header");
  IC_ASSERT(json::parse(lines[4]).at("type").string_value() == "commands");

  const ReplayFile decoded = decode_replay(text);
  IC_ASSERT(decoded.header.schema_version == kReplaySchemaVersion);
  IC_ASSERT(decoded.header.runtime_version == "test");
  IC_ASSERT(decoded.commands.size() == 3);
  IC_ASSERT(decoded.commands[1].type == "RUN_TRANSFORM");
  IC_ASSERT(decoded.commands[2].step == 20);
  IC_ASSERT(decoded.end.end_state_checksum == recorded.end.end_state_checksum);

  // --- Re-run it ---
  {
    auto mem = std::make_shared<MemoryTelemetry>();
    ReplayOptions ro;
    ro.telemetry = mem;
    const ReplayResult r = run_replay(decoded, pack, ro);
    IC_ASSERT(r.end_step == 8);
    IC_ASSERT(r.commands_replayed == 3);
    IC_ASSERT(r.end_state_checksum == recorded.end.end_state_checksum);
    IC_ASSERT(mem->count(TelemetryKind::Error, "SimReplayChecksumMismatch") == 0);
  }

  // A tampered footer is detected after the run.
  {
    ReplayFile tampered = decoded;
    tampered.end.end_state_checksum = "00000000";
    auto mem = std::make_shared<MemoryTelemetry>();
    ReplayOptions ro;
    ro.telemetry = mem;
    bool threw = false;
    try {
      run_replay(tampered, pack, ro);
    } catch (const std::runtime_error&) {
      threw = true;
    }
    IC_ASSERT(threw);
    IC_ASSERT(mem->count(TelemetryKind::Error, "SimReplayChecksumMismatch") == 1);
  }

  // Different content is refused up front.
  {
    const ContentPack other = content_pack_from_json(json::parse(kOtherPack));
    bool threw = false;
    try {
      run_replay(decoded, other);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("Content digest mismatch") != std::string::npos;
    }
    IC_ASSERT(threw);
  }

  // --- Malformed files ---
  IC_ASSERT(decode_throws(""));
  IC_ASSERT(decode_throws(lines[1] + "\n" + lines[0] + "\n"));
  {
    std::string no_end;
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) no_end += lines[i] + "\n";
    IC_ASSERT(decode_throws(no_end));
  }
  {
    json::Value end = json::parse(lines[5]);
    (*end.as_object())["commandCount"] = 4.0;
    std::string bad_count;
    for (std::size_t i = 0; i + 1 < lines.size(); ++i) bad_count += lines[i] + "\n";
    bad_count += json::stringify(end, 0) + "\n";
    IC_ASSERT(decode_throws(bad_count));
  }
  {
    json::Value header = json::parse(lines[0]);
    (*header.as_object())["fileType"] = std::string("something-else");
    std::string bad_type = json::stringify(header, 0) + "\n";
    for (std::size_t i = 1; i < lines.size(); ++i) bad_type += lines[i] + "\n";
    IC_ASSERT(decode_throws(bad_type));
  }
  {
    json::Value rec = json::parse(lines[2]);
    (*rec.as_object())["type"] = std::string("mystery");
    std::string bad_rec;
    for (std::size_t i = 0; i < lines.size(); ++i) bad_rec += (i == 2 ? json::stringify(rec, 0) : lines[i]) + "\n";
    IC_ASSERT(decode_throws(bad_rec));
  }

  return 0;
}
