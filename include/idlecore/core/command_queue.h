#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "idlecore/core/command.h"
#include "idlecore/util/json.h"

namespace idlecore {

class SimulationContext;

inline constexpr int kCommandQueueSchemaVersion = 1;

struct QueueEntry {
  Command command;
  // Insertion order; breaks ties between equal (step, priority).
  std::uint64_t sequence{0};
};

struct CommandQueueRebase {
  std::int64_t saved_step{0};
  std::int64_t current_step{0};
};

struct CommandQueueRestoreOptions {
  // When set, entries whose type is rejected are skipped and counted.
  // Entries past max_size are skipped and counted the same way.
  std::function<bool(const std::string&)> is_command_type_supported;
  std::optional<CommandQueueRebase> rebase_step;
};

struct CommandQueueRestoreResult {
  int restored{0};
  int skipped{0};
};

// Pending commands ordered by (step, priority, sequence).
class CommandQueue {
 public:
  // Throws std::invalid_argument when max_size <= 0.
  explicit CommandQueue(SimulationContext& ctx, int max_size = 10000);

  // False when the queue is full (records CommandQueueOverflow and CommandRejected).
  bool enqueue(Command cmd);

  // Removes and returns, in order, every entry due at or before step.
  std::vector<Command> dequeue_up_to_step(std::int64_t step);
  std::vector<Command> dequeue_all();

  void clear() { entries_.clear(); }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  int max_size() const { return max_size_; }

  std::optional<std::int64_t> peek_next_step() const;

  // Read-only view in execution order.
  const std::deque<QueueEntry>& entries() const { return entries_; }

  json::Value export_for_save() const;
  CommandQueueRestoreResult restore_from_save(const json::Value& data, const CommandQueueRestoreOptions& options = {});

  // Called for every accepted command. Used by the replay recorder.
  void set_enqueue_listener(std::function<void(const Command&)> fn) { on_enqueue_ = std::move(fn); }

 private:
  void insert(Command cmd);

  SimulationContext& ctx_;
  int max_size_;
  std::deque<QueueEntry> entries_;
  std::uint64_t next_sequence_{0};
  std::function<void(const Command&)> on_enqueue_;
};

} // namespace idlecore
