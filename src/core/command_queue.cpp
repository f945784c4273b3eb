#include "idlecore/core/command_queue.h"

#include <algorithm>
#include <stdexcept>

#include "idlecore/core/sim_context.h"

namespace idlecore {
namespace {

bool entry_less(const QueueEntry& a, const QueueEntry& b) {
  if (a.command.step != b.command.step) return a.command.step < b.command.step;
  if (a.command.priority != b.command.priority) return a.command.priority < b.command.priority;
  return a.sequence < b.sequence;
}

} // namespace

CommandQueue::CommandQueue(SimulationContext& ctx, int max_size) : ctx_(ctx), max_size_(max_size) {
  if (max_size <= 0) throw std::invalid_argument("CommandQueue max_size must be a positive integer");
}

void CommandQueue::insert(Command cmd) {
  QueueEntry e{std::move(cmd), next_sequence_++};
  // Sequences only grow, so upper_bound keeps FIFO order among equals.
  auto pos = std::upper_bound(entries_.begin(), entries_.end(), e, entry_less);
  entries_.insert(pos, std::move(e));
}

bool CommandQueue::enqueue(Command cmd) {
  if (static_cast<int>(entries_.size()) >= max_size_) {
    json::Object overflow;
    overflow["size"] = static_cast<double>(entries_.size());
    overflow["maxSize"] = static_cast<double>(max_size_);
    ctx_.telemetry().record_warning("CommandQueueOverflow", overflow);

    json::Object rejected;
    rejected["type"] = std::string(cmd.type);
    rejected["priority"] = std::string(command_priority_name(cmd.priority));
    rejected["step"] = static_cast<double>(cmd.step);
    rejected["reason"] = std::string("queue-full");
    ctx_.telemetry().record_warning("CommandRejected", rejected);
    return false;
  }
  if (on_enqueue_) on_enqueue_(cmd);
  insert(std::move(cmd));
  return true;
}

std::vector<Command> CommandQueue::dequeue_up_to_step(std::int64_t step) {
  std::vector<Command> out;
  while (!entries_.empty() && entries_.front().command.step <= step) {
    out.push_back(std::move(entries_.front().command));
    entries_.pop_front();
  }
  return out;
}

std::vector<Command> CommandQueue::dequeue_all() {
  std::vector<Command> out;
  out.reserve(entries_.size());
  for (auto& e : entries_) out.push_back(std::move(e.command));
  entries_.clear();
  return out;
}

std::optional<std::int64_t> CommandQueue::peek_next_step() const {
  if (entries_.empty()) return std::nullopt;
  return entries_.front().command.step;
}

json::Value CommandQueue::export_for_save() const {
  json::Array list;
  list.reserve(entries_.size());
  for (const auto& e : entries_) list.push_back(command_to_json(e.command));
  json::Object o;
  o["schemaVersion"] = static_cast<double>(kCommandQueueSchemaVersion);
  o["entries"] = std::move(list);
  return json::object(std::move(o));
}

CommandQueueRestoreResult CommandQueue::restore_from_save(const json::Value& data,
                                                          const CommandQueueRestoreOptions& options) {
  clear();
  CommandQueueRestoreResult result;

  const json::Value* schema = data.find("schemaVersion");
  const json::Value* list = data.find("entries");
  if (!schema || !schema->is_number() || *schema->as_number() != kCommandQueueSchemaVersion || !list ||
      !list->is_array()) {
    json::Object details;
    details["schemaVersion"] = schema ? *schema : json::Value(nullptr);
    details["expected"] = static_cast<double>(kCommandQueueSchemaVersion);
    ctx_.telemetry().record_warning("CommandQueueRestoreUnsupportedSchema", details);
    return result;
  }

  const std::int64_t offset = options.rebase_step
                                  ? options.rebase_step->current_step - options.rebase_step->saved_step
                                  : 0;

  const json::Array& arr = *list->as_array();
  for (std::size_t i = 0; i < arr.size(); ++i) {
    Command cmd;
    std::string error;
    if (!command_from_json(arr[i], &cmd, &error)) {
      json::Object details;
      details["index"] = static_cast<double>(i);
      details["reason"] = std::string(error);
      ctx_.telemetry().record_warning("CommandQueueRestoreInvalidEntry", details);
      ++result.skipped;
      continue;
    }
    if (options.is_command_type_supported && !options.is_command_type_supported(cmd.type)) {
      json::Object details;
      details["index"] = static_cast<double>(i);
      details["type"] = std::string(cmd.type);
      ctx_.telemetry().record_warning("CommandQueueRestoreUnsupportedType", details);
      ++result.skipped;
      continue;
    }
    if (static_cast<int>(entries_.size()) >= max_size_) {
      json::Object details;
      details["index"] = static_cast<double>(i);
      details["type"] = std::string(cmd.type);
      details["maxSize"] = static_cast<double>(max_size_);
      ctx_.telemetry().record_warning("CommandQueueRestoreOverflow", details);
      ++result.skipped;
      continue;
    }
    cmd.step = std::max<std::int64_t>(0, cmd.step + offset);
    insert(std::move(cmd));
    ++result.restored;
  }
  return result;
}

} // namespace idlecore
