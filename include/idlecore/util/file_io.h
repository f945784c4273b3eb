#pragma once

#include <string>
#include <vector>

namespace idlecore {

// Reads an entire file. Throws std::runtime_error on failure.
std::string read_text_file(const std::string& path);

// read_text_file + split_lines. Used for JSON-lines replays.
std::vector<std::string> read_lines(const std::string& path);

// Writes a file through a temporary sibling + rename so that saves and replays
// are never left half-written. Parent directories are created as needed.
void write_text_file(const std::string& path, const std::string& contents);

// Creates a directory (and parents). No-op if it already exists.
void ensure_dir(const std::string& path);

} // namespace idlecore
