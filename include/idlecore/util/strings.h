#pragma once

#include <string>
#include <vector>

namespace idlecore {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Splits on '\n', dropping a trailing '\r' from each line and skipping blank lines.
std::vector<std::string> split_lines(const std::string& text);

} // namespace idlecore
