#include "idlecore/util/digest.h"

#include <cstdio>
#include <stdexcept>
#include <string_view>

namespace idlecore {

std::uint32_t fnv1a32(const std::string& text, std::uint32_t basis) {
  std::uint32_t h = basis;
  for (const char c : text) {
    h ^= static_cast<std::uint8_t>(c);
    h *= kFnv1aPrime;
  }
  return h;
}

std::uint32_t fnv1a32_ids(const std::vector<std::string>& ids) {
  std::uint32_t h = kFnv1aOffsetBasis;
  for (const auto& id : ids) {
    h = fnv1a32(id, h);
    h ^= 0xffu;
    h *= kFnv1aPrime;
  }
  return h;
}

std::string digest32_to_hex(std::uint32_t v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(v));
  return std::string(buf);
}

std::uint32_t parse_digest32(const std::string& s) {
  std::string_view sv(s);
  if (sv.substr(0, 6) == "fnv1a-") sv.remove_prefix(6);
  if (sv.size() != 8) throw std::runtime_error("invalid digest: " + s);
  std::uint32_t v = 0;
  for (const char c : sv) {
    v <<= 4;
    if (c >= '0' && c <= '9') v |= static_cast<std::uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f') v |= static_cast<std::uint32_t>(10 + c - 'a');
    else if (c >= 'A' && c <= 'F') v |= static_cast<std::uint32_t>(10 + c - 'A');
    else throw std::runtime_error("invalid digest: " + s);
  }
  return v;
}

} // namespace idlecore
