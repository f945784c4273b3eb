#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace idlecore {

inline constexpr std::uint32_t kFnv1aOffsetBasis = 0x811c9dc5u;
inline constexpr std::uint32_t kFnv1aPrime = 0x01000193u;

// 32-bit FNV-1a over the raw bytes of text.
std::uint32_t fnv1a32(const std::string& text, std::uint32_t basis = kFnv1aOffsetBasis);

// Hash of an ordered id list. Each id is folded byte by byte and then
// terminated by mixing in 0xff, so ["ab","c"] and ["a","bc"] differ.
std::uint32_t fnv1a32_ids(const std::vector<std::string>& ids);

// Fixed-width lowercase hex ("4f9f2cab").
std::string digest32_to_hex(std::uint32_t v);

// Parses 8 hex digits (optionally prefixed by "fnv1a-"). Throws std::runtime_error.
std::uint32_t parse_digest32(const std::string& s);

} // namespace idlecore
