#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rnaflow::util {

// 64-bit FNV-1a. Stable across platforms and runs, unlike std::hash.
std::uint64_t Fnv1a64(std::string_view data);

// Fnv1a64 rendered as 16 lowercase hex characters.
std::string HexDigest(std::string_view data);

} // namespace rnaflow::util
