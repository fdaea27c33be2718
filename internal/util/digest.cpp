#include "digest.hpp"

namespace rnaflow::util {

std::uint64_t Fnv1a64(std::string_view data) {
  constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
  constexpr std::uint64_t kPrime       = 1099511628211ULL;

  std::uint64_t hash = kOffsetBasis;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= kPrime;
  }
  return hash;
}

std::string HexDigest(std::string_view data) {
  static constexpr char kHex[] = "0123456789abcdef";

  auto        hash = Fnv1a64(data);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<size_t>(i)] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

} // namespace rnaflow::util
