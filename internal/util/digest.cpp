#include "digest.hpp"

#include <cstdint>

namespace relaynorm::util {

std::string ContentDigest(std::string_view bytes) {
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

} // namespace relaynorm::util
