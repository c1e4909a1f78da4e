#include "aerojudge/util/digest.h"

#include <cstring>

namespace aerojudge {

void Digest64::add_string(const std::string& s) {
  add_size(s.size());
  for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
}

void Digest64::add_double(double v) {
  std::uint64_t u = 0;
  static_assert(sizeof(u) == sizeof(v));
  std::memcpy(&u, &v, sizeof(u));

  // Normalize -0.0 to +0.0.
  if ((u << 1) == 0) u = 0;

  // Canonicalize NaN payloads.
  const std::uint64_t exp = u & 0x7ff0000000000000ULL;
  const std::uint64_t mant = u & 0x000fffffffffffffULL;
  if (exp == 0x7ff0000000000000ULL && mant != 0) u = 0x7ff8000000000000ULL;

  add_u64(u);
}

std::string digest64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

bool digest64_from_hex(const std::string& hex, std::uint64_t& out) {
  if (hex.empty() || hex.size() > 16) return false;
  std::uint64_t v = 0;
  for (const char c : hex) {
    v <<= 4;
    if (c >= '0' && c <= '9') {
      v |= static_cast<std::uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      v |= static_cast<std::uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      v |= static_cast<std::uint64_t>(c - 'A' + 10);
    } else {
      return false;
    }
  }
  out = v;
  return true;
}

} // namespace aerojudge
