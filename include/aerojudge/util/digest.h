#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace aerojudge {

// FNV-1a 64-bit accumulator for stable content digests.
//
// Properties:
//  - Bytes are fed little-endian, so digests match across hosts.
//  - -0.0 hashes like +0.0 and every NaN hashes alike.
//  - Strings are length-prefixed, so ("ab","c") != ("a","bc").
class Digest64 {
 public:
  Digest64() = default;

  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }
  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }
  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s);
  void add_double(double v);

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

// Fixed-width lowercase hex ("00000000deadbeef").
std::string digest64_to_hex(std::uint64_t v);

// Inverse of digest64_to_hex. Returns false on malformed input.
bool digest64_from_hex(const std::string& hex, std::uint64_t& out);

} // namespace aerojudge
