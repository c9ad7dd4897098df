#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bridge_protocol {

inline uint32_t decode_u32_le(const uint8_t *b) {
  return (static_cast<uint32_t>(b[0])) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

inline void encode_u32_le(uint32_t v, uint8_t *b) {
  b[0] = static_cast<uint8_t>(v & 0xFF);
  b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  b[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

// u64 on the wire is two u32 LE halves, low half first.
inline uint64_t decode_u64_le(const uint8_t *b) {
  const uint64_t low = decode_u32_le(b);
  const uint64_t high = decode_u32_le(b + 4);
  return low + (high << 32);
}

inline void encode_u64_le(uint64_t v, uint8_t *b) {
  encode_u32_le(static_cast<uint32_t>(v & 0xFFFFFFFFu), b);
  encode_u32_le(static_cast<uint32_t>(v >> 32), b + 4);
}

inline void append_u32_le(std::vector<uint8_t> &out, uint32_t v) {
  uint8_t b[4];
  encode_u32_le(v, b);
  out.insert(out.end(), b, b + 4);
}

inline void append_u64_le(std::vector<uint8_t> &out, uint64_t v) {
  uint8_t b[8];
  encode_u64_le(v, b);
  out.insert(out.end(), b, b + 8);
}

} // namespace bridge_protocol
