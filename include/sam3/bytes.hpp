#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sam3 {

using ByteVec = std::vector<uint8_t>;

// I2P base64 replaces '+' and '/' of RFC 4648 with '-' and '~'.
inline uint8_t i2pBase64Value(char c) {
  if (c >= 'A' && c <= 'Z') return static_cast<uint8_t>(c - 'A');
  if (c >= 'a' && c <= 'z') return static_cast<uint8_t>(26 + (c - 'a'));
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(52 + (c - '0'));
  if (c == '-') return 62;
  if (c == '~') return 63;
  throw std::invalid_argument("invalid i2p base64 character");
}

inline ByteVec i2pBase64Decode(std::string_view in) {
  while (!in.empty() && in.back() == '=') in.remove_suffix(1);
  if ((in.size() % 4) == 1) throw std::invalid_argument("invalid i2p base64 length");
  ByteVec out;
  out.reserve(in.size() * 3 / 4);
  uint32_t acc = 0;
  int bits = 0;
  for (char c : in) {
    acc = (acc << 6) | i2pBase64Value(c);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
    }
  }
  return out;
}

// Lowercase RFC 4648 base32 without padding, as used by .b32.i2p names.
inline std::string base32Encode(const uint8_t* data, size_t len) {
  static constexpr char kAlphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
  std::string out;
  out.reserve((len * 8 + 4) / 5);
  uint32_t acc = 0;
  int bits = 0;
  for (size_t i = 0; i < len; ++i) {
    acc = (acc << 8) | data[i];
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(kAlphabet[(acc >> bits) & 0x1F]);
    }
  }
  if (bits > 0) out.push_back(kAlphabet[(acc << (5 - bits)) & 0x1F]);
  return out;
}

}  // namespace sam3
