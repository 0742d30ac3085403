#include "sam3/crypto_utils.hpp"

namespace sam3 {

std::array<uint8_t, kDigestLen> sha256(const uint8_t* data, size_t len) {
  std::array<uint8_t, kDigestLen> out{};
  sha256_Raw(data, len, out.data());
  return out;
}

}  // namespace sam3
