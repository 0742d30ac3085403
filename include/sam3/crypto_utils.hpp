#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

extern "C" {
#include "sha2.h"
}

namespace sam3 {

constexpr size_t kDigestLen = 32;

std::array<uint8_t, kDigestLen> sha256(const uint8_t* data, size_t len);

}  // namespace sam3
