// ============================================================================
// crc16.cpp - implementation for unimix/crc16.hpp
// ============================================================================

#include "unimix/crc16.hpp"

namespace unimix {
namespace crc16 {

uint16_t calculate(const uint8_t* data, size_t len) {
  uint16_t crc = INITIAL_VALUE;
  if (!data) return crc;

  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x0001) crc = (uint16_t)((crc >> 1) ^ POLYNOMIAL);
      else              crc = (uint16_t)(crc >> 1);
    }
  }
  return crc;
}

} // namespace crc16
} // namespace unimix
