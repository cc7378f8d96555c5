#pragma once
/**
 * @file crc16.hpp
 * @brief CRC-16 used by the binary frame trailer check (reflected, poly 0xA001, init 0xFFFF).
 *
 * @details
 * This is the CRC-16/MODBUS register walk: XOR each byte into the low end of the
 * register, then shift right eight times, folding in 0xA001 whenever a 1 falls
 * off. The microcontroller firmware runs the exact same loop; any change here is
 * a wire break, not a refactor.
 *
 * Empty input returns the initial value 0xFFFF unchanged.
 *
 * @code
 *   const char* s = "123456789";
 *   uint16_t c = unimix::crc16::calculate(reinterpret_cast<const uint8_t*>(s), 9);
 *   // c == 0x4B37
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace unimix {
namespace crc16 {

static constexpr uint16_t POLYNOMIAL    = 0xA001;
static constexpr uint16_t INITIAL_VALUE = 0xFFFF;

uint16_t calculate(const uint8_t* data, size_t len);

inline uint16_t calculate(const std::vector<uint8_t>& data) {
  return calculate(data.data(), data.size());
}

} // namespace crc16
} // namespace unimix
