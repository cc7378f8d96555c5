#include <doctest/doctest.h>
#include "unimix/crc16.hpp"

#include <string>
#include <vector>

using namespace unimix;

static uint16_t crc_of(const std::string& s) {
    return crc16::calculate(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

TEST_CASE("CRC-16 of the standard check string matches the firmware (MODBUS) value") {
    CHECK(crc_of("123456789") == 0x4B37);
}

TEST_CASE("Empty input returns the initial register value") {
    CHECK(crc16::calculate(nullptr, 0) == crc16::INITIAL_VALUE);
    CHECK(crc16::calculate(std::vector<uint8_t>{}) == 0xFFFF);
}

TEST_CASE("Pointer and vector overloads agree") {
    std::vector<uint8_t> v{0x7E, 0x7F, 0x7D, 0x00, 0xFF};
    CHECK(crc16::calculate(v) == crc16::calculate(v.data(), v.size()));
}

TEST_CASE("Single-byte difference changes the CRC") {
    CHECK(crc_of("{\"a\":1}") != crc_of("{\"a\":2}"));
}
