#pragma once
/**
 * @page um-frame-debug unimix Frame Diagnostics
 * @file frame_debug.hpp
 * @brief Field-by-field frame analysis, CRC variant checks and hex helpers for unimix-cli.
 *
 * @details
 * PURPOSE
 * -------
 * When the firmware and the host disagree, a captured frame is the only
 * evidence. analyze_frame() reports every field it can read, even after an
 * earlier check failed, so one run shows all problems at once.
 *
 * crc_variants() computes the checksum the common wrong ways (MSB-first
 * polynomials, zero initial value, CRC over the escaped bytes). A match there
 * tells you which mistake the other side made.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "unimix/errors.hpp"

namespace unimix {

struct FrameAnalysis {
  size_t frame_length = 0;
  bool too_short = false;

  uint8_t start_byte = 0;
  bool start_ok = false;
  uint8_t end_byte = 0;
  bool end_ok = false;

  uint32_t declared_length = 0;
  uint16_t declared_crc = 0;
  uint8_t type = 0;

  size_t unescaped_length = 0;
  bool escape_ok = false;
  bool length_ok = false;
  uint16_t computed_crc = 0;
  bool crc_ok = false;

  std::string payload_text;
  ErrorKind verdict = ErrorKind::None;   ///< what frame::decode() reports

  bool ok() const { return verdict == ErrorKind::None; }
};

FrameAnalysis analyze_frame(const uint8_t* data, size_t len);

inline FrameAnalysis analyze_frame(const std::vector<uint8_t>& f) {
  return analyze_frame(f.data(), f.size());
}

/// Multi-line, human-readable report ([ok]/[FAIL] per check).
std::string format_analysis(const FrameAnalysis& a);

struct CrcVariants {
  uint16_t firmware = 0;     ///< reflected 0xA001, init 0xFFFF (what the wire uses)
  uint16_t poly_8005 = 0;    ///< MSB-first 0x8005, init 0xFFFF
  uint16_t poly_1021 = 0;    ///< MSB-first 0x1021, init 0xFFFF
  uint16_t zero_init = 0;    ///< reflected 0xA001, init 0x0000
  uint16_t escaped = 0;      ///< firmware CRC over the escaped payload
};

CrcVariants crc_variants(const uint8_t* payload, size_t len);

std::string format_crc_variants(const CrcVariants& v);

/// MSB-first CRC-16 with init 0xFFFF (used for the variant table).
uint16_t crc16_msb_first(const uint8_t* data, size_t len, uint16_t poly);

/**
 * @brief Parse "7E 07 00", "7E0700", "7E-07-00" or "0x7E,0x07" into bytes.
 *
 * Separators: space, tab, newline, '-', ':', ','. Tokens must have an even
 * number of hex digits.
 */
bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out, std::string& err);

/// Upper-case hex with @p sep between bytes (no separator when sep == 0).
std::string to_hex(const uint8_t* data, size_t len, char sep = ' ');

inline std::string to_hex(const std::vector<uint8_t>& v, char sep = ' ') {
  return to_hex(v.data(), v.size(), sep);
}

} // namespace unimix
