#pragma once
/**
 * @page um-frame-codec unimix Binary Frame Codec
 * @file frame_codec.hpp
 * @brief Encode one payload into a binary frame, and decode one complete frame back.
 *
 * @details
 * OVERVIEW
 * --------
 * The microcontroller and the host exchange JSON text wrapped in a small binary
 * envelope. The envelope gives explicit boundaries on a raw serial byte stream
 * and a CRC so a flipped bit is caught before the JSON parser ever sees it.
 *
 * WIRE LAYOUT (little-endian)
 * ---------------------------
 *   offset 0       START (0x7E)
 *   offset 1..4    payload length, u32, length of the UNESCAPED payload
 *   offset 5..6    CRC-16 of the unescaped payload, u16
 *   offset 7       message type, u8
 *   offset 8..N-2  escaped payload
 *   offset N-1     END (0x7F)
 *
 * The header is not escaped. Its length and CRC bytes may legitimately hold
 * 0x7E or 0x7F, so scanners must never look for END before offset 8.
 *
 * ESCAPING
 * --------
 * Reserved values inside the payload:
 *   START  (0x7E)
 *   END    (0x7F)
 *   ESCAPE (0x7D)
 * Each is sent as ESCAPE followed by (byte XOR 0x20):
 *   0x7E -> 7D 5E
 *   0x7F -> 7D 5F
 *   0x7D -> 7D 5D
 * Every other byte passes through. Unescaping XORs the byte after any ESCAPE,
 * so it is the exact inverse of escaping. An ESCAPE with nothing after it
 * (immediately before END) is an EscapeSequence error.
 *
 * DECODE CHECKS (in order)
 * ------------------------
 *   1) size >= MIN_FRAME_SIZE                 else Framing
 *   2) first byte START, last byte END        else Framing
 *   3) unescape offsets 8..N-2                dangling ESCAPE -> EscapeSequence
 *   4) unescaped size == declared length      else Framing
 *   5) crc16(unescaped) == declared CRC       else Crc
 * Nothing throws. The caller gets a DecodeResult and decides what to count
 * and log.
 *
 * EXAMPLE
 * -------
 * @code
 *   std::string json = R"({"a":1})";
 *   auto wire = unimix::frame::encode(0x01,
 *                   reinterpret_cast<const uint8_t*>(json.data()), json.size());
 *   auto r = unimix::frame::decode(wire.data(), wire.size());
 *   // r.ok(), r.type == 0x01, r.payload holds {"a":1}
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "unimix/errors.hpp"

namespace unimix {
namespace frame {

/**
 * @name Markers and layout constants
 * @{
 */
static constexpr uint8_t START      = 0x7E;
static constexpr uint8_t END        = 0x7F;
static constexpr uint8_t ESCAPE     = 0x7D;
static constexpr uint8_t ESCAPE_XOR = 0x20;

static constexpr size_t HEADER_SIZE    = 8;   ///< START + length(4) + crc(2) + type(1)
static constexpr size_t TRAILER_SIZE   = 1;   ///< END
static constexpr size_t MIN_FRAME_SIZE = HEADER_SIZE + TRAILER_SIZE;

static constexpr size_t OFFSET_LENGTH = 1;
static constexpr size_t OFFSET_CRC    = 5;
static constexpr size_t OFFSET_TYPE   = 7;

/// Type byte for JSON payloads; the firmware sends every message with it.
static constexpr uint8_t TYPE_JSON = 0x01;

/// Compile-time ceiling for the configurable maximum payload size.
static constexpr size_t MAX_PAYLOAD_LIMIT = 4096;
/** @} */

/// Largest wire frame for a payload limit: every payload byte escaped.
inline constexpr size_t max_frame_size(size_t max_payload) {
  return HEADER_SIZE + 2 * max_payload + TRAILER_SIZE;
}

inline bool is_reserved(uint8_t b) {
  return b == START || b == END || b == ESCAPE;
}

inline void put_u32le(uint32_t v, std::vector<uint8_t>& out) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)((v >> 8) & 0xFF));
  out.push_back((uint8_t)((v >> 16) & 0xFF));
  out.push_back((uint8_t)((v >> 24) & 0xFF));
}

inline void put_u16le(uint16_t v, std::vector<uint8_t>& out) {
  out.push_back((uint8_t)(v & 0xFF));
  out.push_back((uint8_t)((v >> 8) & 0xFF));
}

inline uint32_t get_u32le(const uint8_t* p) {
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

inline uint16_t get_u16le(const uint8_t* p) {
  return (uint16_t)(p[0] | (p[1] << 8));
}

/**
 * @brief Append the escaped form of @p in to @p out.
 *
 * Reserved bytes become ESCAPE, byte ^ 0x20. @p out is not cleared.
 */
void escape(const uint8_t* in, size_t n, std::vector<uint8_t>& out);

/**
 * @brief Reverse escape() into @p out (cleared first).
 *
 * @return ErrorKind::None, or ErrorKind::EscapeSequence when the input ends in
 *         an ESCAPE with no byte after it. @p out then holds what was decoded
 *         before the dangling escape.
 */
ErrorKind unescape(const uint8_t* in, size_t n, std::vector<uint8_t>& out);

/**
 * @brief Build a complete frame for one payload.
 *
 * Size limits are the caller's policy; this function frames whatever it is given.
 */
std::vector<uint8_t> encode(uint8_t type, const uint8_t* payload, size_t len);

inline std::vector<uint8_t> encode(uint8_t type, const std::string& payload) {
  return encode(type, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

/**
 * @struct DecodeResult
 * @brief Outcome of decode(): either a payload or the reason it was rejected.
 *
 * The declared/computed fields are filled as far as decoding got, so logs and
 * the debug tool can show what the frame claimed against what arrived.
 */
struct DecodeResult {
  ErrorKind error = ErrorKind::None;
  uint8_t type = 0;
  std::vector<uint8_t> payload;
  uint32_t declared_length = 0;
  uint16_t declared_crc = 0;
  uint16_t computed_crc = 0;

  bool ok() const { return error == ErrorKind::None; }
  std::string payload_text() const { return std::string(payload.begin(), payload.end()); }
};

/**
 * @brief Validate and unwrap exactly one frame (START through END inclusive).
 */
DecodeResult decode(const uint8_t* frame, size_t len);

inline DecodeResult decode(const std::vector<uint8_t>& frame) {
  return decode(frame.data(), frame.size());
}

} // namespace frame
} // namespace unimix
