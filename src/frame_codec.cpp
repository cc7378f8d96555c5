// ============================================================================
// frame_codec.cpp - implementation for unimix/frame_codec.hpp
// For the wire layout and check order see the header.
// ============================================================================

#include "unimix/frame_codec.hpp"
#include "unimix/crc16.hpp"

namespace unimix {
namespace frame {

void escape(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (is_reserved(b)) {
      out.push_back(ESCAPE);
      out.push_back((uint8_t)(b ^ ESCAPE_XOR));
    } else {
      out.push_back(b);
    }
  }
}

ErrorKind unescape(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n);

  bool esc = false;
  for (size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if (esc) {
      out.push_back((uint8_t)(b ^ ESCAPE_XOR));
      esc = false;
    } else if (b == ESCAPE) {
      esc = true;
    } else {
      out.push_back(b);
    }
  }
  return esc ? ErrorKind::EscapeSequence : ErrorKind::None;
}

// ---------------------------------------------------------------------------
// encode()
// --------
// START | len u32 LE | crc u16 LE | type | escape(payload) | END
// Capacity hint: worst case every payload byte escapes.
// ---------------------------------------------------------------------------
std::vector<uint8_t> encode(uint8_t type, const uint8_t* payload, size_t len) {
  std::vector<uint8_t> out;
  out.reserve(max_frame_size(len));

  const uint16_t crc = crc16::calculate(payload, len);

  out.push_back(START);
  put_u32le((uint32_t)len, out);
  put_u16le(crc, out);
  out.push_back(type);
  escape(payload, len, out);
  out.push_back(END);
  return out;
}

// ---------------------------------------------------------------------------
// decode()
// --------
// Checks run in wire order so the first failure is the one reported.
// ---------------------------------------------------------------------------
DecodeResult decode(const uint8_t* frame, size_t len) {
  DecodeResult r;

  if (!frame || len < MIN_FRAME_SIZE) {
    r.error = ErrorKind::Framing;
    return r;
  }
  if (frame[0] != START || frame[len - 1] != END) {
    r.error = ErrorKind::Framing;
    return r;
  }

  r.declared_length = get_u32le(frame + OFFSET_LENGTH);
  r.declared_crc    = get_u16le(frame + OFFSET_CRC);
  r.type            = frame[OFFSET_TYPE];

  const size_t body_len = len - HEADER_SIZE - TRAILER_SIZE;
  r.error = unescape(frame + HEADER_SIZE, body_len, r.payload);
  if (!r.ok()) return r;

  r.computed_crc = crc16::calculate(r.payload);

  if (r.payload.size() != r.declared_length) {
    r.error = ErrorKind::Framing;
    return r;
  }
  if (r.computed_crc != r.declared_crc) {
    r.error = ErrorKind::Crc;
    return r;
  }
  return r;
}

} // namespace frame
} // namespace unimix
