// ============================================================================
// frame_debug.cpp - implementation for unimix/frame_debug.hpp
// ============================================================================

#include "unimix/frame_debug.hpp"
#include "unimix/crc16.hpp"
#include "unimix/frame_codec.hpp"
#include "unimix/log.hpp"

#include <cctype>
#include <sstream>

namespace unimix {

// ---------------------------------------------------------------------------
// analyze_frame()
// ---------------
// Reads every field the buffer is long enough to hold. The verdict always
// comes from frame::decode() so the tool and the receive path never disagree.
// ---------------------------------------------------------------------------
FrameAnalysis analyze_frame(const uint8_t* data, size_t len) {
  FrameAnalysis a;
  a.frame_length = len;
  a.verdict = frame::decode(data, len).error;
  if (!data || len == 0) { a.too_short = true; return a; }

  a.too_short = len < frame::MIN_FRAME_SIZE;
  a.start_byte = data[0];
  a.start_ok = data[0] == frame::START;
  a.end_byte = data[len - 1];
  a.end_ok = data[len - 1] == frame::END;

  if (len >= frame::HEADER_SIZE) {
    a.declared_length = frame::get_u32le(data + frame::OFFSET_LENGTH);
    a.declared_crc    = frame::get_u16le(data + frame::OFFSET_CRC);
    a.type            = data[frame::OFFSET_TYPE];
  }
  if (a.too_short) return a;

  std::vector<uint8_t> payload;
  const size_t body = len - frame::HEADER_SIZE - frame::TRAILER_SIZE;
  a.escape_ok = frame::unescape(data + frame::HEADER_SIZE, body, payload) == ErrorKind::None;
  a.unescaped_length = payload.size();
  a.length_ok = payload.size() == a.declared_length;
  a.computed_crc = crc16::calculate(payload);
  a.crc_ok = a.computed_crc == a.declared_crc;
  a.payload_text.assign(payload.begin(), payload.end());
  return a;
}

static const char* mark(bool ok) { return ok ? "[ok]  " : "[FAIL]"; }

std::string format_analysis(const FrameAnalysis& a) {
  std::ostringstream o;
  o << "frame length: " << a.frame_length << " bytes\n";
  if (a.frame_length == 0) {
    o << "verdict: " << to_string(a.verdict) << "\n";
    return o.str();
  }
  o << mark(a.start_ok) << " start marker " << hex8(a.start_byte)
    << " (want " << hex8(frame::START) << ")\n";
  if (a.frame_length >= frame::HEADER_SIZE) {
    o << "       declared length " << a.declared_length << "\n";
    o << "       declared crc    " << hex16(a.declared_crc) << "\n";
    o << "       message type    " << hex8(a.type) << "\n";
  }
  o << mark(a.end_ok) << " end marker " << hex8(a.end_byte)
    << " (want " << hex8(frame::END) << ")\n";

  if (a.too_short) {
    o << "[FAIL] too short, minimum " << frame::MIN_FRAME_SIZE << " bytes\n";
  } else {
    o << mark(a.escape_ok) << " escape sequences"
      << (a.escape_ok ? "" : " (dangling escape before end)") << "\n";
    o << mark(a.length_ok) << " unescaped length " << a.unescaped_length
      << " (declared " << a.declared_length << ")\n";
    o << mark(a.crc_ok) << " crc calculated " << hex16(a.computed_crc)
      << " (declared " << hex16(a.declared_crc) << ")\n";
    o << "payload: " << a.payload_text << "\n";
  }
  o << "verdict: " << (a.ok() ? "valid" : to_string(a.verdict)) << "\n";
  return o.str();
}

uint16_t crc16_msb_first(const uint8_t* data, size_t len, uint16_t poly) {
  uint16_t crc = 0xFFFF;
  for (size_t i = 0; i < len; ++i) {
    crc ^= (uint16_t)(data[i] << 8);
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x8000) crc = (uint16_t)((crc << 1) ^ poly);
      else              crc = (uint16_t)(crc << 1);
    }
  }
  return crc;
}

static uint16_t crc16_reflected_zero_init(const uint8_t* data, size_t len) {
  uint16_t crc = 0x0000;
  for (size_t i = 0; i < len; ++i) {
    crc ^= data[i];
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x0001) crc = (uint16_t)((crc >> 1) ^ crc16::POLYNOMIAL);
      else              crc = (uint16_t)(crc >> 1);
    }
  }
  return crc;
}

CrcVariants crc_variants(const uint8_t* payload, size_t len) {
  CrcVariants v;
  v.firmware  = crc16::calculate(payload, len);
  v.poly_8005 = crc16_msb_first(payload, len, 0x8005);
  v.poly_1021 = crc16_msb_first(payload, len, 0x1021);
  v.zero_init = crc16_reflected_zero_init(payload, len);

  std::vector<uint8_t> esc;
  frame::escape(payload, len, esc);
  v.escaped = crc16::calculate(esc);
  return v;
}

std::string format_crc_variants(const CrcVariants& v) {
  std::ostringstream o;
  o << "reflected 0xA001 init 0xFFFF (wire): " << hex16(v.firmware) << "\n"
    << "msb-first 0x8005 init 0xFFFF:        " << hex16(v.poly_8005) << "\n"
    << "msb-first 0x1021 init 0xFFFF:        " << hex16(v.poly_1021) << "\n"
    << "reflected 0xA001 init 0x0000:        " << hex16(v.zero_init) << "\n"
    << "wire crc over escaped payload:       " << hex16(v.escaped) << "\n";
  return o.str();
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool is_separator(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '-' || c == ':' || c == ',';
}

bool parse_hex_bytes(const std::string& text, std::vector<uint8_t>& out, std::string& err) {
  out.clear();
  size_t i = 0;
  while (i < text.size()) {
    if (is_separator(text[i])) { ++i; continue; }

    size_t j = i;
    while (j < text.size() && !is_separator(text[j])) ++j;
    std::string tok = text.substr(i, j - i);
    if (tok.size() > 2 && tok[0] == '0' && (tok[1] == 'x' || tok[1] == 'X')) tok = tok.substr(2);

    if (tok.size() % 2 != 0) {
      err = "reason=odd_hex_digits token=" + text.substr(i, j - i);
      return false;
    }
    for (size_t k = 0; k < tok.size(); k += 2) {
      const int hi = hex_value(tok[k]);
      const int lo = hex_value(tok[k + 1]);
      if (hi < 0 || lo < 0) {
        err = "reason=bad_hex token=" + text.substr(i, j - i);
        return false;
      }
      out.push_back((uint8_t)((hi << 4) | lo));
    }
    i = j;
  }
  return true;
}

std::string to_hex(const uint8_t* data, size_t len, char sep) {
  static const char* DIGITS = "0123456789ABCDEF";
  std::string s;
  s.reserve(len * 3);
  for (size_t i = 0; i < len; ++i) {
    if (i && sep) s.push_back(sep);
    s.push_back(DIGITS[data[i] >> 4]);
    s.push_back(DIGITS[data[i] & 0x0F]);
  }
  return s;
}

} // namespace unimix
