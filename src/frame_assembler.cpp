// ============================================================================
// frame_assembler.cpp - implementation for unimix/frame_assembler.hpp
// For the resync rules see the header. Tests: tests/test_frame_assembler.cpp
// ============================================================================

#include "unimix/frame_assembler.hpp"
#include "unimix/protocol_statistics.hpp"

#include <algorithm>

namespace unimix {

FrameAssembler::FrameAssembler(size_t max_payload,
                               uint32_t timeout_ms,
                               ProtocolStatistics* stats,
                               Logger log)
  : max_payload_(std::min(max_payload, frame::MAX_PAYLOAD_LIMIT)),
    timeout_ms_(timeout_ms),
    stats_(stats),
    log_(std::move(log)) {}

void FrameAssembler::reset() {
  buf_.clear();
  partial_ = false;
  partial_since_ = 0;
}

void FrameAssembler::report(ErrorKind kind, AssemblerOutput& out) {
  if (stats_) stats_->record_error(kind);
  out.errors.push_back(kind);
}

// ---------------------------------------------------------------------------
// drop_to_next_start()
// --------------------
// Remove buf_[0] and everything up to (not including) the next START.
// Clears the buffer when there is none.
// ---------------------------------------------------------------------------
void FrameAssembler::drop_to_next_start() {
  partial_ = false;
  if (buf_.empty()) return;
  auto next = std::find(buf_.begin() + 1, buf_.end(), frame::START);
  buf_.erase(buf_.begin(), next);
}

void FrameAssembler::expire(uint64_t now_ms, AssemblerOutput& out) {
  if (!partial_ || timeout_ms_ == 0 || buf_.empty()) return;
  if (now_ms < partial_since_ || now_ms - partial_since_ <= timeout_ms_) return;

  log_.warn("partial frame timed out after " + std::to_string(now_ms - partial_since_) +
            "ms with " + std::to_string(buf_.size()) + " bytes buffered");
  report(ErrorKind::Timeout, out);
  drop_to_next_start();
}

AssemblerOutput FrameAssembler::feed(const uint8_t* data, size_t n, uint64_t now_ms) {
  AssemblerOutput out;
  expire(now_ms, out);

  size_t off = 0;
  while (data && off < n) {
    const size_t room = buf_.capacity() - buf_.size();
    const size_t take = std::min(room, n - off);
    buf_.insert(buf_.end(), data + off, data + off + take);
    off += take;
    process(now_ms, out);
  }
  if (off == 0) process(now_ms, out);
  return out;
}

AssemblerOutput FrameAssembler::poll(uint64_t now_ms) {
  AssemblerOutput out;
  expire(now_ms, out);
  process(now_ms, out);
  return out;
}

// ---------------------------------------------------------------------------
// process()
// ---------
// Resolve as much of buf_ as possible. Exits only when the buffer is empty or
// holds a partial frame starting at buf_[0] that is still within bounds.
// ---------------------------------------------------------------------------
void FrameAssembler::process(uint64_t now_ms, AssemblerOutput& out) {
  const size_t overflow_at = frame::max_frame_size(max_payload_);

  while (!buf_.empty()) {
    // 1) noise before START
    auto start = std::find(buf_.begin(), buf_.end(), frame::START);
    if (start != buf_.begin()) {
      const size_t dropped = (size_t)(start - buf_.begin());
      log_.debug("discarded " + std::to_string(dropped) + " bytes before start marker");
      report(ErrorKind::Framing, out);
      buf_.erase(buf_.begin(), start);
      partial_ = false;
      continue;
    }

    if (!partial_) {
      partial_ = true;
      partial_since_ = now_ms;
    }

    // 2) header
    if (buf_.size() < frame::HEADER_SIZE) return;

    const uint32_t declared = frame::get_u32le(buf_.data() + frame::OFFSET_LENGTH);
    if (declared > max_payload_) {
      log_.warn("declared length " + std::to_string(declared) + " exceeds max " +
                std::to_string(max_payload_));
      report(ErrorKind::BufferOverflow, out);
      drop_to_next_start();
      continue;
    }

    // 3) END scan; an ESCAPE makes the next byte literal
    size_t end_pos = 0;
    bool esc = false;
    for (size_t i = frame::HEADER_SIZE; i < buf_.size(); ++i) {
      const uint8_t b = buf_[i];
      if (esc)                    { esc = false; continue; }
      if (b == frame::ESCAPE)     { esc = true; continue; }
      if (b == frame::END)        { end_pos = i; break; }
    }

    if (end_pos != 0) {
      const size_t frame_len = end_pos + 1;
      frame::DecodeResult r = frame::decode(buf_.data(), frame_len);
      if (r.ok()) {
        log_.trace("frame ok type=" + hex8(r.type) + " len=" + std::to_string(r.payload.size()));
        if (stats_) stats_->record_received(frame_len);
        out.frames.push_back(std::move(r));
        buf_.erase(buf_.begin(), buf_.begin() + frame_len);
        partial_ = false;
      } else {
        if (r.error == ErrorKind::Crc) {
          log_.warn("crc mismatch calc=" + hex16(r.computed_crc) + " want=" + hex16(r.declared_crc));
        } else {
          log_.warn(std::string("frame rejected reason=") + to_string(r.error) +
                    " declared=" + std::to_string(r.declared_length) +
                    " actual=" + std::to_string(r.payload.size()));
        }
        report(r.error, out);
        drop_to_next_start();
      }
      continue;
    }

    // 4) unterminated
    if (buf_.size() >= overflow_at) {
      log_.warn("unterminated frame reached " + std::to_string(buf_.size()) + " bytes");
      report(ErrorKind::BufferOverflow, out);
      drop_to_next_start();
      continue;
    }
    return;
  }
  partial_ = false;
}

} // namespace unimix
