#pragma once
/**
 * @page um-frame-assembler unimix Frame Assembler
 * @file frame_assembler.hpp
 * @brief Incremental reassembly of binary frames from an arbitrarily chunked byte stream.
 *
 * @details
 * PURPOSE
 * -------
 * A serial read returns whatever the driver had: half a frame, three frames,
 * or boot noise followed by the start of a frame. The assembler keeps the
 * unresolved bytes in a fixed-capacity buffer and emits every frame exactly
 * once, fully reassembled, no matter where the reads split it.
 *
 * WHAT THIS DOES
 * --------------
 * On every feed():
 *   1) Expire a stale partial frame (older than the frame timeout).
 *   2) Append the new bytes (in slices, never past buffer capacity).
 *   3) Loop:
 *      - drop bytes before the next START; one Framing error per dropped span
 *      - wait until the 8-byte header is present (normal, not an error)
 *      - declared length above the max payload -> BufferOverflow, resync
 *      - scan for END from offset 8, stepping over ESCAPE+byte pairs
 *      - END found: decode the slice; success is emitted, failure is counted
 *        and the scan resyncs at the next START after the failed frame's start
 *      - no END and the buffer holds a worst-case frame -> BufferOverflow, resync
 *      - otherwise wait for more bytes
 *
 * Resync after a failed frame removes the failed bytes without counting them
 * as noise a second time.
 *
 * STORAGE
 * -------
 * AssemblyBuffer is an etl::vector sized for the worst-case escaped frame at
 * the compile-time payload limit. No heap growth on the receive path; the
 * overflow rule guarantees room for the next slice after every pass.
 *
 * TIME
 * ----
 * Callers pass a monotonic millisecond clock (now_ms). The assembler never
 * reads a clock itself, so tests drive timeouts deterministically.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

#include "etl/vector.h"

#include "unimix/errors.hpp"
#include "unimix/frame_codec.hpp"
#include "unimix/log.hpp"

namespace unimix {

class ProtocolStatistics;

/// Everything one feed()/poll() produced, in stream order per list.
struct AssemblerOutput {
  std::vector<frame::DecodeResult> frames;   ///< decoded frames only (all ok())
  std::vector<ErrorKind> errors;             ///< one entry per counted error

  bool empty() const { return frames.empty() && errors.empty(); }
};

class FrameAssembler {
public:
  static constexpr size_t CAPACITY = frame::max_frame_size(frame::MAX_PAYLOAD_LIMIT);
  using AssemblyBuffer = etl::vector<uint8_t, CAPACITY>;

  /**
   * @param max_payload  Largest accepted payload; clamped to MAX_PAYLOAD_LIMIT.
   * @param timeout_ms   Partial-frame budget; 0 disables the timeout.
   * @param stats        Counters to update (may be null).
   */
  FrameAssembler(size_t max_payload,
                 uint32_t timeout_ms,
                 ProtocolStatistics* stats,
                 Logger log = Logger::null());

  AssemblerOutput feed(const uint8_t* data, size_t n, uint64_t now_ms);

  AssemblerOutput feed(const std::vector<uint8_t>& data, uint64_t now_ms) {
    return feed(data.data(), data.size(), now_ms);
  }

  /// Timeout check without new bytes (called by idle read loops).
  AssemblerOutput poll(uint64_t now_ms);

  /// Forget every pending byte (new connection).
  void reset();

  size_t pending() const { return buf_.size(); }
  const AssemblyBuffer& buffer() const { return buf_; }
  size_t max_payload() const { return max_payload_; }

private:
  void process(uint64_t now_ms, AssemblerOutput& out);
  void expire(uint64_t now_ms, AssemblerOutput& out);
  void drop_to_next_start();
  void report(ErrorKind kind, AssemblerOutput& out);

  AssemblyBuffer buf_;
  size_t max_payload_;
  uint32_t timeout_ms_;
  ProtocolStatistics* stats_;
  Logger log_;

  bool partial_ = false;          // START at buf_[0] seen, frame not complete
  uint64_t partial_since_ = 0;
};

} // namespace unimix
