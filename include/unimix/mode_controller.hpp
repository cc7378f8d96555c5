#pragma once
/**
 * @file mode_controller.hpp
 * @brief Binary vs. text protocol decision with one-way fallback.
 *
 * @details
 * States: Undetermined -> Binary (binary enabled) or Text (disabled), set in
 * the constructor. While Binary and before any successful decode, every
 * frame-level failure counts toward the threshold; reaching it switches to
 * Text for good. After the first success, failures never cause a fallback.
 *
 * The mode is an atomic so the writer path can read it while the reader
 * updates it.
 */

#include <atomic>
#include <cstdint>

namespace unimix {

enum class ProtocolMode : uint8_t { Undetermined = 0, Binary, Text };

const char* to_string(ProtocolMode m);

class ProtocolModeController {
public:
  /// @param fallback_threshold  failures before fallback; values below 1 act as 1.
  ProtocolModeController(bool binary_enabled, uint32_t fallback_threshold);

  ProtocolMode mode() const { return mode_.load(); }
  bool binary() const { return mode() == ProtocolMode::Binary; }

  void on_decode_success();

  /// @return true exactly once: on the failure that caused Binary -> Text.
  bool on_decode_failure();

  bool seen_success() const { return seen_success_.load(); }
  uint32_t failures() const { return failures_.load(); }
  uint32_t threshold() const { return threshold_; }

private:
  std::atomic<ProtocolMode> mode_{ProtocolMode::Undetermined};
  std::atomic<bool> seen_success_{false};
  std::atomic<uint32_t> failures_{0};
  uint32_t threshold_;
};

} // namespace unimix
