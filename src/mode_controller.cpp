// ============================================================================
// mode_controller.cpp - implementation for unimix/mode_controller.hpp
// ============================================================================

#include "unimix/mode_controller.hpp"

namespace unimix {

const char* to_string(ProtocolMode m) {
  switch (m) {
    case ProtocolMode::Undetermined: return "undetermined";
    case ProtocolMode::Binary:       return "binary";
    case ProtocolMode::Text:         return "text";
  }
  return "unknown";
}

ProtocolModeController::ProtocolModeController(bool binary_enabled, uint32_t fallback_threshold)
  : threshold_(fallback_threshold == 0 ? 1 : fallback_threshold) {
  mode_.store(binary_enabled ? ProtocolMode::Binary : ProtocolMode::Text);
}

void ProtocolModeController::on_decode_success() {
  seen_success_.store(true);
}

bool ProtocolModeController::on_decode_failure() {
  if (mode_.load() != ProtocolMode::Binary) return false;
  const uint32_t n = failures_.fetch_add(1) + 1;
  if (seen_success_.load() || n < threshold_) return false;

  ProtocolMode expected = ProtocolMode::Binary;
  return mode_.compare_exchange_strong(expected, ProtocolMode::Text);
}

} // namespace unimix
