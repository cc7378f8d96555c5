#include <doctest/doctest.h>
#include "unimix/mode_controller.hpp"

using namespace unimix;

TEST_CASE("Binary enabled starts in Binary, disabled starts in Text") {
    CHECK(ProtocolModeController(true, 3).mode() == ProtocolMode::Binary);
    CHECK(ProtocolModeController(false, 3).mode() == ProtocolMode::Text);
}

TEST_CASE("Falls back to Text after the threshold with no success seen") {
    ProtocolModeController m(true, 3);
    CHECK_FALSE(m.on_decode_failure());
    CHECK_FALSE(m.on_decode_failure());
    CHECK(m.binary());
    CHECK(m.on_decode_failure());
    CHECK(m.mode() == ProtocolMode::Text);
    CHECK(m.failures() == 3);
}

TEST_CASE("The fallback is reported once and is one-way") {
    ProtocolModeController m(true, 1);
    CHECK(m.on_decode_failure());
    CHECK_FALSE(m.on_decode_failure());
    m.on_decode_success();
    CHECK(m.mode() == ProtocolMode::Text);
}

TEST_CASE("After one successful decode, failures never cause fallback") {
    ProtocolModeController m(true, 2);
    m.on_decode_success();
    for (int i = 0; i < 100; ++i) CHECK_FALSE(m.on_decode_failure());
    CHECK(m.binary());
    CHECK(m.seen_success());
}

TEST_CASE("Threshold zero behaves as one") {
    ProtocolModeController m(true, 0);
    CHECK(m.threshold() == 1);
    CHECK(m.on_decode_failure());
}

TEST_CASE("Text mode ignores decode failures") {
    ProtocolModeController m(false, 1);
    CHECK_FALSE(m.on_decode_failure());
    CHECK(m.failures() == 0);
}
