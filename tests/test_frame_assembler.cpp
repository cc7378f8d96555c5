#include <doctest/doctest.h>
#include "unimix/frame_assembler.hpp"
#include "unimix/frame_codec.hpp"
#include "unimix/protocol_statistics.hpp"

#include <string>
#include <vector>

using namespace unimix;

static std::vector<uint8_t> json_frame(const std::string& payload) {
    return frame::encode(frame::TYPE_JSON, payload);
}

static std::vector<uint8_t> cat(std::vector<uint8_t> a, const std::vector<uint8_t>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

TEST_CASE("Whole frame in one chunk yields one frame and counts wire bytes") {
    ProtocolStatistics stats;
    FrameAssembler asmb(4096, 1000, &stats);
    const auto f = json_frame("{\"a\":1}");

    auto out = asmb.feed(f, 0);
    REQUIRE(out.frames.size() == 1);
    CHECK(out.errors.empty());
    CHECK(out.frames[0].payload_text() == "{\"a\":1}");
    CHECK(asmb.pending() == 0);
    CHECK(stats.messages_received() == 1);
    CHECK(stats.bytes_received() == f.size());
}

TEST_CASE("Three concatenated frames come out in order") {
    FrameAssembler asmb(4096, 1000, nullptr);
    const auto stream = cat(cat(json_frame("{\"n\":1}"), json_frame("{\"n\":2}")), json_frame("{\"n\":3}"));

    auto out = asmb.feed(stream, 0);
    REQUIRE(out.frames.size() == 3);
    CHECK(out.frames[0].payload_text() == "{\"n\":1}");
    CHECK(out.frames[1].payload_text() == "{\"n\":2}");
    CHECK(out.frames[2].payload_text() == "{\"n\":3}");
    CHECK(out.errors.empty());
}

TEST_CASE("Every split point of a frame yields exactly one identical frame") {
    const std::vector<uint8_t> payload{'{', 0x7E, 0x7F, 0x7D, '}'};
    const auto f = frame::encode(frame::TYPE_JSON, payload.data(), payload.size());

    for (size_t cut = 1; cut < f.size(); ++cut) {
        FrameAssembler asmb(4096, 1000, nullptr);
        auto a = asmb.feed(f.data(), cut, 0);
        auto b = asmb.feed(f.data() + cut, f.size() - cut, 0);
        CAPTURE(cut);
        CHECK(a.frames.empty());
        REQUIRE(b.frames.size() == 1);
        CHECK(b.frames[0].payload == payload);
        CHECK(a.errors.empty());
        CHECK(b.errors.empty());
    }
}

TEST_CASE("Byte-at-a-time feeding reassembles the frame once") {
    FrameAssembler asmb(4096, 1000, nullptr);
    const auto f = json_frame("{\"deviceId\":\"mixer\"}");

    size_t frames = 0;
    for (size_t i = 0; i < f.size(); ++i) {
        auto out = asmb.feed(&f[i], 1, i);
        CHECK(out.errors.empty());
        frames += out.frames.size();
        if (i + 1 < f.size()) CHECK(asmb.pending() == i + 1);
    }
    CHECK(frames == 1);
    CHECK(asmb.pending() == 0);
}

TEST_CASE("Noise before START is one framing error for the whole span") {
    ProtocolStatistics stats;
    FrameAssembler asmb(4096, 1000, &stats);
    std::vector<uint8_t> noise{0x00, 0x11, 0x22, 0x7F, 0x7D, 0x33};

    auto out = asmb.feed(cat(noise, json_frame("{}")), 0);
    REQUIRE(out.frames.size() == 1);
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::Framing);
    CHECK(stats.error_count(ErrorKind::Framing) == 1);
    CHECK(out.frames[0].payload_text() == "{}");
}

TEST_CASE("A chunk with no START at all is dropped as one framing error") {
    FrameAssembler asmb(4096, 1000, nullptr);
    auto out = asmb.feed(std::vector<uint8_t>(50, 0x41), 0);
    CHECK(out.frames.empty());
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::Framing);
    CHECK(asmb.pending() == 0);
}

// A frame whose header bytes hold no START value, so resync after a
// rejected frame lands on the next frame and nowhere inside this one.
static std::vector<uint8_t> frame_with_clean_header(char digit) {
    for (char d = digit; d <= '9'; ++d) {
        auto f = json_frame(std::string("{\"a\":") + d + "}");
        bool clean = true;
        for (size_t i = 1; i < frame::HEADER_SIZE; ++i) clean = clean && f[i] != frame::START;
        if (clean) return f;
    }
    return json_frame("{\"a\":0}");
}

TEST_CASE("A corrupted frame is counted once and the next frame is recovered") {
    ProtocolStatistics stats;
    FrameAssembler asmb(4096, 1000, &stats);

    auto bad = frame_with_clean_header('0');
    REQUIRE(bad[frame::HEADER_SIZE + 5] >= '0');
    bad[frame::HEADER_SIZE + 5] ^= 0x01;   // digit changes, CRC no longer matches

    auto out = asmb.feed(cat(bad, json_frame("{\"b\":2}")), 0);
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::Crc);
    REQUIRE(out.frames.size() == 1);
    CHECK(out.frames[0].payload_text() == "{\"b\":2}");
    CHECK(stats.error_count(ErrorKind::Crc) == 1);
    CHECK(stats.messages_received() == 1);
}

TEST_CASE("An escaped END inside the payload does not terminate the frame early") {
    FrameAssembler asmb(4096, 1000, nullptr);
    const std::vector<uint8_t> payload{0x7F, 0x7F, 'x'};
    const auto f = frame::encode(frame::TYPE_JSON, payload.data(), payload.size());

    auto out = asmb.feed(f, 0);
    REQUIRE(out.frames.size() == 1);
    CHECK(out.frames[0].payload == payload);
    CHECK(out.errors.empty());
}

TEST_CASE("Declared length above the maximum is rejected once the header is in") {
    ProtocolStatistics stats;
    FrameAssembler asmb(64, 1000, &stats);

    std::vector<uint8_t> hdr{frame::START};
    frame::put_u32le(5000, hdr);
    frame::put_u16le(0, hdr);
    hdr.push_back(frame::TYPE_JSON);

    auto out = asmb.feed(hdr, 0);
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::BufferOverflow);
    CHECK(asmb.pending() == 0);
    CHECK(stats.error_count(ErrorKind::BufferOverflow) == 1);
}

TEST_CASE("Unterminated frame past the worst-case size overflows and resyncs") {
    FrameAssembler asmb(16, 0, nullptr);

    std::vector<uint8_t> junk{frame::START};
    frame::put_u32le(10, junk);
    frame::put_u16le(0, junk);
    junk.push_back(frame::TYPE_JSON);
    junk.insert(junk.end(), 40, 'a');   // 48 bytes > 8 + 2*16 + 1, no END

    auto out = asmb.feed(junk, 0);
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::BufferOverflow);
    CHECK(asmb.pending() == 0);

    auto next = asmb.feed(json_frame("{}"), 0);
    REQUIRE(next.frames.size() == 1);
    CHECK(next.frames[0].payload_text() == "{}");
}

TEST_CASE("A partial frame older than the timeout is dropped on poll") {
    ProtocolStatistics stats;
    FrameAssembler asmb(4096, 1000, &stats);
    const auto f = json_frame("{\"a\":1}");

    CHECK(asmb.feed(f.data(), 5, 100).empty());
    CHECK(asmb.poll(1100).empty());           // exactly at the budget
    auto out = asmb.poll(1101);
    REQUIRE(out.errors.size() == 1);
    CHECK(out.errors[0] == ErrorKind::Timeout);
    CHECK(asmb.pending() == 0);
    CHECK(stats.error_count(ErrorKind::Timeout) == 1);

    // a fresh frame after the timeout still decodes
    auto next = asmb.feed(f, 2000);
    CHECK(next.frames.size() == 1);
}

TEST_CASE("Zero timeout keeps a partial frame forever") {
    FrameAssembler asmb(4096, 0, nullptr);
    const auto f = json_frame("{}");
    asmb.feed(f.data(), 4, 0);
    CHECK(asmb.poll(10'000'000).empty());
    CHECK(asmb.pending() == 4);
}

TEST_CASE("reset() forgets a partial frame") {
    FrameAssembler asmb(4096, 1000, nullptr);
    const auto f = json_frame("{}");
    asmb.feed(f.data(), 6, 0);
    CHECK(asmb.pending() == 6);
    asmb.reset();
    CHECK(asmb.pending() == 0);
    CHECK(asmb.feed(f, 0).frames.size() == 1);
}

TEST_CASE("Max payload is clamped to the compile-time limit") {
    FrameAssembler asmb(1 << 20, 1000, nullptr);
    CHECK(asmb.max_payload() == frame::MAX_PAYLOAD_LIMIT);
    CHECK(asmb.buffer().capacity() == FrameAssembler::CAPACITY);
}

TEST_CASE("A maximum-size fully escaped frame fits the fixed buffer") {
    FrameAssembler asmb(frame::MAX_PAYLOAD_LIMIT, 1000, nullptr);
    std::vector<uint8_t> payload(frame::MAX_PAYLOAD_LIMIT, 0x7D);
    const auto f = frame::encode(frame::TYPE_JSON, payload.data(), payload.size());
    REQUIRE(f.size() == FrameAssembler::CAPACITY);

    auto out = asmb.feed(f, 0);
    REQUIRE(out.frames.size() == 1);
    CHECK(out.frames[0].payload.size() == frame::MAX_PAYLOAD_LIMIT);
}
