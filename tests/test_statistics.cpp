#include <doctest/doctest.h>
#include "unimix/protocol_statistics.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace unimix;

TEST_CASE("Counters start at zero and success rate is zero without traffic") {
    ProtocolStatistics s;
    const auto snap = s.snapshot();
    CHECK(snap.messages_sent == 0);
    CHECK(snap.messages_received == 0);
    CHECK(snap.total_frame_errors() == 0);
    CHECK(snap.success_rate() == doctest::Approx(0.0));
}

TEST_CASE("record_* update the matching counters") {
    ProtocolStatistics s;
    s.record_sent(10);
    s.record_received(20);
    s.record_received(30);
    s.record_error(ErrorKind::Crc);
    s.record_error(ErrorKind::Parse);
    s.record_error(ErrorKind::None);

    CHECK(s.messages_sent() == 1);
    CHECK(s.bytes_sent() == 10);
    CHECK(s.messages_received() == 2);
    CHECK(s.bytes_received() == 50);
    CHECK(s.error_count(ErrorKind::Crc) == 1);
    CHECK(s.error_count(ErrorKind::Parse) == 1);
    CHECK(s.error_count(ErrorKind::None) == 0);
}

TEST_CASE("Success rate counts frame-level errors only") {
    ProtocolStatistics s;
    for (int i = 0; i < 9; ++i) s.record_received(1);
    s.record_error(ErrorKind::Framing);
    s.record_error(ErrorKind::Parse);        // message level, not a frame error
    s.record_error(ErrorKind::Transport);

    const auto snap = s.snapshot();
    CHECK(snap.total_frame_errors() == 1);
    CHECK(snap.success_rate() == doctest::Approx(90.0));
}

TEST_CASE("Every frame error kind feeds total_frame_errors") {
    ProtocolStatistics s;
    for (ErrorKind k : {ErrorKind::Framing, ErrorKind::Crc, ErrorKind::EscapeSequence,
                        ErrorKind::BufferOverflow, ErrorKind::Timeout})
        s.record_error(k);
    CHECK(s.snapshot().total_frame_errors() == 5);
}

TEST_CASE("reset() zeroes everything and accumulation restarts from zero") {
    ProtocolStatistics s;
    s.record_sent(5);
    s.record_received(5);
    s.record_error(ErrorKind::Timeout);
    s.record_error(ErrorKind::Transport);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    s.reset();
    const auto zero = s.snapshot();
    CHECK(zero.messages_sent == 0);
    CHECK(zero.messages_received == 0);
    CHECK(zero.bytes_sent == 0);
    CHECK(zero.timeout_errors == 0);
    CHECK(zero.transport_errors == 0);
    CHECK(zero.uptime_seconds < 0.02);

    s.record_received(7);
    CHECK(s.messages_received() == 1);
    CHECK(s.bytes_received() == 7);
}

TEST_CASE("Concurrent updates are not lost") {
    ProtocolStatistics s;
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&s] {
            for (int i = 0; i < 10000; ++i) {
                s.record_received(2);
                s.record_error(ErrorKind::Crc);
            }
        });
    }
    for (auto& w : workers) w.join();
    CHECK(s.messages_received() == 40000);
    CHECK(s.bytes_received() == 80000);
    CHECK(s.error_count(ErrorKind::Crc) == 40000);
}

TEST_CASE("Rates divide by uptime") {
    StatsSnapshot snap;
    snap.messages_sent = 10;
    snap.messages_received = 30;
    snap.bytes_sent = 100;
    snap.bytes_received = 300;
    snap.uptime_seconds = 4.0;
    CHECK(snap.messages_per_second() == doctest::Approx(10.0));
    CHECK(snap.bytes_per_second() == doctest::Approx(100.0));

    snap.uptime_seconds = 0.0;
    CHECK(snap.messages_per_second() == doctest::Approx(0.0));
}

TEST_CASE("Summary line carries every counter as key=value") {
    StatsSnapshot snap;
    snap.messages_received = 3;
    snap.crc_errors = 1;
    snap.uptime_seconds = 3725.0;   // 01:02:05
    const std::string line = snap.summary();
    CHECK(line.find("recv=3") != std::string::npos);
    CHECK(line.find("crc=1") != std::string::npos);
    CHECK(line.find("success=75.00%") != std::string::npos);
    CHECK(line.find("uptime=01:02:05") != std::string::npos);
}
