#include <doctest/doctest.h>
#include "unimix/transport/transport_linux_serial.hpp"

#include <fcntl.h>
#include <poll.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace unimix;
using unimix::transport::LinuxSerial;
using unimix::transport::SerialConfig;
using unimix::transport::TxResult;

namespace {

// Pseudo-terminal pair; LinuxSerial opens the slave path like a tty device.
struct Pty {
    int master = -1;
    std::string slave;

    Pty() {
        master = ::posix_openpt(O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (master < 0) return;
        const char* name = nullptr;
        if (::grantpt(master) != 0 || ::unlockpt(master) != 0 || (name = ::ptsname(master)) == nullptr) {
            ::close(master);
            master = -1;
            return;
        }
        slave = name;
    }
    ~Pty() { if (master >= 0) ::close(master); }

    bool ok() const { return master >= 0; }

    void drain() const {
        uint8_t buf[256];
        while (::read(master, buf, sizeof(buf)) > 0) {}
    }
};

SerialConfig pty_config(const Pty& p) {
    SerialConfig c;
    c.path = p.slave;
    c.boot_delay_ms = 0;
    c.write_timeout_ms = 5;
    c.poll_ms = 1;
    return c;
}

} // namespace

TEST_CASE("send() on a port that was never opened is refused") {
    LinuxSerial port(SerialConfig{});
    const uint8_t b[4] = {0x7E, 0x01, 0x02, 0x7F};
    std::string err;
    CHECK(port.send(b, sizeof(b), err) == TxResult::Error);
    CHECK(err == "reason=not_open");
    CHECK_FALSE(port.is_open());

    CHECK_FALSE(port.open(err));
    CHECK(err == "reason=no_port");
}

TEST_CASE("Bytes sent on an open pty arrive on the other side") {
    Pty pty;
    if (!pty.ok()) { MESSAGE("no pseudo-terminal available"); return; }

    LinuxSerial port(pty_config(pty));
    std::string err;
    REQUIRE_MESSAGE(port.open(err), err);
    CHECK(port.is_open());

    const uint8_t b[4] = {0x7E, 0x01, 0x02, 0x7F};
    REQUIRE(port.send(b, sizeof(b), err) == TxResult::Ok);

    pollfd pfd{pty.master, POLLIN, 0};
    REQUIRE(::poll(&pfd, 1, 1000) == 1);
    uint8_t got[8] = {};
    CHECK(::read(pty.master, got, sizeof(got)) == 4);
    CHECK(std::vector<uint8_t>(got, got + 4) == std::vector<uint8_t>(b, b + 4));

    port.close();
    CHECK_FALSE(port.is_open());
    CHECK(port.send(b, sizeof(b), err) == TxResult::Error);
    CHECK(err == "reason=not_open");
}

TEST_CASE("Writers on another thread never hit a descriptor closed under them") {
    Pty pty;
    if (!pty.ok()) { MESSAGE("no pseudo-terminal available"); return; }

    LinuxSerial port(pty_config(pty));
    std::string err;
    REQUIRE_MESSAGE(port.open(err), err);

    std::atomic<bool> done{false};
    std::atomic<int> sent{0};
    std::vector<std::string> unexpected;

    std::thread writer([&] {
        const uint8_t b[4] = {0x7E, 0x01, 0x02, 0x7F};
        std::string e;
        while (!done.load()) {
            e.clear();
            if (port.send(b, sizeof(b), e) == TxResult::Ok) { ++sent; continue; }
            // closed between sends, or the pty buffer is full
            if (e != "reason=not_open" && e != "reason=write_timeout") unexpected.push_back(e);
        }
    });

    int reopened = 0;
    for (int i = 0; i < 200; ++i) {
        port.close();
        pty.drain();
        std::string oe;
        if (port.open(oe)) ++reopened;
        pty.drain();
    }
    for (int i = 0; i < 1000 && sent.load() == 0; ++i) {
        pty.drain();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    done.store(true);
    writer.join();

    CHECK(reopened == 200);
    CHECK(sent.load() > 0);
    CHECK(unexpected.empty());
    if (!unexpected.empty()) MESSAGE(unexpected.front());
}
