#pragma once
/**
 * @page um-serial-io unimix Serial I/O helpers
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode, move bytes with timeouts, and list candidate ports.
 *
 * @details
 * PURPOSE
 * -------
 * The POSIX work behind LinuxSerial and `unimix-cli --list-ports`. Free
 * functions, no hidden threads; the transport class owns the descriptor.
 *
 * WHAT THIS DOES
 * --------------
 * - open_serial: O_RDWR | O_NOCTTY | O_NONBLOCK, raw 8N1, baud from a small
 *   table, then a boot delay for USB CDC auto-reset and a flush of the boot
 *   chatter.
 * - read_some: poll for readability up to a timeout, then one read(2).
 * - write_all: loop write(2), waiting for POLLOUT on EAGAIN, until every byte
 *   is out or the timeout expires.
 * - list_serial_ports: /dev/serial/by-id symlinks (resolved), else
 *   /dev/ttyUSB* and /dev/ttyACM*.
 *
 * ERRORS
 * ------
 * Every call that can fail returns false/-1 and fills `err` with a
 * `reason=...` style message including strerror(errno).
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace unimix {

/// Map an integer baud rate to a termios speed. Returns false if unsupported.
bool baud_supported(int baud);

/**
 * @brief Open and configure a serial device.
 * @return file descriptor (>= 0) or -1 with @p err filled.
 */
int open_serial(const std::string& dev, int baud, int boot_delay_ms, std::string& err);

/// Close @p fd when >= 0.
void close_serial(int fd);

enum class ReadStatus : uint8_t { Data, Timeout, Error };

/**
 * @brief Wait up to @p timeout_ms for input, then read what is there.
 *
 * @return Data with @p out_len > 0, Timeout when nothing arrived, Error on
 *         poll/read failure or hang-up (device unplugged).
 */
ReadStatus read_some(int fd, uint8_t* out, size_t cap, size_t& out_len,
                     int timeout_ms, std::string& err);

/// Write every byte or fail. @p timeout_ms bounds each wait for POLLOUT.
bool write_all(int fd, const uint8_t* data, size_t len, int timeout_ms, std::string& err);

struct SerialPortInfo {
  std::string path;      ///< path to open (the by-id symlink when available)
  std::string device;    ///< canonical device node (/dev/ttyUSB0)
  bool stable = false;   ///< true when path is a /dev/serial/by-id link
};

std::vector<SerialPortInfo> list_serial_ports();

} // namespace unimix
