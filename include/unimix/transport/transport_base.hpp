#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-level transport interface the session drives.
 *
 * Contract:
 *  - open() acquires the link; false with `err` filled on failure.
 *  - recv() waits at most the transport's read timeout and returns
 *    RxResult::Ok with out_len > 0, RxResult::None when idle, or
 *    RxResult::Error when the link is gone (session reconnects).
 *  - send() writes the whole buffer or returns Error.
 *  - name() is the source identity attached to every parsed message.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace unimix::transport {

enum class TxResult : uint8_t { Ok = 0, Busy = 1, Error = 2 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Error = 2 };

class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        open(std::string& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len, std::string& err) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len, std::string& err) = 0;
  virtual const char* name() const = 0;
};

} // namespace unimix::transport
