#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>

#include "tlsdial/base-fd.hpp"

namespace tlsdial {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation returns EAGAIN/WANT.
enum class TransportHint : uint8_t {
  None,        // No special action needed (operation completed)
  ReadReady,   // Need fd readable before operation can proceed (EAGAIN on read, SSL_ERROR_WANT_READ)
  WriteReady,  // Need fd writable before operation can proceed (EAGAIN on write, SSL_ERROR_WANT_WRITE)
  Error
};

struct TransportResult {
  std::size_t bytesProcessed;  // bytes read for read operations, or written for write operations
  TransportHint want;          // readiness needed before the operation can make progress
};

// Non-blocking byte stream established before any TLS is layered on top of it.
class RawTransport {
 public:
  virtual ~RawTransport() = default;

  // Non-blocking read. bytesProcessed > 0 on data, 0 with want == None on orderly close from the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write. Returns the number of bytes written. If fewer than requested, check want.
  virtual TransportResult write(std::string_view data) = 0;

  // Push any buffered bytes to the peer.
  virtual TransportHint flush() { return TransportHint::None; }

  // Close the write side of the stream. None once done.
  virtual TransportHint shutdown() = 0;

  // File descriptor an executor can wait on, or -1 when the transport is not fd based.
  [[nodiscard]] virtual int fd() const noexcept = 0;
};

// TCP transport directly operating on a non-blocking, connected socket it owns.
class TcpTransport : public RawTransport {
 public:
  explicit TcpTransport(BaseFd baseFd) noexcept : _baseFd(std::move(baseFd)) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportHint shutdown() override;

  [[nodiscard]] int fd() const noexcept override { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace tlsdial
