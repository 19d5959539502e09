#pragma once

#include <cstddef>
#include <memory>
#include <string_view>
#include <utility>

#include "tlsdial/tls-backend.hpp"
#include "tlsdial/transport.hpp"

namespace tlsdial {

// Encrypted byte stream produced by a completed handshake.
// Owns the backend session, which itself owns the raw transport.
class TlsStream {
 public:
  explicit TlsStream(std::unique_ptr<ITlsSession> session) noexcept : _session(std::move(session)) {}

  TransportResult read(char* buf, std::size_t len) { return _session->read(buf, len); }

  TransportResult write(std::string_view data) { return _session->write(data); }

  TransportHint flush() { return _session->flush(); }

  // Two phase graceful close: send close_notify, then shut the raw transport down.
  // Returns ReadReady / WriteReady while a phase needs the transport, and should then be called again.
  // An error while sending close_notify is returned as is, the raw transport is left untouched.
  TransportHint shutdown();

  // Access to the backend session (certificates, ALPN, native handle).
  [[nodiscard]] const ITlsSession& session() const noexcept { return *_session; }
  [[nodiscard]] ITlsSession& session() noexcept { return *_session; }

  [[nodiscard]] int fd() const noexcept { return _session->fd(); }

 private:
  std::unique_ptr<ITlsSession> _session;
  bool _closeNotifyDone{false};
};

}  // namespace tlsdial
